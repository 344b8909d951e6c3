#pragma once

#include "glasscheck/categories.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace glasscheck {

/**
 * @brief One interlayer shear modulus measurement
 *
 * Units:
 * - temperature_c: Temperature [°C]
 * - shear_modulus_mpa: Interlayer shear modulus G [MPa]
 */
struct MaterialSample {
    std::string product_id;       ///< Interlayer product (e.g. "PVB-A")
    double temperature_c = 0.0;   ///< Sample temperature [°C]
    DurationClass duration = DurationClass::Short;  ///< Load duration class
    double shear_modulus_mpa = 0.0;  ///< Shear modulus [MPa], >= 0

    MaterialSample() = default;

    MaterialSample(std::string product_id, double temperature_c,
                   DurationClass duration, double shear_modulus_mpa)
        : product_id(std::move(product_id)), temperature_c(temperature_c),
          duration(duration), shear_modulus_mpa(shear_modulus_mpa) {}
};

/**
 * @brief Temperature/modulus point of one product and duration class
 */
struct ModulusPoint {
    double temperature_c;      ///< [°C]
    double shear_modulus_mpa;  ///< [MPa]
};

/**
 * @brief Immutable interlayer shear modulus dataset
 *
 * Maps (product, temperature, duration class) to shear modulus. Sampling
 * may be sparse and irregular: each product holds, per duration class, a
 * list of temperature points sorted ascending. The table is validated and
 * frozen at construction; all member functions are const and the table
 * can be shared between threads without locking.
 *
 * Usage:
 *   auto table = std::make_shared<MaterialPropertyTable>(samples);
 *   auto hit = table->lookup("PVB-A", 20.0, DurationClass::Short);
 *   if (hit) { double G = hit->shear_modulus_mpa; }
 */
class MaterialPropertyTable {
public:
    /**
     * @brief Build the table from a flat list of samples
     * @param samples Samples in any order
     * @throws DesignException INVALID_REQUEST for empty product ids,
     *         non-finite values or negative moduli; DUPLICATE_SAMPLE when
     *         a product repeats a (temperature, duration) pair
     */
    explicit MaterialPropertyTable(const std::vector<MaterialSample>& samples);

    /**
     * @brief Exact-match lookup, no interpolation
     * @return The sample, or std::nullopt if that point was not sampled
     * @throws DesignException UNKNOWN_PRODUCT if the product is absent
     */
    std::optional<MaterialSample> lookup(const std::string& product_id,
                                         double temperature_c,
                                         DurationClass duration) const;

    bool has_product(const std::string& product_id) const;

    /**
     * @brief Product ids in lexicographic order
     */
    std::vector<std::string> products() const;

    /**
     * @brief Duration classes sampled for a product, in enum order
     * @throws DesignException UNKNOWN_PRODUCT
     */
    std::vector<DurationClass> durations(const std::string& product_id) const;

    /**
     * @brief Points of one product and duration class sorted by temperature
     * @return Empty vector if the duration class has no samples
     * @throws DesignException UNKNOWN_PRODUCT
     */
    const std::vector<ModulusPoint>& points(const std::string& product_id,
                                            DurationClass duration) const;

    /**
     * @brief Lowest and highest sampled temperature [°C]
     * @throws DesignException UNKNOWN_PRODUCT or UNSUPPORTED_DURATION_CLASS
     */
    std::pair<double, double> temperature_range(const std::string& product_id,
                                                DurationClass duration) const;

    /**
     * @brief All samples of the table (product, duration, temperature order)
     */
    std::vector<MaterialSample> samples() const;

    /**
     * @brief Total number of samples
     */
    size_t size() const { return size_; }

    bool empty() const { return size_ == 0; }

private:
    using DurationMap = std::map<DurationClass, std::vector<ModulusPoint>>;

    const DurationMap& product_data(const std::string& product_id) const;

    std::map<std::string, DurationMap> data_;
    size_t size_ = 0;
};

} // namespace glasscheck
