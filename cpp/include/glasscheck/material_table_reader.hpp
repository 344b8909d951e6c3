#pragma once

#include "glasscheck/material.hpp"
#include "glasscheck/warnings.hpp"

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace glasscheck {

/**
 * @brief Settings for reading interlayer tables
 */
struct MaterialTableReaderSettings {
    /// Value substituted for empty or non-numeric modulus cells [MPa]
    double missing_modulus_fill_mpa = 0.05;

    /// Throw instead of filling when a modulus cell is missing
    bool reject_missing_values = false;

    /// Field delimiter
    char delimiter = ',';
};

/**
 * @brief Reader for interlayer shear modulus tables in CSV form
 *
 * Two layouts are supported:
 *
 * Long format (all products in one file), header required:
 * @code
 *   product,temperature_c,duration,shear_modulus_mpa
 *   PVB-A,20,short,4.0
 *   PVB-A,40,3 sec,1.0
 * @endcode
 *
 * Wide format (one product per file): the first column holds the
 * temperature, the other header cells are duration labels. Columns whose
 * label is not a duration class ("1 sec", "1 min", ...) are skipped.
 * @code
 *   Temperature (°C),3 sec,10 min,1 day
 *   0,250,120,30
 *   20,4.0,1.2,
 * @endcode
 *
 * Blank lines and lines starting with '#' are ignored. Rows are returned
 * in file order; MaterialPropertyTable performs the duplicate check.
 */
class MaterialTableReader {
public:
    using Settings = MaterialTableReaderSettings;

    explicit MaterialTableReader(Settings settings = Settings{});

    /**
     * @brief Parse a long-format table
     * @throws DesignException INVALID_TABLE_FORMAT on malformed rows
     */
    std::vector<MaterialSample> read_long(std::istream& in) const;

    /**
     * @brief Parse a wide-format table of one product
     * @param product_id Product id assigned to every sample
     * @param in Input stream
     * @param warnings Receives MISSING_MODULUS_FILLED warnings (optional)
     * @throws DesignException INVALID_TABLE_FORMAT on malformed rows, on a
     *         header without any duration class column, or on missing cells
     *         when reject_missing_values is set
     */
    std::vector<MaterialSample> read_wide(const std::string& product_id,
                                          std::istream& in,
                                          WarningList* warnings = nullptr) const;

    /**
     * @brief Read a long-format file
     * @throws DesignException FILE_NOT_FOUND if the file cannot be opened
     */
    std::vector<MaterialSample> read_long_file(const std::string& path) const;

    /**
     * @brief Read a wide-format file of one product
     * @throws DesignException FILE_NOT_FOUND if the file cannot be opened
     */
    std::vector<MaterialSample> read_wide_file(const std::string& product_id,
                                               const std::string& path,
                                               WarningList* warnings = nullptr) const;

    const Settings& settings() const { return settings_; }

private:
    std::vector<std::string> split(const std::string& line) const;

    Settings settings_;
};

/**
 * @brief One-time ingestion of a long-format source into a shared table
 *
 * The returned table is immutable; reloading means building a new table
 * and swapping the pointer held by the calculator.
 */
std::shared_ptr<const MaterialPropertyTable> load_material_table(
    std::istream& in, const MaterialTableReaderSettings& settings = {});

/**
 * @brief One-time ingestion of a long-format file
 */
std::shared_ptr<const MaterialPropertyTable> load_material_table(
    const std::string& path, const MaterialTableReaderSettings& settings = {});

} // namespace glasscheck
