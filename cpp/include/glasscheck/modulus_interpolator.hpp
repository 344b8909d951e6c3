#pragma once

#include "glasscheck/material.hpp"
#include "glasscheck/warnings.hpp"

#include <string>

namespace glasscheck {

/**
 * @brief How an interpolated modulus was obtained
 */
enum class InterpolationMethod {
    Exact,         ///< Sample present verbatim in the table
    Interpolated,  ///< Log-linear interpolation between two bracketing samples
    ClampedLow,    ///< Below lowest sampled temperature, lowest sample used
    ClampedHigh    ///< Above highest sampled temperature, highest sample used
};

inline std::string interpolation_method_to_string(InterpolationMethod method) {
    switch (method) {
        case InterpolationMethod::Exact: return "exact";
        case InterpolationMethod::Interpolated: return "interpolated";
        case InterpolationMethod::ClampedLow: return "clamped low";
        case InterpolationMethod::ClampedHigh: return "clamped high";
        default: return "unknown";
    }
}

/**
 * @brief Shear modulus estimate for one (product, temperature, duration) query
 */
struct ModulusEstimate {
    /// Shear modulus [MPa]
    double shear_modulus_mpa = 0.0;

    /// How the value was obtained
    InterpolationMethod method = InterpolationMethod::Exact;

    /// True when the query lay outside the sampled temperature range
    bool extrapolated = false;

    /// Requested temperature [°C]
    double query_temperature_c = 0.0;

    /// Temperature the value corresponds to (boundary temperature when clamped) [°C]
    double used_temperature_c = 0.0;
};

/**
 * @brief Temperature interpolation of interlayer shear modulus
 *
 * Duration is a discrete axis: only samples of the requested duration
 * class are used. Within it, the modulus is interpolated log-linearly in
 * temperature (the interlayer modulus varies roughly exponentially with
 * temperature over design ranges):
 *
 *   G(T) = G0^(1-w) * G1^w,   w = (T - T0) / (T1 - T0)
 *
 * A zero-modulus endpoint gives zero inside that segment. Outside the
 * sampled range the nearest boundary sample is returned and the estimate
 * is flagged as extrapolated.
 *
 * The interpolator holds only a reference to the immutable table and has
 * no other state, so identical queries always give identical results.
 *
 * Usage:
 *   ModulusInterpolator interp(*table);
 *   WarningList warnings;
 *   ModulusEstimate est = interp.interpolate("PVB-A", 30.0, DurationClass::Short, &warnings);
 */
class ModulusInterpolator {
public:
    explicit ModulusInterpolator(const MaterialPropertyTable& table);

    /**
     * @brief Estimate shear modulus at a temperature and duration class
     * @param product_id Interlayer product
     * @param temperature_c Query temperature [°C]
     * @param duration Load duration class
     * @param warnings Receives OUT_OF_RANGE_EXTRAPOLATION when clamped (optional)
     * @return ModulusEstimate
     * @throws DesignException UNKNOWN_PRODUCT, UNSUPPORTED_DURATION_CLASS,
     *         or INVALID_REQUEST for a non-finite temperature
     */
    ModulusEstimate interpolate(const std::string& product_id,
                                double temperature_c,
                                DurationClass duration,
                                WarningList* warnings = nullptr) const;

    /**
     * @brief Convenience overload returning only the modulus [MPa]
     */
    double shear_modulus(const std::string& product_id,
                         double temperature_c,
                         DurationClass duration) const;

    /**
     * @brief Log-linear interpolation between two points
     * @param t Query temperature, expected within [t0, t1]
     */
    static double log_linear(double t0, double g0, double t1, double g1, double t);

private:
    const MaterialPropertyTable& table_;
};

} // namespace glasscheck
