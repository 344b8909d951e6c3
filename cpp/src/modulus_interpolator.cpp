#include "glasscheck/modulus_interpolator.hpp"
#include "glasscheck/errors.hpp"
#include "glasscheck/logging.hpp"

#include <algorithm>
#include <cmath>

namespace glasscheck {

ModulusInterpolator::ModulusInterpolator(const MaterialPropertyTable& table)
    : table_(table) {}

double ModulusInterpolator::log_linear(double t0, double g0, double t1, double g1, double t) {
    if (t1 == t0) return g0;
    const double w = (t - t0) / (t1 - t0);
    if (w <= 0.0) return g0;
    if (w >= 1.0) return g1;
    // Geometric form of exp(lerp(ln g0, ln g1)); stays defined when an endpoint is 0
    return std::pow(g0, 1.0 - w) * std::pow(g1, w);
}

ModulusEstimate ModulusInterpolator::interpolate(const std::string& product_id,
                                                 double temperature_c,
                                                 DurationClass duration,
                                                 WarningList* warnings) const {
    if (!std::isfinite(temperature_c)) {
        DesignError err = DesignError::invalid_request("non-finite temperature");
        err.details["product"] = product_id;
        throw DesignException(err);
    }

    // Throws UNKNOWN_PRODUCT before anything else
    const auto& pts = table_.points(product_id, duration);
    if (pts.empty()) {
        throw DesignException(
            DesignError::unsupported_duration(product_id, to_string(duration)));
    }

    ModulusEstimate est;
    est.query_temperature_c = temperature_c;

    // First point with temperature >= query
    auto upper = std::lower_bound(pts.begin(), pts.end(), temperature_c,
        [](const ModulusPoint& p, double t) { return p.temperature_c < t; });

    if (upper != pts.end() && upper->temperature_c == temperature_c) {
        est.shear_modulus_mpa = upper->shear_modulus_mpa;
        est.method = InterpolationMethod::Exact;
        est.used_temperature_c = upper->temperature_c;
        return est;
    }

    if (upper == pts.begin() || upper == pts.end()) {
        const ModulusPoint& boundary = (upper == pts.begin()) ? pts.front() : pts.back();
        est.shear_modulus_mpa = boundary.shear_modulus_mpa;
        est.method = (upper == pts.begin()) ? InterpolationMethod::ClampedLow
                                            : InterpolationMethod::ClampedHigh;
        est.extrapolated = true;
        est.used_temperature_c = boundary.temperature_c;

        logger()->warn("{} ({}): {} °C outside sampled range, using {} MPa at {} °C",
                       product_id, to_string(duration), temperature_c,
                       boundary.shear_modulus_mpa, boundary.temperature_c);
        if (warnings) {
            warnings->add(DesignWarning::out_of_range(product_id, to_string(duration),
                                                      temperature_c, boundary.temperature_c));
        }
        return est;
    }

    auto lower = upper - 1;
    est.shear_modulus_mpa = log_linear(lower->temperature_c, lower->shear_modulus_mpa,
                                       upper->temperature_c, upper->shear_modulus_mpa,
                                       temperature_c);
    est.method = InterpolationMethod::Interpolated;
    est.used_temperature_c = temperature_c;
    return est;
}

double ModulusInterpolator::shear_modulus(const std::string& product_id,
                                          double temperature_c,
                                          DurationClass duration) const {
    return interpolate(product_id, temperature_c, duration).shear_modulus_mpa;
}

} // namespace glasscheck
