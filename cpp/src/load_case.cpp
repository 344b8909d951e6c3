#include "glasscheck/load_case.hpp"
#include "glasscheck/errors.hpp"

#include <cmath>

namespace glasscheck {

LoadCase LoadCase::stress(const std::string& name, DurationClass duration,
                          double stress_mpa, double temperature_c) {
    return LoadCase(name, duration, stress_mpa, temperature_c, ActionKind::Stress);
}

LoadCase LoadCase::pressure(const std::string& name, DurationClass duration,
                            double pressure_kpa, double temperature_c) {
    return LoadCase(name, duration, pressure_kpa, temperature_c, ActionKind::UniformPressure);
}

std::string LoadCase::unit() const {
    return kind == ActionKind::UniformPressure ? "kPa" : "MPa";
}

void LoadCase::validate() const {
    if (!std::isfinite(applied_value) || applied_value < 0.0) {
        DesignError err = DesignError::invalid_request("applied value must be finite and non-negative");
        err.details["load_case"] = name;
        err.details["applied_value"] = std::to_string(applied_value);
        throw DesignException(err);
    }
    if (!std::isfinite(temperature_c)) {
        DesignError err = DesignError::invalid_request("temperature must be finite");
        err.details["load_case"] = name;
        throw DesignException(err);
    }
}

} // namespace glasscheck
