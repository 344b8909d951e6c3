#pragma once

#include "glasscheck/categories.hpp"

#include <string>

namespace glasscheck {

/**
 * @brief What the applied value of a load case represents
 */
enum class ActionKind {
    Stress,          ///< Principal tensile stress in the glass [MPa]
    UniformPressure  ///< Uniform pressure on the pane [kPa]
};

inline std::string action_kind_to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::Stress: return "Stress";
        case ActionKind::UniformPressure: return "UniformPressure";
        default: return "unknown";
    }
}

/**
 * @brief One design situation of a pane
 *
 * A load case pairs an action with the load duration class and the glass
 * temperature that act together. The duration drives both k_mod and the
 * interlayer modulus lookup; the temperature drives the modulus lookup.
 *
 * Usage:
 *   LoadCase wind = LoadCase::pressure("Wind", DurationClass::Medium, 1.2, 20.0);
 *   LoadCase snow("Snow", DurationClass::Day, 0.6, 0.0, ActionKind::UniformPressure);
 */
struct LoadCase {
    std::string name;                            ///< Descriptive name (e.g. "Wind gust")
    DurationClass duration = DurationClass::Short;  ///< Load duration class
    double applied_value = 0.0;                  ///< Applied stress [MPa] or pressure [kPa], >= 0
    double temperature_c = 20.0;                 ///< Glass/interlayer temperature [°C]
    ActionKind kind = ActionKind::Stress;

    LoadCase() = default;

    LoadCase(const std::string& name, DurationClass duration, double applied_value,
             double temperature_c, ActionKind kind = ActionKind::Stress)
        : name(name), duration(duration), applied_value(applied_value),
          temperature_c(temperature_c), kind(kind) {}

    /**
     * @brief Load case with an applied principal stress [MPa]
     */
    static LoadCase stress(const std::string& name, DurationClass duration,
                           double stress_mpa, double temperature_c);

    /**
     * @brief Load case with an applied uniform pressure [kPa]
     */
    static LoadCase pressure(const std::string& name, DurationClass duration,
                             double pressure_kpa, double temperature_c);

    /**
     * @brief Unit of the applied value ("MPa" or "kPa")
     */
    std::string unit() const;

    /**
     * @brief Check the applied value and temperature are usable
     * @throws DesignException INVALID_REQUEST
     */
    void validate() const;
};

} // namespace glasscheck
