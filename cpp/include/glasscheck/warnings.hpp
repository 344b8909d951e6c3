/**
 * @file warnings.hpp
 * @brief Warning system for non-fatal design conditions.
 *
 * Warnings indicate conditions that don't prevent the calculation
 * but must be surfaced with the result (e.g. a modulus taken from the
 * nearest boundary sample instead of an interpolated value).
 */

#ifndef GLASSCHECK_WARNINGS_HPP
#define GLASSCHECK_WARNINGS_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace glasscheck {

/**
 * @brief Warning codes for non-fatal design conditions.
 */
enum class WarningCode {
    // === Material Data Warnings (100-199) ===

    /// Query temperature outside the sampled range, nearest boundary sample used
    OUT_OF_RANGE_EXTRAPOLATION = 100,

    /// Missing or non-numeric cell replaced by the configured fill value
    MISSING_MODULUS_FILLED = 101,

    // === Serviceability Warnings (200-299) ===

    /// Computed deflection exceeds the configured span ratio
    DEFLECTION_LIMIT_EXCEEDED = 200,

    // === Strength Warnings (300-399) ===

    /// Applied action exceeds the design resistance (utilization > 1)
    UTILIZATION_EXCEEDED = 300
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Review recommended
    Medium = 1,

    /// Design does not satisfy a check
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::OUT_OF_RANGE_EXTRAPOLATION: return "OUT_OF_RANGE_EXTRAPOLATION";
        case WarningCode::MISSING_MODULUS_FILLED: return "MISSING_MODULUS_FILLED";
        case WarningCode::DEFLECTION_LIMIT_EXCEEDED: return "DEFLECTION_LIMIT_EXCEEDED";
        case WarningCode::UTILIZATION_EXCEEDED: return "UTILIZATION_EXCEEDED";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for glasscheck.
 */
struct DesignWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Index of the load case the warning belongs to (-1 if none)
    int load_case_index = -1;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested action
    std::string suggestion;

    DesignWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (load_case_index >= 0) {
            result += "\n  Load case: " + std::to_string(load_case_index);
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Modulus clamped to the nearest sampled temperature.
     */
    static DesignWarning out_of_range(const std::string& product_id,
                                      const std::string& duration,
                                      double query_temperature,
                                      double used_temperature) {
        DesignWarning warn(WarningCode::OUT_OF_RANGE_EXTRAPOLATION, WarningSeverity::Medium,
            "Temperature outside sampled range for '" + product_id +
            "', nearest boundary sample used");
        warn.details["product"] = product_id;
        warn.details["duration"] = duration;
        warn.details["query_temperature_c"] = std::to_string(query_temperature);
        warn.details["used_temperature_c"] = std::to_string(used_temperature);
        warn.suggestion = "Extend the interlayer data to cover the design temperature";
        return warn;
    }

    static DesignWarning missing_modulus_filled(const std::string& product_id, int line,
                                                const std::string& column, double fill) {
        DesignWarning warn(WarningCode::MISSING_MODULUS_FILLED, WarningSeverity::Low,
            "Missing shear modulus replaced by fill value");
        warn.details["product"] = product_id;
        warn.details["line"] = std::to_string(line);
        warn.details["column"] = column;
        warn.details["fill_mpa"] = std::to_string(fill);
        return warn;
    }

    static DesignWarning deflection_exceeded(double deflection, double limit) {
        DesignWarning warn(WarningCode::DEFLECTION_LIMIT_EXCEEDED, WarningSeverity::Medium,
            "Deflection exceeds span limit");
        warn.details["deflection_mm"] = std::to_string(deflection);
        warn.details["limit_mm"] = std::to_string(limit);
        warn.suggestion = "Increase ply thickness or use a stiffer interlayer";
        return warn;
    }

    static DesignWarning utilization_exceeded(double utilization) {
        DesignWarning warn(WarningCode::UTILIZATION_EXCEEDED, WarningSeverity::High,
            "Applied action exceeds design resistance");
        warn.details["utilization"] = std::to_string(utilization);
        return warn;
    }
};

/**
 * @brief Collection of warnings gathered during a calculation.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<DesignWarning> warnings;

    void add(const DesignWarning& warning) {
        warnings.push_back(warning);
    }

    void add(DesignWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    /**
     * @brief Append all warnings of another list.
     */
    void append(const WarningList& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Get count of warnings with a given code.
     */
    size_t count_by_code(WarningCode code) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.code == code) ++count;
        }
        return count;
    }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace glasscheck

#endif  // GLASSCHECK_WARNINGS_HPP
