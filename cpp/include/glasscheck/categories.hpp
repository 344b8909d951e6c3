#pragma once

#include <array>
#include <string>

namespace glasscheck {

/**
 * @brief Design standard whose methodology and coefficient tables are applied
 */
enum class Standard {
    EN16612,   ///< EN 16612 Glass in building - lateral load resistance
    IStructE   ///< IStructE Structural use of glass in buildings
};

/**
 * @brief Glass product by manufacturing process
 *
 * Annealed glass carries no prestress; every other type is treated as
 * prestressed glass with an additional strength contribution.
 */
enum class GlassType {
    Annealed,                ///< EN 572-1 float, f_b;k = 45 MPa
    HeatStrengthened,        ///< EN 1863-1, f_b;k = 70 MPa
    Toughened,               ///< EN 12150-1 thermally toughened, f_b;k = 120 MPa
    ChemicallyStrengthened   ///< EN 12337-1, f_b;k = 150 MPa
};

/**
 * @brief Edge working of the ply (edge strength factor k_e)
 */
enum class EdgeCondition {
    Polished,
    Ground,
    Arrissed,
    AsCut
};

/**
 * @brief Glass surface profile (k_sp)
 */
enum class SurfaceProfile {
    Float,
    DrawnSheet,
    Enamelled,
    Patterned,
    EnamelledPatterned,
    PolishedWired,
    PatternedWired
};

/**
 * @brief Surface finish treatment (k'_sp)
 */
enum class SurfaceFinish {
    None,
    SandBlasted,
    AcidEtched
};

/**
 * @brief Toughening process of prestressed glass (k_v)
 */
enum class TougheningProcess {
    Horizontal,
    Vertical
};

/**
 * @brief Consequence class of the glass element (scales the material factors)
 */
enum class ConsequenceClass {
    CC1,
    CC2,
    CC3
};

/**
 * @brief Discrete load duration classes
 *
 * Duration classes are categories defined by the standards and by the
 * interlayer data; they are never interpolated between.
 */
enum class DurationClass {
    Short,      ///< 3 s: wind gust, impact
    Medium,     ///< 10 min: accumulated wind storm
    Day,        ///< 1 day: snow, daily temperature cycle
    Long,       ///< 6 months: seasonal temperature variation
    Permanent   ///< 50 years: self weight, permanent loads
};

/// All duration classes in ascending duration order
constexpr std::array<DurationClass, 5> kAllDurationClasses = {
    DurationClass::Short, DurationClass::Medium, DurationClass::Day,
    DurationClass::Long, DurationClass::Permanent
};

std::string to_string(Standard standard);
std::string to_string(GlassType type);
std::string to_string(EdgeCondition edge);
std::string to_string(SurfaceProfile profile);
std::string to_string(SurfaceFinish finish);
std::string to_string(TougheningProcess process);
std::string to_string(ConsequenceClass cc);
std::string to_string(DurationClass duration);

/**
 * @brief Representative duration label used by interlayer datasets
 * @return "3 sec", "10 min", "1 day", "6 months" or "50 years"
 */
std::string duration_label(DurationClass duration);

/**
 * @brief Representative load duration [s]
 */
double duration_seconds(DurationClass duration);

/**
 * @brief Whether the glass type carries a prestress contribution
 */
inline bool is_prestressed(GlassType type) {
    return type != GlassType::Annealed;
}

// Parsing is case-insensitive and ignores spaces, '-' and '_'.
// Unknown text throws DesignException with ErrorCode::INVALID_REQUEST.

Standard parse_standard(const std::string& text);
GlassType parse_glass_type(const std::string& text);
EdgeCondition parse_edge_condition(const std::string& text);
SurfaceProfile parse_surface_profile(const std::string& text);
SurfaceFinish parse_surface_finish(const std::string& text);
TougheningProcess parse_toughening_process(const std::string& text);
ConsequenceClass parse_consequence_class(const std::string& text);

/**
 * @brief Parse a duration class from its name or representative label
 *
 * Accepts "short", "Medium", "10 min", "1 day", "50 years", ...
 */
DurationClass parse_duration_class(const std::string& text);

} // namespace glasscheck
