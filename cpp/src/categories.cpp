#include "glasscheck/categories.hpp"
#include "glasscheck/errors.hpp"

#include <algorithm>
#include <cctype>

namespace glasscheck {

namespace {

// Lower-case and drop separators so "Heat strengthened", "heat_strengthened"
// and "HeatStrengthened" compare equal.
std::string normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || c == '-' || c == '_') continue;
        out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

template <typename Enum, size_t N>
Enum parse_enum(const std::string& text, const std::array<Enum, N>& values,
                const char* what) {
    const std::string key = normalize(text);
    for (Enum value : values) {
        if (normalize(to_string(value)) == key) {
            return value;
        }
    }
    DesignError err = DesignError::invalid_request(
        std::string("unknown ") + what + " '" + text + "'");
    err.details["field"] = what;
    throw DesignException(err);
}

} // namespace

std::string to_string(Standard standard) {
    switch (standard) {
        case Standard::EN16612: return "EN16612";
        case Standard::IStructE: return "IStructE";
    }
    return "unknown";
}

std::string to_string(GlassType type) {
    switch (type) {
        case GlassType::Annealed: return "Annealed";
        case GlassType::HeatStrengthened: return "HeatStrengthened";
        case GlassType::Toughened: return "Toughened";
        case GlassType::ChemicallyStrengthened: return "ChemicallyStrengthened";
    }
    return "unknown";
}

std::string to_string(EdgeCondition edge) {
    switch (edge) {
        case EdgeCondition::Polished: return "Polished";
        case EdgeCondition::Ground: return "Ground";
        case EdgeCondition::Arrissed: return "Arrissed";
        case EdgeCondition::AsCut: return "AsCut";
    }
    return "unknown";
}

std::string to_string(SurfaceProfile profile) {
    switch (profile) {
        case SurfaceProfile::Float: return "Float";
        case SurfaceProfile::DrawnSheet: return "DrawnSheet";
        case SurfaceProfile::Enamelled: return "Enamelled";
        case SurfaceProfile::Patterned: return "Patterned";
        case SurfaceProfile::EnamelledPatterned: return "EnamelledPatterned";
        case SurfaceProfile::PolishedWired: return "PolishedWired";
        case SurfaceProfile::PatternedWired: return "PatternedWired";
    }
    return "unknown";
}

std::string to_string(SurfaceFinish finish) {
    switch (finish) {
        case SurfaceFinish::None: return "None";
        case SurfaceFinish::SandBlasted: return "SandBlasted";
        case SurfaceFinish::AcidEtched: return "AcidEtched";
    }
    return "unknown";
}

std::string to_string(TougheningProcess process) {
    switch (process) {
        case TougheningProcess::Horizontal: return "Horizontal";
        case TougheningProcess::Vertical: return "Vertical";
    }
    return "unknown";
}

std::string to_string(ConsequenceClass cc) {
    switch (cc) {
        case ConsequenceClass::CC1: return "CC1";
        case ConsequenceClass::CC2: return "CC2";
        case ConsequenceClass::CC3: return "CC3";
    }
    return "unknown";
}

std::string to_string(DurationClass duration) {
    switch (duration) {
        case DurationClass::Short: return "Short";
        case DurationClass::Medium: return "Medium";
        case DurationClass::Day: return "Day";
        case DurationClass::Long: return "Long";
        case DurationClass::Permanent: return "Permanent";
    }
    return "unknown";
}

std::string duration_label(DurationClass duration) {
    switch (duration) {
        case DurationClass::Short: return "3 sec";
        case DurationClass::Medium: return "10 min";
        case DurationClass::Day: return "1 day";
        case DurationClass::Long: return "6 months";
        case DurationClass::Permanent: return "50 years";
    }
    return "unknown";
}

double duration_seconds(DurationClass duration) {
    switch (duration) {
        case DurationClass::Short: return 3.0;
        case DurationClass::Medium: return 600.0;
        case DurationClass::Day: return 86400.0;
        case DurationClass::Long: return 0.5 * 365.0 * 86400.0;
        case DurationClass::Permanent: return 50.0 * 365.0 * 86400.0;
    }
    return 0.0;
}

Standard parse_standard(const std::string& text) {
    // Accept the full document titles used by the original input forms
    const std::string key = normalize(text);
    if (key == "en16612") return Standard::EN16612;
    if (key.rfind("istructe", 0) == 0) return Standard::IStructE;
    return parse_enum(text, std::array<Standard, 2>{Standard::EN16612, Standard::IStructE},
                      "standard");
}

GlassType parse_glass_type(const std::string& text) {
    return parse_enum(text, std::array<GlassType, 4>{
        GlassType::Annealed, GlassType::HeatStrengthened,
        GlassType::Toughened, GlassType::ChemicallyStrengthened}, "glass type");
}

EdgeCondition parse_edge_condition(const std::string& text) {
    return parse_enum(text, std::array<EdgeCondition, 4>{
        EdgeCondition::Polished, EdgeCondition::Ground,
        EdgeCondition::Arrissed, EdgeCondition::AsCut}, "edge condition");
}

SurfaceProfile parse_surface_profile(const std::string& text) {
    return parse_enum(text, std::array<SurfaceProfile, 7>{
        SurfaceProfile::Float, SurfaceProfile::DrawnSheet, SurfaceProfile::Enamelled,
        SurfaceProfile::Patterned, SurfaceProfile::EnamelledPatterned,
        SurfaceProfile::PolishedWired, SurfaceProfile::PatternedWired}, "surface profile");
}

SurfaceFinish parse_surface_finish(const std::string& text) {
    return parse_enum(text, std::array<SurfaceFinish, 3>{
        SurfaceFinish::None, SurfaceFinish::SandBlasted, SurfaceFinish::AcidEtched},
        "surface finish");
}

TougheningProcess parse_toughening_process(const std::string& text) {
    return parse_enum(text, std::array<TougheningProcess, 2>{
        TougheningProcess::Horizontal, TougheningProcess::Vertical}, "toughening process");
}

ConsequenceClass parse_consequence_class(const std::string& text) {
    return parse_enum(text, std::array<ConsequenceClass, 3>{
        ConsequenceClass::CC1, ConsequenceClass::CC2, ConsequenceClass::CC3},
        "consequence class");
}

DurationClass parse_duration_class(const std::string& text) {
    const std::string key = normalize(text);
    for (DurationClass duration : kAllDurationClasses) {
        if (normalize(duration_label(duration)) == key) {
            return duration;
        }
    }
    return parse_enum(text, kAllDurationClasses, "duration class");
}

} // namespace glasscheck
