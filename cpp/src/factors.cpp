#include "glasscheck/factors.hpp"
#include "glasscheck/errors.hpp"

#include <algorithm>

namespace glasscheck {

namespace {

// Upper bound of k_mod in both standards
constexpr double kDurationFactorCap = 1.0;

bool is_wired(SurfaceProfile profile) {
    return profile == SurfaceProfile::PolishedWired ||
           profile == SurfaceProfile::PatternedWired;
}

} // namespace

std::string to_string(CombinationStep step) {
    switch (step) {
        case CombinationStep::StartFromAnnealedStrength: return "StartFromAnnealedStrength";
        case CombinationStep::ApplyDurationFactor: return "ApplyDurationFactor";
        case CombinationStep::ApplySurfaceFactors: return "ApplySurfaceFactors";
        case CombinationStep::ApplyEdgeFactor: return "ApplyEdgeFactor";
        case CombinationStep::DivideByAnnealedMaterialFactor: return "DivideByAnnealedMaterialFactor";
        case CombinationStep::AddPrestressContribution: return "AddPrestressContribution";
    }
    return "unknown";
}

std::vector<CombinationStep> combination_sequence(Standard standard) {
    switch (standard) {
        case Standard::EN16612:
            return {CombinationStep::StartFromAnnealedStrength,
                    CombinationStep::ApplyDurationFactor,
                    CombinationStep::ApplySurfaceFactors,
                    CombinationStep::ApplyEdgeFactor,
                    CombinationStep::DivideByAnnealedMaterialFactor,
                    CombinationStep::AddPrestressContribution};
        case Standard::IStructE:
            return {CombinationStep::StartFromAnnealedStrength,
                    CombinationStep::ApplyDurationFactor,
                    CombinationStep::ApplySurfaceFactors,
                    CombinationStep::DivideByAnnealedMaterialFactor,
                    CombinationStep::AddPrestressContribution,
                    CombinationStep::ApplyEdgeFactor};
    }
    throw DesignException(DesignError::invalid_request("unknown standard"));
}

StrengthTrace apply_combination(const FactorSet& factors) {
    StrengthTrace trace;
    double acc = 0.0;

    for (CombinationStep step : combination_sequence(factors.standard)) {
        switch (step) {
            case CombinationStep::StartFromAnnealedStrength:
                acc = factors.f_gk;
                break;
            case CombinationStep::ApplyDurationFactor:
                acc *= factors.k_mod;
                break;
            case CombinationStep::ApplySurfaceFactors:
                acc *= factors.k_sp_total();
                break;
            case CombinationStep::ApplyEdgeFactor:
                acc *= factors.k_e;
                break;
            case CombinationStep::DivideByAnnealedMaterialFactor:
                acc /= factors.gamma_MA;
                break;
            case CombinationStep::AddPrestressContribution:
                if (!factors.prestressed()) {
                    continue;
                }
                acc += factors.k_v * (factors.f_bk - factors.f_gk) / *factors.gamma_Mv;
                break;
        }
        trace.steps.emplace_back(step, acc);
    }

    trace.design_strength_mpa = acc;
    return trace;
}

// =============================================================================
// Coefficient tables
// =============================================================================

double FactorResolver::characteristic_strength(GlassType glass_type) {
    switch (glass_type) {
        case GlassType::Annealed: return 45.0;
        case GlassType::HeatStrengthened: return 70.0;
        case GlassType::Toughened: return 120.0;
        case GlassType::ChemicallyStrengthened: return 150.0;
    }
    return kAnnealedCharacteristicStrength;
}

double FactorResolver::duration_factor(Standard /*standard*/, DurationClass duration) {
    // 0.663 t^(-1/16) at the representative duration, rounded as tabulated
    double k_mod = 1.0;
    switch (duration) {
        case DurationClass::Short: k_mod = 1.00; break;
        case DurationClass::Medium: k_mod = 0.74; break;
        case DurationClass::Day: k_mod = 0.54; break;
        case DurationClass::Long: k_mod = 0.39; break;
        case DurationClass::Permanent: k_mod = 0.29; break;
    }
    return std::min(k_mod, kDurationFactorCap);
}

double FactorResolver::surface_profile_factor(SurfaceProfile profile) {
    switch (profile) {
        case SurfaceProfile::Float:
        case SurfaceProfile::DrawnSheet:
        case SurfaceProfile::Enamelled:
            return 1.0;
        case SurfaceProfile::Patterned:
        case SurfaceProfile::EnamelledPatterned:
            return 0.75;
        case SurfaceProfile::PolishedWired:
        case SurfaceProfile::PatternedWired:
            return 0.6;
    }
    return 1.0;
}

double FactorResolver::surface_finish_factor(SurfaceFinish finish) {
    switch (finish) {
        case SurfaceFinish::None: return 1.0;
        case SurfaceFinish::SandBlasted: return 0.6;
        case SurfaceFinish::AcidEtched: return 1.0;
    }
    return 1.0;
}

double FactorResolver::toughening_factor(TougheningProcess process) {
    switch (process) {
        case TougheningProcess::Horizontal: return 1.0;
        case TougheningProcess::Vertical: return 0.6;
    }
    return 1.0;
}

double FactorResolver::edge_factor(EdgeCondition edge) {
    switch (edge) {
        case EdgeCondition::Polished: return 1.0;
        case EdgeCondition::Ground: return 0.9;
        case EdgeCondition::Arrissed: return 0.8;
        case EdgeCondition::AsCut: return 0.8;
    }
    return 1.0;
}

double FactorResolver::annealed_material_factor(Standard standard) {
    return standard == Standard::IStructE ? 1.6 : 1.8;
}

double FactorResolver::prestress_material_factor(Standard /*standard*/) {
    return 1.2;
}

double FactorResolver::consequence_factor(ConsequenceClass cc) {
    switch (cc) {
        case ConsequenceClass::CC1: return 0.9;
        case ConsequenceClass::CC2: return 1.0;
        case ConsequenceClass::CC3: return 1.1;
    }
    return 1.0;
}

// =============================================================================
// Resolution
// =============================================================================

std::string FactorResolver::unsupported_reason(const FactorInputs& inputs,
                                               GlassType glass_type) const {
    if (inputs.standard == Standard::IStructE &&
        glass_type == GlassType::ChemicallyStrengthened) {
        return "chemically strengthened glass is not covered";
    }
    if (is_wired(inputs.surface_profile) && is_prestressed(glass_type)) {
        return "wired glass cannot be " + to_string(glass_type);
    }
    return "";
}

FactorSet FactorResolver::resolve_factors(const FactorInputs& inputs,
                                          GlassType glass_type,
                                          DurationClass duration) const {
    const std::string reason = unsupported_reason(inputs, glass_type);
    if (!reason.empty()) {
        DesignError err = DesignError::unsupported_combination(to_string(inputs.standard), reason);
        err.details["glass_type"] = to_string(glass_type);
        err.details["surface_profile"] = to_string(inputs.surface_profile);
        throw DesignException(err);
    }

    FactorSet f;
    f.standard = inputs.standard;
    f.glass_type = glass_type;
    f.duration = duration;

    f.f_gk = kAnnealedCharacteristicStrength;
    f.f_bk = characteristic_strength(glass_type);
    f.k_mod = duration_factor(inputs.standard, duration);
    f.k_sp = surface_profile_factor(inputs.surface_profile);
    f.k_sp_finish = surface_finish_factor(inputs.surface_finish);
    f.k_e = edge_factor(inputs.edge);
    f.k_fi = consequence_factor(inputs.consequence);
    f.gamma_MA = annealed_material_factor(inputs.standard) * f.k_fi;

    if (is_prestressed(glass_type)) {
        f.k_v = toughening_factor(inputs.toughening);
        f.gamma_Mv = prestress_material_factor(inputs.standard) * f.k_fi;
    } else {
        f.k_v = 1.0;
        f.gamma_Mv.reset();
    }
    return f;
}

} // namespace glasscheck
