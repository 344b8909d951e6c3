#pragma once

#include "glasscheck/categories.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace glasscheck {

/// Characteristic bending strength of annealed glass f_g;k [MPa]
constexpr double kAnnealedCharacteristicStrength = 45.0;

/**
 * @brief Categorical inputs shared by all plies of a pane
 */
struct FactorInputs {
    Standard standard = Standard::EN16612;
    EdgeCondition edge = EdgeCondition::Polished;
    SurfaceProfile surface_profile = SurfaceProfile::Float;
    SurfaceFinish surface_finish = SurfaceFinish::None;
    TougheningProcess toughening = TougheningProcess::Horizontal;
    ConsequenceClass consequence = ConsequenceClass::CC2;
};

/**
 * @brief Resolved coefficients for one glass type and duration class
 *
 * The material factors already include the consequence factor K_FI.
 */
struct FactorSet {
    Standard standard = Standard::EN16612;
    GlassType glass_type = GlassType::Annealed;
    DurationClass duration = DurationClass::Short;

    double f_gk = kAnnealedCharacteristicStrength;  ///< Annealed characteristic strength [MPa]
    double f_bk = kAnnealedCharacteristicStrength;  ///< Characteristic strength of the glass type [MPa]

    double k_mod = 1.0;        ///< Load duration factor
    double k_sp = 1.0;         ///< Surface profile factor
    double k_sp_finish = 1.0;  ///< Surface finish factor k'_sp
    double k_v = 1.0;          ///< Toughening process factor
    double k_e = 1.0;          ///< Edge strength factor
    double k_fi = 1.0;         ///< Consequence factor K_FI

    double gamma_MA = 1.8;                ///< Material factor for annealed glass (x K_FI)
    std::optional<double> gamma_Mv;       ///< Material factor for prestress (x K_FI), prestressed only

    /**
     * @brief Combined surface factor k_sp * k'_sp
     */
    double k_sp_total() const { return k_sp * k_sp_finish; }

    bool prestressed() const { return gamma_Mv.has_value(); }
};

/**
 * @brief One step of the design strength combination
 */
enum class CombinationStep {
    StartFromAnnealedStrength,       ///< acc = f_g;k
    ApplyDurationFactor,             ///< acc *= k_mod
    ApplySurfaceFactors,             ///< acc *= k_sp * k'_sp
    ApplyEdgeFactor,                 ///< acc *= k_e
    DivideByAnnealedMaterialFactor,  ///< acc /= gamma_M;A
    AddPrestressContribution         ///< acc += k_v (f_b;k - f_g;k) / gamma_M;v
};

std::string to_string(CombinationStep step);

/**
 * @brief Value of the accumulator after each applied step
 */
struct StrengthTrace {
    /// Design strength f_g;d [MPa]
    double design_strength_mpa = 0.0;

    /// (step, accumulator after the step); skipped steps are absent
    std::vector<std::pair<CombinationStep, double>> steps;
};

/**
 * @brief Ordered combination steps of a standard
 *
 * EN 16612:
 *   f_g;d = k_e k_mod k_sp k'_sp f_g;k / gamma_M;A + k_v (f_b;k - f_g;k) / gamma_M;v
 *
 * IStructE (edge factor applied to the total):
 *   f_g;d = k_e (k_mod k_sp k'_sp f_g;k / gamma_M;A + k_v (f_b;k - f_g;k) / gamma_M;v)
 */
std::vector<CombinationStep> combination_sequence(Standard standard);

/**
 * @brief Run the combination sequence of the factor set's standard
 *
 * The prestress step is skipped for annealed glass.
 */
StrengthTrace apply_combination(const FactorSet& factors);

/**
 * @brief Coefficient lookup for EN 16612 and IStructE
 *
 * Pure table lookups: the resolver has no state and every call with the
 * same inputs returns the same FactorSet.
 *
 * Usage:
 *   FactorResolver resolver;
 *   FactorSet f = resolver.resolve_factors(inputs, GlassType::Toughened, DurationClass::Medium);
 *   double f_gd = apply_combination(f).design_strength_mpa;
 */
class FactorResolver {
public:
    /**
     * @brief Resolve the coefficients for a glass type and duration
     * @throws DesignException UNSUPPORTED_COMBINATION if the standard does
     *         not cover the combination
     */
    FactorSet resolve_factors(const FactorInputs& inputs,
                              GlassType glass_type,
                              DurationClass duration) const;

    /**
     * @brief Check a combination without resolving it
     * @return Empty string if supported, otherwise the reason
     */
    std::string unsupported_reason(const FactorInputs& inputs, GlassType glass_type) const;

    static double characteristic_strength(GlassType glass_type);
    static double duration_factor(Standard standard, DurationClass duration);
    static double surface_profile_factor(SurfaceProfile profile);
    static double surface_finish_factor(SurfaceFinish finish);
    static double toughening_factor(TougheningProcess process);
    static double edge_factor(EdgeCondition edge);
    static double annealed_material_factor(Standard standard);
    static double prestress_material_factor(Standard standard);
    static double consequence_factor(ConsequenceClass cc);
};

} // namespace glasscheck
