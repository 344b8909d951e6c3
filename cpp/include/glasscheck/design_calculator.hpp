#pragma once

#include "glasscheck/categories.hpp"
#include "glasscheck/effective_thickness.hpp"
#include "glasscheck/factors.hpp"
#include "glasscheck/laminate.hpp"
#include "glasscheck/load_case.hpp"
#include "glasscheck/material.hpp"
#include "glasscheck/modulus_interpolator.hpp"
#include "glasscheck/panel_geometry.hpp"
#include "glasscheck/warnings.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace glasscheck {

/**
 * @brief Settings for the design strength calculator
 */
struct CalculatorSettings {
    /// Deflection limit as span / ratio for pressure load cases
    double deflection_span_ratio = 65.0;

    /// Add UTILIZATION_EXCEEDED warnings for load cases with utilization > 1
    bool warn_on_utilization_exceeded = true;
};

/**
 * @brief Everything needed to check one pane
 *
 * The interlayer product is taken from the stack. The geometry is only
 * required for laminated stacks and for pressure load cases.
 */
struct DesignRequest {
    std::vector<LoadCase> load_cases;  ///< Evaluated in order
    LaminateStack stack;
    PanelGeometry geometry;
    FactorInputs factors;

    bool has_geometry() const { return geometry.is_valid(); }
};

/**
 * @brief Outcome of one load case
 */
struct DesignResult {
    LoadCase load_case;

    /// Effective thicknesses used for this case
    EffectiveThickness effective_thickness;

    /// Governing stress effective thickness [mm]
    double bending_thickness_mm = 0.0;

    /// Deflection effective thickness [mm]
    double deflection_thickness_mm = 0.0;

    /// Interlayer shear modulus [MPa] (laminated stacks only)
    std::optional<double> shear_modulus_mpa;

    /// Modulus estimate with provenance (laminated stacks only)
    std::optional<ModulusEstimate> modulus;

    /// Factors of the governing ply
    FactorSet factors;

    /// Design strength combination of the governing ply
    StrengthTrace strength_trace;

    /// Design resistance of every ply [MPa or kPa]
    std::vector<double> ply_design_resistance;

    double characteristic_resistance = 0.0;  ///< Minimum over plies [MPa or kPa]
    double design_resistance = 0.0;          ///< Minimum over plies [MPa or kPa]
    double utilization = 0.0;                ///< applied / design resistance
    size_t governing_ply = 0;                ///< Ply with the smallest design resistance

    std::optional<double> deflection_mm;        ///< Pressure cases only
    std::optional<double> deflection_limit_mm;  ///< Pressure cases only

    /// True when the modulus was taken from a boundary sample
    bool extrapolated = false;

    /// Warnings raised by this case
    WarningList warnings;

    bool passes() const { return utilization <= 1.0; }

    /// Unit of resistances and applied value ("MPa" or "kPa")
    std::string unit() const { return load_case.unit(); }
};

/**
 * @brief Results of all load cases and the governing case
 */
struct DesignReport {
    Standard standard = Standard::EN16612;
    std::vector<DesignResult> results;  ///< Same order as the request
    size_t governing_index = 0;         ///< Highest utilization, earliest on ties
    WarningList warnings;               ///< All warnings of all cases

    /**
     * @brief Governing result
     * @throws std::out_of_range if the report is empty
     */
    const DesignResult& governing() const { return results.at(governing_index); }

    /// Whether every load case has utilization <= 1
    bool passes() const;

    /// Whether any load case used an extrapolated modulus
    bool has_extrapolation() const;

    /// Highest utilization over all load cases
    double max_utilization() const;

    /// Multi-line human-readable summary
    std::string summary() const;
};

/**
 * @brief Design strength of one duration class (results table of a glass type)
 */
struct DesignStrengthRow {
    DurationClass duration;
    double k_mod;
    double design_strength_mpa;
};

/**
 * @brief Checks a pane against a list of load cases
 *
 * For each load case: interlayer modulus at the case temperature and
 * duration, effective thickness, factors per ply, design strength and
 * resistance, utilization. The governing case is the one with the highest
 * utilization; ties go to the earliest case.
 *
 * Any fatal error aborts the whole evaluation: evaluate() throws a
 * DesignException whose error carries the failing load case index, and no
 * partial report is returned.
 *
 * evaluate() is const and keeps no state between calls, so one calculator
 * can serve concurrent evaluations. set_material_table() swaps the table
 * pointer atomically; an evaluation already running keeps the table it
 * started with.
 *
 * Usage:
 *   auto table = load_material_table("interlayers.csv");
 *   DesignStrengthCalculator calc(table);
 *
 *   DesignRequest req;
 *   req.stack = LaminateStack::two_ply(10, 10, 1.52, "PVB-A", GlassType::HeatStrengthened);
 *   req.geometry = PanelGeometry(1500, 1000, SupportCondition::FourEdgeSimplySupported);
 *   req.load_cases.push_back(LoadCase::pressure("Wind", DurationClass::Medium, 1.2, 20.0));
 *
 *   DesignReport report = calc.evaluate(req);
 *   double u = report.governing().utilization;
 */
class DesignStrengthCalculator {
public:
    using Settings = CalculatorSettings;

    explicit DesignStrengthCalculator(std::shared_ptr<const MaterialPropertyTable> table,
                                      Settings settings = Settings{});

    /**
     * @brief Evaluate all load cases of a request
     * @throws DesignException on the first fatal error
     */
    DesignReport evaluate(const DesignRequest& request) const;

    /**
     * @brief Design strength f_g;d of a glass type for every duration class
     * @return Rows in duration order (Short ... Permanent)
     * @throws DesignException UNSUPPORTED_COMBINATION
     */
    std::vector<DesignStrengthRow> design_strength_table(const FactorInputs& inputs,
                                                         GlassType glass_type) const;

    /**
     * @brief Replace the material table used by subsequent evaluations
     */
    void set_material_table(std::shared_ptr<const MaterialPropertyTable> table);

    std::shared_ptr<const MaterialPropertyTable> material_table() const {
        return std::atomic_load(&table_);
    }

    const Settings& settings() const { return settings_; }

private:
    void validate_request(const DesignRequest& request,
                          const MaterialPropertyTable* table) const;

    DesignResult evaluate_load_case(const DesignRequest& request,
                                    const MaterialPropertyTable& table,
                                    size_t index) const;

    std::shared_ptr<const MaterialPropertyTable> table_;
    Settings settings_;
    EffectiveThicknessResolver thickness_resolver_;
    FactorResolver factor_resolver_;
};

} // namespace glasscheck
