#include "glasscheck/design_calculator.hpp"
#include "glasscheck/errors.hpp"
#include "glasscheck/logging.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace glasscheck {

// =============================================================================
// DesignReport
// =============================================================================

bool DesignReport::passes() const {
    for (const auto& r : results) {
        if (!r.passes()) return false;
    }
    return true;
}

bool DesignReport::has_extrapolation() const {
    for (const auto& r : results) {
        if (r.extrapolated) return true;
    }
    return false;
}

double DesignReport::max_utilization() const {
    return results.empty() ? 0.0 : governing().utilization;
}

std::string DesignReport::summary() const {
    std::ostringstream oss;
    oss << "Standard: " << to_string(standard) << "\n";
    oss << std::fixed;
    for (size_t i = 0; i < results.size(); ++i) {
        const DesignResult& r = results[i];
        oss << (i == governing_index ? "* " : "  ")
            << r.load_case.name << " (" << duration_label(r.load_case.duration)
            << ", " << std::setprecision(1) << r.load_case.temperature_c << " C): "
            << std::setprecision(2) << r.load_case.applied_value << " / "
            << r.design_resistance << " " << r.unit()
            << ", utilization " << std::setprecision(3) << r.utilization
            << (r.passes() ? "" : " FAIL")
            << (r.extrapolated ? " [extrapolated]" : "") << "\n";
    }
    oss << (passes() ? "PASS" : "FAIL") << ", " << warnings.summary();
    return oss.str();
}

// =============================================================================
// DesignStrengthCalculator
// =============================================================================

DesignStrengthCalculator::DesignStrengthCalculator(
    std::shared_ptr<const MaterialPropertyTable> table, Settings settings)
    : table_(std::move(table)), settings_(settings) {}

void DesignStrengthCalculator::set_material_table(
    std::shared_ptr<const MaterialPropertyTable> table) {
    const size_t size = table ? table->size() : 0;
    std::atomic_store(&table_, std::move(table));
    logger()->info("Material table replaced ({} samples)", size);
}

void DesignStrengthCalculator::validate_request(const DesignRequest& request,
                                                const MaterialPropertyTable* table) const {
    if (!table) {
        throw DesignException(DesignError::invalid_request("no material table loaded"));
    }
    if (request.load_cases.empty()) {
        throw DesignException(DesignError::invalid_request("no load cases"));
    }

    request.stack.validate();

    if (!request.stack.is_monolithic() && !request.has_geometry()) {
        DesignError err = DesignError::invalid_request("laminated stack requires panel geometry");
        err.suggestion = "Set the span (and width for four-edge support) of the pane.";
        throw DesignException(err);
    }
}

DesignResult DesignStrengthCalculator::evaluate_load_case(const DesignRequest& request,
                                                          const MaterialPropertyTable& table,
                                                          size_t index) const {
    const LoadCase& lc = request.load_cases[index];
    lc.validate();

    const bool pressure = lc.kind == ActionKind::UniformPressure;
    if (pressure && !request.has_geometry()) {
        throw DesignException(DesignError::invalid_request("pressure load case requires panel geometry"));
    }

    DesignResult result;
    result.load_case = lc;

    // Interlayer modulus and effective thickness
    if (request.stack.is_monolithic()) {
        result.effective_thickness =
            thickness_resolver_.resolve(request.stack, 0.0, request.geometry);
    } else {
        ModulusInterpolator interpolator(table);
        ModulusEstimate estimate = interpolator.interpolate(
            request.stack.interlayer_product(), lc.temperature_c, lc.duration, &result.warnings);
        result.shear_modulus_mpa = estimate.shear_modulus_mpa;
        result.extrapolated = estimate.extrapolated;
        result.modulus = estimate;
        result.effective_thickness = thickness_resolver_.resolve(
            request.stack, estimate.shear_modulus_mpa, request.geometry);
    }
    result.bending_thickness_mm = result.effective_thickness.bending_mm();
    result.deflection_thickness_mm = result.effective_thickness.deflection_mm;

    // Strength and resistance per ply; the smallest design resistance governs
    const auto plies = request.stack.plies();
    for (size_t p = 0; p < plies.size(); ++p) {
        FactorSet factors = factor_resolver_.resolve_factors(
            request.factors, plies[p].glass_type, lc.duration);
        StrengthTrace trace = apply_combination(factors);

        double characteristic = factors.f_bk;
        double design = trace.design_strength_mpa;
        if (pressure) {
            const double h = result.effective_thickness.ply_bending_mm(p);
            characteristic = request.geometry.pressure_capacity(characteristic, h);
            design = request.geometry.pressure_capacity(design, h);
        }
        result.ply_design_resistance.push_back(design);

        if (p == 0 || characteristic < result.characteristic_resistance) {
            result.characteristic_resistance = characteristic;
        }
        if (p == 0 || design < result.design_resistance) {
            result.design_resistance = design;
            result.governing_ply = p;
            result.factors = factors;
            result.strength_trace = std::move(trace);
        }
    }

    result.utilization = lc.applied_value / result.design_resistance;

    if (pressure) {
        const double deflection = request.geometry.deflection(
            lc.applied_value, result.deflection_thickness_mm, thickness_resolver_.youngs_modulus());
        const double limit = request.geometry.characteristic_span() / settings_.deflection_span_ratio;
        result.deflection_mm = deflection;
        result.deflection_limit_mm = limit;
        if (deflection > limit) {
            result.warnings.add(DesignWarning::deflection_exceeded(deflection, limit));
        }
    }

    if (settings_.warn_on_utilization_exceeded && result.utilization > 1.0) {
        result.warnings.add(DesignWarning::utilization_exceeded(result.utilization));
    }

    for (auto& w : result.warnings.warnings) {
        w.load_case_index = static_cast<int>(index);
        w.details["load_case"] = lc.name;
    }

    logger()->debug("Load case {} '{}': f_g;d = {:.2f} MPa, resistance {:.3f} {}, utilization {:.3f}",
                    index, lc.name, result.strength_trace.design_strength_mpa,
                    result.design_resistance, lc.unit(), result.utilization);
    return result;
}

DesignReport DesignStrengthCalculator::evaluate(const DesignRequest& request) const {
    // Keep the table alive for the whole evaluation even if it is swapped
    std::shared_ptr<const MaterialPropertyTable> table = std::atomic_load(&table_);

    try {
        validate_request(request, table.get());
    } catch (const DesignException& e) {
        logger()->error("Design request rejected: {}", e.error().message);
        throw;
    }

    logger()->debug("Evaluating {} load case(s) for {} to {}",
                    request.load_cases.size(), request.stack.description(),
                    to_string(request.factors.standard));

    DesignReport report;
    report.standard = request.factors.standard;
    report.results.reserve(request.load_cases.size());

    for (size_t i = 0; i < request.load_cases.size(); ++i) {
        try {
            report.results.push_back(evaluate_load_case(request, *table, i));
        } catch (const DesignException& e) {
            DesignError err = e.error();
            err.load_case_index = static_cast<int>(i);
            err.details["load_case"] = request.load_cases[i].name;
            logger()->error("Load case {} '{}' failed: {}", i, request.load_cases[i].name,
                            err.message);
            throw DesignException(err);
        }
        report.warnings.append(report.results.back().warnings);
    }

    report.governing_index = 0;
    for (size_t i = 1; i < report.results.size(); ++i) {
        if (report.results[i].utilization > report.results[report.governing_index].utilization) {
            report.governing_index = i;
        }
    }

    const DesignResult& gov = report.governing();
    logger()->info("Evaluated {} load case(s): governing '{}' utilization {:.3f} ({})",
                   report.results.size(), gov.load_case.name, gov.utilization,
                   report.passes() ? "pass" : "fail");
    return report;
}

std::vector<DesignStrengthRow> DesignStrengthCalculator::design_strength_table(
    const FactorInputs& inputs, GlassType glass_type) const {
    std::vector<DesignStrengthRow> rows;
    rows.reserve(kAllDurationClasses.size());
    for (DurationClass duration : kAllDurationClasses) {
        FactorSet factors = factor_resolver_.resolve_factors(inputs, glass_type, duration);
        rows.push_back({duration, factors.k_mod, apply_combination(factors).design_strength_mpa});
    }
    return rows;
}

} // namespace glasscheck
