/**
 * @file test_design_calculator.cpp
 * @brief Tests for load case evaluation and the design report
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "glasscheck/design_calculator.hpp"
#include "test_support.hpp"

#include <atomic>
#include <memory>
#include <thread>

using namespace glasscheck;
using glasscheck::testing::error_code_of;
using glasscheck::testing::error_of;
using glasscheck::testing::sample_table;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

DesignRequest monolithic_request(GlassType type, LoadCase lc) {
    DesignRequest req;
    req.stack = LaminateStack::monolithic(10.0, type);
    req.load_cases.push_back(lc);
    return req;
}

DesignRequest laminated_request(double temperature_c) {
    DesignRequest req;
    req.stack = LaminateStack::two_ply(10.0, 10.0, 1.52, "PVB-A", GlassType::HeatStrengthened);
    req.geometry = PanelGeometry(1000.0, 0.0, SupportCondition::TwoEdgeSimplySupported);
    req.load_cases.push_back(LoadCase::pressure("Wind", DurationClass::Short, 1.0, temperature_c));
    return req;
}

} // namespace

// =============================================================================
// Monolithic panes
// =============================================================================

TEST_CASE("DesignStrengthCalculator: monolithic stress case", "[Calculator][monolithic]") {
    DesignStrengthCalculator calc(sample_table());
    DesignReport report = calc.evaluate(monolithic_request(
        GlassType::Toughened, LoadCase::stress("Wind", DurationClass::Short, 50.0, 20.0)));

    REQUIRE(report.results.size() == 1);
    const DesignResult& r = report.governing();

    REQUIRE_FALSE(r.shear_modulus_mpa.has_value());
    REQUIRE_FALSE(r.modulus.has_value());
    REQUIRE_FALSE(r.deflection_mm.has_value());
    REQUIRE(r.bending_thickness_mm == 10.0);
    REQUIRE(r.deflection_thickness_mm == 10.0);
    REQUIRE_THAT(r.design_resistance, WithinRel(87.5, 1e-12));
    REQUIRE(r.characteristic_resistance == 120.0);
    REQUIRE_THAT(r.utilization, WithinRel(50.0 / 87.5, 1e-12));
    REQUIRE(r.unit() == "MPa");
    REQUIRE(r.passes());
    REQUIRE(report.passes());
    REQUIRE(report.warnings.empty());
}

TEST_CASE("DesignStrengthCalculator: monolithic pressure case", "[Calculator][monolithic]") {
    DesignStrengthCalculator calc(sample_table());

    DesignRequest req = monolithic_request(
        GlassType::Annealed, LoadCase::pressure("Wind", DurationClass::Short, 1.0, 20.0));
    req.geometry = PanelGeometry(1000.0, 0.0, SupportCondition::TwoEdgeSimplySupported);

    SECTION("within limits") {
        DesignReport report = calc.evaluate(req);
        const DesignResult& r = report.governing();

        // 25 MPa * 100 mm^2 / (0.75 * 1e6 mm^2 * 1e-3)
        REQUIRE_THAT(r.design_resistance, WithinRel(10.0 / 3.0, 1e-12));
        REQUIRE_THAT(r.utilization, WithinRel(0.3, 1e-12));
        REQUIRE(r.unit() == "kPa");
        REQUIRE_THAT(*r.deflection_mm, WithinRel(0.15625e9 / 7.0e7, 1e-12));
        REQUIRE_THAT(*r.deflection_limit_mm, WithinRel(1000.0 / 65.0, 1e-12));
        REQUIRE(r.warnings.empty());
    }

    SECTION("overloaded") {
        req.load_cases[0].applied_value = 8.0;
        DesignReport report = calc.evaluate(req);
        const DesignResult& r = report.governing();

        REQUIRE_THAT(r.utilization, WithinRel(2.4, 1e-12));
        REQUIRE(*r.deflection_mm > *r.deflection_limit_mm);
        REQUIRE(r.warnings.count_by_code(WarningCode::DEFLECTION_LIMIT_EXCEEDED) == 1);
        REQUIRE(r.warnings.count_by_code(WarningCode::UTILIZATION_EXCEEDED) == 1);
        REQUIRE_FALSE(r.passes());
        REQUIRE_FALSE(report.passes());
        REQUIRE(report.warnings.count() == 2);
    }

    SECTION("utilization warning can be disabled") {
        CalculatorSettings settings;
        settings.warn_on_utilization_exceeded = false;
        settings.deflection_span_ratio = 20.0;
        DesignStrengthCalculator quiet(sample_table(), settings);

        req.load_cases[0].applied_value = 8.0;
        DesignReport report = quiet.evaluate(req);
        REQUIRE(report.warnings.empty());
        REQUIRE_FALSE(report.passes());
    }
}

// =============================================================================
// Laminated panes
// =============================================================================

TEST_CASE("DesignStrengthCalculator: laminated modulus follows temperature",
          "[Calculator][laminated]") {
    DesignStrengthCalculator calc(sample_table());

    DesignResult r20 = calc.evaluate(laminated_request(20.0)).governing();
    DesignResult r30 = calc.evaluate(laminated_request(30.0)).governing();
    DesignResult r40 = calc.evaluate(laminated_request(40.0)).governing();

    REQUIRE(*r20.shear_modulus_mpa == 4.0);
    REQUIRE_THAT(*r30.shear_modulus_mpa, WithinRel(2.0, 1e-12));
    REQUIRE(*r40.shear_modulus_mpa == 1.0);

    // Softer interlayer -> thinner effective section -> lower resistance
    REQUIRE(r20.design_resistance > r30.design_resistance);
    REQUIRE(r30.design_resistance > r40.design_resistance);
    REQUIRE(r20.deflection_thickness_mm > r40.deflection_thickness_mm);

    // Bounded by the layered and monolithic limits
    REQUIRE(r20.bending_thickness_mm > 10.0);
    REQUIRE(r20.bending_thickness_mm < 20.0);
    REQUIRE(r20.ply_design_resistance.size() == 2);
}

TEST_CASE("DesignStrengthCalculator: extrapolated modulus is flagged", "[Calculator][laminated]") {
    DesignStrengthCalculator calc(sample_table());
    DesignReport report = calc.evaluate(laminated_request(90.0));
    const DesignResult& r = report.governing();

    REQUIRE(r.extrapolated);
    REQUIRE(*r.shear_modulus_mpa == 1.0);
    REQUIRE(r.modulus->method == InterpolationMethod::ClampedHigh);
    REQUIRE(report.has_extrapolation());
    REQUIRE(report.warnings.count_by_code(WarningCode::OUT_OF_RANGE_EXTRAPOLATION) == 1);
}

TEST_CASE("DesignStrengthCalculator: weakest ply governs", "[Calculator][laminated]") {
    DesignStrengthCalculator calc(sample_table());

    DesignRequest req;
    req.stack.add_ply(10.0, GlassType::Toughened)
             .add_interlayer(1.52, "PVB-A")
             .add_ply(10.0, GlassType::Annealed);
    req.geometry = PanelGeometry(1000.0, 0.0, SupportCondition::TwoEdgeSimplySupported);
    req.load_cases.push_back(LoadCase::stress("Snow", DurationClass::Short, 20.0, 20.0));

    const DesignResult r = calc.evaluate(req).governing();
    REQUIRE(r.governing_ply == 1);
    REQUIRE_THAT(r.design_resistance, WithinRel(25.0, 1e-12));
    REQUIRE(r.characteristic_resistance == 45.0);
    REQUIRE(r.factors.glass_type == GlassType::Annealed);
    REQUIRE_THAT(r.ply_design_resistance[0], WithinRel(87.5, 1e-12));
}

TEST_CASE("DesignStrengthCalculator: replacing the material table", "[Calculator][laminated]") {
    DesignStrengthCalculator calc(sample_table());
    REQUIRE(*calc.evaluate(laminated_request(20.0)).governing().shear_modulus_mpa == 4.0);

    std::vector<MaterialSample> stiffer = {{"PVB-A", 20.0, DurationClass::Short, 8.0}};
    calc.set_material_table(std::make_shared<MaterialPropertyTable>(stiffer));
    REQUIRE(*calc.evaluate(laminated_request(20.0)).governing().shear_modulus_mpa == 8.0);
    REQUIRE(calc.material_table()->size() == 1);
}

TEST_CASE("DesignStrengthCalculator: table swap during evaluations", "[Calculator][laminated]") {
    auto soft = sample_table();
    std::vector<MaterialSample> stiffer = {{"PVB-A", 20.0, DurationClass::Short, 8.0}};
    std::shared_ptr<const MaterialPropertyTable> stiff =
        std::make_shared<MaterialPropertyTable>(stiffer);

    DesignStrengthCalculator calc(soft);
    const DesignRequest req = laminated_request(20.0);

    std::atomic<bool> done{false};
    std::thread reloader([&] {
        for (int i = 0; i < 200; ++i) {
            calc.set_material_table(i % 2 == 0 ? stiff : soft);
        }
        done = true;
    });

    bool unexpected = false;
    int evaluations = 0;
    while (!done || evaluations < 20) {
        const double g = *calc.evaluate(req).governing().shear_modulus_mpa;
        if (g != 4.0 && g != 8.0) unexpected = true;
        ++evaluations;
    }
    reloader.join();

    REQUIRE_FALSE(unexpected);
}

// =============================================================================
// Multiple load cases
// =============================================================================

TEST_CASE("DesignStrengthCalculator: governing load case", "[Calculator][governing]") {
    DesignStrengthCalculator calc(sample_table());
    DesignRequest req = laminated_request(20.0);

    SECTION("highest utilization wins") {
        req.load_cases.push_back(LoadCase::pressure("Crowd", DurationClass::Medium, 1.0, 20.0));
        req.load_cases.push_back(LoadCase::pressure("Gust", DurationClass::Short, 0.5, 20.0));

        DesignReport report = calc.evaluate(req);
        REQUIRE(report.results.size() == 3);
        REQUIRE(report.governing_index == 1);
        REQUIRE(report.max_utilization() == report.results[1].utilization);
        REQUIRE(report.results[0].load_case.name == "Wind");
    }

    SECTION("ties go to the earliest case") {
        req.load_cases.push_back(req.load_cases[0]);
        DesignReport report = calc.evaluate(req);
        REQUIRE(report.results[0].utilization == report.results[1].utilization);
        REQUIRE(report.governing_index == 0);
    }

    SECTION("first and last cases tie above a lower middle case") {
        DesignRequest stress = monolithic_request(
            GlassType::Toughened, LoadCase::stress("A", DurationClass::Short, 10.0, 20.0));
        stress.load_cases.push_back(LoadCase::stress("B", DurationClass::Short, 5.0, 20.0));
        stress.load_cases.push_back(LoadCase::stress("C", DurationClass::Short, 10.0, 20.0));

        DesignReport report = calc.evaluate(stress);
        REQUIRE(report.results[0].utilization == report.results[2].utilization);
        REQUIRE(report.results[1].utilization < report.results[0].utilization);
        REQUIRE(report.governing_index == 0);
        REQUIRE(report.governing().load_case.name == "A");
    }
}

TEST_CASE("DesignStrengthCalculator: repeated evaluation is identical", "[Calculator][idempotence]") {
    DesignStrengthCalculator calc(sample_table());
    DesignRequest req = laminated_request(27.5);

    req.load_cases.push_back(LoadCase::pressure("Crowd", DurationClass::Medium, 0.8, 35.0));
    req.load_cases.push_back(LoadCase::pressure("Hot", DurationClass::Short, 1.0, 90.0));

    DesignReport a = calc.evaluate(req);
    DesignReport b = calc.evaluate(req);

    REQUIRE(a.governing_index == b.governing_index);
    REQUIRE(a.warnings.count() == b.warnings.count());
    REQUIRE(a.results.size() == b.results.size());
    for (size_t i = 0; i < a.results.size(); ++i) {
        const DesignResult& ra = a.results[i];
        const DesignResult& rb = b.results[i];
        REQUIRE(ra.utilization == rb.utilization);
        REQUIRE(ra.design_resistance == rb.design_resistance);
        REQUIRE(ra.characteristic_resistance == rb.characteristic_resistance);
        REQUIRE(ra.bending_thickness_mm == rb.bending_thickness_mm);
        REQUIRE(ra.deflection_thickness_mm == rb.deflection_thickness_mm);
        REQUIRE(ra.shear_modulus_mpa == rb.shear_modulus_mpa);
        REQUIRE(ra.extrapolated == rb.extrapolated);
        REQUIRE(ra.governing_ply == rb.governing_ply);
        REQUIRE(ra.warnings.count() == rb.warnings.count());
    }
    REQUIRE(a.results[2].extrapolated);
}

TEST_CASE("DesignStrengthCalculator: warnings carry the load case", "[Calculator][warnings]") {
    DesignStrengthCalculator calc(sample_table());
    DesignRequest req = laminated_request(20.0);
    req.load_cases.push_back(LoadCase::pressure("Hot", DurationClass::Short, 1.0, 90.0));

    DesignReport report = calc.evaluate(req);
    REQUIRE(report.results[0].warnings.empty());
    REQUIRE(report.warnings.count() == report.results[1].warnings.count());

    for (const auto& w : report.warnings.warnings) {
        REQUIRE(w.load_case_index == 1);
        REQUIRE(w.details.at("load_case") == "Hot");
    }
}

TEST_CASE("DesignReport: summary", "[Calculator][report]") {
    DesignStrengthCalculator calc(sample_table());
    DesignReport report = calc.evaluate(laminated_request(20.0));

    const std::string text = report.summary();
    REQUIRE_THAT(text, ContainsSubstring("Wind"));
    REQUIRE_THAT(text, ContainsSubstring("* "));
    REQUIRE_THAT(text, ContainsSubstring("PASS"));
    REQUIRE_THAT(text, ContainsSubstring("kPa"));
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("DesignStrengthCalculator: invalid requests", "[Calculator][errors]") {
    DesignStrengthCalculator calc(sample_table());

    SECTION("no material table") {
        DesignStrengthCalculator empty(nullptr);
        DesignError err = error_of([&] { empty.evaluate(laminated_request(20.0)); });
        REQUIRE(err.code == ErrorCode::INVALID_REQUEST);
        REQUIRE(err.load_case_index == -1);
    }

    SECTION("no load cases") {
        DesignRequest req = laminated_request(20.0);
        req.load_cases.clear();
        REQUIRE(error_code_of([&] { calc.evaluate(req); }) == ErrorCode::INVALID_REQUEST);
    }

    SECTION("laminated stack without geometry") {
        DesignRequest req = laminated_request(20.0);
        req.geometry = PanelGeometry();
        DesignError err = error_of([&] { calc.evaluate(req); });
        REQUIRE(err.code == ErrorCode::INVALID_REQUEST);
        REQUIRE(err.load_case_index == -1);
    }

    SECTION("pressure case without geometry") {
        DesignRequest req = monolithic_request(
            GlassType::Annealed, LoadCase::pressure("Wind", DurationClass::Short, 1.0, 20.0));
        DesignError err = error_of([&] { calc.evaluate(req); });
        REQUIRE(err.code == ErrorCode::INVALID_REQUEST);
        REQUIRE(err.load_case_index == 0);
    }

    SECTION("negative applied value") {
        DesignRequest req = monolithic_request(
            GlassType::Annealed, LoadCase::stress("Wind", DurationClass::Short, -1.0, 20.0));
        REQUIRE(error_code_of([&] { calc.evaluate(req); }) == ErrorCode::INVALID_REQUEST);
    }

    SECTION("invalid stack") {
        DesignRequest req = laminated_request(20.0);
        req.stack = LaminateStack();
        REQUIRE(error_code_of([&] { calc.evaluate(req); }) ==
                ErrorCode::INVALID_STACK_CONFIGURATION);
    }
}

TEST_CASE("DesignStrengthCalculator: failing load case aborts the evaluation",
          "[Calculator][errors]") {
    DesignStrengthCalculator calc(sample_table());

    SECTION("unknown interlayer") {
        DesignRequest req = laminated_request(20.0);
        req.stack = LaminateStack::two_ply(10.0, 10.0, 1.52, "EVA-C", GlassType::Annealed);
        DesignError err = error_of([&] { calc.evaluate(req); });
        REQUIRE(err.code == ErrorCode::UNKNOWN_PRODUCT);
        REQUIRE(err.load_case_index == 0);
    }

    SECTION("duration without data in the second case") {
        DesignRequest req = laminated_request(20.0);
        req.load_cases.push_back(LoadCase::pressure("Dead", DurationClass::Long, 0.3, 20.0));
        DesignError err = error_of([&] { calc.evaluate(req); });
        REQUIRE(err.code == ErrorCode::UNSUPPORTED_DURATION_CLASS);
        REQUIRE(err.load_case_index == 1);
        REQUIRE(err.details.at("load_case") == "Dead");
    }

    SECTION("unsupported glass and standard") {
        DesignRequest req = monolithic_request(
            GlassType::ChemicallyStrengthened,
            LoadCase::stress("Wind", DurationClass::Short, 10.0, 20.0));
        req.factors.standard = Standard::IStructE;
        DesignError err = error_of([&] { calc.evaluate(req); });
        REQUIRE(err.code == ErrorCode::UNSUPPORTED_COMBINATION);
        REQUIRE(err.load_case_index == 0);
    }
}

// =============================================================================
// Design strength table
// =============================================================================

TEST_CASE("DesignStrengthCalculator: design strength per duration", "[Calculator][table]") {
    DesignStrengthCalculator calc(sample_table());

    auto rows = calc.design_strength_table(FactorInputs{}, GlassType::Annealed);
    REQUIRE(rows.size() == 5);

    const double expected[] = {25.0, 18.5, 13.5, 9.75, 7.25};
    for (size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(rows[i].duration == kAllDurationClasses[i]);
        REQUIRE_THAT(rows[i].design_strength_mpa, WithinRel(expected[i], 1e-12));
    }
    REQUIRE(rows[1].k_mod == 0.74);

    FactorInputs istructe;
    istructe.standard = Standard::IStructE;
    REQUIRE(error_code_of([&] {
        calc.design_strength_table(istructe, GlassType::ChemicallyStrengthened);
    }) == ErrorCode::UNSUPPORTED_COMBINATION);
}
