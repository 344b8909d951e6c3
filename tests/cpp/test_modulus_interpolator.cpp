/**
 * @file test_modulus_interpolator.cpp
 * @brief Tests for temperature interpolation of interlayer shear modulus
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "glasscheck/modulus_interpolator.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>

using namespace glasscheck;
using glasscheck::testing::error_code_of;
using glasscheck::testing::sample_data;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

struct InterpolatorFixture {
    MaterialPropertyTable table{sample_data()};
    ModulusInterpolator interp{table};
};

// =============================================================================
// Sampled points
// =============================================================================

TEST_CASE("ModulusInterpolator: exact match returns stored value", "[Interpolator][exact]") {
    InterpolatorFixture f;

    for (const auto& s : sample_data()) {
        ModulusEstimate est = f.interp.interpolate(s.product_id, s.temperature_c, s.duration);
        REQUIRE(est.shear_modulus_mpa == s.shear_modulus_mpa);
        REQUIRE(est.method == InterpolationMethod::Exact);
        REQUIRE_FALSE(est.extrapolated);
        REQUIRE(est.used_temperature_c == s.temperature_c);
    }
}

TEST_CASE("ModulusInterpolator: single sample duration is exact only", "[Interpolator][exact]") {
    InterpolatorFixture f;
    REQUIRE(f.interp.shear_modulus("PVB-A", 20.0, DurationClass::Day) == 0.5);

    WarningList warnings;
    ModulusEstimate est = f.interp.interpolate("PVB-A", 25.0, DurationClass::Day, &warnings);
    REQUIRE(est.extrapolated);
    REQUIRE(est.shear_modulus_mpa == 0.5);
}

// =============================================================================
// Interpolation
// =============================================================================

TEST_CASE("ModulusInterpolator: geometric midpoint", "[Interpolator][interpolate]") {
    InterpolatorFixture f;

    // 20 °C -> 4.0 MPa, 40 °C -> 1.0 MPa
    ModulusEstimate est = f.interp.interpolate("PVB-A", 30.0, DurationClass::Short);
    REQUIRE(est.method == InterpolationMethod::Interpolated);
    REQUIRE_FALSE(est.extrapolated);
    REQUIRE_THAT(est.shear_modulus_mpa, WithinRel(2.0, 1e-12));
    REQUIRE(est.shear_modulus_mpa > 1.0);
    REQUIRE(est.shear_modulus_mpa < 4.0);
}

TEST_CASE("ModulusInterpolator: interpolated value lies between neighbours",
          "[Interpolator][interpolate]") {
    InterpolatorFixture f;

    for (double t = 0.5; t < 40.0; t += 0.5) {
        if (t == 20.0) continue;
        const double g = f.interp.shear_modulus("PVB-A", t, DurationClass::Short);
        const double lo = t < 20.0 ? 4.0 : 1.0;
        const double hi = t < 20.0 ? 100.0 : 4.0;
        REQUIRE(g > lo);
        REQUIRE(g < hi);
    }
}

TEST_CASE("ModulusInterpolator: decreasing data gives decreasing modulus",
          "[Interpolator][interpolate]") {
    InterpolatorFixture f;

    double previous = f.interp.shear_modulus("ION-B", 20.0, DurationClass::Short);
    for (double t = 21.0; t <= 50.0; t += 1.0) {
        const double g = f.interp.shear_modulus("ION-B", t, DurationClass::Short);
        REQUIRE(g < previous);
        previous = g;
    }
}

TEST_CASE("ModulusInterpolator: log-linear formula", "[Interpolator][interpolate]") {
    REQUIRE_THAT(ModulusInterpolator::log_linear(0.0, 100.0, 20.0, 4.0, 10.0),
                 WithinRel(20.0, 1e-12));
    REQUIRE_THAT(ModulusInterpolator::log_linear(20.0, 4.0, 40.0, 1.0, 25.0),
                 WithinRel(4.0 * std::pow(0.25, 0.25), 1e-12));
    REQUIRE(ModulusInterpolator::log_linear(20.0, 4.0, 40.0, 1.0, 20.0) == 4.0);
    REQUIRE(ModulusInterpolator::log_linear(20.0, 4.0, 40.0, 1.0, 40.0) == 1.0);
}

TEST_CASE("ModulusInterpolator: zero endpoint", "[Interpolator][interpolate]") {
    REQUIRE(ModulusInterpolator::log_linear(60.0, 0.5, 80.0, 0.0, 70.0) == 0.0);
}

TEST_CASE("ModulusInterpolator: durations are never mixed", "[Interpolator][interpolate]") {
    InterpolatorFixture f;

    // Medium: 20 °C -> 1.2, 40 °C -> 0.3; Short data must not leak in
    const double g = f.interp.shear_modulus("PVB-A", 30.0, DurationClass::Medium);
    REQUIRE_THAT(g, WithinRel(std::sqrt(1.2 * 0.3), 1e-12));
}

TEST_CASE("ModulusInterpolator: repeated queries are identical", "[Interpolator][idempotence]") {
    InterpolatorFixture f;

    const double a = f.interp.shear_modulus("PVB-A", 27.3, DurationClass::Short);
    const double b = f.interp.shear_modulus("PVB-A", 27.3, DurationClass::Short);
    REQUIRE(a == b);
}

// =============================================================================
// Outside the sampled range
// =============================================================================

TEST_CASE("ModulusInterpolator: above range uses highest sample", "[Interpolator][extrapolation]") {
    InterpolatorFixture f;

    WarningList warnings;
    ModulusEstimate est = f.interp.interpolate("PVB-A", 90.0, DurationClass::Short, &warnings);

    REQUIRE(est.extrapolated);
    REQUIRE(est.method == InterpolationMethod::ClampedHigh);
    REQUIRE(est.shear_modulus_mpa == 1.0);
    REQUIRE(est.used_temperature_c == 40.0);
    REQUIRE(est.query_temperature_c == 90.0);

    REQUIRE(warnings.count_by_code(WarningCode::OUT_OF_RANGE_EXTRAPOLATION) == 1);
    REQUIRE(warnings.warnings[0].details.at("product") == "PVB-A");
}

TEST_CASE("ModulusInterpolator: below range uses lowest sample", "[Interpolator][extrapolation]") {
    InterpolatorFixture f;

    WarningList warnings;
    ModulusEstimate est = f.interp.interpolate("PVB-A", -30.0, DurationClass::Short, &warnings);

    REQUIRE(est.extrapolated);
    REQUIRE(est.method == InterpolationMethod::ClampedLow);
    REQUIRE(est.shear_modulus_mpa == 100.0);
    REQUIRE(warnings.count() == 1);
}

TEST_CASE("ModulusInterpolator: extrapolation without warning list", "[Interpolator][extrapolation]") {
    InterpolatorFixture f;
    REQUIRE(f.interp.shear_modulus("ION-B", 100.0, DurationClass::Short) == 30.0);
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("ModulusInterpolator: unknown product", "[Interpolator][errors]") {
    InterpolatorFixture f;
    REQUIRE(error_code_of([&] { f.interp.interpolate("EVA-C", 20.0, DurationClass::Short); }) ==
            ErrorCode::UNKNOWN_PRODUCT);
}

TEST_CASE("ModulusInterpolator: duration without samples", "[Interpolator][errors]") {
    InterpolatorFixture f;
    REQUIRE(error_code_of([&] { f.interp.interpolate("PVB-A", 20.0, DurationClass::Long); }) ==
            ErrorCode::UNSUPPORTED_DURATION_CLASS);
    REQUIRE(error_code_of([&] { f.interp.interpolate("ION-B", 20.0, DurationClass::Medium); }) ==
            ErrorCode::UNSUPPORTED_DURATION_CLASS);
}

TEST_CASE("ModulusInterpolator: non-finite temperature", "[Interpolator][errors]") {
    InterpolatorFixture f;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    REQUIRE(error_code_of([&] { f.interp.interpolate("PVB-A", nan, DurationClass::Short); }) ==
            ErrorCode::INVALID_REQUEST);
    REQUIRE(error_code_of([&] { f.interp.interpolate("PVB-A", inf, DurationClass::Short); }) ==
            ErrorCode::INVALID_REQUEST);
}
