/**
 * @file test_categories.cpp
 * @brief Tests for categorical inputs and their text parsing
 */

#include <catch2/catch_test_macros.hpp>

#include "glasscheck/categories.hpp"
#include "test_support.hpp"

using namespace glasscheck;
using glasscheck::testing::error_code_of;

TEST_CASE("Categories: duration labels", "[Categories][duration]") {
    REQUIRE(duration_label(DurationClass::Short) == "3 sec");
    REQUIRE(duration_label(DurationClass::Medium) == "10 min");
    REQUIRE(duration_label(DurationClass::Day) == "1 day");
    REQUIRE(duration_label(DurationClass::Long) == "6 months");
    REQUIRE(duration_label(DurationClass::Permanent) == "50 years");
}

TEST_CASE("Categories: duration seconds increase with class", "[Categories][duration]") {
    for (size_t i = 1; i < kAllDurationClasses.size(); ++i) {
        REQUIRE(duration_seconds(kAllDurationClasses[i]) >
                duration_seconds(kAllDurationClasses[i - 1]));
    }
}

TEST_CASE("Categories: duration parsing accepts names and labels", "[Categories][parse]") {
    REQUIRE(parse_duration_class("Short") == DurationClass::Short);
    REQUIRE(parse_duration_class("medium") == DurationClass::Medium);
    REQUIRE(parse_duration_class("3 sec") == DurationClass::Short);
    REQUIRE(parse_duration_class("10 min") == DurationClass::Medium);
    REQUIRE(parse_duration_class("1 day") == DurationClass::Day);
    REQUIRE(parse_duration_class("6 Months") == DurationClass::Long);
    REQUIRE(parse_duration_class("50 years") == DurationClass::Permanent);
}

TEST_CASE("Categories: parsing ignores case and separators", "[Categories][parse]") {
    REQUIRE(parse_glass_type("heat strengthened") == GlassType::HeatStrengthened);
    REQUIRE(parse_glass_type("CHEMICALLY_STRENGTHENED") == GlassType::ChemicallyStrengthened);
    REQUIRE(parse_edge_condition("as-cut") == EdgeCondition::AsCut);
    REQUIRE(parse_surface_profile("Enamelled patterned") == SurfaceProfile::EnamelledPatterned);
    REQUIRE(parse_surface_finish("sand blasted") == SurfaceFinish::SandBlasted);
    REQUIRE(parse_toughening_process("vertical") == TougheningProcess::Vertical);
    REQUIRE(parse_consequence_class("cc3") == ConsequenceClass::CC3);
}

TEST_CASE("Categories: standard titles", "[Categories][parse]") {
    REQUIRE(parse_standard("EN 16612") == Standard::EN16612);
    REQUIRE(parse_standard("IStructE") == Standard::IStructE);
    REQUIRE(parse_standard("IStructE Structural Use of Glass in Buildings") == Standard::IStructE);
}

TEST_CASE("Categories: unknown text is rejected", "[Categories][parse]") {
    REQUIRE(error_code_of([] { parse_glass_type("laminated"); }) == ErrorCode::INVALID_REQUEST);
    REQUIRE(error_code_of([] { parse_duration_class("2 weeks"); }) == ErrorCode::INVALID_REQUEST);
    REQUIRE(error_code_of([] { parse_standard("ASTM E1300"); }) == ErrorCode::INVALID_REQUEST);
    REQUIRE(error_code_of([] { parse_edge_condition(""); }) == ErrorCode::INVALID_REQUEST);
}

TEST_CASE("Categories: round trip through to_string", "[Categories][parse]") {
    for (DurationClass d : kAllDurationClasses) {
        REQUIRE(parse_duration_class(to_string(d)) == d);
        REQUIRE(parse_duration_class(duration_label(d)) == d);
    }
    REQUIRE(parse_surface_profile(to_string(SurfaceProfile::PatternedWired)) ==
            SurfaceProfile::PatternedWired);
}

TEST_CASE("Categories: prestressed glass types", "[Categories][glass]") {
    REQUIRE_FALSE(is_prestressed(GlassType::Annealed));
    REQUIRE(is_prestressed(GlassType::HeatStrengthened));
    REQUIRE(is_prestressed(GlassType::Toughened));
    REQUIRE(is_prestressed(GlassType::ChemicallyStrengthened));
}
