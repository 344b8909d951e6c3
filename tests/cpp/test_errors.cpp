/**
 * @file test_errors.cpp
 * @brief Tests for DesignError, DesignException and the warning list
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "glasscheck/errors.hpp"
#include "glasscheck/warnings.hpp"

using namespace glasscheck;
using Catch::Matchers::ContainsSubstring;

// =============================================================================
// DesignError
// =============================================================================

TEST_CASE("DesignError: default is OK", "[Errors][error]") {
    DesignError err;
    REQUIRE(err.is_ok());
    REQUIRE_FALSE(err.is_error());
    REQUIRE(err.to_string() == "OK");
}

TEST_CASE("DesignError: codes keep their numeric ranges", "[Errors][error]") {
    REQUIRE(static_cast<int>(ErrorCode::UNKNOWN_PRODUCT) == 100);
    REQUIRE(static_cast<int>(ErrorCode::UNSUPPORTED_DURATION_CLASS) == 101);
    REQUIRE(static_cast<int>(ErrorCode::INVALID_STACK_CONFIGURATION) == 200);
    REQUIRE(static_cast<int>(ErrorCode::UNSUPPORTED_COMBINATION) == 300);
    REQUIRE(static_cast<int>(ErrorCode::INVALID_REQUEST) == 400);
    REQUIRE(static_cast<int>(ErrorCode::UNKNOWN_ERROR) == 999);
}

TEST_CASE("DesignError: factories set code and details", "[Errors][error]") {
    DesignError unknown = DesignError::unknown_product("PVB-X");
    REQUIRE(unknown.code == ErrorCode::UNKNOWN_PRODUCT);
    REQUIRE(unknown.details.at("product") == "PVB-X");
    REQUIRE_FALSE(unknown.suggestion.empty());

    DesignError duration = DesignError::unsupported_duration("PVB-A", "Long");
    REQUIRE(duration.code == ErrorCode::UNSUPPORTED_DURATION_CLASS);
    REQUIRE(duration.details.at("duration") == "Long");

    REQUIRE(DesignError::invalid_stack("x").code == ErrorCode::INVALID_STACK_CONFIGURATION);
    REQUIRE(DesignError::unsupported_combination("IStructE", "x").code ==
            ErrorCode::UNSUPPORTED_COMBINATION);
    REQUIRE(DesignError::invalid_request("x").code == ErrorCode::INVALID_REQUEST);

    DesignError table = DesignError::invalid_table("bad row", 7);
    REQUIRE(table.code == ErrorCode::INVALID_TABLE_FORMAT);
    REQUIRE(table.details.at("line") == "7");
    REQUIRE(DesignError::invalid_table("empty").details.count("line") == 0);
}

TEST_CASE("DesignError: to_string includes load case and details", "[Errors][error]") {
    DesignError err = DesignError::unknown_product("PVB-X");
    err.load_case_index = 2;

    std::string s = err.to_string();
    REQUIRE_THAT(s, ContainsSubstring("[UNKNOWN_PRODUCT]"));
    REQUIRE_THAT(s, ContainsSubstring("Load case: 2"));
    REQUIRE_THAT(s, ContainsSubstring("product: PVB-X"));
    REQUIRE_THAT(s, ContainsSubstring("Suggestion:"));
}

TEST_CASE("DesignException: carries the error", "[Errors][exception]") {
    try {
        throw DesignException(DesignError::invalid_request("no load cases"));
    } catch (const std::runtime_error& e) {
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("INVALID_REQUEST"));
        const auto* de = dynamic_cast<const DesignException*>(&e);
        REQUIRE(de != nullptr);
        REQUIRE(de->code() == ErrorCode::INVALID_REQUEST);
        REQUIRE_THAT(de->error().message, ContainsSubstring("no load cases"));
    }
}

// =============================================================================
// Warnings
// =============================================================================

TEST_CASE("DesignWarning: out of range warning", "[Errors][warning]") {
    DesignWarning w = DesignWarning::out_of_range("PVB-A", "Short", 90.0, 40.0);
    REQUIRE(w.code == WarningCode::OUT_OF_RANGE_EXTRAPOLATION);
    REQUIRE(w.severity == WarningSeverity::Medium);
    REQUIRE(w.details.at("product") == "PVB-A");
    REQUIRE_THAT(w.to_string(), ContainsSubstring("OUT_OF_RANGE_EXTRAPOLATION"));
}

TEST_CASE("WarningList: counting and summary", "[Errors][warning]") {
    WarningList list;
    REQUIRE_FALSE(list.has_warnings());
    REQUIRE(list.summary() == "No warnings");

    list.add(DesignWarning::out_of_range("PVB-A", "Short", 90.0, 40.0));
    list.add(DesignWarning::utilization_exceeded(1.2));
    list.add(DesignWarning::utilization_exceeded(1.5));

    REQUIRE(list.count() == 3);
    REQUIRE(list.count_by_code(WarningCode::UTILIZATION_EXCEEDED) == 2);
    REQUIRE(list.count_by_severity(WarningSeverity::High) == 2);
    REQUIRE(list.summary() == "3 warning(s): 2 high, 1 medium, 0 low");

    WarningList other;
    other.add(DesignWarning::deflection_exceeded(20.0, 15.0));
    list.append(other);
    REQUIRE(list.count() == 4);

    list.clear();
    REQUIRE(list.count() == 0);
}
