/**
 * @file test_decimal.cpp
 * @brief Unit tests for decimal validation and fixed-point reduction.
 */

#include <fracpack/decimal.hpp>

#include <catch2/catch.hpp>

using namespace fracpack;

TEST_CASE("is_valid structural check", "[decimal]") {
    SECTION("accepted") {
        REQUIRE(is_valid("0.02"));
        REQUIRE(is_valid("3300"));
        REQUIRE(is_valid(".5"));
        REQUIRE(is_valid("0."));
        REQUIRE(is_valid("12.75"));
    }

    SECTION("rejected") {
        REQUIRE_FALSE(is_valid("0.034.0"));
        REQUIRE_FALSE(is_valid(".."));
        REQUIRE_FALSE(is_valid("-0.5"));
        REQUIRE_FALSE(is_valid("+0.5"));
        REQUIRE_FALSE(is_valid("0,5"));
        REQUIRE_FALSE(is_valid("0.5e1"));
        REQUIRE_FALSE(is_valid(" 0.5"));
        REQUIRE_FALSE(is_valid("0.5\n"));
    }
}

TEST_CASE("parse_fraction extracts digit count and numerator", "[decimal]") {
    struct Case {
        const char* input;
        std::uint32_t digit_count;
        std::uint32_t numerator;
    };
    const Case cases[] = {
        {"0.12", 2, 12},     {"0.000012", 6, 12},  {"0.0150", 4, 150},
        {"0.1234", 4, 1234}, {"0.00010001", 8, 10001}, {"0.25", 2, 25},
        {"0.0625", 4, 625},  {".5", 1, 5},         {"000.5", 1, 5},
        {"0.0", 1, 0},
    };

    for (const auto& c : cases) {
        DecimalFixedPoint fp;
        REQUIRE(parse_fraction(c.input, fp) == Error::Ok);
        REQUIRE(fp.digit_count == c.digit_count);
        REQUIRE(fp.numerator == c.numerator);
    }
}

TEST_CASE("parse_fraction rejects", "[decimal]") {
    DecimalFixedPoint fp{7, 42};

    SECTION("structurally invalid") {
        REQUIRE(parse_fraction("0.034.0", fp) == Error::InvalidInput);
        REQUIRE(parse_fraction("0.a", fp) == Error::InvalidInput);
    }

    SECTION("no fractional part") {
        REQUIRE(parse_fraction("3300", fp) == Error::InvalidInput);
        REQUIRE(parse_fraction("0.", fp) == Error::InvalidInput);
        REQUIRE(parse_fraction("", fp) == Error::InvalidInput);
    }

    SECTION("integer part not zero") {
        REQUIRE(parse_fraction("1.5", fp) == Error::InvalidInput);
        REQUIRE(parse_fraction("10.0", fp) == Error::InvalidInput);
    }

    SECTION("too many fractional digits") {
        REQUIRE(parse_fraction("0.1234567890", fp) == Error::InvalidInput);
    }

    // Output is left untouched on failure
    REQUIRE(fp == DecimalFixedPoint{7, 42});
}

TEST_CASE("parse_fraction accepts the longest fraction", "[decimal]") {
    DecimalFixedPoint fp;
    REQUIRE(parse_fraction("0.999999999", fp) == Error::Ok);
    REQUIRE(fp.digit_count == MAX_FRACTION_DIGITS);
    REQUIRE(fp.numerator == 999999999U);
}

TEST_CASE("power_of_ten", "[decimal]") {
    REQUIRE(power_of_ten(0) == 1U);
    REQUIRE(power_of_ten(1) == 10U);
    REQUIRE(power_of_ten(4) == 10000U);
    REQUIRE(power_of_ten(9) == 1000000000U);
}
