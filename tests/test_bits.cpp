/**
 * @file test_bits.cpp
 * @brief Unit tests for single-word bit primitives.
 */

#include <fracpack/bits.hpp>

#include <catch2/catch.hpp>

using namespace fracpack;

TEST_CASE("set_bit", "[bits]") {
    SECTION("set bits") {
        REQUIRE(set_bit(4U, 1, true) == 6U);
        REQUIRE(set_bit(8U, 2, true) == 12U);
        REQUIRE(set_bit(0U, 31, true) == 0x80000000U);
    }

    SECTION("setting a set bit is a no-op") {
        REQUIRE(set_bit(6U, 1, true) == 6U);
    }

    SECTION("clear bits") {
        REQUIRE(set_bit(6U, 1, false) == 4U);
        REQUIRE(set_bit(0xFFFFFFFFU, 31, false) == 0x7FFFFFFFU);
        REQUIRE(set_bit(0U, 5, false) == 0U);
    }
}

TEST_CASE("get_bit", "[bits]") {
    const word_t word = 0b1010U;
    REQUIRE_FALSE(get_bit(word, 0));
    REQUIRE(get_bit(word, 1));
    REQUIRE_FALSE(get_bit(word, 2));
    REQUIRE(get_bit(word, 3));
    REQUIRE(get_bit(0x80000000U, 31));
}

TEST_CASE("reverse_word", "[bits]") {
    REQUIRE(reverse_word(0x00000001U) == 0x80000000U);
    REQUIRE(reverse_word(0x80000000U) == 0x00000001U);
    REQUIRE(reverse_word(0x0000000FU) == 0xF0000000U);
    REQUIRE(reverse_word(0x12345678U) == 0x1E6A2C48U);
    REQUIRE(reverse_word(0U) == 0U);
    REQUIRE(reverse_word(0xFFFFFFFFU) == 0xFFFFFFFFU);
}

TEST_CASE("reverse_low_bits", "[bits]") {
    SECTION("known values") {
        REQUIRE(reverse_low_bits(313U, 6) == 39U); // 100111001 -> 100111
        REQUIRE(reverse_low_bits(3U, 2) == 3U);
        REQUIRE(reverse_low_bits(0b001U, 3) == 0b100U);
        REQUIRE(reverse_low_bits(0b110U, 3) == 0b011U);
    }

    SECTION("high bits are dropped") {
        REQUIRE(reverse_low_bits(0xFFFFFF00U | 0b01U, 2) == 0b10U);
        REQUIRE(reverse_low_bits(0x80000000U, 31) == 0U);
    }

    SECTION("count of zero yields zero") {
        REQUIRE(reverse_low_bits(0xFFFFFFFFU, 0) == 0U);
    }

    SECTION("full width matches reverse_word") {
        REQUIRE(reverse_low_bits(0x12345678U, 32) == reverse_word(0x12345678U));
        REQUIRE(reverse_low_bits(0x12345678U, 40) == reverse_word(0x12345678U));
    }

    SECTION("reversal is an involution for every width up to the significand") {
        for (std::uint32_t n = 1; n <= SIGNIFICAND_BITS; ++n) {
            const word_t mask = (1U << n) - 1U;
            const word_t samples[] = {0U, 1U, mask, mask >> 1, 0x2AAAAAU & mask,
                                      0x555555U & mask, 0x123456U & mask};
            for (word_t x : samples) {
                REQUIRE(reverse_low_bits(reverse_low_bits(x, n), n) == x);
            }
        }
    }
}

TEST_CASE("bit primitives are usable in constant expressions", "[bits]") {
    static_assert(set_bit(0U, 3, true) == 8U);
    static_assert(get_bit(8U, 3));
    static_assert(reverse_low_bits(0b1U, 23) == (1U << 22));
    SUCCEED();
}
