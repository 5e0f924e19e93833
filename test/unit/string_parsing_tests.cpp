// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace headerchain::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("1", 1, 1000000) == 1);
        REQUIRE(SafeParseInt("1000000", 1, 1000000) == 1000000);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("0", 1, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("4 2", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    }

    SECTION("Not a number") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt("99999999999999999999999", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseUInt64", "[util][string_parsing]") {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();

    SECTION("Valid values") {
        REQUIRE(SafeParseUInt64("0", kMax) == uint64_t{0});
        REQUIRE(SafeParseUInt64("18446744073709551615", kMax) == kMax);
    }

    SECTION("Upper bound is inclusive") {
        REQUIRE(SafeParseUInt64("10", 10) == uint64_t{10});
        REQUIRE_FALSE(SafeParseUInt64("11", 10).has_value());
    }

    SECTION("Signs are rejected") {
        REQUIRE_FALSE(SafeParseUInt64("-1", kMax).has_value());
        REQUIRE_FALSE(SafeParseUInt64("+1", kMax).has_value());
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(SafeParseUInt64("", kMax).has_value());
        REQUIRE_FALSE(SafeParseUInt64("12a", kMax).has_value());
        REQUIRE_FALSE(SafeParseUInt64(" 1", kMax).has_value());
        REQUIRE_FALSE(SafeParseUInt64("18446744073709551616", kMax).has_value());
    }
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("0123456789abcdefABCDEF"));
    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("0x12"));
    REQUIRE_FALSE(IsValidHex("12 34"));
    REQUIRE_FALSE(IsValidHex("g"));
}

TEST_CASE("SafeParseHash", "[util][string_parsing]") {
    const std::string one =
        "0000000000000000000000000000000000000000000000000000000000000001";

    SECTION("Valid hash") {
        auto result = SafeParseHash(one);
        REQUIRE(result.has_value());
        REQUIRE(*result == uint256(1));
        REQUIRE(result->GetHex() == one);
    }

    SECTION("Wrong length") {
        REQUIRE_FALSE(SafeParseHash(one.substr(1)).has_value());
        REQUIRE_FALSE(SafeParseHash(one + "0").has_value());
        REQUIRE_FALSE(SafeParseHash("").has_value());
    }

    SECTION("Prefix is not accepted") {
        REQUIRE_FALSE(SafeParseHash("0x" + one.substr(2)).has_value());
    }

    SECTION("Non-hex character") {
        std::string bad = one;
        bad[10] = 'z';
        REQUIRE_FALSE(SafeParseHash(bad).has_value());
    }
}
