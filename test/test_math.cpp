// pump-engine - Math Tests

#include <catch2/catch.hpp>

#include "test_helpers.hpp"
#include "pump/math.hpp"

using namespace pump;
using namespace pump::math;

TEST_CASE("256-bit multiply", "[math]") {
    SECTION("Small operands stay in the low limb") {
        U256 p = mul_u128(6, 7);
        REQUIRE(p.hi == 0);
        REQUIRE(p.lo == 42);
    }

    SECTION("2^64 * 2^64 carries into the high limb") {
        U128 two64 = U128(1) << 64;
        U256 p = mul_u128(two64, two64);
        REQUIRE(p.lo == 0);
        REQUIRE(p.hi == 1);
    }

    SECTION("MAX * MAX") {
        U256 p = mul_u128(AMOUNT_MAX, AMOUNT_MAX);
        // (2^128 - 1)^2 = 2^256 - 2^129 + 1
        REQUIRE(p.lo == 1);
        REQUIRE(p.hi == AMOUNT_MAX - 1);
    }
}

TEST_CASE("256/128 division", "[math]") {
    SECTION("Exact division of a wide product") {
        U128 a = from_whole(1000000000);
        U128 b = from_whole(12500000);
        DivResult r = div_u256_u128(mul_u128(a, b), b);
        REQUIRE_FALSE(r.overflow);
        REQUIRE(r.quotient == a);
        REQUIRE(r.remainder == 0);
    }

    SECTION("Remainder is reported") {
        DivResult r = div_u256_u128(U256(10), 3);
        REQUIRE(r.quotient == 3);
        REQUIRE(r.remainder == 1);
    }

    SECTION("Zero denominator overflows") {
        REQUIRE(div_u256_u128(U256(1), 0).overflow);
    }

    SECTION("Quotient wider than 128 bits overflows") {
        REQUIRE(div_u256_u128(U256(0, 5), 5).overflow);
    }
}

TEST_CASE("mul_div rounding", "[math]") {
    SECTION("Floor and ceil agree on exact results") {
        REQUIRE(mul_div(10, 20, 5) == 40);
        REQUIRE(mul_div_up(10, 20, 5) == 40);
    }

    SECTION("Floor and ceil differ by one otherwise") {
        REQUIRE(mul_div(10, 10, 3) == 33);
        REQUIRE(mul_div_up(10, 10, 3) == 34);
    }

    SECTION("Intermediate product exceeds 128 bits") {
        // 1e27 * 1e27 / 1e27
        Amount big = from_whole(1000000000);
        REQUIRE(mul_div(big, big, big) == big);
    }

    SECTION("Overflowing quotient saturates") {
        REQUIRE(mul_div(AMOUNT_MAX, 2, 1) == AMOUNT_MAX);
    }
}

TEST_CASE("Basis points", "[math]") {
    REQUIRE(apply_bps(10000000, 100) == 100000);
    REQUIRE(apply_bps(199, 100) == 1);  // floors
    REQUIRE(apply_bps(12345, 0) == 0);
    REQUIRE(apply_bps(12345, BPS_DENOMINATOR) == 12345);
    REQUIRE(abs_diff(3, 10) == 7);
    REQUIRE(abs_diff(10, 3) == 7);
}

TEST_CASE("Amount and address formatting", "[types]") {
    SECTION("Decimal round trip") {
        Amount v = from_whole(12500000);
        REQUIRE(to_string(v) == "12500000000000000000000000");
        REQUIRE(amount_from_string(to_string(v)) == v);
    }

    SECTION("Exponent suffix and separators") {
        REQUIRE(amount_from_string("125e5") == Amount(12500000));
        REQUIRE(amount_from_string("1_000") == Amount(1000));
        REQUIRE(amount_from_string("12500000e18") == from_whole(12500000));
    }

    SECTION("Malformed amounts") {
        REQUIRE_FALSE(amount_from_string("").has_value());
        REQUIRE_FALSE(amount_from_string("12a").has_value());
        REQUIRE_FALSE(amount_from_string("-5").has_value());
        REQUIRE_FALSE(amount_from_string("1e99").has_value());
    }

    SECTION("Address hex") {
        REQUIRE(to_hex(addresses::BURN_SINK) == "0x000000000000000000000000000000000000dead");
        auto parsed = address_from_hex("0x000000000000000000000000000000000000dEaD");
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == addresses::BURN_SINK);
        REQUIRE_FALSE(address_from_hex("0x1234").has_value());
    }

    SECTION("Error names") {
        REQUIRE(std::string(to_string(ErrorCode::AlreadyGraduated)) == "AlreadyGraduated");
        REQUIRE(std::string(to_string(ErrorCode::Ok)) == "Ok");
    }
}
