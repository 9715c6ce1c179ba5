// Hyperdrive - YieldSpace Curve Tests

#include <catch2/catch_test_macros.hpp>
#include <hyper/yield_space.hpp>
#include <hyper/errors.hpp>

#include "mocks.hpp"

using namespace hyper;
using namespace hyper::testing;

namespace {

CurveState balanced_curve(const U256& time_stretch) {
    return CurveState{units(100), units(100), U256(0), ONE, time_stretch, ONE, ONE};
}

// s for a 5% target rate
const U256 STRETCH = U256("44463125629060298");

}  // namespace

TEST_CASE("Curve exponent", "[yield_space]") {
    CurveState state = balanced_curve(STRETCH);
    REQUIRE(yield_space::curve_exponent(state) == ONE - STRETCH);

    state.time_remaining = U256(500000000000000000ULL);
    REQUIRE(yield_space::curve_exponent(state) == ONE - STRETCH / 2);

    state.time_stretch = units(2);
    state.time_remaining = ONE;
    REQUIRE_THROWS_AS(yield_space::curve_exponent(state), ArithmeticError);
}

TEST_CASE("Zero-exponent curve trades on the log limit", "[yield_space]") {
    // s * t == 1: (mu z)^(c/mu) * (y + adj) is the invariant
    CurveState state = balanced_curve(ONE);

    SECTION("Bonds in, shares out") {
        REQUIRE(yield_space::calculate_out_given_in(state, units(10), false) ==
                U256("9090909090909090909"));
    }

    SECTION("Shares in, bonds out") {
        REQUIRE(yield_space::calculate_out_given_in(state, units(10), true) ==
                U256("9090909090909090909"));
    }

    SECTION("Draining a side is rejected") {
        REQUIRE_THROWS_AS(yield_space::calculate_in_given_out(state, units(100), true), CurveError);
        REQUIRE_THROWS_AS(yield_space::calculate_in_given_out(state, units(100), false), CurveError);
    }
}

TEST_CASE("Curve solves are monotone and consistent", "[yield_space]") {
    CurveState state{units(1000), units(2000), units(1000), ONE, STRETCH, ONE, ONE};

    SECTION("More shares in buys more bonds, at a worse average price") {
        U256 small = yield_space::calculate_out_given_in(state, units(10), true);
        U256 large = yield_space::calculate_out_given_in(state, units(20), true);
        REQUIRE(small > units(10));
        REQUIRE(large > small);
        REQUIRE(large < small * 2);
    }

    SECTION("More bonds in returns more shares") {
        U256 small = yield_space::calculate_out_given_in(state, units(10), false);
        U256 large = yield_space::calculate_out_given_in(state, units(20), false);
        REQUIRE(small < units(10));
        REQUIRE(large > small);
    }

    SECTION("in_given_out inverts out_given_in") {
        U256 bonds = yield_space::calculate_out_given_in(state, units(10), true);
        U256 shares = yield_space::calculate_in_given_out(state, bonds, true);
        REQUIRE(abs_diff(shares, units(10)) < U256(10000000000ULL));

        U256 shares_out = yield_space::calculate_out_given_in(state, units(10), false);
        U256 bonds_in = yield_space::calculate_in_given_out(state, shares_out, false);
        REQUIRE(abs_diff(bonds_in, units(10)) < U256(10000000000ULL));
    }

    SECTION("Invariant is preserved by a trade") {
        U256 k_before = yield_space::calculate_k(state);
        U256 bonds = yield_space::calculate_out_given_in(state, units(10), true);
        CurveState after = state;
        after.share_reserves += units(10);
        after.bond_reserves -= bonds;
        U256 k_after = yield_space::calculate_k(after);
        REQUIRE(abs_diff(k_before, k_after) < fixed::mul_down(k_before, U256(1000000000ULL)));
    }

    SECTION("Trades larger than the reserves are rejected") {
        REQUIRE_THROWS_AS(yield_space::calculate_out_given_in(state, units(100000), false), CurveError);
    }
}

TEST_CASE("Spot price", "[yield_space]") {
    SECTION("Balanced reserves price bonds at par") {
        REQUIRE(yield_space::calculate_spot_price(balanced_curve(STRETCH)) == ONE);
    }

    SECTION("Excess bonds price at a discount") {
        CurveState state{units(1000), units(2000), units(1000), ONE, STRETCH, ONE, ONE};
        U256 p = yield_space::calculate_spot_price(state);
        REQUIRE(p < ONE);
        REQUIRE(p > U256(900000000000000000ULL));
    }
}

TEST_CASE("Trade limits", "[yield_space]") {
    // Spot price below one
    const CurveState discounted{units(1000), units(2000), units(1000), ONE, STRETCH, ONE, ONE};
    const U256 tolerance = U256(1000000000000ULL);

    SECTION("Max buy brings the spot price to par") {
        U256 shares_in = yield_space::calculate_max_buy_shares_in(discounted);
        REQUIRE(shares_in > 0);

        CurveState after = discounted;
        after.share_reserves += shares_in;
        after.bond_reserves -= yield_space::calculate_out_given_in(discounted, shares_in, true);
        REQUIRE(abs_diff(yield_space::calculate_spot_price(after), ONE) < tolerance);
    }

    SECTION("Max bonds out agrees with the max shares in") {
        U256 bonds_out = yield_space::calculate_max_buy_bonds_out(discounted);
        REQUIRE(bonds_out > 0);

        CurveState after = discounted;
        after.share_reserves += yield_space::calculate_in_given_out(discounted, bonds_out, true);
        after.bond_reserves -= bonds_out;
        REQUIRE(abs_diff(yield_space::calculate_spot_price(after), ONE) < tolerance);
    }

    SECTION("Max sell stops at the minimum share reserves") {
        const U256 minimum = units(10);
        U256 bonds_in = yield_space::calculate_max_sell_bonds_in(discounted, minimum);
        U256 shares_out = yield_space::calculate_out_given_in(discounted, bonds_in, false);
        REQUIRE(abs_diff(discounted.share_reserves - shares_out, minimum) < tolerance);
    }

    SECTION("Reserves already past the limit") {
        CurveState premium{units(2000), units(1000), U256(0), ONE, STRETCH, ONE, ONE};
        REQUIRE_THROWS_AS(yield_space::calculate_max_buy_shares_in(premium), CurveError);
        REQUIRE_THROWS_AS(yield_space::calculate_max_buy_bonds_out(premium), CurveError);
    }

    SECTION("Zero exponent has no closed form") {
        REQUIRE_THROWS_AS(yield_space::calculate_max_buy_shares_in(balanced_curve(ONE)), CurveError);
        REQUIRE_THROWS_AS(yield_space::calculate_max_sell_bonds_in(balanced_curve(ONE), units(1)),
                          CurveError);
    }
}
