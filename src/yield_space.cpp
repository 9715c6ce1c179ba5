// =============================================================================
// yield_space.cpp - YieldSpace invariant solves
// =============================================================================

#include "hyper/yield_space.hpp"
#include "hyper/fixed_point.hpp"
#include "hyper/errors.hpp"

namespace hyper {
namespace yield_space {

namespace {

using namespace fixed;

// base ** (1 / a), rounded up
U256 inverse_pow_up(const U256& base, const U256& a) {
    U256 exponent = base >= ONE ? div_up(ONE, a) : div_down(ONE, a);
    return pow(base, exponent);
}

// value * (num / den) ** exponent, rounded up
U256 scale_by_ratio_up(const U256& value, const U256& num, const U256& den,
                       const U256& exponent) {
    if (exponent == ONE) {
        return mul_div_up(value, num, den);
    }
    return mul_up(value, pow(mul_div_up(num, ONE, den), exponent));
}

U256 adjusted_bonds(const CurveState& s) {
    return add(s.bond_reserves, s.bond_reserve_adjustment);
}

U256 share_term(const CurveState& s, const U256& shares) {
    U256 c_div_mu = div_down(s.share_price, s.initial_share_price);
    return mul_down(c_div_mu, pow(mul_down(s.initial_share_price, shares), curve_exponent(s)));
}

U256 calculate_k_down(const CurveState& s) {
    U256 a = curve_exponent(s);
    U256 c_div_mu = div_down(s.share_price, s.initial_share_price);
    U256 shares = mul_down(c_div_mu, pow(mul_down(s.initial_share_price, s.share_reserves), a));
    return add(shares, pow(adjusted_bonds(s), a));
}

// Limits solve x ** (1 / a); the log limit has no closed form
U256 limit_exponent(const CurveState& s) {
    U256 a = curve_exponent(s);
    if (a == 0) {
        throw CurveError("yield_space: trade limits need a nonzero curve exponent");
    }
    return a;
}

U256 remaining_term(const U256& k, const U256& term) {
    if (term > k) {
        throw CurveError("yield_space: invariant solve requires a negative radicand");
    }
    return k - term;
}

U256 checked_difference(const U256& larger, const U256& smaller) {
    if (smaller > larger) {
        throw CurveError("yield_space: trade would make reserves negative");
    }
    return larger - smaller;
}

// Shares -> bond-side term solve: returns the new (y + adj)
U256 solve_bonds(const CurveState& s, const U256& new_share_reserves) {
    U256 a = curve_exponent(s);
    U256 k = calculate_k(s);
    U256 rest = remaining_term(k, share_term(s, new_share_reserves));
    return inverse_pow_up(rest, a);
}

// Bonds -> share-side term solve: returns the new z
U256 solve_shares(const CurveState& s, const U256& new_adjusted_bonds) {
    U256 a = curve_exponent(s);
    U256 k = calculate_k(s);
    U256 rest = remaining_term(k, pow(new_adjusted_bonds, a));
    U256 c_div_mu = div_down(s.share_price, s.initial_share_price);
    U256 mu_z = inverse_pow_up(div_up(rest, c_div_mu), a);
    return div_up(mu_z, s.initial_share_price);
}

// In the a -> 0 limit the invariant becomes (mu * z) ** (c / mu) * (y + adj) = k
U256 share_exponent_limit(const CurveState& s, bool ratio_above_one) {
    return ratio_above_one ? div_up(s.initial_share_price, s.share_price)
                           : div_down(s.initial_share_price, s.share_price);
}

}  // namespace

U256 curve_exponent(const CurveState& state) {
    return sub(ONE, mul_down(state.time_stretch, state.time_remaining));
}

U256 calculate_k(const CurveState& state) {
    U256 a = curve_exponent(state);
    U256 c_div_mu = div_up(state.share_price, state.initial_share_price);
    U256 shares = mul_up(c_div_mu, pow(mul_up(state.initial_share_price, state.share_reserves), a));
    return add(shares, pow(adjusted_bonds(state), a));
}

U256 calculate_out_given_in(const CurveState& state, const U256& amount_in, bool is_bond_out) {
    const U256 z = state.share_reserves;
    const U256 y_adj = adjusted_bonds(state);
    const bool log_limit = curve_exponent(state) == 0;

    if (is_bond_out) {
        U256 new_z = add(z, amount_in);
        U256 new_y_adj;
        if (log_limit) {
            U256 r = div_down(state.share_price, state.initial_share_price);
            new_y_adj = scale_by_ratio_up(y_adj, z, new_z, r);
        } else {
            new_y_adj = solve_bonds(state, new_z);
        }
        return checked_difference(y_adj, new_y_adj);
    }

    U256 new_y_adj = add(y_adj, amount_in);
    U256 new_z;
    if (log_limit) {
        new_z = scale_by_ratio_up(z, y_adj, new_y_adj, share_exponent_limit(state, false));
    } else {
        new_z = solve_shares(state, new_y_adj);
    }
    return checked_difference(z, new_z);
}

U256 calculate_in_given_out(const CurveState& state, const U256& amount_out, bool is_bond_out) {
    const U256 z = state.share_reserves;
    const U256 y_adj = adjusted_bonds(state);
    const bool log_limit = curve_exponent(state) == 0;

    if (is_bond_out) {
        U256 new_y_adj = checked_difference(y_adj, amount_out);
        U256 new_z;
        if (log_limit) {
            if (new_y_adj == 0) {
                throw CurveError("yield_space: cannot drain bond reserves");
            }
            new_z = scale_by_ratio_up(z, y_adj, new_y_adj, share_exponent_limit(state, true));
        } else {
            new_z = solve_shares(state, new_y_adj);
        }
        return checked_difference(new_z, z);
    }

    U256 new_z = checked_difference(z, amount_out);
    U256 new_y_adj;
    if (log_limit) {
        if (new_z == 0) {
            throw CurveError("yield_space: cannot drain share reserves");
        }
        U256 r = div_up(state.share_price, state.initial_share_price);
        new_y_adj = scale_by_ratio_up(y_adj, z, new_z, r);
    } else {
        new_y_adj = solve_bonds(state, new_z);
    }
    return checked_difference(new_y_adj, y_adj);
}

U256 calculate_spot_price(const CurveState& state) {
    U256 y_adj = adjusted_bonds(state);
    U256 ratio = mul_div_down(state.initial_share_price, state.share_reserves, y_adj);
    return pow(ratio, mul_down(state.time_stretch, state.time_remaining));
}

// -----------------------------------------------------------------------------
// Trade Limits
// -----------------------------------------------------------------------------

// At p == 1 the invariant becomes k = (c / mu + 1) * (mu * z') ** a
U256 calculate_max_buy_shares_in(const CurveState& state) {
    U256 a = limit_exponent(state);
    U256 optimal = div_down(calculate_k_down(state),
                            add(div_up(state.share_price, state.initial_share_price), ONE));
    optimal = div_down(pow(optimal, div_down(ONE, a)), state.initial_share_price);
    if (optimal < state.share_reserves) {
        throw CurveError("yield_space: share reserves already exceed the max buy");
    }
    return optimal - state.share_reserves;
}

// At p == 1 the invariant becomes k = (c / mu + 1) * (y' + adj) ** a
U256 calculate_max_buy_bonds_out(const CurveState& state) {
    U256 a = limit_exponent(state);
    U256 optimal = div_up(calculate_k(state),
                          add(div_down(state.share_price, state.initial_share_price), ONE));
    optimal = pow(optimal, optimal >= ONE ? div_up(ONE, a) : div_down(ONE, a));
    U256 y_adj = adjusted_bonds(state);
    if (optimal > y_adj) {
        throw CurveError("yield_space: bond reserves already below the max buy");
    }
    return y_adj - optimal;
}

// At z == z_min the invariant becomes k = (c / mu) * (mu * z_min) ** a + (y' + adj) ** a
U256 calculate_max_sell_bonds_in(const CurveState& state, const U256& minimum_share_reserves) {
    U256 a = limit_exponent(state);
    U256 floor_term = mul_div_up(state.share_price,
                                 pow(mul_up(state.initial_share_price, minimum_share_reserves), a),
                                 state.initial_share_price);
    U256 optimal = remaining_term(calculate_k_down(state), floor_term);
    optimal = pow(optimal, optimal >= ONE ? div_down(ONE, a) : div_up(ONE, a));
    U256 y_adj = adjusted_bonds(state);
    if (optimal < y_adj) {
        throw CurveError("yield_space: share reserves already at the minimum");
    }
    return optimal - y_adj;
}

} // namespace yield_space
} // namespace hyper
