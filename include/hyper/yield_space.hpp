#ifndef HYPER_YIELD_SPACE_HPP
#define HYPER_YIELD_SPACE_HPP

#include "types.hpp"

namespace hyper {

// =============================================================================
// YieldSpace Curve
//
//   k = (c / mu) * (mu * z) ** (1 - s * t) + (y + adj) ** (1 - s * t)
//
// z: share reserves, y: bond reserves, adj: bond reserve adjustment,
// t: normalized time remaining, s: time stretch, c: vault share price,
// mu: initial vault share price. Every solve rounds against the trader.
// =============================================================================

struct CurveState {
    U256 share_reserves;
    U256 bond_reserves;
    U256 bond_reserve_adjustment;
    U256 time_remaining;
    U256 time_stretch;
    U256 share_price;
    U256 initial_share_price;
};

namespace yield_space {

// 1 - s * t; throws ArithmeticError when s * t > 1
U256 curve_exponent(const CurveState& state);

U256 calculate_k(const CurveState& state);

// is_bond_out: `amount_in` shares enter, returns bonds leaving.
// Otherwise `amount_in` bonds enter, returns shares leaving.
U256 calculate_out_given_in(const CurveState& state, const U256& amount_in, bool is_bond_out);

// is_bond_out: `amount_out` bonds leave, returns shares entering.
// Otherwise `amount_out` shares leave, returns bonds entering.
U256 calculate_in_given_out(const CurveState& state, const U256& amount_out, bool is_bond_out);

// Price of one bond in base: ((mu * z) / (y + adj)) ** (s * t)
U256 calculate_spot_price(const CurveState& state);

// -----------------------------------------------------------------------------
// Trade limits
//
// Buys are capped where the spot price reaches one (mu * z == y + adj) and
// sells where the share reserves reach `minimum_share_reserves`. Each limit
// is rounded so that it is underestimated; a CurveError means the reserves
// are already past the limit.
// -----------------------------------------------------------------------------

U256 calculate_max_buy_shares_in(const CurveState& state);

U256 calculate_max_buy_bonds_out(const CurveState& state);

U256 calculate_max_sell_bonds_in(const CurveState& state, const U256& minimum_share_reserves);

} // namespace yield_space

} // namespace hyper

#endif // HYPER_YIELD_SPACE_HPP
