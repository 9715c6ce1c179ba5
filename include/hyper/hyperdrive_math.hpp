#ifndef HYPER_HYPERDRIVE_MATH_HPP
#define HYPER_HYPERDRIVE_MATH_HPP

#include "types.hpp"
#include "yield_space.hpp"

namespace hyper {

// =============================================================================
// Fee Schedule (all 1e18 fractions)
// =============================================================================

struct Fees {
    U256 curve;       // charged on the curve leg, scaled by the price discount
    U256 flat;        // charged on the matured (flat) leg
    U256 governance;  // fraction of curve and flat fees routed to governance
};

// =============================================================================
// Trade Quote
// =============================================================================

struct TradeQuote {
    U256 curve_shares;  // share side of the curve leg
    U256 curve_bonds;   // bond side of the curve leg
    U256 flat_shares;   // flat leg settled 1:1 at the share price
    U256 flat_bonds;
    U256 total;         // amount out (out_given_in) or amount in (in_given_out)
};

namespace hyperdrive_math {

// -----------------------------------------------------------------------------
// Flat / curve decomposition
// -----------------------------------------------------------------------------

// `state.time_remaining` is the trade's normalized time to maturity. The
// curve leg is always solved with t = 1 against reserves that already
// reflect the flat leg. Bonds-out trades require t == 1.
TradeQuote calculate_out_given_in(const CurveState& state, const U256& amount_in, bool is_bond_out);

// Bonds-out: shares a trader pays to buy back `amount_out` bonds. Shares-out
// quotes require t == 1.
TradeQuote calculate_in_given_out(const CurveState& state, const U256& amount_out, bool is_bond_out);

// Normalized time remaining, in [0, 1]
U256 calculate_time_remaining(uint64_t maturity_time, uint64_t latest_checkpoint,
                              uint64_t position_duration);

// Position duration in years (1e18 scale)
U256 annualized_time(uint64_t position_duration);

// -----------------------------------------------------------------------------
// Rates
// -----------------------------------------------------------------------------

U256 calculate_spot_price(const U256& share_reserves, const U256& bond_reserves,
                          const U256& bond_reserve_adjustment,
                          const U256& initial_share_price, const U256& time_stretch);

// apr = (1 - p) / (p * T)
U256 calculate_apr_from_reserves(const U256& share_reserves, const U256& bond_reserves,
                                 const U256& bond_reserve_adjustment,
                                 const U256& initial_share_price,
                                 uint64_t position_duration, const U256& time_stretch);

// y = mu * z * (1 + apr * T) ** (1 / s) - adj
U256 calculate_bond_reserves(const U256& share_reserves, const U256& bond_reserve_adjustment,
                             const U256& initial_share_price, const U256& apr,
                             uint64_t position_duration, const U256& time_stretch);

// -----------------------------------------------------------------------------
// LP math
// -----------------------------------------------------------------------------

// Outstanding positions and their average normalized time remaining
struct OpenPositions {
    U256 longs_outstanding;
    U256 shorts_outstanding;
    U256 long_time_remaining;
    U256 short_time_remaining;
};

// Normalized time remaining of an average maturity time (seconds, 1e18 scale)
U256 calculate_average_time_remaining(const U256& average_maturity_time, uint64_t latest_checkpoint,
                                      uint64_t position_duration);

// Change in share reserves from closing y_l * t_l - y_s * t_s bonds on the
// curve; negative when the pool is net long. Bonds past the curve's limits
// are marked at zero (longs) or at face value (shorts).
I256 calculate_net_curve_trade(const CurveState& state, const OpenPositions& positions,
                               const U256& minimum_share_reserves);

// y_s * (1 - t_s) / c - y_l * (1 - t_l) / c
I256 calculate_net_flat_trade(const OpenPositions& positions, const U256& share_price);

// Shares the LPs would hold if every position closed now, net of the minimum
// share reserves. Throws ValidationError if negative.
U256 calculate_present_value(const CurveState& state, const OpenPositions& positions,
                             const U256& minimum_share_reserves);

// Reserves not backing net long exposure: z - exposure / c - z_min, floored at zero
U256 calculate_idle_liquidity(const U256& share_reserves, const U256& long_exposure,
                              const U256& share_price, const U256& minimum_share_reserves);

// LP shares for `shares_in` priced at the present value
U256 calculate_lp_out_given_shares_in(const U256& shares_in, const U256& present_value,
                                      const U256& lp_outstanding);

U256 calculate_shares_out_given_lp_in(const U256& lp_in, const U256& liquidity,
                                      const U256& lp_outstanding);

// -----------------------------------------------------------------------------
// Shorts
// -----------------------------------------------------------------------------

// Shares owed to a short: dy * c1 / (c0 * c) - dz, floored at zero
U256 calculate_short_proceeds(const U256& bond_amount, const U256& share_amount,
                              const U256& open_share_price, const U256& close_share_price,
                              const U256& share_price);

// -----------------------------------------------------------------------------
// Fees
// -----------------------------------------------------------------------------

// Curve fee on an open long, in bonds: phi_c * (1 / p - 1) * base
U256 open_long_curve_fee(const Fees& fees, const U256& base_amount, const U256& spot_price);

// Governance cut of the open long curve fee, in shares: phi_g * p * fee / c
U256 open_long_governance_fee(const Fees& fees, const U256& curve_fee_bonds,
                              const U256& spot_price, const U256& share_price);

// Curve fee on an open short, in shares: phi_c * (1 - p) * dy / c
U256 open_short_curve_fee(const Fees& fees, const U256& bond_amount,
                          const U256& spot_price, const U256& share_price);

// Curve fee on a close, in shares: phi_c * (1 - p) * dy * t / c
U256 close_curve_fee(const Fees& fees, const U256& bond_amount, const U256& time_remaining,
                     const U256& spot_price, const U256& share_price);

// Flat fee on a close, in shares: phi_f * dy * (1 - t) / c
U256 close_flat_fee(const Fees& fees, const U256& bond_amount, const U256& time_remaining,
                    const U256& share_price);

U256 governance_fee(const Fees& fees, const U256& fee);

// Base needed to mint `bond_amount` paired longs and shorts:
// dy * max(c, c0) / c0 + dy * phi_f + 2 * dy * phi_f * phi_g, rounded up
U256 calculate_mint_cost(const Fees& fees, const U256& bond_amount,
                         const U256& share_price, const U256& open_share_price);

} // namespace hyperdrive_math

} // namespace hyper

#endif // HYPER_HYPERDRIVE_MATH_HPP
