// =============================================================================
// hyperdrive_math.cpp - Trade decomposition, rates, LP and fee math
// =============================================================================

#include "hyper/hyperdrive_math.hpp"
#include "hyper/fixed_point.hpp"
#include "hyper/errors.hpp"

namespace hyper {
namespace hyperdrive_math {

namespace {

using namespace fixed;

// Reserves as the curve sees them after the flat leg moved `share_delta`
// through the liquidity update rule.
CurveState after_flat_leg(const CurveState& state, const U256& share_delta, bool is_adding) {
    CurveState local = state;
    local.time_remaining = ONE;
    if (share_delta == 0 || state.share_reserves == 0) {
        return local;
    }
    local.share_reserves = is_adding ? add(state.share_reserves, share_delta)
                                     : sub(state.share_reserves, share_delta);
    local.bond_reserves = mul_div_down(state.bond_reserves, local.share_reserves,
                                       state.share_reserves);
    return local;
}

void check_time_remaining(const U256& t) {
    if (t > ONE) {
        throw ValidationError(errors::INVALID_TIME_REMAINING, "time remaining exceeds one");
    }
}

}  // namespace

// =============================================================================
// Flat / Curve Decomposition
// =============================================================================

TradeQuote calculate_out_given_in(const CurveState& state, const U256& amount_in, bool is_bond_out) {
    const U256 t = state.time_remaining;
    check_time_remaining(t);

    TradeQuote quote{};
    if (is_bond_out) {
        if (t < ONE) {
            throw ValidationError(errors::INVALID_TIME_REMAINING,
                                  "bonds-out trades require a full term");
        }
        quote.curve_shares = amount_in;
        quote.curve_bonds = yield_space::calculate_out_given_in(state, amount_in, true);
        quote.total = quote.curve_bonds;
        return quote;
    }

    // Bonds in, shares out
    quote.curve_bonds = mul_down(amount_in, t);
    quote.flat_bonds = amount_in - quote.curve_bonds;
    quote.flat_shares = div_down(quote.flat_bonds, state.share_price);

    if (quote.curve_bonds > 0) {
        CurveState local = after_flat_leg(state, quote.flat_shares, false);
        quote.curve_shares = yield_space::calculate_out_given_in(local, quote.curve_bonds, false);
    }
    quote.total = add(quote.flat_shares, quote.curve_shares);
    return quote;
}

TradeQuote calculate_in_given_out(const CurveState& state, const U256& amount_out, bool is_bond_out) {
    const U256 t = state.time_remaining;
    check_time_remaining(t);

    TradeQuote quote{};
    if (!is_bond_out) {
        if (t < ONE) {
            throw ValidationError(errors::INVALID_TIME_REMAINING,
                                  "shares-out quotes require a full term");
        }
        quote.curve_shares = amount_out;
        quote.curve_bonds = yield_space::calculate_in_given_out(state, amount_out, false);
        quote.total = quote.curve_bonds;
        return quote;
    }

    // Bonds out, shares in
    quote.curve_bonds = mul_down(amount_out, t);
    quote.flat_bonds = amount_out - quote.curve_bonds;
    quote.flat_shares = div_up(quote.flat_bonds, state.share_price);

    if (quote.curve_bonds > 0) {
        CurveState local = after_flat_leg(state, quote.flat_shares, true);
        quote.curve_shares = yield_space::calculate_in_given_out(local, quote.curve_bonds, true);
    }
    quote.total = add(quote.flat_shares, quote.curve_shares);
    return quote;
}

U256 calculate_time_remaining(uint64_t maturity_time, uint64_t latest_checkpoint,
                              uint64_t position_duration) {
    if (maturity_time <= latest_checkpoint) return 0;
    U256 remaining = mul_div_down(U256(maturity_time - latest_checkpoint), ONE,
                                  U256(position_duration));
    return fixed::min(remaining, ONE);
}

U256 annualized_time(uint64_t position_duration) {
    return mul_div_down(U256(position_duration), ONE, U256(SECONDS_PER_YEAR));
}

// =============================================================================
// Rates
// =============================================================================

U256 calculate_spot_price(const U256& share_reserves, const U256& bond_reserves,
                          const U256& bond_reserve_adjustment,
                          const U256& initial_share_price, const U256& time_stretch) {
    CurveState state{share_reserves, bond_reserves, bond_reserve_adjustment, ONE,
                     time_stretch, initial_share_price, initial_share_price};
    return yield_space::calculate_spot_price(state);
}

U256 calculate_apr_from_reserves(const U256& share_reserves, const U256& bond_reserves,
                                 const U256& bond_reserve_adjustment,
                                 const U256& initial_share_price,
                                 uint64_t position_duration, const U256& time_stretch) {
    U256 p = calculate_spot_price(share_reserves, bond_reserves, bond_reserve_adjustment,
                                  initial_share_price, time_stretch);
    if (p > ONE) {
        throw ValidationError(errors::INVALID_APR, "reserves imply a negative rate");
    }
    return div_down(ONE - p, mul_down(p, annualized_time(position_duration)));
}

U256 calculate_bond_reserves(const U256& share_reserves, const U256& bond_reserve_adjustment,
                             const U256& initial_share_price, const U256& apr,
                             uint64_t position_duration, const U256& time_stretch) {
    U256 growth = add(ONE, mul_down(apr, annualized_time(position_duration)));
    U256 y_adj = mul_down(mul_down(initial_share_price, share_reserves),
                          pow(growth, div_up(ONE, time_stretch)));
    if (y_adj < bond_reserve_adjustment) {
        throw ValidationError(errors::INVALID_APR, "target rate is unreachable for these reserves");
    }
    return y_adj - bond_reserve_adjustment;
}

// =============================================================================
// LP Math
// =============================================================================

U256 calculate_average_time_remaining(const U256& average_maturity_time, uint64_t latest_checkpoint,
                                      uint64_t position_duration) {
    U256 latest = U256(latest_checkpoint) * ONE;
    if (average_maturity_time <= latest) return 0;
    U256 remaining = mul_div_down(average_maturity_time - latest, ONE, U256(position_duration) * ONE);
    return fixed::min(remaining, ONE);
}

I256 calculate_net_curve_trade(const CurveState& state, const OpenPositions& positions,
                               const U256& minimum_share_reserves) {
    CurveState curve = state;
    curve.time_remaining = ONE;

    U256 long_bonds = mul_down(positions.longs_outstanding, positions.long_time_remaining);
    U256 short_bonds = mul_down(positions.shorts_outstanding, positions.short_time_remaining);

    if (long_bonds > short_bonds) {
        U256 net = long_bonds - short_bonds;
        U256 max_sell = yield_space::calculate_max_sell_bonds_in(curve, minimum_share_reserves);
        if (max_sell >= net) {
            return -to_signed(yield_space::calculate_out_given_in(curve, net, false));
        }
        return -to_signed(sub(curve.share_reserves, minimum_share_reserves));
    }
    if (short_bonds > long_bonds) {
        U256 net = short_bonds - long_bonds;
        U256 max_buy = yield_space::calculate_max_buy_bonds_out(curve);
        if (max_buy >= net) {
            return to_signed(yield_space::calculate_in_given_out(curve, net, true));
        }
        return to_signed(add(yield_space::calculate_max_buy_shares_in(curve),
                             div_down(net - max_buy, curve.share_price)));
    }
    return 0;
}

I256 calculate_net_flat_trade(const OpenPositions& positions, const U256& share_price) {
    U256 shorts = mul_div_down(positions.shorts_outstanding,
                               sub(ONE, positions.short_time_remaining), share_price);
    U256 longs = mul_div_down(positions.longs_outstanding,
                              sub(ONE, positions.long_time_remaining), share_price);
    return to_signed(shorts) - to_signed(longs);
}

U256 calculate_present_value(const CurveState& state, const OpenPositions& positions,
                             const U256& minimum_share_reserves) {
    I256 value = to_signed(state.share_reserves) +
                 calculate_net_curve_trade(state, positions, minimum_share_reserves) +
                 calculate_net_flat_trade(positions, state.share_price) -
                 to_signed(minimum_share_reserves);
    if (value < 0) {
        throw ValidationError(errors::INSUFFICIENT_LIQUIDITY, "negative present value");
    }
    return to_unsigned(value);
}

U256 calculate_idle_liquidity(const U256& share_reserves, const U256& long_exposure,
                              const U256& share_price, const U256& minimum_share_reserves) {
    U256 locked = add(div_up(long_exposure, share_price), minimum_share_reserves);
    return share_reserves > locked ? U256(share_reserves - locked) : U256(0);
}

U256 calculate_lp_out_given_shares_in(const U256& shares_in, const U256& present_value,
                                      const U256& lp_outstanding) {
    if (present_value == 0) {
        throw ValidationError(errors::INSUFFICIENT_LIQUIDITY, "pool has no present value");
    }
    return mul_div_down(shares_in, lp_outstanding, present_value);
}

U256 calculate_shares_out_given_lp_in(const U256& lp_in, const U256& liquidity,
                                      const U256& lp_outstanding) {
    return mul_div_down(liquidity, lp_in, lp_outstanding);
}

// =============================================================================
// Shorts
// =============================================================================

U256 calculate_short_proceeds(const U256& bond_amount, const U256& share_amount,
                              const U256& open_share_price, const U256& close_share_price,
                              const U256& share_price) {
    U256 bond_factor = mul_div_down(bond_amount, close_share_price,
                                    mul_down(open_share_price, share_price));
    return bond_factor > share_amount ? bond_factor - share_amount : U256(0);
}

// =============================================================================
// Fees
// =============================================================================

U256 open_long_curve_fee(const Fees& fees, const U256& base_amount, const U256& spot_price) {
    U256 discount = sub(div_down(ONE, spot_price), ONE);
    return mul_up(mul_up(discount, fees.curve), base_amount);
}

U256 open_long_governance_fee(const Fees& fees, const U256& curve_fee_bonds,
                              const U256& spot_price, const U256& share_price) {
    U256 base = mul_down(mul_down(curve_fee_bonds, spot_price), fees.governance);
    return div_down(base, share_price);
}

U256 open_short_curve_fee(const Fees& fees, const U256& bond_amount,
                          const U256& spot_price, const U256& share_price) {
    U256 base = mul_up(mul_up(sub(ONE, spot_price), fees.curve), bond_amount);
    return div_up(base, share_price);
}

U256 close_curve_fee(const Fees& fees, const U256& bond_amount, const U256& time_remaining,
                     const U256& spot_price, const U256& share_price) {
    return mul_up(mul_up(sub(ONE, spot_price), fees.curve),
                  mul_div_up(bond_amount, time_remaining, share_price));
}

U256 close_flat_fee(const Fees& fees, const U256& bond_amount, const U256& time_remaining,
                    const U256& share_price) {
    return mul_up(mul_div_up(bond_amount, sub(ONE, time_remaining), share_price), fees.flat);
}

U256 governance_fee(const Fees& fees, const U256& fee) {
    return mul_down(fee, fees.governance);
}

U256 calculate_mint_cost(const Fees& fees, const U256& bond_amount,
                         const U256& share_price, const U256& open_share_price) {
    U256 principal = mul_div_up(bond_amount, fixed::max(share_price, open_share_price), open_share_price);
    U256 flat = mul_up(bond_amount, fees.flat);
    U256 gov = mul_up(flat, fees.governance);
    return add(add(principal, flat), add(gov, gov));
}

} // namespace hyperdrive_math
} // namespace hyper
