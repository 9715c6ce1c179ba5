// =============================================================================
// hyperdrive.cpp - Fixed-rate pool: checkpoints, trades and LP lifecycle
// =============================================================================

#include "hyper/hyperdrive.hpp"
#include "hyper/fixed_point.hpp"
#include "hyper/errors.hpp"
#include "hyper/log.hpp"

#include <string>
#include <utility>

namespace hyper {

using namespace fixed;
namespace hm = hyperdrive_math;

namespace {

U256 lp_id() { return asset_id::encode(AssetKind::LP, uint64_t(0)); }
U256 withdrawal_id() { return asset_id::encode(AssetKind::WITHDRAWAL_SHARE, uint64_t(0)); }

U256 net_long_exposure(const PoolState& state) {
    return state.longs_outstanding > state.shorts_outstanding
        ? U256(state.longs_outstanding - state.shorts_outstanding)
        : U256(0);
}

U256 timestamp_weight(uint64_t time) {
    return U256(time) * ONE;
}

// Largest bond amount whose mint cost fits `base_paid`. The cost is monotone
// in the bond amount and cost(b) >= b * max(c, c0) / c0, which bounds the search.
U256 max_bonds_for(const Fees& fees, const U256& base_paid, const U256& share_price,
                   const U256& open_share_price) {
    U256 lo = 0;
    U256 hi = add(mul_div_down(base_paid, open_share_price,
                               fixed::max(share_price, open_share_price)), U256(1));
    while (hi - lo > 1) {
        U256 mid = lo + (hi - lo) / 2;
        if (hm::calculate_mint_cost(fees, mid, share_price, open_share_price) <= base_paid) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

// Whether `fn` completes without the pool rejecting it
template <typename Fn>
bool accepted(Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const HyperError&) {
        return false;
    }
}

// Largest x in [0, hi] with fits(x); fits must be monotone and fits(0) hold
template <typename Fits>
U256 search_largest(U256 hi, Fits&& fits) {
    if (hi == 0 || fits(hi)) return hi;
    U256 lo = 0;
    while (hi - lo > 1) {
        U256 mid = lo + (hi - lo) / 2;
        if (fits(mid)) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

}  // namespace

bool PoolState::operator==(const PoolState& other) const {
    return share_reserves == other.share_reserves &&
           bond_reserves == other.bond_reserves &&
           lp_total_supply == other.lp_total_supply &&
           longs_outstanding == other.longs_outstanding &&
           shorts_outstanding == other.shorts_outstanding &&
           long_average_maturity_time == other.long_average_maturity_time &&
           short_average_maturity_time == other.short_average_maturity_time &&
           withdrawal_shares_ready_to_withdraw == other.withdrawal_shares_ready_to_withdraw &&
           withdrawal_shares_proceeds == other.withdrawal_shares_proceeds &&
           governance_fees_accrued == other.governance_fees_accrued &&
           initialized == other.initialized;
}

// =============================================================================
// Guards
// =============================================================================

class Hyperdrive::OperationGuard {
public:
    explicit OperationGuard(Hyperdrive& pool) : pool_(pool) {
        if (pool_.owner_.load() == std::this_thread::get_id()) {
            throw AuthorizationError(errors::REENTRANCY, "Hyperdrive: reentrant call");
        }
        pool_.mutex_.lock();
        pool_.owner_.store(std::this_thread::get_id());
    }

    ~OperationGuard() {
        pool_.owner_.store(std::thread::id());
        pool_.mutex_.unlock();
    }

    OperationGuard(const OperationGuard&) = delete;
    OperationGuard& operator=(const OperationGuard&) = delete;

private:
    Hyperdrive& pool_;
};

class Hyperdrive::ReadGuard {
public:
    explicit ReadGuard(const Hyperdrive& pool) : lock_(checked_mutex(pool)) {}

private:
    static std::shared_mutex& checked_mutex(const Hyperdrive& pool) {
        if (pool.owner_.load() == std::this_thread::get_id()) {
            throw AuthorizationError(errors::REENTRANCY, "Hyperdrive: view called during an operation");
        }
        return pool.mutex_;
    }

    std::shared_lock<std::shared_mutex> lock_;
};

template <typename Fn>
auto Hyperdrive::transact(const char* operation, Fn&& fn) {
    OperationGuard guard(*this);
    try {
        return fn();
    } catch (const HyperError& e) {
        log::warn(std::string(operation) + " rejected: " + error_name(e.code()) + " (" + e.what() + ")");
        throw;
    }
}

// =============================================================================
// Construction
// =============================================================================

Hyperdrive::Hyperdrive(const Address& self, PoolConfig config, IYieldSource& yield_source,
                       ILedger& ledger, Clock clock)
    : self_(self),
      config_(std::move(config)),
      yield_source_(yield_source),
      ledger_(ledger),
      clock_(std::move(clock)) {
    config_.validate();
    if (!clock_) {
        throw ValidationError(errors::INVALID_CONFIG, "Hyperdrive: clock is required");
    }
    log::set_level(log::parse_level(config_.log_level));
}

void Hyperdrive::commit(Staged&& staged) {
    state_ = std::move(staged.state);
    checkpoints_ = std::move(staged.checkpoints);
}

// =============================================================================
// Validation
// =============================================================================

void Hyperdrive::require_initialized(const PoolState& state) const {
    if (!state.initialized) {
        throw ValidationError(errors::POOL_NOT_INITIALIZED, "Hyperdrive: pool not initialized");
    }
}

void Hyperdrive::require_amount(const U256& amount) const {
    if (amount == 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "Hyperdrive: zero amount");
    }
    if (amount < config_.minimum_transaction_amount) {
        throw ValidationError(errors::BELOW_MINIMUM_TRANSACTION,
                              "Hyperdrive: amount below minimum transaction amount");
    }
}

void Hyperdrive::require_destination(const Address& destination) const {
    if (is_zero(destination)) {
        throw ValidationError(errors::INVALID_DESTINATION, "Hyperdrive: zero destination");
    }
}

void Hyperdrive::require_maturity(uint64_t maturity_time) const {
    if (maturity_time == 0 || maturity_time % config_.checkpoint_duration != 0 ||
        maturity_time > latest_checkpoint() + config_.position_duration) {
        throw ValidationError(errors::INVALID_MATURITY_TIME,
                              "Hyperdrive: invalid maturity " + std::to_string(maturity_time));
    }
}

void Hyperdrive::require_balance(AssetKind kind, uint64_t maturity_time, const Address& account,
                                 const U256& amount) const {
    U256 id = asset_id::encode(kind, maturity_time);
    if (ledger_.balance_of(id, account) < amount) {
        throw AuthorizationError(errors::INSUFFICIENT_BALANCE,
                                 std::string("Hyperdrive: insufficient ") + to_string(kind) + " balance");
    }
}

// =============================================================================
// Pricing Helpers
// =============================================================================

uint64_t Hyperdrive::now() const {
    return clock_();
}

uint64_t Hyperdrive::latest_checkpoint_at(uint64_t time) const {
    return time - time % config_.checkpoint_duration;
}

CurveState Hyperdrive::curve_state(const PoolState& state, const U256& time_remaining,
                                   const U256& share_price) const {
    return CurveState{state.share_reserves, state.bond_reserves, state.lp_total_supply,
                      time_remaining, config_.time_stretch, share_price,
                      config_.initial_vault_share_price};
}

U256 Hyperdrive::spot_price_of(const PoolState& state) const {
    return hm::calculate_spot_price(state.share_reserves, state.bond_reserves,
                                    state.lp_total_supply, config_.initial_vault_share_price,
                                    config_.time_stretch);
}

U256 Hyperdrive::spot_rate_of(const PoolState& state) const {
    return hm::calculate_apr_from_reserves(state.share_reserves, state.bond_reserves,
                                           state.lp_total_supply,
                                           config_.initial_vault_share_price,
                                           config_.position_duration, config_.time_stretch);
}

U256 Hyperdrive::present_value_of(const PoolState& state, const U256& share_price) const {
    const uint64_t latest = latest_checkpoint();
    hm::OpenPositions positions{
        state.longs_outstanding, state.shorts_outstanding,
        hm::calculate_average_time_remaining(state.long_average_maturity_time, latest,
                                             config_.position_duration),
        hm::calculate_average_time_remaining(state.short_average_maturity_time, latest,
                                             config_.position_duration)};
    return hm::calculate_present_value(curve_state(state, ONE, share_price), positions,
                                       config_.minimum_share_reserves);
}

// The minimum share reserves' LP shares are locked and carry no claim
U256 Hyperdrive::lp_outstanding(const PoolState& state) const {
    return sub(state.lp_total_supply, config_.minimum_share_reserves);
}

U256 Hyperdrive::open_share_price(const Staged& staged, uint64_t maturity_time,
                                  const U256& fallback) const {
    if (maturity_time < config_.position_duration) return fallback;
    auto it = staged.checkpoints.find(maturity_time - config_.position_duration);
    if (it == staged.checkpoints.end() || it->second.share_price == 0) return fallback;
    return it->second.share_price;
}

// =============================================================================
// State Transitions
// =============================================================================

void Hyperdrive::apply_checkpoint(Staged& staged, uint64_t checkpoint_time,
                                  const U256& share_price) const {
    Checkpoint& checkpoint = staged.checkpoints[checkpoint_time];
    if (checkpoint.share_price != 0) return;
    checkpoint.share_price = share_price;

    PoolState& state = staged.state;
    U256 matured_shorts = ledger_.total_supply(asset_id::encode(AssetKind::SHORT, checkpoint_time));
    U256 matured_longs = ledger_.total_supply(asset_id::encode(AssetKind::LONG, checkpoint_time));

    // Shorts first so paired positions back their own longs
    if (matured_shorts > 0) {
        update_liquidity(state, div_down(matured_shorts, share_price), true);
        state.short_average_maturity_time = update_weighted_average(
            state.short_average_maturity_time, state.shorts_outstanding,
            timestamp_weight(checkpoint_time), matured_shorts, false);
        state.shorts_outstanding = sub(state.shorts_outstanding, matured_shorts);
    }

    if (matured_longs > 0) {
        U256 exposure_before = net_long_exposure(state);
        U256 reserved = div_up(matured_longs, share_price);
        update_liquidity(state, reserved, false);
        state.long_average_maturity_time = update_weighted_average(
            state.long_average_maturity_time, state.longs_outstanding,
            timestamp_weight(checkpoint_time), matured_longs, false);
        state.longs_outstanding = sub(state.longs_outstanding, matured_longs);
        release_withdrawal_liquidity(state, exposure_before, matured_longs, reserved, share_price);
    }

    log::debug("checkpoint " + std::to_string(checkpoint_time) + " share_price=" +
               format_fixed(share_price) + " matured longs=" + format_fixed(matured_longs) +
               " shorts=" + format_fixed(matured_shorts));
}

void Hyperdrive::update_liquidity(PoolState& state, const U256& delta, bool is_adding) const {
    if (delta == 0 || state.share_reserves == 0) return;
    U256 share_reserves = is_adding ? add(state.share_reserves, delta)
                                    : sub(state.share_reserves, delta);
    state.bond_reserves = mul_div_down(state.bond_reserves, share_reserves, state.share_reserves);
    state.share_reserves = share_reserves;
}

// Withdrawal shares are denominated in bonds of net long exposure. Closing
// `bonds_closed` unlocks the same fraction of the pending withdrawal shares,
// and their slice of whatever the close did not pay out leaves the reserves.
void Hyperdrive::release_withdrawal_liquidity(PoolState& state, const U256& exposure_before,
                                              const U256& bonds_closed, const U256& shares_paid,
                                              const U256& share_price) const {
    if (exposure_before == 0) return;
    U256 total = ledger_.total_supply(withdrawal_id());
    if (total <= state.withdrawal_shares_ready_to_withdraw) return;

    U256 pending = total - state.withdrawal_shares_ready_to_withdraw;
    U256 freed = fixed::min(bonds_closed, exposure_before);
    U256 unlocked = fixed::min(pending, mul_div_down(pending, freed, exposure_before));
    if (unlocked == 0) return;

    U256 freed_shares = div_down(freed, share_price);
    U256 surplus = freed_shares > shares_paid ? U256(freed_shares - shares_paid) : U256(0);
    U256 proceeds = mul_div_down(surplus, fixed::min(pending, exposure_before), exposure_before);

    U256 available = state.share_reserves > config_.minimum_share_reserves
        ? U256(state.share_reserves - config_.minimum_share_reserves)
        : U256(0);
    proceeds = fixed::min(proceeds, available);

    update_liquidity(state, proceeds, false);
    state.withdrawal_shares_ready_to_withdraw = add(state.withdrawal_shares_ready_to_withdraw, unlocked);
    state.withdrawal_shares_proceeds = add(state.withdrawal_shares_proceeds, proceeds);
}

void Hyperdrive::check_solvency(const PoolState& state, const U256& share_price) const {
    if (state.share_reserves < config_.minimum_share_reserves) {
        throw ValidationError(errors::INSUFFICIENT_LIQUIDITY,
                              "Hyperdrive: share reserves below minimum");
    }
    U256 exposure = net_long_exposure(state);
    if (exposure > 0 &&
        state.share_reserves < add(div_up(exposure, share_price), config_.minimum_share_reserves)) {
        throw ValidationError(errors::INSUFFICIENT_LIQUIDITY,
                              "Hyperdrive: reserves cannot cover open long exposure");
    }
}

void Hyperdrive::record_long_open(Staged& staged, uint64_t opened_at, uint64_t maturity_time,
                                  const U256& bonds, const U256& share_price) const {
    Checkpoint& checkpoint = staged.checkpoints[opened_at];
    U256 prior = ledger_.total_supply(asset_id::encode(AssetKind::LONG, maturity_time));
    checkpoint.long_share_price =
        update_weighted_average(checkpoint.long_share_price, prior, share_price, bonds, true);

    PoolState& state = staged.state;
    state.long_average_maturity_time =
        update_weighted_average(state.long_average_maturity_time, state.longs_outstanding,
                                timestamp_weight(maturity_time), bonds, true);
    state.longs_outstanding = add(state.longs_outstanding, bonds);
}

U256 Hyperdrive::apply_open_long(Staged& staged, uint64_t latest, const U256& shares,
                                 const U256& share_price) const {
    PoolState& state = staged.state;
    const U256& c = share_price;

    U256 p = spot_price_of(state);
    TradeQuote quote = hm::calculate_out_given_in(curve_state(state, ONE, c), shares, true);
    U256 curve_fee = hm::open_long_curve_fee(config_.fees, mul_down(shares, c), p);
    U256 governance = hm::open_long_governance_fee(config_.fees, curve_fee, p, c);
    U256 bonds = sub(quote.total, curve_fee);

    state.share_reserves = sub(add(state.share_reserves, shares), governance);
    state.bond_reserves = sub(state.bond_reserves, bonds);
    state.governance_fees_accrued = add(state.governance_fees_accrued, governance);
    record_long_open(staged, latest, latest + config_.position_duration, bonds, c);

    if (spot_price_of(state) > ONE) {
        throw ValidationError(errors::INSUFFICIENT_LIQUIDITY,
                              "Hyperdrive: trade would push the fixed rate below zero");
    }
    check_solvency(state, c);
    return bonds;
}

U256 Hyperdrive::apply_open_short(Staged& staged, uint64_t latest, const U256& bond_amount,
                                  const U256& share_price) const {
    PoolState& state = staged.state;
    const U256& c = share_price;

    U256 p = spot_price_of(state);
    TradeQuote quote = hm::calculate_out_given_in(curve_state(state, ONE, c), bond_amount, false);
    U256 curve_fee = hm::open_short_curve_fee(config_.fees, bond_amount, p, c);
    U256 governance = hm::governance_fee(config_.fees, curve_fee);
    U256 share_proceeds = sub(quote.curve_shares, curve_fee);

    state.share_reserves = sub(state.share_reserves, add(share_proceeds, governance));
    state.bond_reserves = add(state.bond_reserves, bond_amount);
    state.governance_fees_accrued = add(state.governance_fees_accrued, governance);
    state.short_average_maturity_time = update_weighted_average(
        state.short_average_maturity_time, state.shorts_outstanding,
        timestamp_weight(latest + config_.position_duration), bond_amount, true);
    state.shorts_outstanding = add(state.shorts_outstanding, bond_amount);
    check_solvency(state, c);

    // Collateral is the face value at the opening checkpoint price: dy / c0 - proceeds
    U256 open_price = staged.checkpoints[latest].share_price;
    return sub(div_up(bond_amount, open_price), share_proceeds);
}

// The pair's principal stays outside the reserves; only the LP flat fee enters them
void Hyperdrive::apply_mint(Staged& staged, uint64_t latest, const U256& bond_amount,
                            const U256& share_price) const {
    PoolState& state = staged.state;
    const uint64_t maturity = latest + config_.position_duration;

    U256 flat_base = mul_down(bond_amount, config_.fees.flat);
    U256 flat_fee = div_down(flat_base, share_price);
    U256 governance_base = mul_down(flat_base, config_.fees.governance);
    U256 governance = div_down(add(governance_base, governance_base), share_price);
    update_liquidity(state, flat_fee, true);
    state.governance_fees_accrued = add(state.governance_fees_accrued, governance);

    record_long_open(staged, latest, maturity, bond_amount, share_price);
    state.short_average_maturity_time = update_weighted_average(
        state.short_average_maturity_time, state.shorts_outstanding,
        timestamp_weight(maturity), bond_amount, true);
    state.shorts_outstanding = add(state.shorts_outstanding, bond_amount);
    check_solvency(state, share_price);
}

// =============================================================================
// Fund Movement
// =============================================================================

DepositResult Hyperdrive::deposit(const Address& from, const U256& amount, bool as_base) {
    if (as_base) {
        return yield_source_.deposit_base(from, amount);
    }
    yield_source_.deposit_shares(from, amount);
    return DepositResult{amount, 0};
}

U256 Hyperdrive::pay(const U256& shares, const Address& destination, bool as_base) {
    if (shares == 0) return 0;
    return as_base ? yield_source_.withdraw_base(shares, destination)
                   : yield_source_.withdraw_shares(shares, destination);
}

U256 Hyperdrive::to_output_units(const U256& shares, bool as_base) const {
    return as_base ? yield_source_.convert_to_base(shares) : shares;
}

// =============================================================================
// Liquidity
// =============================================================================

U256 Hyperdrive::initialize(const Address& caller, const U256& contribution, const U256& apr,
                            const Options& options) {
    return transact("initialize", [&]() {
        if (state_.initialized) {
            throw ValidationError(errors::POOL_ALREADY_INITIALIZED,
                                  "Hyperdrive: pool already initialized");
        }
        require_destination(options.destination);
        if (contribution == 0) {
            throw ValidationError(errors::ZERO_AMOUNT, "Hyperdrive: zero contribution");
        }

        const U256 c = vault_share_price();
        const uint64_t latest = latest_checkpoint();
        const U256 shares = deposit(caller, contribution, options.as_base).shares;

        Staged staged = stage();
        try {
            if (shares < add(config_.minimum_share_reserves, config_.minimum_share_reserves)) {
                throw ValidationError(errors::INSUFFICIENT_LIQUIDITY,
                                      "Hyperdrive: contribution below twice the minimum share reserves");
            }
            PoolState& state = staged.state;
            state.share_reserves = shares;
            state.lp_total_supply = shares;
            state.bond_reserves = hm::calculate_bond_reserves(
                shares, shares, config_.initial_vault_share_price, apr,
                config_.position_duration, config_.time_stretch);
            state.initialized = true;
            apply_checkpoint(staged, latest, c);
        } catch (...) {
            pay(shares, caller, options.as_base);
            throw;
        }
        commit(std::move(staged));

        U256 lp_shares = shares - config_.minimum_share_reserves;
        ledger_.mint(lp_id(), options.destination, lp_shares);
        ledger_.mint(lp_id(), ZERO_ADDRESS, config_.minimum_share_reserves);

        log::info("initialized pool " + to_hex(self_) + " shares=" + format_fixed(shares) +
                  " apr=" + format_fixed(apr));
        return lp_shares;
    });
}

U256 Hyperdrive::add_liquidity(const Address& caller, const U256& contribution,
                               const U256& min_apr, const U256& max_apr, const Options& options) {
    return transact("add_liquidity", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        require_amount(contribution);

        U256 apr = spot_rate_of(state_);
        if (apr < min_apr || apr > max_apr) {
            throw SlippageError(errors::INVALID_APR, "Hyperdrive: spot rate outside the accepted band");
        }

        const U256 c = vault_share_price();
        const uint64_t latest = latest_checkpoint();
        const U256 shares = deposit(caller, contribution, options.as_base).shares;

        Staged staged = stage();
        U256 lp_shares;
        try {
            apply_checkpoint(staged, latest, c);
            PoolState& state = staged.state;
            lp_shares = hm::calculate_lp_out_given_shares_in(
                shares, present_value_of(state, c), lp_outstanding(state));
            if (lp_shares == 0) {
                throw ValidationError(errors::ZERO_AMOUNT, "Hyperdrive: contribution mints no LP shares");
            }
            update_liquidity(state, shares, true);
            state.lp_total_supply = add(state.lp_total_supply, lp_shares);
        } catch (...) {
            pay(shares, caller, options.as_base);
            throw;
        }
        commit(std::move(staged));

        ledger_.mint(lp_id(), options.destination, lp_shares);
        log::debug("add_liquidity " + to_hex(caller) + " lp=" + format_fixed(lp_shares));
        return lp_shares;
    });
}

RemoveLiquidityResult Hyperdrive::remove_liquidity(const Address& caller, const U256& lp_shares,
                                                   const U256& min_output, const Options& options) {
    return transact("remove_liquidity", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        require_amount(lp_shares);
        require_balance(AssetKind::LP, 0, caller, lp_shares);

        const U256 c = vault_share_price();
        Staged staged = stage();
        apply_checkpoint(staged, latest_checkpoint(), c);

        PoolState& state = staged.state;
        U256 idle = hm::calculate_idle_liquidity(state.share_reserves, net_long_exposure(state), c,
                                                 config_.minimum_share_reserves);
        U256 shares_out = hm::calculate_shares_out_given_lp_in(lp_shares, idle, lp_outstanding(state));
        U256 withdrawal_shares =
            mul_div_down(net_long_exposure(state), lp_shares, state.lp_total_supply);

        update_liquidity(state, shares_out, false);
        state.lp_total_supply = sub(state.lp_total_supply, lp_shares);
        check_solvency(state, c);

        if (to_output_units(shares_out, options.as_base) < min_output) {
            throw SlippageError(errors::OUTPUT_LIMIT, "Hyperdrive: proceeds below min_output");
        }
        commit(std::move(staged));

        ledger_.burn(lp_id(), caller, lp_shares);
        if (withdrawal_shares > 0) {
            ledger_.mint(withdrawal_id(), options.destination, withdrawal_shares);
        }
        U256 proceeds = pay(shares_out, options.destination, options.as_base);

        log::debug("remove_liquidity " + to_hex(caller) + " lp=" + format_fixed(lp_shares) +
                   " withdrawal_shares=" + format_fixed(withdrawal_shares));
        return RemoveLiquidityResult{proceeds, withdrawal_shares};
    });
}

RedeemResult Hyperdrive::redeem_withdrawal_shares(const Address& caller, const U256& withdrawal_shares,
                                                  const U256& min_output_per_share,
                                                  const Options& options) {
    return transact("redeem_withdrawal_shares", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        if (withdrawal_shares == 0) {
            throw ValidationError(errors::ZERO_AMOUNT, "Hyperdrive: zero withdrawal shares");
        }
        require_balance(AssetKind::WITHDRAWAL_SHARE, 0, caller, withdrawal_shares);

        const U256 c = vault_share_price();
        Staged staged = stage();
        apply_checkpoint(staged, latest_checkpoint(), c);

        PoolState& state = staged.state;
        U256 redeemed = fixed::min(withdrawal_shares, state.withdrawal_shares_ready_to_withdraw);
        U256 shares_out = 0;
        if (redeemed > 0) {
            shares_out = mul_div_down(state.withdrawal_shares_proceeds, redeemed,
                                      state.withdrawal_shares_ready_to_withdraw);
            state.withdrawal_shares_ready_to_withdraw =
                sub(state.withdrawal_shares_ready_to_withdraw, redeemed);
            state.withdrawal_shares_proceeds = sub(state.withdrawal_shares_proceeds, shares_out);

            U256 per_share = div_down(to_output_units(shares_out, options.as_base), redeemed);
            if (per_share < min_output_per_share) {
                throw SlippageError(errors::OUTPUT_LIMIT,
                                    "Hyperdrive: proceeds per share below minimum");
            }
        }
        commit(std::move(staged));

        if (redeemed > 0) {
            ledger_.burn(withdrawal_id(), caller, redeemed);
        }
        U256 proceeds = pay(shares_out, options.destination, options.as_base);
        return RedeemResult{proceeds, redeemed};
    });
}

// =============================================================================
// Longs
// =============================================================================

OpenLongResult Hyperdrive::open_long(const Address& caller, const U256& amount, const U256& min_output,
                                     const U256& min_vault_share_price, const Options& options) {
    return transact("open_long", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        require_amount(amount);

        const U256 c = vault_share_price();
        if (c < min_vault_share_price) {
            throw SlippageError(errors::MINIMUM_SHARE_PRICE, "Hyperdrive: vault share price below minimum");
        }
        const uint64_t latest = latest_checkpoint();
        const uint64_t maturity = latest + config_.position_duration;
        const U256 shares = deposit(caller, amount, options.as_base).shares;

        Staged staged = stage();
        U256 bonds;
        try {
            apply_checkpoint(staged, latest, c);
            bonds = apply_open_long(staged, latest, shares, c);
            if (bonds < min_output) {
                throw SlippageError(errors::OUTPUT_LIMIT, "Hyperdrive: bonds below min_output");
            }
        } catch (...) {
            pay(shares, caller, options.as_base);
            throw;
        }
        commit(std::move(staged));

        ledger_.mint(asset_id::encode(AssetKind::LONG, maturity), options.destination, bonds);
        log::debug("open_long " + to_hex(caller) + " bonds=" + format_fixed(bonds) +
                   " maturity=" + std::to_string(maturity));
        return OpenLongResult{maturity, bonds};
    });
}

U256 Hyperdrive::close_long(const Address& caller, uint64_t maturity_time, const U256& bond_amount,
                            const U256& min_output, const Options& options) {
    return transact("close_long", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        require_amount(bond_amount);
        require_maturity(maturity_time);
        require_balance(AssetKind::LONG, maturity_time, caller, bond_amount);

        const U256 c = vault_share_price();
        const uint64_t latest = latest_checkpoint();
        Staged staged = stage();
        apply_checkpoint(staged, latest, c);
        PoolState& state = staged.state;

        U256 shares_out;
        if (maturity_time <= latest) {
            // Matured: reserves were set aside when the checkpoint was recorded
            apply_checkpoint(staged, maturity_time, c);
            U256 close_price = staged.checkpoints[maturity_time].share_price;
            shares_out = div_down(bond_amount, close_price);

            auto opened = staged.checkpoints.find(maturity_time - config_.position_duration);
            if (opened != staged.checkpoints.end() && opened->second.long_share_price > close_price) {
                shares_out = mul_div_down(shares_out, close_price, opened->second.long_share_price);
            }
        } else {
            U256 t = hm::calculate_time_remaining(maturity_time, latest, config_.position_duration);
            U256 p = spot_price_of(state);
            TradeQuote quote = hm::calculate_out_given_in(curve_state(state, t, c), bond_amount, false);

            U256 curve_fee = hm::close_curve_fee(config_.fees, bond_amount, t, p, c);
            U256 flat_fee = hm::close_flat_fee(config_.fees, bond_amount, t, c);
            U256 governance_curve = hm::governance_fee(config_.fees, curve_fee);
            U256 governance_flat = hm::governance_fee(config_.fees, flat_fee);
            U256 curve_out = sub(quote.curve_shares, curve_fee);
            U256 flat_out = sub(quote.flat_shares, flat_fee);
            U256 exposure_before = net_long_exposure(state);

            // Flat leg
            update_liquidity(state, add(flat_out, governance_flat), false);
            // Curve leg
            state.share_reserves = sub(state.share_reserves, add(curve_out, governance_curve));
            state.bond_reserves = add(state.bond_reserves, quote.curve_bonds);
            state.governance_fees_accrued =
                add(state.governance_fees_accrued, add(governance_curve, governance_flat));

            state.long_average_maturity_time = update_weighted_average(
                state.long_average_maturity_time, state.longs_outstanding,
                timestamp_weight(maturity_time), bond_amount, false);
            state.longs_outstanding = sub(state.longs_outstanding, bond_amount);

            shares_out = add(curve_out, flat_out);
            release_withdrawal_liquidity(state, exposure_before, bond_amount, shares_out, c);
            check_solvency(state, c);
        }

        if (to_output_units(shares_out, options.as_base) < min_output) {
            throw SlippageError(errors::OUTPUT_LIMIT, "Hyperdrive: proceeds below min_output");
        }
        commit(std::move(staged));

        ledger_.burn(asset_id::encode(AssetKind::LONG, maturity_time), caller, bond_amount);
        U256 proceeds = pay(shares_out, options.destination, options.as_base);
        log::debug("close_long " + to_hex(caller) + " bonds=" + format_fixed(bond_amount) +
                   " proceeds=" + format_fixed(proceeds));
        return proceeds;
    });
}

// =============================================================================
// Shorts
// =============================================================================

OpenShortResult Hyperdrive::open_short(const Address& caller, const U256& bond_amount,
                                       const U256& max_deposit, const U256& min_vault_share_price,
                                       const Options& options) {
    return transact("open_short", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        require_amount(bond_amount);

        const U256 c = vault_share_price();
        if (c < min_vault_share_price) {
            throw SlippageError(errors::MINIMUM_SHARE_PRICE, "Hyperdrive: vault share price below minimum");
        }
        const uint64_t latest = latest_checkpoint();
        const uint64_t maturity = latest + config_.position_duration;

        Staged staged = stage();
        apply_checkpoint(staged, latest, c);
        U256 deposit_shares = apply_open_short(staged, latest, bond_amount, c);
        U256 deposit_amount = options.as_base ? mul_up(deposit_shares, c) : deposit_shares;
        if (deposit_amount > max_deposit) {
            throw SlippageError(errors::INPUT_LIMIT, "Hyperdrive: deposit exceeds max_deposit");
        }

        deposit(caller, deposit_amount, options.as_base);
        commit(std::move(staged));

        ledger_.mint(asset_id::encode(AssetKind::SHORT, maturity), options.destination, bond_amount);
        log::debug("open_short " + to_hex(caller) + " bonds=" + format_fixed(bond_amount) +
                   " deposit=" + format_fixed(deposit_amount));
        return OpenShortResult{maturity, deposit_amount};
    });
}

U256 Hyperdrive::close_short(const Address& caller, uint64_t maturity_time, const U256& bond_amount,
                             const U256& min_output, const Options& options) {
    return transact("close_short", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        require_amount(bond_amount);
        require_maturity(maturity_time);
        require_balance(AssetKind::SHORT, maturity_time, caller, bond_amount);

        const U256 c = vault_share_price();
        const uint64_t latest = latest_checkpoint();
        Staged staged = stage();
        apply_checkpoint(staged, latest, c);
        PoolState& state = staged.state;
        U256 open_price = open_share_price(staged, maturity_time, c);

        U256 shares_out;
        if (maturity_time <= latest) {
            apply_checkpoint(staged, maturity_time, c);
            U256 close_price = staged.checkpoints[maturity_time].share_price;
            shares_out = hm::calculate_short_proceeds(bond_amount, div_up(bond_amount, c),
                                                      open_price, close_price, c);
        } else {
            U256 t = hm::calculate_time_remaining(maturity_time, latest, config_.position_duration);
            U256 p = spot_price_of(state);
            TradeQuote quote = hm::calculate_in_given_out(curve_state(state, t, c), bond_amount, true);

            U256 curve_fee = hm::close_curve_fee(config_.fees, bond_amount, t, p, c);
            U256 flat_fee = hm::close_flat_fee(config_.fees, bond_amount, t, c);
            U256 governance_curve = hm::governance_fee(config_.fees, curve_fee);
            U256 governance_flat = hm::governance_fee(config_.fees, flat_fee);

            // Flat leg
            update_liquidity(state, sub(add(quote.flat_shares, flat_fee), governance_flat), true);
            // Curve leg
            state.share_reserves =
                add(state.share_reserves, sub(add(quote.curve_shares, curve_fee), governance_curve));
            state.bond_reserves = sub(state.bond_reserves, quote.curve_bonds);
            state.governance_fees_accrued =
                add(state.governance_fees_accrued, add(governance_curve, governance_flat));

            state.short_average_maturity_time = update_weighted_average(
                state.short_average_maturity_time, state.shorts_outstanding,
                timestamp_weight(maturity_time), bond_amount, false);
            state.shorts_outstanding = sub(state.shorts_outstanding, bond_amount);

            U256 share_cost = add(quote.total, add(curve_fee, flat_fee));
            shares_out = hm::calculate_short_proceeds(bond_amount, share_cost, open_price, c, c);

            if (spot_price_of(state) > ONE) {
                throw ValidationError(errors::INSUFFICIENT_LIQUIDITY,
                                      "Hyperdrive: trade would push the fixed rate below zero");
            }
            check_solvency(state, c);
        }

        if (to_output_units(shares_out, options.as_base) < min_output) {
            throw SlippageError(errors::OUTPUT_LIMIT, "Hyperdrive: proceeds below min_output");
        }
        commit(std::move(staged));

        ledger_.burn(asset_id::encode(AssetKind::SHORT, maturity_time), caller, bond_amount);
        U256 proceeds = pay(shares_out, options.destination, options.as_base);
        log::debug("close_short " + to_hex(caller) + " bonds=" + format_fixed(bond_amount) +
                   " proceeds=" + format_fixed(proceeds));
        return proceeds;
    });
}

// =============================================================================
// Pairs
// =============================================================================

MintResult Hyperdrive::mint(const Address& caller, const U256& amount, const U256& min_output,
                            const U256& min_vault_share_price, const PairOptions& options) {
    return transact("mint", [&]() {
        require_initialized(state_);
        require_destination(options.long_destination);
        require_destination(options.short_destination);
        require_amount(amount);

        const U256 c = vault_share_price();
        if (c < min_vault_share_price) {
            throw SlippageError(errors::MINIMUM_SHARE_PRICE, "Hyperdrive: vault share price below minimum");
        }
        const uint64_t latest = latest_checkpoint();
        const uint64_t maturity = latest + config_.position_duration;
        const DepositResult deposited = deposit(caller, amount, options.as_base);

        Staged staged = stage();
        U256 bonds;
        try {
            apply_checkpoint(staged, latest, c);
            U256 open_price = staged.checkpoints[latest].share_price;
            U256 base_paid = options.as_base ? sub(amount, deposited.refund)
                                             : yield_source_.convert_to_base(deposited.shares);

            bonds = max_bonds_for(config_.fees, base_paid, c, open_price);

            if (bonds < min_output) {
                throw SlippageError(errors::OUTPUT_LIMIT, "Hyperdrive: bonds below min_output");
            }
            if (bonds < config_.minimum_transaction_amount) {
                throw ValidationError(errors::BELOW_MINIMUM_TRANSACTION,
                                      "Hyperdrive: minted bonds below minimum transaction amount");
            }

            apply_mint(staged, latest, bonds, c);
        } catch (...) {
            pay(deposited.shares, caller, options.as_base);
            throw;
        }
        commit(std::move(staged));

        ledger_.mint(asset_id::encode(AssetKind::LONG, maturity), options.long_destination, bonds);
        ledger_.mint(asset_id::encode(AssetKind::SHORT, maturity), options.short_destination, bonds);
        log::debug("mint " + to_hex(caller) + " bonds=" + format_fixed(bonds) +
                   " maturity=" + std::to_string(maturity));
        return MintResult{maturity, bonds};
    });
}

MintResult Hyperdrive::mint_bonds(const Address& caller, const U256& bond_amount,
                                  const U256& max_deposit, const U256& min_vault_share_price,
                                  const PairOptions& options) {
    return transact("mint_bonds", [&]() {
        require_initialized(state_);
        require_destination(options.long_destination);
        require_destination(options.short_destination);
        require_amount(bond_amount);

        const U256 c = vault_share_price();
        if (c < min_vault_share_price) {
            throw SlippageError(errors::MINIMUM_SHARE_PRICE, "Hyperdrive: vault share price below minimum");
        }
        const uint64_t latest = latest_checkpoint();
        const uint64_t maturity = latest + config_.position_duration;

        Staged staged = stage();
        apply_checkpoint(staged, latest, c);
        U256 open_price = staged.checkpoints[latest].share_price;
        apply_mint(staged, latest, bond_amount, c);

        U256 cost = hm::calculate_mint_cost(config_.fees, bond_amount, c, open_price);
        U256 deposit_amount = options.as_base ? cost : div_up(cost, c);
        if (deposit_amount > max_deposit) {
            throw SlippageError(errors::INPUT_LIMIT, "Hyperdrive: mint cost exceeds max_deposit");
        }

        deposit(caller, deposit_amount, options.as_base);
        commit(std::move(staged));

        ledger_.mint(asset_id::encode(AssetKind::LONG, maturity), options.long_destination, bond_amount);
        ledger_.mint(asset_id::encode(AssetKind::SHORT, maturity), options.short_destination, bond_amount);
        log::debug("mint_bonds " + to_hex(caller) + " bonds=" + format_fixed(bond_amount) +
                   " deposit=" + format_fixed(deposit_amount));
        return MintResult{maturity, bond_amount};
    });
}

U256 Hyperdrive::burn(const Address& caller, uint64_t maturity_time, const U256& bond_amount,
                      const U256& min_output, const Options& options) {
    return transact("burn", [&]() {
        require_initialized(state_);
        require_destination(options.destination);
        require_amount(bond_amount);
        require_maturity(maturity_time);
        require_balance(AssetKind::LONG, maturity_time, caller, bond_amount);
        require_balance(AssetKind::SHORT, maturity_time, caller, bond_amount);

        const U256 c = vault_share_price();
        const uint64_t latest = latest_checkpoint();
        Staged staged = stage();
        apply_checkpoint(staged, latest, c);
        PoolState& state = staged.state;
        U256 open_price = open_share_price(staged, maturity_time, c);

        U256 shares_out;
        if (maturity_time <= latest) {
            apply_checkpoint(staged, maturity_time, c);
            U256 close_price = staged.checkpoints[maturity_time].share_price;
            U256 long_part = div_down(bond_amount, close_price);
            U256 short_part = hm::calculate_short_proceeds(bond_amount, div_up(bond_amount, c),
                                                           open_price, close_price, c);
            shares_out = add(long_part, short_part);
        } else {
            U256 t = hm::calculate_time_remaining(maturity_time, latest, config_.position_duration);
            U256 flat_fee = hm::close_flat_fee(config_.fees, bond_amount, t, c);
            U256 governance_flat = hm::governance_fee(config_.fees, flat_fee);
            U256 governance = add(governance_flat, governance_flat);

            shares_out = sub(div_down(bond_amount, open_price), add(flat_fee, governance));
            update_liquidity(state, flat_fee, true);
            state.governance_fees_accrued = add(state.governance_fees_accrued, governance);

            state.long_average_maturity_time = update_weighted_average(
                state.long_average_maturity_time, state.longs_outstanding,
                timestamp_weight(maturity_time), bond_amount, false);
            state.longs_outstanding = sub(state.longs_outstanding, bond_amount);
            state.short_average_maturity_time = update_weighted_average(
                state.short_average_maturity_time, state.shorts_outstanding,
                timestamp_weight(maturity_time), bond_amount, false);
            state.shorts_outstanding = sub(state.shorts_outstanding, bond_amount);
        }

        if (to_output_units(shares_out, options.as_base) < min_output) {
            throw SlippageError(errors::OUTPUT_LIMIT, "Hyperdrive: proceeds below min_output");
        }
        commit(std::move(staged));

        ledger_.burn(asset_id::encode(AssetKind::LONG, maturity_time), caller, bond_amount);
        ledger_.burn(asset_id::encode(AssetKind::SHORT, maturity_time), caller, bond_amount);
        U256 proceeds = pay(shares_out, options.destination, options.as_base);
        log::debug("burn " + to_hex(caller) + " bonds=" + format_fixed(bond_amount) +
                   " proceeds=" + format_fixed(proceeds));
        return proceeds;
    });
}

// =============================================================================
// Positions
// =============================================================================

void Hyperdrive::transfer_position(const Address& caller, const Address& from, const Address& to,
                                   const U256& id, const U256& amount) {
    transact("transfer_position", [&]() {
        if (caller != from && approvals_.count({from, caller}) == 0) {
            throw AuthorizationError(errors::UNAUTHORIZED,
                                     "Hyperdrive: caller may not move positions of " + to_hex(from));
        }
        require_destination(to);
        if (amount == 0) {
            throw ValidationError(errors::ZERO_AMOUNT, "Hyperdrive: zero transfer");
        }
        (void)asset_id::decode(id);
        if (ledger_.balance_of(id, from) < amount) {
            throw AuthorizationError(errors::INSUFFICIENT_BALANCE, "Hyperdrive: insufficient position balance");
        }
        ledger_.burn(id, from, amount);
        ledger_.mint(id, to, amount);
    });
}

void Hyperdrive::set_approval_for_all(const Address& owner, const Address& operator_address,
                                      bool approved) {
    transact("set_approval_for_all", [&]() {
        if (approved) {
            approvals_.insert({owner, operator_address});
        } else {
            approvals_.erase({owner, operator_address});
        }
    });
}

bool Hyperdrive::is_approved_for_all(const Address& owner, const Address& operator_address) const {
    ReadGuard guard(*this);
    return approvals_.count({owner, operator_address}) > 0;
}

// =============================================================================
// Checkpoints
// =============================================================================

void Hyperdrive::checkpoint(uint64_t checkpoint_time) {
    transact("checkpoint", [&]() {
        if (checkpoint_time % config_.checkpoint_duration != 0 ||
            checkpoint_time > latest_checkpoint()) {
            throw ValidationError(errors::INVALID_CHECKPOINT_TIME,
                                  "Hyperdrive: invalid checkpoint time " + std::to_string(checkpoint_time));
        }
        auto it = checkpoints_.find(checkpoint_time);
        if (it != checkpoints_.end() && it->second.share_price != 0) return;

        const U256 c = vault_share_price();
        Staged staged = stage();
        apply_checkpoint(staged, checkpoint_time, c);
        commit(std::move(staged));

        log::info("checkpoint " + std::to_string(checkpoint_time) + " recorded at share price " +
                  format_fixed(c));
    });
}

// =============================================================================
// Views
// =============================================================================

PoolState Hyperdrive::pool_state() const {
    ReadGuard guard(*this);
    return state_;
}

Checkpoint Hyperdrive::get_checkpoint(uint64_t checkpoint_time) const {
    ReadGuard guard(*this);
    auto it = checkpoints_.find(checkpoint_time);
    return it == checkpoints_.end() ? Checkpoint{} : it->second;
}

uint64_t Hyperdrive::latest_checkpoint() const {
    return latest_checkpoint_at(now());
}

U256 Hyperdrive::vault_share_price() const {
    return yield_source_.convert_to_base(ONE);
}

U256 Hyperdrive::spot_price() const {
    ReadGuard guard(*this);
    require_initialized(state_);
    return spot_price_of(state_);
}

U256 Hyperdrive::spot_rate() const {
    ReadGuard guard(*this);
    require_initialized(state_);
    return spot_rate_of(state_);
}

U256 Hyperdrive::lp_share_price() const {
    ReadGuard guard(*this);
    require_initialized(state_);
    U256 outstanding = lp_outstanding(state_);
    if (outstanding == 0) return 0;
    const U256 c = vault_share_price();
    return mul_div_down(present_value_of(state_, c), c, outstanding);
}

U256 Hyperdrive::present_value() const {
    ReadGuard guard(*this);
    require_initialized(state_);
    return present_value_of(state_, vault_share_price());
}

U256 Hyperdrive::max_long(const U256& budget) const {
    ReadGuard guard(*this);
    require_initialized(state_);
    const U256 c = vault_share_price();
    const uint64_t latest = latest_checkpoint();

    Staged base_staged = stage();
    apply_checkpoint(base_staged, latest, c);

    // The spot price reaches one before the reserves take the max buy
    U256 limit = 0;
    if (!accepted([&] {
            limit = yield_space::calculate_max_buy_shares_in(curve_state(base_staged.state, ONE, c));
        })) {
        return 0;
    }

    U256 shares = search_largest(fixed::min(yield_source_.convert_to_shares(budget), limit),
                                 [&](const U256& x) {
                                     Staged trial = base_staged;
                                     return accepted([&] { apply_open_long(trial, latest, x, c); });
                                 });
    return yield_source_.convert_to_base(shares);
}

U256 Hyperdrive::max_short(const U256& budget) const {
    ReadGuard guard(*this);
    require_initialized(state_);
    const U256 c = vault_share_price();
    const uint64_t latest = latest_checkpoint();

    Staged base_staged = stage();
    apply_checkpoint(base_staged, latest, c);

    U256 limit = 0;
    if (!accepted([&] {
            limit = yield_space::calculate_max_sell_bonds_in(curve_state(base_staged.state, ONE, c),
                                                             config_.minimum_share_reserves);
        })) {
        return 0;
    }

    return search_largest(limit, [&](const U256& x) {
        Staged trial = base_staged;
        U256 deposit_shares = 0;
        return accepted([&] { deposit_shares = apply_open_short(trial, latest, x, c); }) &&
               mul_up(deposit_shares, c) <= budget;
    });
}

U256 Hyperdrive::spot_price_after_long(const U256& base_amount) const {
    ReadGuard guard(*this);
    require_initialized(state_);
    const U256 c = vault_share_price();
    const uint64_t latest = latest_checkpoint();

    Staged staged = stage();
    apply_checkpoint(staged, latest, c);
    apply_open_long(staged, latest, yield_source_.convert_to_shares(base_amount), c);
    return spot_price_of(staged.state);
}

U256 Hyperdrive::spot_price_after_short(const U256& bond_amount) const {
    ReadGuard guard(*this);
    require_initialized(state_);
    const U256 c = vault_share_price();
    const uint64_t latest = latest_checkpoint();

    Staged staged = stage();
    apply_checkpoint(staged, latest, c);
    apply_open_short(staged, latest, bond_amount, c);
    return spot_price_of(staged.state);
}

} // namespace hyper
