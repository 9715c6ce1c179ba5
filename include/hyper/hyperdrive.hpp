#ifndef HYPER_HYPERDRIVE_HPP
#define HYPER_HYPERDRIVE_HPP

#include <atomic>
#include <map>
#include <set>
#include <shared_mutex>
#include <thread>

#include "types.hpp"
#include "asset_id.hpp"
#include "config.hpp"
#include "interfaces.hpp"
#include "hyperdrive_math.hpp"

namespace hyper {

// =============================================================================
// Pool State
// =============================================================================

struct PoolState {
    U256 share_reserves;
    U256 bond_reserves;
    U256 lp_total_supply;          // also the curve's bond reserve adjustment
    U256 longs_outstanding;
    U256 shorts_outstanding;
    U256 long_average_maturity_time;   // seconds, 1e18 scale
    U256 short_average_maturity_time;  // seconds, 1e18 scale
    U256 withdrawal_shares_ready_to_withdraw;
    U256 withdrawal_shares_proceeds;   // vault shares backing ready withdrawal shares
    U256 governance_fees_accrued;      // vault shares
    bool initialized = false;

    bool operator==(const PoolState& other) const;
    bool operator!=(const PoolState& other) const { return !(*this == other); }
};

// =============================================================================
// Checkpoint
// =============================================================================

struct Checkpoint {
    U256 share_price;       // vault share price at first touch; frozen once nonzero
    U256 long_share_price;  // bond-weighted share price of longs opened in this bucket

    bool operator==(const Checkpoint& other) const {
        return share_price == other.share_price && long_share_price == other.long_share_price;
    }
};

// =============================================================================
// Trade Options
// =============================================================================

struct Options {
    Address destination{};
    bool as_base = true;  // settle in base (true) or vault shares (false)
};

struct PairOptions {
    Address long_destination{};
    Address short_destination{};
    bool as_base = true;
};

struct OpenLongResult {
    uint64_t maturity_time = 0;
    U256 bond_amount;
};

struct OpenShortResult {
    uint64_t maturity_time = 0;
    U256 deposit;  // base (or vault shares) paid by the trader
};

struct RemoveLiquidityResult {
    U256 proceeds;           // base (or vault shares) paid out
    U256 withdrawal_shares;  // claims on liquidity still backing longs
};

struct RedeemResult {
    U256 proceeds;
    U256 shares_redeemed;
};

struct MintResult {
    uint64_t maturity_time = 0;
    U256 bond_amount;
};

// =============================================================================
// Hyperdrive - fixed-rate yield pool
//
// Every public mutator is one atomic operation: state changes are staged on
// a copy and committed only if the whole operation succeeds. Operations are
// serialized on the pool mutex and a nested call from inside an operation
// (e.g. from a yield source callback) fails with errors::REENTRANCY.
// =============================================================================

class Hyperdrive {
public:
    Hyperdrive(const Address& self, PoolConfig config, IYieldSource& yield_source,
               ILedger& ledger, Clock clock);
    ~Hyperdrive() = default;

    // Non-copyable
    Hyperdrive(const Hyperdrive&) = delete;
    Hyperdrive& operator=(const Hyperdrive&) = delete;

    // =========================================================================
    // Liquidity
    // =========================================================================

    // Seeds reserves at the target `apr`. Returns LP shares minted to the
    // destination; minimum_share_reserves worth of LP is locked.
    U256 initialize(const Address& caller, const U256& contribution, const U256& apr,
                    const Options& options);

    U256 add_liquidity(const Address& caller, const U256& contribution,
                       const U256& min_apr, const U256& max_apr, const Options& options);

    RemoveLiquidityResult remove_liquidity(const Address& caller, const U256& lp_shares,
                                           const U256& min_output, const Options& options);

    // Redeems up to `withdrawal_shares` of the caller's ready withdrawal shares
    RedeemResult redeem_withdrawal_shares(const Address& caller, const U256& withdrawal_shares,
                                          const U256& min_output_per_share,
                                          const Options& options);

    // =========================================================================
    // Trading
    // =========================================================================

    OpenLongResult open_long(const Address& caller, const U256& amount, const U256& min_output,
                             const U256& min_vault_share_price, const Options& options);

    U256 close_long(const Address& caller, uint64_t maturity_time, const U256& bond_amount,
                    const U256& min_output, const Options& options);

    OpenShortResult open_short(const Address& caller, const U256& bond_amount,
                               const U256& max_deposit, const U256& min_vault_share_price,
                               const Options& options);

    U256 close_short(const Address& caller, uint64_t maturity_time, const U256& bond_amount,
                     const U256& min_output, const Options& options);

    // Paired long + short at the current maturity, bypassing the curve
    MintResult mint(const Address& caller, const U256& amount, const U256& min_output,
                    const U256& min_vault_share_price, const PairOptions& options);

    // Mints exactly `bond_amount` pairs; the caller pays the mint cost, at
    // most `max_deposit` base (or vault shares)
    MintResult mint_bonds(const Address& caller, const U256& bond_amount, const U256& max_deposit,
                          const U256& min_vault_share_price, const PairOptions& options);

    // Closes `bond_amount` paired longs and shorts held by the caller
    U256 burn(const Address& caller, uint64_t maturity_time, const U256& bond_amount,
              const U256& min_output, const Options& options);

    // =========================================================================
    // Positions
    // =========================================================================

    void transfer_position(const Address& caller, const Address& from, const Address& to,
                           const U256& id, const U256& amount);

    void set_approval_for_all(const Address& owner, const Address& operator_address, bool approved);
    bool is_approved_for_all(const Address& owner, const Address& operator_address) const;

    // =========================================================================
    // Checkpoints
    // =========================================================================

    // Records `checkpoint_time` and matures its positions; idempotent
    void checkpoint(uint64_t checkpoint_time);

    // =========================================================================
    // Views
    // =========================================================================

    PoolState pool_state() const;
    Checkpoint get_checkpoint(uint64_t checkpoint_time) const;
    const PoolConfig& config() const noexcept { return config_; }
    const Address& address() const noexcept { return self_; }

    uint64_t latest_checkpoint() const;
    U256 vault_share_price() const;
    U256 spot_price() const;
    U256 spot_rate() const;
    U256 lp_share_price() const;

    // Shares the LPs would hold if every open position closed now
    U256 present_value() const;

    // Largest base amount, at most `budget`, that open_long accepts now
    U256 max_long(const U256& budget) const;

    // Largest bond amount open_short accepts now with a base deposit of at most `budget`
    U256 max_short(const U256& budget) const;

    // Spot price the pool would show after the trade, fees included
    U256 spot_price_after_long(const U256& base_amount) const;
    U256 spot_price_after_short(const U256& bond_amount) const;

private:
    struct Staged {
        PoolState state;
        std::map<uint64_t, Checkpoint> checkpoints;
    };

    class OperationGuard;
    class ReadGuard;

    template <typename Fn>
    auto transact(const char* operation, Fn&& fn);

    Staged stage() const { return Staged{state_, checkpoints_}; }
    void commit(Staged&& staged);

    void require_initialized(const PoolState& state) const;
    void require_amount(const U256& amount) const;
    void require_destination(const Address& destination) const;
    void require_maturity(uint64_t maturity_time) const;
    void require_balance(AssetKind kind, uint64_t maturity_time, const Address& account,
                         const U256& amount) const;

    uint64_t now() const;
    uint64_t latest_checkpoint_at(uint64_t time) const;
    CurveState curve_state(const PoolState& state, const U256& time_remaining,
                           const U256& share_price) const;
    U256 spot_price_of(const PoolState& state) const;
    U256 spot_rate_of(const PoolState& state) const;
    U256 present_value_of(const PoolState& state, const U256& share_price) const;
    U256 lp_outstanding(const PoolState& state) const;
    U256 open_share_price(const Staged& staged, uint64_t maturity_time, const U256& fallback) const;

    // Records the checkpoint and matures positions expiring at it
    void apply_checkpoint(Staged& staged, uint64_t checkpoint_time, const U256& share_price) const;

    // Trade steps shared by the mutators and the quoting views. Each applies
    // the trade at the `latest` checkpoint to `staged` and throws if the pool
    // would reject it.
    U256 apply_open_long(Staged& staged, uint64_t latest, const U256& shares,
                         const U256& share_price) const;  // returns bonds bought
    U256 apply_open_short(Staged& staged, uint64_t latest, const U256& bond_amount,
                          const U256& share_price) const;  // returns collateral in shares
    void apply_mint(Staged& staged, uint64_t latest, const U256& bond_amount,
                    const U256& share_price) const;

    // z += delta, then y *= z_new / z_old
    void update_liquidity(PoolState& state, const U256& delta, bool is_adding) const;

    // Moves the withdrawal pool's share of freed long exposure out of reserves
    void release_withdrawal_liquidity(PoolState& state, const U256& exposure_before,
                                      const U256& bonds_closed, const U256& shares_paid,
                                      const U256& share_price) const;

    void check_solvency(const PoolState& state, const U256& share_price) const;

    void record_long_open(Staged& staged, uint64_t opened_at, uint64_t maturity_time,
                          const U256& bonds, const U256& share_price) const;

    DepositResult deposit(const Address& from, const U256& amount, bool as_base);
    U256 pay(const U256& shares, const Address& destination, bool as_base);
    U256 to_output_units(const U256& shares, bool as_base) const;

    Address self_;
    PoolConfig config_;
    IYieldSource& yield_source_;
    ILedger& ledger_;
    Clock clock_;

    PoolState state_;
    std::map<uint64_t, Checkpoint> checkpoints_;
    std::set<std::pair<Address, Address>> approvals_;  // (owner, operator)

    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> owner_{};
};

} // namespace hyper

#endif // HYPER_HYPERDRIVE_HPP
