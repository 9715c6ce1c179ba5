#ifndef HYPER_MATCHING_ENGINE_HPP
#define HYPER_MATCHING_ENGINE_HPP

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "types.hpp"
#include "interfaces.hpp"
#include "hyperdrive.hpp"
#include "signature.hpp"

namespace hyper {

// =============================================================================
// Order Intents
// =============================================================================

enum class OrderType : uint8_t {
    OpenLong = 0,
    OpenShort = 1,
    CloseLong = 2,
    CloseShort = 3
};

const char* to_string(OrderType type);

struct OrderIntent {
    Address trader{};
    Address counterparty{};  // zero matches anyone
    Address hyperdrive{};    // pool address
    U256 fund_amount;      // max paid for opens, min received for closes
    U256 bond_amount;
    U256 min_vault_share_price;
    Options options;
    OrderType order_type = OrderType::OpenLong;
    uint64_t min_maturity_time = 0;
    uint64_t max_maturity_time = 0;
    uint64_t expiry = 0;
    Hash salt{};
    std::vector<uint8_t> signature;
};

// Cumulative fills against one intent hash
struct OrderAmounts {
    U256 bond_amount;
    U256 fund_amount;
};

struct EngineDomain {
    std::string name = "Hyperdrive Matching Engine";
    std::string version = "1";
    uint64_t chain_id = 1;
    Address verifying_contract{};  // the engine's own address
};

enum class Settlement : uint8_t {
    Mint,
    Burn,
    Transfer
};

struct MatchResult {
    Settlement settlement = Settlement::Mint;
    uint64_t maturity_time = 0;
    U256 bond_amount;
    U256 fund_amount1;  // paid by (open) or paid to (close) the first trader
    U256 fund_amount2;
    U256 surplus;       // sent to the surplus recipient
};

// =============================================================================
// MatchingEngine - settles pairs of signed intents against registered pools
//
// Accepted ordered pairs:
//   (OpenLong, OpenShort)    mint a new long/short pair funded by both traders
//   (CloseLong, CloseShort)  burn a pair and split the proceeds
//   (OpenLong, CloseLong)    move longs from the closer to the opener
//   (OpenShort, CloseShort)  move shorts from the closer to the opener
// Close orders pull positions through the pool's operator approval, so the
// trader must have approved the engine address on that pool.
// =============================================================================

class MatchingEngine {
public:
    MatchingEngine(EngineDomain domain, Clock clock, const IAccountRegistry* registry = nullptr);
    ~MatchingEngine() = default;

    // Non-copyable
    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    // Funds settle in `base_token` for as_base orders and `share_token` otherwise
    void register_pool(Hyperdrive& pool, IToken& base_token, IToken& share_token);

    [[nodiscard]] const Address& address() const noexcept { return domain_.verifying_contract; }
    [[nodiscard]] const Hash& domain_separator() const noexcept { return domain_separator_; }

    // Typed-data digest the trader signs
    Hash hash_order(const OrderIntent& order) const;

    bool is_cancelled(const Hash& order_hash) const;
    OrderAmounts order_amounts_used(const Hash& order_hash) const;

    // Every order must be signed by `caller`; cancellation is permanent
    void cancel_orders(const Address& caller, const std::vector<OrderIntent>& orders);

    MatchResult match_orders(const OrderIntent& order1, const OrderIntent& order2,
                             const Address& surplus_recipient);

    // Fills a signed maker intent against an unsigned taker intent submitted
    // by `caller` (taker.trader must be the caller). Surplus goes to the caller.
    MatchResult fill_order(const Address& caller, const OrderIntent& maker, const OrderIntent& taker);

private:
    struct PoolEntry {
        Hyperdrive* pool;
        IToken* base_token;
        IToken* share_token;
    };

    struct Leg {
        const OrderIntent& order;
        Hash hash;
        bool tracked;  // signed intents accumulate fills; a taker leg does not
        U256 bond_remaining;
        U256 fund_remaining;
    };

    class SettlementGuard;

    Leg make_leg(const OrderIntent& order, bool tracked) const;
    void validate(const Leg& first, const Leg& second) const;
    const PoolEntry& pool_entry(const Address& pool) const;

    MatchResult settle(const Leg& first, const Leg& second, const Address& surplus_recipient);
    MatchResult settle_mint(const PoolEntry& entry, const Leg& first, const Leg& second,
                            const U256& bond_match);
    MatchResult settle_burn(const PoolEntry& entry, const Leg& first, const Leg& second,
                            const U256& bond_match);
    MatchResult settle_transfer(const PoolEntry& entry, const Leg& first, const Leg& second,
                                const U256& bond_match);

    void record_fill(const Leg& leg, const U256& bond_amount, const U256& fund_amount);

    EngineDomain domain_;
    Hash domain_separator_;
    Clock clock_;
    SignatureChecker signatures_;

    std::map<Address, PoolEntry> pools_;
    std::map<Hash, OrderAmounts> amounts_used_;
    std::set<Hash> cancelled_;

    mutable std::mutex mutex_;
    mutable std::atomic<std::thread::id> owner_{};
};

} // namespace hyper

#endif // HYPER_MATCHING_ENGINE_HPP
