// =============================================================================
// matching_engine.cpp - Signed intent validation, hashing and settlement
// =============================================================================

#include "hyper/matching_engine.hpp"
#include "hyper/asset_id.hpp"
#include "hyper/config.hpp"
#include "hyper/crypto.hpp"
#include "hyper/errors.hpp"
#include "hyper/fixed_point.hpp"
#include "hyper/log.hpp"

#include <string_view>
#include <utility>

namespace hyper {

namespace {

constexpr std::string_view DOMAIN_TYPE =
    "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)";
constexpr std::string_view OPTIONS_TYPE = "Options(address destination,bool asBase)";
constexpr std::string_view ORDER_TYPE =
    "OrderIntent(address trader,address counterparty,address hyperdrive,uint256 fundAmount,"
    "uint256 bondAmount,uint256 minVaultSharePrice,Options options,uint8 orderType,"
    "uint256 minMaturityTime,uint256 maxMaturityTime,uint256 expiry,bytes32 salt)"
    "Options(address destination,bool asBase)";

Hash hash_text(std::string_view text) {
    return crypto::sha3_256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// ABI-style 32-byte word encoder
class WordWriter {
public:
    WordWriter& word(const Hash& h) {
        bytes_.insert(bytes_.end(), h.begin(), h.end());
        return *this;
    }

    WordWriter& number(const U256& v) { return word(to_bytes32(v)); }

    WordWriter& address(const Address& a) {
        bytes_.insert(bytes_.end(), 12, 0);
        bytes_.insert(bytes_.end(), a.begin(), a.end());
        return *this;
    }

    WordWriter& boolean(bool b) { return number(U256(b ? 1 : 0)); }

    Hash hash() const { return crypto::sha3_256(bytes_); }

private:
    crypto::Bytes bytes_;
};

bool is_open(OrderType type) {
    return type == OrderType::OpenLong || type == OrderType::OpenShort;
}

bool accepted_pair(OrderType first, OrderType second) {
    return (first == OrderType::OpenLong && second == OrderType::OpenShort) ||
           (first == OrderType::CloseLong && second == OrderType::CloseShort) ||
           (first == OrderType::OpenLong && second == OrderType::CloseLong) ||
           (first == OrderType::OpenShort && second == OrderType::CloseShort);
}

}  // namespace

const char* to_string(OrderType type) {
    switch (type) {
        case OrderType::OpenLong:   return "OpenLong";
        case OrderType::OpenShort:  return "OpenShort";
        case OrderType::CloseLong:  return "CloseLong";
        case OrderType::CloseShort: return "CloseShort";
    }
    return "Unknown";
}

// =============================================================================
// Guard
// =============================================================================

class MatchingEngine::SettlementGuard {
public:
    explicit SettlementGuard(const MatchingEngine& engine) : engine_(engine) {
        if (engine_.owner_.load() == std::this_thread::get_id()) {
            throw AuthorizationError(errors::REENTRANCY, "MatchingEngine: reentrant call");
        }
        engine_.mutex_.lock();
        engine_.owner_.store(std::this_thread::get_id());
    }

    ~SettlementGuard() {
        engine_.owner_.store(std::thread::id());
        engine_.mutex_.unlock();
    }

    SettlementGuard(const SettlementGuard&) = delete;
    SettlementGuard& operator=(const SettlementGuard&) = delete;

private:
    const MatchingEngine& engine_;
};

// =============================================================================
// Construction / Registry
// =============================================================================

MatchingEngine::MatchingEngine(EngineDomain domain, Clock clock, const IAccountRegistry* registry)
    : domain_(std::move(domain)), clock_(std::move(clock)), signatures_(registry) {
    if (!clock_) {
        throw ValidationError(errors::INVALID_CONFIG, "MatchingEngine: clock is required");
    }
    domain_separator_ = WordWriter()
        .word(hash_text(DOMAIN_TYPE))
        .word(hash_text(domain_.name))
        .word(hash_text(domain_.version))
        .number(U256(domain_.chain_id))
        .address(domain_.verifying_contract)
        .hash();
}

void MatchingEngine::register_pool(Hyperdrive& pool, IToken& base_token, IToken& share_token) {
    SettlementGuard guard(*this);
    pools_[pool.address()] = PoolEntry{&pool, &base_token, &share_token};
    log::info("MatchingEngine: registered pool " + to_hex(pool.address()));
}

const MatchingEngine::PoolEntry& MatchingEngine::pool_entry(const Address& pool) const {
    auto it = pools_.find(pool);
    if (it == pools_.end()) {
        throw ValidationError(errors::UNKNOWN_POOL, "MatchingEngine: unknown pool " + to_hex(pool));
    }
    return it->second;
}

// =============================================================================
// Hashing
// =============================================================================

Hash MatchingEngine::hash_order(const OrderIntent& order) const {
    Hash options_hash = WordWriter()
        .word(hash_text(OPTIONS_TYPE))
        .address(order.options.destination)
        .boolean(order.options.as_base)
        .hash();

    Hash struct_hash = WordWriter()
        .word(hash_text(ORDER_TYPE))
        .address(order.trader)
        .address(order.counterparty)
        .address(order.hyperdrive)
        .number(order.fund_amount)
        .number(order.bond_amount)
        .number(order.min_vault_share_price)
        .word(options_hash)
        .number(U256(static_cast<uint8_t>(order.order_type)))
        .number(U256(order.min_maturity_time))
        .number(U256(order.max_maturity_time))
        .number(U256(order.expiry))
        .word(order.salt)
        .hash();

    crypto::Bytes payload = {0x19, 0x01};
    payload.insert(payload.end(), domain_separator_.begin(), domain_separator_.end());
    payload.insert(payload.end(), struct_hash.begin(), struct_hash.end());
    return crypto::sha3_256(payload);
}

// =============================================================================
// Queries
// =============================================================================

bool MatchingEngine::is_cancelled(const Hash& order_hash) const {
    SettlementGuard guard(*this);
    return cancelled_.count(order_hash) > 0;
}

OrderAmounts MatchingEngine::order_amounts_used(const Hash& order_hash) const {
    SettlementGuard guard(*this);
    auto it = amounts_used_.find(order_hash);
    return it == amounts_used_.end() ? OrderAmounts{} : it->second;
}

// =============================================================================
// Cancellation
// =============================================================================

void MatchingEngine::cancel_orders(const Address& caller, const std::vector<OrderIntent>& orders) {
    SettlementGuard guard(*this);

    std::vector<Hash> hashes;
    hashes.reserve(orders.size());
    for (const auto& order : orders) {
        if (order.trader != caller) {
            throw AuthorizationError(errors::UNAUTHORIZED, "MatchingEngine: only the signer may cancel");
        }
        Hash h = hash_order(order);
        if (!signatures_.verify(h, order.signature, caller)) {
            throw AuthorizationError(errors::INVALID_SIGNATURE, "MatchingEngine: invalid signature");
        }
        hashes.push_back(h);
    }

    for (const auto& h : hashes) {
        cancelled_.insert(h);
        log::info("MatchingEngine: cancelled order " + to_hex(h));
    }
}

// =============================================================================
// Validation
// =============================================================================

MatchingEngine::Leg MatchingEngine::make_leg(const OrderIntent& order, bool tracked) const {
    Leg leg{order, hash_order(order), tracked, order.bond_amount, order.fund_amount};
    if (tracked) {
        auto it = amounts_used_.find(leg.hash);
        if (it != amounts_used_.end()) {
            leg.bond_remaining = fixed::sub(order.bond_amount, it->second.bond_amount);
            leg.fund_remaining = fixed::sub(order.fund_amount, it->second.fund_amount);
        }
    }
    return leg;
}

void MatchingEngine::validate(const Leg& first, const Leg& second) const {
    const Leg* legs[] = {&first, &second};
    const uint64_t now = clock_();

    for (int i = 0; i < 2; ++i) {
        const OrderIntent& order = legs[i]->order;
        const OrderIntent& other = legs[1 - i]->order;
        if (!is_zero(order.counterparty) && order.counterparty != other.trader) {
            throw ValidationError(errors::INVALID_COUNTERPARTY, "MatchingEngine: counterparty mismatch");
        }
    }

    for (const Leg* leg : legs) {
        if (leg->tracked && now > leg->order.expiry) {
            throw AuthorizationError(errors::ORDER_EXPIRED, "MatchingEngine: order expired");
        }
    }

    if (first.order.hyperdrive != second.order.hyperdrive) {
        throw ValidationError(errors::MISMATCHED_POOL, "MatchingEngine: orders target different pools");
    }
    if (first.order.options.as_base != second.order.options.as_base) {
        throw ValidationError(errors::INVALID_SETTLEMENT_ASSET,
                              "MatchingEngine: orders settle in different assets");
    }

    for (const Leg* leg : legs) {
        const OrderIntent& order = leg->order;
        if (order.min_maturity_time > order.max_maturity_time) {
            throw ValidationError(errors::INVALID_MATURITY_TIME, "MatchingEngine: maturity range is empty");
        }
        if (!is_open(order.order_type) && order.min_maturity_time != order.max_maturity_time) {
            throw ValidationError(errors::INVALID_MATURITY_TIME,
                                  "MatchingEngine: close orders name a single maturity");
        }
    }

    for (const Leg* leg : legs) {
        if (is_zero(leg->order.options.destination)) {
            throw ValidationError(errors::INVALID_DESTINATION, "MatchingEngine: zero destination");
        }
        if (leg->order.bond_amount == 0) {
            throw ValidationError(errors::ZERO_AMOUNT, "MatchingEngine: zero bond amount");
        }
    }

    for (const Leg* leg : legs) {
        if (leg->bond_remaining == 0) {
            throw AuthorizationError(errors::ORDER_FULLY_EXECUTED, "MatchingEngine: order fully executed");
        }
    }

    for (const Leg* leg : legs) {
        if (leg->tracked && cancelled_.count(leg->hash) > 0) {
            throw AuthorizationError(errors::ORDER_CANCELLED, "MatchingEngine: order cancelled");
        }
    }

    for (const Leg* leg : legs) {
        if (leg->tracked && !signatures_.verify(leg->hash, leg->order.signature, leg->order.trader)) {
            throw AuthorizationError(errors::INVALID_SIGNATURE, "MatchingEngine: invalid signature");
        }
    }
}

// =============================================================================
// Matching
// =============================================================================

MatchResult MatchingEngine::match_orders(const OrderIntent& order1, const OrderIntent& order2,
                                         const Address& surplus_recipient) {
    SettlementGuard guard(*this);
    try {
        Leg first = make_leg(order1, true);
        Leg second = make_leg(order2, true);
        if (first.hash == second.hash) {
            throw ValidationError(errors::INVALID_ORDER_COMBINATION,
                                  "MatchingEngine: an order cannot match itself");
        }
        return settle(first, second, surplus_recipient);
    } catch (const HyperError& e) {
        log::warn(std::string("MatchingEngine: match rejected: ") + error_name(e.code()) +
                  " (" + e.what() + ")");
        throw;
    }
}

MatchResult MatchingEngine::fill_order(const Address& caller, const OrderIntent& maker,
                                       const OrderIntent& taker) {
    SettlementGuard guard(*this);
    try {
        if (taker.trader != caller) {
            throw AuthorizationError(errors::UNAUTHORIZED, "MatchingEngine: taker must be the caller");
        }
        Leg maker_leg = make_leg(maker, true);
        Leg taker_leg = make_leg(taker, false);
        if (accepted_pair(maker.order_type, taker.order_type)) {
            return settle(maker_leg, taker_leg, caller);
        }
        return settle(taker_leg, maker_leg, caller);
    } catch (const HyperError& e) {
        log::warn(std::string("MatchingEngine: fill rejected: ") + error_name(e.code()) +
                  " (" + e.what() + ")");
        throw;
    }
}

MatchResult MatchingEngine::settle(const Leg& first, const Leg& second,
                                   const Address& surplus_recipient) {
    if (is_zero(surplus_recipient)) {
        throw ValidationError(errors::INVALID_DESTINATION, "MatchingEngine: zero surplus recipient");
    }
    validate(first, second);

    const PoolEntry& entry = pool_entry(first.order.hyperdrive);
    const U256 bond_match = fixed::min(first.bond_remaining, second.bond_remaining);
    IToken& token = first.order.options.as_base ? *entry.base_token : *entry.share_token;
    const U256 balance_before = token.balance_of(address());

    const OrderType t1 = first.order.order_type;
    const OrderType t2 = second.order.order_type;
    MatchResult result;
    if (t1 == OrderType::OpenLong && t2 == OrderType::OpenShort) {
        result = settle_mint(entry, first, second, bond_match);
    } else if (t1 == OrderType::CloseLong && t2 == OrderType::CloseShort) {
        result = settle_burn(entry, first, second, bond_match);
    } else if ((t1 == OrderType::OpenLong && t2 == OrderType::CloseLong) ||
               (t1 == OrderType::OpenShort && t2 == OrderType::CloseShort)) {
        result = settle_transfer(entry, first, second, bond_match);
    } else {
        throw ValidationError(errors::INVALID_ORDER_COMBINATION,
                              std::string("MatchingEngine: cannot match ") + to_string(t1) +
                              " with " + to_string(t2));
    }

    record_fill(first, bond_match, result.fund_amount1);
    record_fill(second, bond_match, result.fund_amount2);

    // Anything the settlement left behind (fund surplus, deposit refunds)
    U256 balance_after = token.balance_of(address());
    result.surplus = balance_after > balance_before ? U256(balance_after - balance_before) : U256(0);
    if (result.surplus > 0) {
        token.transfer(address(), surplus_recipient, result.surplus);
    }

    log::info(std::string("MatchingEngine: matched ") + to_string(t1) + "/" + to_string(t2) +
              " bonds=" + format_fixed(bond_match) + " maturity=" +
              std::to_string(result.maturity_time));
    return result;
}

namespace {

// Payers are charged at most their prorated share
U256 prorate_down(const OrderIntent& order, const U256& fund_remaining, const U256& bonds) {
    return fixed::min(fixed::mul_div_down(order.fund_amount, bonds, order.bond_amount), fund_remaining);
}

// Receivers are guaranteed at least their prorated floor
U256 prorate_up(const OrderIntent& order, const U256& fund_remaining, const U256& bonds) {
    return fixed::min(fixed::mul_div_up(order.fund_amount, bonds, order.bond_amount), fund_remaining);
}

void require_maturity_in_range(const OrderIntent& order, uint64_t maturity_time) {
    if (maturity_time < order.min_maturity_time || maturity_time > order.max_maturity_time) {
        throw ValidationError(errors::INVALID_MATURITY_TIME,
                              "MatchingEngine: maturity " + std::to_string(maturity_time) +
                              " outside the order's range");
    }
}

}  // namespace

MatchResult MatchingEngine::settle_mint(const PoolEntry& entry, const Leg& first, const Leg& second,
                                        const U256& bond_match) {
    Hyperdrive& pool = *entry.pool;
    const bool as_base = first.order.options.as_base;
    IToken& token = as_base ? *entry.base_token : *entry.share_token;

    const U256 c = pool.vault_share_price();
    const U256 min_share_price =
        fixed::max(first.order.min_vault_share_price, second.order.min_vault_share_price);
    if (c < min_share_price) {
        throw SlippageError(errors::MINIMUM_SHARE_PRICE, "MatchingEngine: vault share price below minimum");
    }

    const uint64_t latest = pool.latest_checkpoint();
    const uint64_t maturity = latest + pool.config().position_duration;
    require_maturity_in_range(first.order, maturity);
    require_maturity_in_range(second.order, maturity);

    U256 open_price = pool.get_checkpoint(latest).share_price;
    if (open_price == 0) open_price = c;
    U256 cost = hyperdrive_math::calculate_mint_cost(pool.config().fees, bond_match, c, open_price);
    if (!as_base) cost = fixed::div_up(cost, c);

    const U256 fund1 = prorate_down(first.order, first.fund_remaining, bond_match);
    const U256 fund2 = prorate_down(second.order, second.fund_remaining, bond_match);
    if (fixed::add(fund1, fund2) < cost) {
        throw AuthorizationError(errors::INSUFFICIENT_FUNDING,
                                 "MatchingEngine: funds do not cover the mint cost");
    }

    token.transfer_from(address(), first.order.trader, address(), fund1);
    try {
        token.transfer_from(address(), second.order.trader, address(), fund2);
    } catch (...) {
        token.transfer(address(), first.order.trader, fund1);
        throw;
    }

    MintResult minted;
    try {
        minted = pool.mint_bonds(address(), bond_match, cost, min_share_price,
                                 PairOptions{first.order.options.destination,
                                             second.order.options.destination, as_base});
    } catch (...) {
        token.transfer(address(), first.order.trader, fund1);
        token.transfer(address(), second.order.trader, fund2);
        throw;
    }
    if (minted.bond_amount != bond_match) {
        throw ValidationError(errors::SETTLEMENT_MISMATCH,
                              "MatchingEngine: pool minted " + format_fixed(minted.bond_amount) +
                              " bonds for a match of " + format_fixed(bond_match));
    }

    return MatchResult{Settlement::Mint, minted.maturity_time, minted.bond_amount, fund1, fund2, 0};
}

MatchResult MatchingEngine::settle_burn(const PoolEntry& entry, const Leg& first, const Leg& second,
                                        const U256& bond_match) {
    Hyperdrive& pool = *entry.pool;
    const bool as_base = first.order.options.as_base;
    IToken& token = as_base ? *entry.base_token : *entry.share_token;

    const uint64_t maturity = first.order.min_maturity_time;
    if (second.order.min_maturity_time != maturity) {
        throw ValidationError(errors::INVALID_MATURITY_TIME,
                              "MatchingEngine: close orders name different maturities");
    }

    const U256 fund1 = prorate_up(first.order, first.fund_remaining, bond_match);
    const U256 fund2 = prorate_up(second.order, second.fund_remaining, bond_match);
    const U256 long_id = asset_id::encode(AssetKind::LONG, maturity);
    const U256 short_id = asset_id::encode(AssetKind::SHORT, maturity);

    pool.transfer_position(address(), first.order.trader, address(), long_id, bond_match);
    try {
        pool.transfer_position(address(), second.order.trader, address(), short_id, bond_match);
    } catch (...) {
        pool.transfer_position(address(), address(), first.order.trader, long_id, bond_match);
        throw;
    }

    try {
        pool.burn(address(), maturity, bond_match, fixed::add(fund1, fund2),
                  Options{address(), as_base});
    } catch (...) {
        pool.transfer_position(address(), address(), first.order.trader, long_id, bond_match);
        pool.transfer_position(address(), address(), second.order.trader, short_id, bond_match);
        throw;
    }

    token.transfer(address(), first.order.options.destination, fund1);
    token.transfer(address(), second.order.options.destination, fund2);
    return MatchResult{Settlement::Burn, maturity, bond_match, fund1, fund2, 0};
}

MatchResult MatchingEngine::settle_transfer(const PoolEntry& entry, const Leg& first,
                                            const Leg& second, const U256& bond_match) {
    Hyperdrive& pool = *entry.pool;
    IToken& token = first.order.options.as_base ? *entry.base_token : *entry.share_token;

    const uint64_t maturity = second.order.min_maturity_time;
    require_maturity_in_range(first.order, maturity);

    const AssetKind kind =
        first.order.order_type == OrderType::OpenLong ? AssetKind::LONG : AssetKind::SHORT;
    const U256 id = asset_id::encode(kind, maturity);

    const U256 fund1 = prorate_down(first.order, first.fund_remaining, bond_match);
    const U256 fund2 = prorate_up(second.order, second.fund_remaining, bond_match);
    if (fund1 < fund2) {
        throw AuthorizationError(errors::INSUFFICIENT_FUNDING,
                                 "MatchingEngine: buyer's price is below the seller's floor");
    }

    token.transfer_from(address(), first.order.trader, address(), fund1);
    try {
        pool.transfer_position(address(), second.order.trader, first.order.options.destination,
                               id, bond_match);
    } catch (...) {
        token.transfer(address(), first.order.trader, fund1);
        throw;
    }

    token.transfer(address(), second.order.options.destination, fund2);
    return MatchResult{Settlement::Transfer, maturity, bond_match, fund1, fund2, 0};
}

void MatchingEngine::record_fill(const Leg& leg, const U256& bond_amount, const U256& fund_amount) {
    if (!leg.tracked) return;
    OrderAmounts& used = amounts_used_[leg.hash];
    OrderAmounts updated{fixed::add(used.bond_amount, bond_amount),
                         fixed::add(used.fund_amount, fund_amount)};
    if (updated.bond_amount > leg.order.bond_amount || updated.fund_amount > leg.order.fund_amount) {
        throw ArithmeticError(errors::ARITHMETIC_OVERFLOW,
                              "MatchingEngine: fills exceed the order's declared amounts");
    }
    used = updated;
}

} // namespace hyper
