// =============================================================================
// ledger.cpp - In-memory multi-token position ledger
// =============================================================================

#include "hyper/ledger.hpp"
#include "hyper/errors.hpp"
#include "hyper/fixed_point.hpp"

#include <mutex>

namespace hyper {

U256 MultiTokenLedger::balance_of(const U256& asset_id, const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(Key{asset_id, account});
    return it == balances_.end() ? U256(0) : it->second;
}

void MultiTokenLedger::mint(const U256& asset_id, const Address& account, const U256& amount) {
    if (amount == 0) return;
    std::unique_lock lock(mutex_);
    U256& supply = supplies_[asset_id];
    supply = fixed::add(supply, amount);
    U256& balance = balances_[Key{asset_id, account}];
    balance = fixed::add(balance, amount);
}

void MultiTokenLedger::burn(const U256& asset_id, const Address& account, const U256& amount) {
    if (amount == 0) return;
    std::unique_lock lock(mutex_);
    auto it = balances_.find(Key{asset_id, account});
    if (it == balances_.end() || it->second < amount) {
        throw AuthorizationError(errors::INSUFFICIENT_BALANCE,
                                 "ledger: burn exceeds balance of " + to_hex(account));
    }
    it->second = fixed::sub(it->second, amount);
    if (it->second == 0) balances_.erase(it);
    U256& supply = supplies_[asset_id];
    supply = fixed::sub(supply, amount);
}

U256 MultiTokenLedger::total_supply(const U256& asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = supplies_.find(asset_id);
    return it == supplies_.end() ? U256(0) : it->second;
}

} // namespace hyper
