#ifndef HYPER_LEDGER_HPP
#define HYPER_LEDGER_HPP

#include <map>
#include <shared_mutex>

#include "interfaces.hpp"

namespace hyper {

// =============================================================================
// MultiTokenLedger - in-memory ILedger
// =============================================================================

class MultiTokenLedger : public ILedger {
public:
    MultiTokenLedger() = default;
    ~MultiTokenLedger() override = default;

    // Non-copyable
    MultiTokenLedger(const MultiTokenLedger&) = delete;
    MultiTokenLedger& operator=(const MultiTokenLedger&) = delete;

    U256 balance_of(const U256& asset_id, const Address& account) const override;
    void mint(const U256& asset_id, const Address& account, const U256& amount) override;

    // Throws AuthorizationError(INSUFFICIENT_BALANCE) if the account holds less
    void burn(const U256& asset_id, const Address& account, const U256& amount) override;

    U256 total_supply(const U256& asset_id) const override;

private:
    struct Key {
        U256 asset_id;
        Address account;

        bool operator<(const Key& other) const {
            if (asset_id != other.asset_id) return asset_id < other.asset_id;
            return account < other.account;
        }
    };

    std::map<Key, U256> balances_;
    std::map<U256, U256> supplies_;
    mutable std::shared_mutex mutex_;
};

} // namespace hyper

#endif // HYPER_LEDGER_HPP
