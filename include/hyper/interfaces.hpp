#ifndef HYPER_INTERFACES_HPP
#define HYPER_INTERFACES_HPP

#include <vector>

#include "types.hpp"

namespace hyper {

// =============================================================================
// Yield Source (adapter over an external lending / staking vault)
// =============================================================================

struct DepositResult {
    U256 shares;  // vault shares credited to the pool
    U256 refund;  // base returned to the depositor
};

class IYieldSource {
public:
    virtual ~IYieldSource() = default;

    // Pulls `amount` base from `from` and deposits it into the vault
    virtual DepositResult deposit_base(const Address& from, const U256& amount) = 0;

    // Pulls `shares` vault shares from `from`
    virtual void deposit_shares(const Address& from, const U256& shares) = 0;

    // Redeems `shares` and sends the base to `destination`; returns base sent
    virtual U256 withdraw_base(const U256& shares, const Address& destination) = 0;

    // Sends `shares` vault shares to `destination`; returns shares sent
    virtual U256 withdraw_shares(const U256& shares, const Address& destination) = 0;

    virtual U256 convert_to_base(const U256& shares) const = 0;
    virtual U256 convert_to_shares(const U256& base) const = 0;

    // Vault shares held on behalf of the pool
    virtual U256 total_shares() const = 0;
};

// =============================================================================
// Multi-Token Position Ledger
// =============================================================================

class ILedger {
public:
    virtual ~ILedger() = default;

    virtual U256 balance_of(const U256& asset_id, const Address& account) const = 0;
    virtual void mint(const U256& asset_id, const Address& account, const U256& amount) = 0;
    virtual void burn(const U256& asset_id, const Address& account, const U256& amount) = 0;
    virtual U256 total_supply(const U256& asset_id) const = 0;
};

// =============================================================================
// Fungible Token (settlement funds for matched orders)
// =============================================================================

class IToken {
public:
    virtual ~IToken() = default;

    virtual U256 balance_of(const Address& account) const = 0;
    virtual void transfer(const Address& from, const Address& to, const U256& amount) = 0;

    // Moves `amount` from `from` to `to` on behalf of `spender`
    virtual void transfer_from(const Address& spender, const Address& from,
                               const Address& to, const U256& amount) = 0;
};

// =============================================================================
// Contract Accounts
// =============================================================================

class IContractSigner {
public:
    virtual ~IContractSigner() = default;

    virtual bool is_valid_signature(const Hash& digest, const std::vector<uint8_t>& signature) const = 0;
};

// Resolves addresses to contract accounts; nullptr for externally-owned ones
class IAccountRegistry {
public:
    virtual ~IAccountRegistry() = default;

    virtual const IContractSigner* contract_signer(const Address& account) const = 0;
};

} // namespace hyper

#endif // HYPER_INTERFACES_HPP
