// Hyperdrive - Test doubles for tokens, the yield source and the clock

#ifndef HYPER_TESTS_MOCKS_HPP
#define HYPER_TESTS_MOCKS_HPP

#include <functional>
#include <map>
#include <utility>

#include <hyper/errors.hpp>
#include <hyper/fixed_point.hpp>
#include <hyper/hyperdrive.hpp>
#include <hyper/interfaces.hpp>
#include <hyper/ledger.hpp>

namespace hyper {
namespace testing {

// Balance-and-allowance token
class MockToken : public IToken {
public:
    void mint(const Address& to, const U256& amount) { balances_[to] += amount; }

    void approve(const Address& owner, const Address& spender, const U256& amount) {
        allowances_[{owner, spender}] = amount;
    }

    U256 balance_of(const Address& account) const override {
        auto it = balances_.find(account);
        return it == balances_.end() ? U256(0) : it->second;
    }

    void transfer(const Address& from, const Address& to, const U256& amount) override {
        if (amount == 0) return;
        U256& balance = balances_[from];
        if (balance < amount) {
            throw AuthorizationError(errors::INSUFFICIENT_BALANCE, "MockToken: insufficient balance");
        }
        balance -= amount;
        balances_[to] += amount;
    }

    void transfer_from(const Address& spender, const Address& from, const Address& to,
                       const U256& amount) override {
        if (spender != from) {
            U256& allowance = allowances_[{from, spender}];
            if (allowance < amount) {
                throw AuthorizationError(errors::UNAUTHORIZED, "MockToken: allowance exceeded");
            }
            if (allowance != U256_MAX) allowance -= amount;
        }
        transfer(from, to, amount);
    }

private:
    std::map<Address, U256> balances_;
    std::map<std::pair<Address, Address>, U256> allowances_;
};

// Vault whose share price is set by the test. Base that the vault does not
// hold when paying out is minted, which stands in for accrued yield.
class MockYieldSource : public IYieldSource {
public:
    MockYieldSource(const Address& self, MockToken& base, MockToken& shares)
        : self_(self), base_(base), shares_(shares) {}

    void set_share_price(const U256& price) { share_price_ = price; }

    // Runs before funds move on every deposit
    std::function<void()> on_deposit;

    DepositResult deposit_base(const Address& from, const U256& amount) override {
        if (on_deposit) on_deposit();
        base_.transfer(from, self_, amount);
        U256 shares = fixed::div_down(amount, share_price_);
        total_shares_ += shares;
        return DepositResult{shares, 0};
    }

    void deposit_shares(const Address& from, const U256& shares) override {
        if (on_deposit) on_deposit();
        shares_.transfer(from, self_, shares);
        total_shares_ += shares;
    }

    U256 withdraw_base(const U256& shares, const Address& destination) override {
        U256 amount = fixed::mul_down(shares, share_price_);
        release(shares);
        U256 held = base_.balance_of(self_);
        if (held < amount) base_.mint(self_, amount - held);
        base_.transfer(self_, destination, amount);
        return amount;
    }

    U256 withdraw_shares(const U256& shares, const Address& destination) override {
        release(shares);
        U256 held = shares_.balance_of(self_);
        if (held < shares) shares_.mint(self_, shares - held);
        shares_.transfer(self_, destination, shares);
        return shares;
    }

    U256 convert_to_base(const U256& shares) const override {
        return fixed::mul_down(shares, share_price_);
    }

    U256 convert_to_shares(const U256& base) const override {
        return fixed::div_down(base, share_price_);
    }

    U256 total_shares() const override { return total_shares_; }

private:
    void release(const U256& shares) {
        total_shares_ = shares > total_shares_ ? U256(0) : U256(total_shares_ - shares);
    }

    Address self_;
    MockToken& base_;
    MockToken& shares_;
    U256 share_price_ = ONE;
    U256 total_shares_ = 0;
};

struct ManualClock {
    uint64_t now = 0;

    Clock clock() {
        return [this]() { return now; };
    }
};

// =============================================================================
// Pool fixture
// =============================================================================

constexpr uint64_t DAY = 24 * 60 * 60;
constexpr uint64_t START_TIME = 20000 * DAY;

const Address POOL_ADDRESS = make_address(100);
const Address VAULT_ADDRESS = make_address(101);
const Address LP_ADDRESS = make_address(1);

inline U256 units(uint64_t whole) { return U256(whole) * ONE; }

inline PoolConfig test_config() {
    return PoolConfig()
        .with_durations(365 * DAY, DAY)
        .with_target_rate(U256(50000000000000000ULL))
        .with_log_level("error");
}

struct PoolFixture {
    MockToken base;
    MockToken shares;
    MockYieldSource vault{VAULT_ADDRESS, base, shares};
    MultiTokenLedger ledger;
    ManualClock time{START_TIME};
    Hyperdrive pool;

    explicit PoolFixture(PoolConfig config = test_config())
        : pool(POOL_ADDRESS, std::move(config), vault, ledger, time.clock()) {}

    // Seeds the pool with `liquidity` base at a 5% fixed rate
    void initialize(const U256& liquidity) {
        base.mint(LP_ADDRESS, liquidity);
        pool.initialize(LP_ADDRESS, liquidity, U256(50000000000000000ULL),
                        Options{LP_ADDRESS, true});
    }

    uint64_t maturity() const { return pool.latest_checkpoint() + pool.config().position_duration; }
};

// Error code of the HyperError thrown by `fn`, or errors::OK
template <typename Fn>
int32_t error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const HyperError& e) {
        return e.code();
    }
    return errors::OK;
}

inline U256 abs_diff(const U256& a, const U256& b) {
    return a > b ? U256(a - b) : U256(b - a);
}

} // namespace testing
} // namespace hyper

#endif // HYPER_TESTS_MOCKS_HPP
