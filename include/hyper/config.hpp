#ifndef HYPER_CONFIG_HPP
#define HYPER_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"
#include "hyperdrive_math.hpp"

namespace hyper {

// Parses decimal text such as "0.05" or "1" into a 1e18 fixed-point word.
// Throws std::invalid_argument on malformed input or more than 18 decimals.
U256 parse_fixed(std::string_view text);

// Formats a 1e18 fixed-point word as decimal text ("1.25")
std::string format_fixed(const U256& value);

// Time stretch targeting `apr`: s = 0.04665 * (apr * 100) / 5.24592
U256 calculate_time_stretch(const U256& apr);

// =============================================================================
// Pool Configuration
// =============================================================================

class PoolConfig {
public:
    U256 initial_vault_share_price = ONE;
    U256 minimum_share_reserves = U256(1000000000000000ULL);      // 0.001
    U256 minimum_transaction_amount = U256(1000000000000000ULL);  // 0.001
    uint64_t position_duration = SECONDS_PER_YEAR;
    uint64_t checkpoint_duration = 24 * 60 * 60;
    U256 time_stretch = calculate_time_stretch(U256(50000000000000000ULL));  // 5% target
    Fees fees{};
    std::string log_level = "info";

    PoolConfig() = default;

    static PoolConfig from_file(std::string_view path);
    static PoolConfig from_json(std::string_view content);

    // Throws ValidationError(INVALID_CONFIG) describing the first violation
    void validate() const;

    PoolConfig& with_initial_vault_share_price(const U256& price) {
        initial_vault_share_price = price;
        return *this;
    }

    PoolConfig& with_minimum_share_reserves(const U256& amount) {
        minimum_share_reserves = amount;
        return *this;
    }

    PoolConfig& with_minimum_transaction_amount(const U256& amount) {
        minimum_transaction_amount = amount;
        return *this;
    }

    PoolConfig& with_durations(uint64_t position, uint64_t checkpoint) {
        position_duration = position;
        checkpoint_duration = checkpoint;
        return *this;
    }

    PoolConfig& with_time_stretch(const U256& stretch) {
        time_stretch = stretch;
        return *this;
    }

    PoolConfig& with_target_rate(const U256& apr) {
        time_stretch = calculate_time_stretch(apr);
        return *this;
    }

    PoolConfig& with_fees(const U256& curve, const U256& flat, const U256& governance) {
        fees = Fees{curve, flat, governance};
        return *this;
    }

    PoolConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

} // namespace hyper

#endif // HYPER_CONFIG_HPP
