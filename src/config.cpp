// =============================================================================
// config.cpp - Pool configuration loading and validation
// =============================================================================

#include "hyper/config.hpp"
#include "hyper/errors.hpp"
#include "hyper/fixed_point.hpp"
#include "hyper/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hyper {

namespace {

using nlohmann::json;

U256 fixed_field(const json& j, const char* key, const U256& fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_string()) return parse_fixed(it->get<std::string>());
    if (it->is_number()) return parse_fixed(it->dump());
    throw std::runtime_error(std::string("Config field must be a decimal: ") + key);
}

uint64_t duration_field(const json& j, const char* key, uint64_t fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_unsigned()) {
        throw std::runtime_error(std::string("Config field must be a whole number of seconds: ") + key);
    }
    return it->get<uint64_t>();
}

}  // namespace

// =============================================================================
// Decimal Text
// =============================================================================

U256 parse_fixed(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty fixed-point value");
    }

    U256 whole = 0;
    U256 fraction = 0;
    size_t fraction_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (char ch : text) {
        if (ch == '.') {
            if (seen_dot) throw std::invalid_argument("Malformed fixed-point value: " + std::string(text));
            seen_dot = true;
            continue;
        }
        if (ch < '0' || ch > '9') {
            throw std::invalid_argument("Malformed fixed-point value: " + std::string(text));
        }
        seen_digit = true;
        unsigned digit = static_cast<unsigned>(ch - '0');
        if (seen_dot) {
            if (++fraction_digits > 18) {
                throw std::invalid_argument("More than 18 decimals: " + std::string(text));
            }
            fraction = fraction * 10 + digit;
        } else {
            whole = fixed::add(fixed::mul_div_down(whole, U256(10), U256(1)), U256(digit));
        }
    }
    if (!seen_digit) {
        throw std::invalid_argument("Malformed fixed-point value: " + std::string(text));
    }

    for (size_t i = fraction_digits; i < 18; ++i) fraction *= 10;
    return fixed::add(fixed::mul_div_down(whole, ONE, U256(1)), fraction);
}

std::string format_fixed(const U256& value) {
    std::string whole = (value / ONE).str();
    std::string fraction = (value % ONE).str();
    if (fraction == "0") return whole;

    fraction.insert(0, 18 - fraction.size(), '0');
    while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
    return whole + "." + fraction;
}

U256 calculate_time_stretch(const U256& apr) {
    // 0.04665 * (apr * 100) / 5.24592
    U256 scaled = fixed::mul_down(U256(46650000000000000ULL), fixed::mul_div_down(apr, U256(100), U256(1)));
    return fixed::div_down(scaled, U256(5245920000000000000ULL));
}

// =============================================================================
// Loading
// =============================================================================

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

PoolConfig PoolConfig::from_json(std::string_view content) {
    PoolConfig config;
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    config.initial_vault_share_price =
        fixed_field(j, "initial_vault_share_price", config.initial_vault_share_price);
    config.minimum_share_reserves =
        fixed_field(j, "minimum_share_reserves", config.minimum_share_reserves);
    config.minimum_transaction_amount =
        fixed_field(j, "minimum_transaction_amount", config.minimum_transaction_amount);
    config.position_duration = duration_field(j, "position_duration", config.position_duration);
    config.checkpoint_duration = duration_field(j, "checkpoint_duration", config.checkpoint_duration);

    if (j.contains("time_stretch")) {
        config.time_stretch = fixed_field(j, "time_stretch", config.time_stretch);
    } else if (j.contains("target_rate")) {
        config.with_target_rate(fixed_field(j, "target_rate", 0));
    }

    if (j.contains("fees")) {
        const json& fees = j.at("fees");
        config.fees.curve = fixed_field(fees, "curve", 0);
        config.fees.flat = fixed_field(fees, "flat", 0);
        config.fees.governance = fixed_field(fees, "governance", 0);
    }

    if (j.contains("log_level")) {
        config.log_level = j.at("log_level").get<std::string>();
    }

    config.validate();
    return config;
}

// =============================================================================
// Validation
// =============================================================================

void PoolConfig::validate() const {
    auto fail = [](const std::string& msg) {
        throw ValidationError(errors::INVALID_CONFIG, "PoolConfig: " + msg);
    };

    if (initial_vault_share_price == 0) fail("initial vault share price must be positive");
    if (minimum_share_reserves == 0) fail("minimum share reserves must be positive");
    if (checkpoint_duration == 0) fail("checkpoint duration must be positive");
    if (position_duration < checkpoint_duration || position_duration % checkpoint_duration != 0) {
        fail("position duration must be a multiple of the checkpoint duration");
    }
    if (time_stretch == 0 || time_stretch >= ONE) fail("time stretch must be in (0, 1)");
    if (fees.curve > ONE || fees.flat > ONE || fees.governance > ONE) {
        fail("fees must not exceed one");
    }

    // Throws on an unknown level name
    log::parse_level(log_level);
}

} // namespace hyper
