// =============================================================================
// errors.cpp - Error code names and shared word helpers
// =============================================================================

#include "hyper/errors.hpp"
#include "hyper/types.hpp"

namespace hyper {

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case errors::ARITHMETIC_UNDERFLOW: return "ARITHMETIC_UNDERFLOW";
        case errors::DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        case errors::INVALID_EXPONENT: return "INVALID_EXPONENT";
        case errors::LN_INVALID_INPUT: return "LN_INVALID_INPUT";
        case errors::INVALID_CURVE_STATE: return "INVALID_CURVE_STATE";
        case errors::INVALID_ASSET_ID: return "INVALID_ASSET_ID";
        case errors::INVALID_TIMESTAMP: return "INVALID_TIMESTAMP";
        case errors::ZERO_AMOUNT: return "ZERO_AMOUNT";
        case errors::BELOW_MINIMUM_TRANSACTION: return "BELOW_MINIMUM_TRANSACTION";
        case errors::INVALID_TIME_REMAINING: return "INVALID_TIME_REMAINING";
        case errors::INVALID_CHECKPOINT_TIME: return "INVALID_CHECKPOINT_TIME";
        case errors::INVALID_MATURITY_TIME: return "INVALID_MATURITY_TIME";
        case errors::INVALID_COUNTERPARTY: return "INVALID_COUNTERPARTY";
        case errors::INVALID_SETTLEMENT_ASSET: return "INVALID_SETTLEMENT_ASSET";
        case errors::INVALID_ORDER_COMBINATION: return "INVALID_ORDER_COMBINATION";
        case errors::MISMATCHED_POOL: return "MISMATCHED_POOL";
        case errors::INVALID_DESTINATION: return "INVALID_DESTINATION";
        case errors::POOL_NOT_INITIALIZED: return "POOL_NOT_INITIALIZED";
        case errors::POOL_ALREADY_INITIALIZED: return "POOL_ALREADY_INITIALIZED";
        case errors::INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case errors::INVALID_CONFIG: return "INVALID_CONFIG";
        case errors::UNKNOWN_POOL: return "UNKNOWN_POOL";
        case errors::SETTLEMENT_MISMATCH: return "SETTLEMENT_MISMATCH";
        case errors::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
        case errors::ORDER_EXPIRED: return "ORDER_EXPIRED";
        case errors::ORDER_CANCELLED: return "ORDER_CANCELLED";
        case errors::ORDER_FULLY_EXECUTED: return "ORDER_FULLY_EXECUTED";
        case errors::INSUFFICIENT_FUNDING: return "INSUFFICIENT_FUNDING";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        case errors::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case errors::REENTRANCY: return "REENTRANCY";
        case errors::OUTPUT_LIMIT: return "OUTPUT_LIMIT";
        case errors::INPUT_LIMIT: return "INPUT_LIMIT";
        case errors::MINIMUM_SHARE_PRICE: return "MINIMUM_SHARE_PRICE";
        case errors::INVALID_APR: return "INVALID_APR";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// Word Helpers
// =============================================================================

namespace {

template <size_t N>
std::string hex_bytes(const std::array<uint8_t, N>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + N * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

}  // namespace

std::string to_hex(const Address& a) { return hex_bytes(a); }
std::string to_hex(const Hash& h) { return hex_bytes(h); }

Hash to_bytes32(const U256& v) {
    Hash out = {};
    U256 x = v;
    for (int i = 31; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(x & 0xFF);
        x >>= 8;
    }
    return out;
}

U256 from_bytes32(const Hash& h) {
    U256 v = 0;
    for (uint8_t b : h) {
        v <<= 8;
        v |= b;
    }
    return v;
}

} // namespace hyper
