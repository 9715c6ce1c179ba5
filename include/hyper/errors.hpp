#ifndef HYPER_ERRORS_HPP
#define HYPER_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hyper {

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Arithmetic (-1xx)
constexpr int32_t ARITHMETIC_OVERFLOW = -100;
constexpr int32_t ARITHMETIC_UNDERFLOW = -101;
constexpr int32_t DIVISION_BY_ZERO = -102;
constexpr int32_t INVALID_EXPONENT = -103;
constexpr int32_t LN_INVALID_INPUT = -104;

// Curve (-2xx)
constexpr int32_t INVALID_CURVE_STATE = -200;

// Validation (-3xx)
constexpr int32_t INVALID_ASSET_ID = -300;
constexpr int32_t INVALID_TIMESTAMP = -301;
constexpr int32_t ZERO_AMOUNT = -302;
constexpr int32_t BELOW_MINIMUM_TRANSACTION = -303;
constexpr int32_t INVALID_TIME_REMAINING = -304;
constexpr int32_t INVALID_CHECKPOINT_TIME = -305;
constexpr int32_t INVALID_MATURITY_TIME = -306;
constexpr int32_t INVALID_COUNTERPARTY = -307;
constexpr int32_t INVALID_SETTLEMENT_ASSET = -308;
constexpr int32_t INVALID_ORDER_COMBINATION = -309;
constexpr int32_t MISMATCHED_POOL = -310;
constexpr int32_t INVALID_DESTINATION = -311;
constexpr int32_t POOL_NOT_INITIALIZED = -312;
constexpr int32_t POOL_ALREADY_INITIALIZED = -313;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -314;
constexpr int32_t INVALID_CONFIG = -315;
constexpr int32_t UNKNOWN_POOL = -316;
constexpr int32_t SETTLEMENT_MISMATCH = -317;

// Authorization (-4xx)
constexpr int32_t INVALID_SIGNATURE = -400;
constexpr int32_t ORDER_EXPIRED = -401;
constexpr int32_t ORDER_CANCELLED = -402;
constexpr int32_t ORDER_FULLY_EXECUTED = -403;
constexpr int32_t INSUFFICIENT_FUNDING = -404;
constexpr int32_t UNAUTHORIZED = -405;
constexpr int32_t INSUFFICIENT_BALANCE = -406;
constexpr int32_t REENTRANCY = -407;

// Slippage / limits (-5xx)
constexpr int32_t OUTPUT_LIMIT = -500;
constexpr int32_t INPUT_LIMIT = -501;
constexpr int32_t MINIMUM_SHARE_PRICE = -502;
constexpr int32_t INVALID_APR = -503;
}

// Short name for a code, used in log lines
const char* error_name(int32_t code);

// =============================================================================
// Exceptions
// =============================================================================

class HyperError : public std::runtime_error {
public:
    HyperError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    [[nodiscard]] int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

class ArithmeticError : public HyperError {
public:
    ArithmeticError(int32_t code, const std::string& msg) : HyperError(code, msg) {}
};

class CurveError : public HyperError {
public:
    explicit CurveError(const std::string& msg)
        : HyperError(errors::INVALID_CURVE_STATE, msg) {}
};

class ValidationError : public HyperError {
public:
    ValidationError(int32_t code, const std::string& msg) : HyperError(code, msg) {}
};

class AuthorizationError : public HyperError {
public:
    AuthorizationError(int32_t code, const std::string& msg) : HyperError(code, msg) {}
};

class SlippageError : public HyperError {
public:
    SlippageError(int32_t code, const std::string& msg) : HyperError(code, msg) {}
};

} // namespace hyper

#endif // HYPER_ERRORS_HPP
