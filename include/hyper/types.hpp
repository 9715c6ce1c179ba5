#ifndef HYPER_TYPES_HPP
#define HYPER_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <functional>

#include <boost/multiprecision/cpp_int.hpp>

namespace hyper {

// =============================================================================
// Integer Types (EVM word width)
// =============================================================================

using U256 = boost::multiprecision::uint256_t;
using I256 = boost::multiprecision::int256_t;
using U512 = boost::multiprecision::uint512_t;

// =============================================================================
// Account / Hash Types
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Hash = std::array<uint8_t, 32>;

constexpr Address ZERO_ADDRESS = {};

inline bool is_zero(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Test and fixture helper: address whose last two bytes hold `n`
constexpr Address make_address(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

std::string to_hex(const Address& a);
std::string to_hex(const Hash& h);

// Big-endian 32-byte encoding of a word, as used by hashing and signatures
Hash to_bytes32(const U256& v);
U256 from_bytes32(const Hash& h);

// =============================================================================
// Fixed-Point Constants (18 decimals)
// =============================================================================

const U256 ONE = U256(1000000000000000000ULL);        // 1e18
const U256 RAY = U256("1000000000000000000000000000");  // 1e27
const U256 U256_MAX = ~U256(0);

constexpr uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;

// Seconds since epoch; pools read time only through this
using Clock = std::function<uint64_t()>;

} // namespace hyper

#endif // HYPER_TYPES_HPP
