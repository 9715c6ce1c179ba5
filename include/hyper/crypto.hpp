#ifndef HYPER_CRYPTO_HPP
#define HYPER_CRYPTO_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace hyper {

// =============================================================================
// Hashing and secp256k1 ECDSA (OpenSSL libcrypto)
// =============================================================================

namespace crypto {

using Bytes = std::vector<uint8_t>;

// 65-byte recoverable signature: r (32) || s (32) || v (27 or 28)
constexpr size_t SIGNATURE_SIZE = 65;

Hash sha3_256(const uint8_t* data, size_t len);
Hash sha3_256(const Bytes& data);

// Uncompressed public key without the 0x04 prefix: x (32) || y (32).
// Throws std::invalid_argument if the secret is zero or not below the group order.
Bytes derive_public_key(const Hash& secret);

// Last 20 bytes of sha3_256(x || y)
Address address_from_public_key(const Bytes& public_key);
Address address_from_secret(const Hash& secret);

// Signs a 32-byte digest; the result always carries a low s value
Bytes sign(const Hash& digest, const Hash& secret);

// Recovers the signer address. Returns nullopt for malformed signatures,
// out-of-range r/s, high s, or points that are not on the curve.
std::optional<Address> recover(const Hash& digest, const Bytes& signature);

} // namespace crypto

} // namespace hyper

#endif // HYPER_CRYPTO_HPP
