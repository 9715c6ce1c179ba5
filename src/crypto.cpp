// =============================================================================
// crypto.cpp - SHA3-256 and recoverable secp256k1 ECDSA over OpenSSL
// Public key recovery follows SEC1 v2 section 4.1.6.
// =============================================================================

#include "hyper/crypto.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

namespace hyper {
namespace crypto {

namespace {

struct BnCtxDeleter { void operator()(BN_CTX* c) const { BN_CTX_free(c); } };
struct BnDeleter { void operator()(BIGNUM* b) const { BN_clear_free(b); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* g) const { EC_GROUP_free(g); } };

using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;

void check(int ok, const char* what) {
    if (ok != 1) {
        ERR_clear_error();
        throw std::runtime_error(std::string("OpenSSL: ") + what + " failed");
    }
}

template <typename T>
T* check_ptr(T* ptr, const char* what) {
    if (ptr == nullptr) {
        ERR_clear_error();
        throw std::runtime_error(std::string("OpenSSL: ") + what + " failed");
    }
    return ptr;
}

BnPtr new_bn() { return BnPtr(check_ptr(BN_new(), "BN_new")); }

BnPtr bn_from_bytes(const uint8_t* data, size_t len) {
    return BnPtr(check_ptr(BN_bin2bn(data, static_cast<int>(len), nullptr), "BN_bin2bn"));
}

void bn_to_bytes32(const BIGNUM* bn, uint8_t* out) {
    if (BN_bn2binpad(bn, out, 32) != 32) {
        throw std::runtime_error("OpenSSL: BN_bn2binpad failed");
    }
}

struct Curve {
    GroupPtr group;
    BnPtr order;
    BnPtr half_order;
    BnPtr field;
};

const Curve& secp256k1() {
    static const Curve curve = [] {
        Curve c;
        c.group.reset(check_ptr(EC_GROUP_new_by_curve_name(NID_secp256k1), "EC_GROUP_new_by_curve_name"));
        BnCtxPtr ctx(check_ptr(BN_CTX_new(), "BN_CTX_new"));
        c.order = new_bn();
        c.half_order = new_bn();
        c.field = new_bn();
        check(EC_GROUP_get_order(c.group.get(), c.order.get(), ctx.get()), "EC_GROUP_get_order");
        check(BN_rshift1(c.half_order.get(), c.order.get()), "BN_rshift1");
        check(EC_GROUP_get_curve(c.group.get(), c.field.get(), nullptr, nullptr, ctx.get()),
              "EC_GROUP_get_curve");
        return c;
    }();
    return curve;
}

Bytes point_to_bytes(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
    uint8_t buf[65];
    if (EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED, buf, sizeof(buf), ctx) != sizeof(buf)) {
        ERR_clear_error();
        throw std::runtime_error("OpenSSL: EC_POINT_point2oct failed");
    }
    return Bytes(buf + 1, buf + sizeof(buf));
}

BnPtr checked_secret(const Hash& secret, const Curve& curve) {
    BnPtr d = bn_from_bytes(secret.data(), secret.size());
    if (BN_is_zero(d.get()) || BN_cmp(d.get(), curve.order.get()) >= 0) {
        throw std::invalid_argument("secp256k1: secret key out of range");
    }
    return d;
}

}  // namespace

// =============================================================================
// Hashing
// =============================================================================

Hash sha3_256(const uint8_t* data, size_t len) {
    Hash out = {};
    unsigned int out_len = 0;
    check(EVP_Digest(data, len, out.data(), &out_len, EVP_sha3_256(), nullptr), "EVP_Digest");
    return out;
}

Hash sha3_256(const Bytes& data) {
    return sha3_256(data.data(), data.size());
}

// =============================================================================
// Keys
// =============================================================================

Bytes derive_public_key(const Hash& secret) {
    const Curve& curve = secp256k1();
    BnCtxPtr ctx(check_ptr(BN_CTX_new(), "BN_CTX_new"));
    BnPtr d = checked_secret(secret, curve);

    PointPtr pub(check_ptr(EC_POINT_new(curve.group.get()), "EC_POINT_new"));
    check(EC_POINT_mul(curve.group.get(), pub.get(), d.get(), nullptr, nullptr, ctx.get()), "EC_POINT_mul");
    return point_to_bytes(curve.group.get(), pub.get(), ctx.get());
}

Address address_from_public_key(const Bytes& public_key) {
    if (public_key.size() != 64) {
        throw std::invalid_argument("secp256k1: public key must be 64 bytes");
    }
    Hash h = sha3_256(public_key);
    Address addr = {};
    std::copy(h.begin() + 12, h.end(), addr.begin());
    return addr;
}

Address address_from_secret(const Hash& secret) {
    return address_from_public_key(derive_public_key(secret));
}

// =============================================================================
// Signing
// =============================================================================

Bytes sign(const Hash& digest, const Hash& secret) {
    const Curve& curve = secp256k1();
    const EC_GROUP* group = curve.group.get();
    const BIGNUM* n = curve.order.get();
    BnCtxPtr ctx(check_ptr(BN_CTX_new(), "BN_CTX_new"));
    BnPtr d = checked_secret(secret, curve);
    BnPtr e = bn_from_bytes(digest.data(), digest.size());

    BnPtr k = new_bn();
    BnPtr rx = new_bn();
    BnPtr ry = new_bn();
    BnPtr r = new_bn();
    BnPtr s = new_bn();
    BnPtr tmp = new_bn();
    PointPtr big_r(check_ptr(EC_POINT_new(group), "EC_POINT_new"));

    for (;;) {
        check(BN_generate_dsa_nonce(k.get(), n, d.get(), digest.data(), digest.size(), ctx.get()),
              "BN_generate_dsa_nonce");
        if (BN_is_zero(k.get())) continue;

        check(EC_POINT_mul(group, big_r.get(), k.get(), nullptr, nullptr, ctx.get()), "EC_POINT_mul");
        check(EC_POINT_get_affine_coordinates(group, big_r.get(), rx.get(), ry.get(), ctx.get()),
              "EC_POINT_get_affine_coordinates");
        check(BN_nnmod(r.get(), rx.get(), n, ctx.get()), "BN_nnmod");
        if (BN_is_zero(r.get())) continue;

        int recid = BN_is_odd(ry.get()) ? 1 : 0;
        if (BN_cmp(rx.get(), n) >= 0) recid |= 2;

        // s = k^-1 * (e + r * d) mod n
        BnPtr k_inv(check_ptr(BN_mod_inverse(nullptr, k.get(), n, ctx.get()), "BN_mod_inverse"));
        check(BN_mod_mul(tmp.get(), r.get(), d.get(), n, ctx.get()), "BN_mod_mul");
        check(BN_mod_add(tmp.get(), tmp.get(), e.get(), n, ctx.get()), "BN_mod_add");
        check(BN_mod_mul(s.get(), k_inv.get(), tmp.get(), n, ctx.get()), "BN_mod_mul");
        if (BN_is_zero(s.get())) continue;

        if (BN_cmp(s.get(), curve.half_order.get()) > 0) {
            check(BN_sub(s.get(), n, s.get()), "BN_sub");
            recid ^= 1;
        }

        Bytes out(SIGNATURE_SIZE);
        bn_to_bytes32(r.get(), out.data());
        bn_to_bytes32(s.get(), out.data() + 32);
        out[64] = static_cast<uint8_t>(27 + recid);
        return out;
    }
}

// =============================================================================
// Recovery
// =============================================================================

std::optional<Address> recover(const Hash& digest, const Bytes& signature) {
    if (signature.size() != SIGNATURE_SIZE) return std::nullopt;

    int v = signature[64];
    int recid = v >= 27 ? v - 27 : v;
    if (recid < 0 || recid > 3) return std::nullopt;

    const Curve& curve = secp256k1();
    const EC_GROUP* group = curve.group.get();
    const BIGNUM* n = curve.order.get();
    BnCtxPtr ctx(check_ptr(BN_CTX_new(), "BN_CTX_new"));

    BnPtr r = bn_from_bytes(signature.data(), 32);
    BnPtr s = bn_from_bytes(signature.data() + 32, 32);
    if (BN_is_zero(r.get()) || BN_cmp(r.get(), n) >= 0) return std::nullopt;
    if (BN_is_zero(s.get()) || BN_cmp(s.get(), curve.half_order.get()) > 0) return std::nullopt;

    // x = r + (recid / 2) * n must be a field element
    BnPtr x = new_bn();
    check(BN_copy(x.get(), n) != nullptr ? 1 : 0, "BN_copy");
    check(BN_mul_word(x.get(), static_cast<BN_ULONG>(recid / 2)), "BN_mul_word");
    check(BN_add(x.get(), x.get(), r.get()), "BN_add");
    if (BN_cmp(x.get(), curve.field.get()) >= 0) return std::nullopt;

    PointPtr big_r(check_ptr(EC_POINT_new(group), "EC_POINT_new"));
    if (EC_POINT_set_compressed_coordinates(group, big_r.get(), x.get(), recid & 1, ctx.get()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }

    // Q = r^-1 * (s * R - e * G)
    BnPtr e = bn_from_bytes(digest.data(), digest.size());
    BnPtr e_neg = new_bn();
    check(BN_nnmod(e.get(), e.get(), n, ctx.get()), "BN_nnmod");
    check(BN_mod_sub(e_neg.get(), n, e.get(), n, ctx.get()), "BN_mod_sub");

    BnPtr r_inv(check_ptr(BN_mod_inverse(nullptr, r.get(), n, ctx.get()), "BN_mod_inverse"));
    BnPtr sor = new_bn();
    BnPtr eor = new_bn();
    check(BN_mod_mul(sor.get(), s.get(), r_inv.get(), n, ctx.get()), "BN_mod_mul");
    check(BN_mod_mul(eor.get(), e_neg.get(), r_inv.get(), n, ctx.get()), "BN_mod_mul");

    PointPtr q(check_ptr(EC_POINT_new(group), "EC_POINT_new"));
    check(EC_POINT_mul(group, q.get(), eor.get(), big_r.get(), sor.get(), ctx.get()), "EC_POINT_mul");
    if (EC_POINT_is_at_infinity(group, q.get())) return std::nullopt;

    return address_from_public_key(point_to_bytes(group, q.get(), ctx.get()));
}

} // namespace crypto
} // namespace hyper
