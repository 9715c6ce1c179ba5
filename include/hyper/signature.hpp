#ifndef HYPER_SIGNATURE_HPP
#define HYPER_SIGNATURE_HPP

#include <vector>

#include "types.hpp"
#include "interfaces.hpp"

namespace hyper {

// =============================================================================
// Signature Verification Strategies
// =============================================================================

class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    virtual bool verify(const Hash& digest, const std::vector<uint8_t>& signature,
                        const Address& claimed_signer) const = 0;
};

// Externally-owned accounts: recover the secp256k1 signer and compare
class EcdsaVerifier : public ISignatureVerifier {
public:
    bool verify(const Hash& digest, const std::vector<uint8_t>& signature,
                const Address& claimed_signer) const override;
};

// Contract accounts: delegate to the account's own validation
class ContractSignatureVerifier : public ISignatureVerifier {
public:
    explicit ContractSignatureVerifier(const IAccountRegistry& registry) : registry_(registry) {}

    bool verify(const Hash& digest, const std::vector<uint8_t>& signature,
                const Address& claimed_signer) const override;

private:
    const IAccountRegistry& registry_;
};

// Picks the contract strategy when the signer is a registered contract
// account, ECDSA recovery otherwise
class SignatureChecker : public ISignatureVerifier {
public:
    explicit SignatureChecker(const IAccountRegistry* registry = nullptr);

    bool verify(const Hash& digest, const std::vector<uint8_t>& signature,
                const Address& claimed_signer) const override;

private:
    const IAccountRegistry* registry_;
    EcdsaVerifier ecdsa_;
};

} // namespace hyper

#endif // HYPER_SIGNATURE_HPP
