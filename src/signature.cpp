// =============================================================================
// signature.cpp - ECDSA and contract-account signature verification
// =============================================================================

#include "hyper/signature.hpp"
#include "hyper/crypto.hpp"

namespace hyper {

bool EcdsaVerifier::verify(const Hash& digest, const std::vector<uint8_t>& signature,
                           const Address& claimed_signer) const {
    if (is_zero(claimed_signer)) return false;
    auto signer = crypto::recover(digest, signature);
    return signer.has_value() && *signer == claimed_signer;
}

bool ContractSignatureVerifier::verify(const Hash& digest, const std::vector<uint8_t>& signature,
                                       const Address& claimed_signer) const {
    const IContractSigner* contract = registry_.contract_signer(claimed_signer);
    if (contract == nullptr) return false;
    return contract->is_valid_signature(digest, signature);
}

SignatureChecker::SignatureChecker(const IAccountRegistry* registry) : registry_(registry) {}

bool SignatureChecker::verify(const Hash& digest, const std::vector<uint8_t>& signature,
                              const Address& claimed_signer) const {
    if (registry_ != nullptr && registry_->contract_signer(claimed_signer) != nullptr) {
        return ContractSignatureVerifier(*registry_).verify(digest, signature, claimed_signer);
    }
    return ecdsa_.verify(digest, signature, claimed_signer);
}

} // namespace hyper
