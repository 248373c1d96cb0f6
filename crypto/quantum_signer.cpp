#include "quantum_signer.hpp"

#include "factories.hpp"
#include "primitives.hpp"

#include <stdexcept>

namespace pqgate {

QuantumSigner::QuantumSigner()
    : provider_(make_ml_dsa_44_signature_provider()) {}

QuantumSigner::QuantumSigner(std::unique_ptr<SignatureProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_ || provider_->algorithm() != SigAlgorithm::ML_DSA_44) {
        throw std::invalid_argument("QuantumSigner requires an ML-DSA-44 provider");
    }
}

std::string QuantumSigner::sign(const std::string &message) const {
    return to_hex(provider_->sign(to_bytes(message)).bytes);
}

bool QuantumSigner::verify(const std::string &message,
                           const std::string &signature_hex,
                           const std::string &public_key_hex) const {
    Signature sig;
    sig.algorithm = SigAlgorithm::ML_DSA_44;
    try {
        sig.bytes = from_hex(signature_hex);
        if (sig.bytes.empty()) {
            return false;
        }
        if (public_key_hex.empty()) {
            return provider_->verify(to_bytes(message), sig);
        }
        auto verifier = make_ml_dsa_44_verifier(from_hex(public_key_hex));
        return verifier->verify(to_bytes(message), sig);
    } catch (const std::invalid_argument &) {
        return false;
    }
}

std::string QuantumSigner::public_key_hex() const {
    return to_hex(provider_->public_key());
}

} // namespace pqgate
