#include "classical_signer.hpp"

#include "factories.hpp"
#include "primitives.hpp"

#include <stdexcept>

namespace pqgate {

ClassicalSigner::ClassicalSigner()
    : provider_(make_ed25519_signature_provider()) {}

ClassicalSigner::ClassicalSigner(std::unique_ptr<SignatureProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_ || provider_->algorithm() != SigAlgorithm::Ed25519) {
        throw std::invalid_argument("ClassicalSigner requires an Ed25519 provider");
    }
}

std::string ClassicalSigner::sign(const std::string &message) const {
    return to_hex(provider_->sign(to_bytes(message)).bytes);
}

bool ClassicalSigner::verify(const std::string &message,
                             const std::string &signature_hex,
                             const std::string &public_key_hex) const {
    Signature sig;
    sig.algorithm = SigAlgorithm::Ed25519;
    try {
        sig.bytes = from_hex(signature_hex);
        if (public_key_hex.empty()) {
            return provider_->verify(to_bytes(message), sig);
        }
        auto verifier = make_ed25519_verifier(from_hex(public_key_hex));
        return verifier->verify(to_bytes(message), sig);
    } catch (const std::invalid_argument &) {
        return false;
    }
}

std::string ClassicalSigner::public_key_hex() const {
    return to_hex(provider_->public_key());
}

std::string ClassicalSigner::hash(const std::string &data) {
    return sha256_hex(data);
}

std::string ClassicalSigner::generate_id() {
    return to_hex(random_bytes(16));
}

bool ClassicalSigner::constant_time_equal(const std::string &a, const std::string &b) {
    return pqgate::constant_time_equal(a, b);
}

std::string ClassicalSigner::hmac(const std::vector<std::uint8_t> &key,
                                  const std::string &message) {
    return to_hex(hmac_sha256(key, to_bytes(message)));
}

} // namespace pqgate
