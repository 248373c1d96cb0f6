#include "key_encapsulator.hpp"

#include "factories.hpp"

#include <stdexcept>

namespace pqgate {

KeyEncapsulator::KeyEncapsulator() : kem_(make_ml_kem_768_provider()) {}

KeyEncapsulator::KeyEncapsulator(std::unique_ptr<KemProvider> kem) : kem_(std::move(kem)) {
    if (!kem_) {
        throw std::invalid_argument("KeyEncapsulator requires a KEM provider");
    }
}

KemKeyPair KeyEncapsulator::generate_keypair() const {
    return kem_->keypair();
}

KemEncapsulation KeyEncapsulator::encapsulate(const std::vector<std::uint8_t> &public_key) const {
    return kem_->encapsulate(public_key);
}

std::vector<std::uint8_t> KeyEncapsulator::decapsulate(
    const std::vector<std::uint8_t> &ciphertext,
    const std::vector<std::uint8_t> &secret_key) const {
    return kem_->decapsulate(ciphertext, secret_key);
}

std::vector<std::uint8_t> KeyEncapsulator::derive_channel_key(
    const std::vector<std::uint8_t> &shared_secret,
    const std::string &context) const {
    return pqgate::derive_channel_key(shared_secret, context, hkdf_);
}

} // namespace pqgate
