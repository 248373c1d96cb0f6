#pragma once

#include "interfaces.hpp"

namespace pqgate {

// Classical (OpenSSL-backed) factories
std::unique_ptr<SignatureProvider> make_ed25519_signature_provider();
std::unique_ptr<SignatureProvider> make_ed25519_verifier(
    const std::vector<std::uint8_t> &public_key);

// PQ (liboqs-backed) factories
std::unique_ptr<SignatureProvider> make_ml_dsa_44_signature_provider();
std::unique_ptr<SignatureProvider> make_ml_dsa_44_verifier(
    const std::vector<std::uint8_t> &public_key);
std::unique_ptr<KemProvider>       make_ml_kem_768_provider();

} // namespace pqgate
