#pragma once

#include "interfaces.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pqgate {

// Ed25519 signer with hex-encoded signatures and public keys, plus the
// hashing/id helpers used across the gateway.
class ClassicalSigner {
public:
    // Generates a fresh Ed25519 keypair.
    ClassicalSigner();

    // Takes ownership of an existing provider (e.g. one restored from a
    // secret store). Throws std::invalid_argument on null or non-Ed25519.
    explicit ClassicalSigner(std::unique_ptr<SignatureProvider> provider);

    std::string sign(const std::string &message) const;

    // Verifies against this signer's key, or against public_key_hex when
    // given. Returns false for malformed hex or keys; never throws.
    bool verify(const std::string &message,
                const std::string &signature_hex,
                const std::string &public_key_hex = std::string()) const;

    std::string public_key_hex() const;

    static std::string hash(const std::string &data);
    static std::string generate_id();
    static bool constant_time_equal(const std::string &a, const std::string &b);
    static std::string hmac(const std::vector<std::uint8_t> &key,
                            const std::string &message);

private:
    std::unique_ptr<SignatureProvider> provider_;
};

} // namespace pqgate
