#pragma once

#include "interfaces.hpp"

#include <memory>
#include <string>

namespace pqgate {

// ML-DSA-44 signer with hex-encoded signatures and public keys.
class QuantumSigner {
public:
    QuantumSigner();
    explicit QuantumSigner(std::unique_ptr<SignatureProvider> provider);

    std::string sign(const std::string &message) const;

    bool verify(const std::string &message,
                const std::string &signature_hex,
                const std::string &public_key_hex = std::string()) const;

    std::string public_key_hex() const;

private:
    std::unique_ptr<SignatureProvider> provider_;
};

} // namespace pqgate
