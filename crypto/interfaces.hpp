#pragma once

#include "algorithms.hpp"

#include <memory>
#include <vector>

namespace pqgate {

class SignatureProvider {
public:
    virtual ~SignatureProvider() = default;

    virtual SigAlgorithm algorithm() const = 0;

    // Raw public key bytes for the keypair held by this provider.
    virtual std::vector<std::uint8_t> public_key() const = 0;

    // Throws std::runtime_error when the provider only holds a public key.
    virtual Signature sign(const std::vector<std::uint8_t> &msg) const = 0;

    virtual bool verify(const std::vector<std::uint8_t> &msg,
                        const Signature &sig) const = 0;
};

class KemProvider {
public:
    virtual ~KemProvider() = default;

    virtual KemAlgorithm algorithm() const = 0;

    virtual KemKeyPair keypair() const = 0;

    virtual KemEncapsulation encapsulate(
        const std::vector<std::uint8_t> &public_key) const = 0;

    virtual std::vector<std::uint8_t> decapsulate(
        const std::vector<std::uint8_t> &ciphertext,
        const std::vector<std::uint8_t> &secret_key) const = 0;
};

class HkdfProvider {
public:
    virtual ~HkdfProvider() = default;

    virtual HashAlgorithm hash() const = 0;

    // HKDF-Extract + HKDF-Expand; out_len is output key size in bytes.
    virtual std::vector<std::uint8_t> derive(
        const std::vector<std::uint8_t> &ikm,
        const std::vector<std::uint8_t> &salt,
        const std::vector<std::uint8_t> &info,
        std::size_t out_len) const = 0;
};

} // namespace pqgate
