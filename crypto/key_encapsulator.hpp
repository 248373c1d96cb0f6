#pragma once

#include "hkdf_sha3.hpp"
#include "interfaces.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pqgate {

// ML-KEM-768 key encapsulation for external secure-channel setup. Not used
// on the token signing path.
class KeyEncapsulator {
public:
    KeyEncapsulator();
    explicit KeyEncapsulator(std::unique_ptr<KemProvider> kem);

    KemKeyPair generate_keypair() const;

    KemEncapsulation encapsulate(const std::vector<std::uint8_t> &public_key) const;

    std::vector<std::uint8_t> decapsulate(const std::vector<std::uint8_t> &ciphertext,
                                          const std::vector<std::uint8_t> &secret_key) const;

    std::vector<std::uint8_t> derive_channel_key(const std::vector<std::uint8_t> &shared_secret,
                                                 const std::string &context) const;

private:
    std::unique_ptr<KemProvider> kem_;
    HkdfSha3Provider hkdf_;
};

} // namespace pqgate
