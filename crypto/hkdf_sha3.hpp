#pragma once

#include "algorithms.hpp"
#include "interfaces.hpp"

#include <string>

namespace pqgate {

// HKDF implementation using SHA3-256 via OpenSSL.
// We do NOT reimplement SHA3; we only orchestrate HKDF around library calls.
class HkdfSha3Provider : public HkdfProvider {
public:
    HashAlgorithm hash() const override { return HashAlgorithm::SHA3_256; }

    std::vector<std::uint8_t> derive(const std::vector<std::uint8_t> &ikm,
                                     const std::vector<std::uint8_t> &salt,
                                     const std::vector<std::uint8_t> &info,
                                     std::size_t out_len) const override;
};

// Channel key derivation for callers that completed an ML-KEM exchange:
//   channel_key = HKDF-SHA3-256(IKM = shared_secret, salt = "",
//                               info = "pq-gate/channel/" + context, 32 bytes)
std::vector<std::uint8_t> derive_channel_key(
    const std::vector<std::uint8_t> &shared_secret,
    const std::string &context,
    const HkdfProvider &hkdf);

} // namespace pqgate
