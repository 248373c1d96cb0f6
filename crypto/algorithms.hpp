#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pqgate {

// Signing mode of the token issuer. Classical signs with Ed25519 only;
// Hybrid requires both Ed25519 and ML-DSA-44 to verify.
enum class SigningMode {
    Classical,
    Hybrid
};

enum class KemAlgorithm {
    ML_KEM_768
};

enum class SigAlgorithm {
    Ed25519,
    ML_DSA_44
};

enum class HashAlgorithm {
    SHA2_256,
    SHA3_256
};

struct Signature {
    std::vector<std::uint8_t> bytes;
    SigAlgorithm algorithm;
};

struct KemKeyPair {
    std::vector<std::uint8_t> public_key;
    std::vector<std::uint8_t> secret_key;
};

struct KemEncapsulation {
    std::vector<std::uint8_t> ciphertext;
    std::vector<std::uint8_t> shared_secret;
};

SigningMode signing_mode_from_string(const std::string &mode);
std::string signing_mode_to_string(SigningMode mode);

} // namespace pqgate
