#include "key_material.hpp"

#include <stdexcept>

namespace pqgate {

namespace {

// The key id is the leading 16 hex digits of the Ed25519 public key.
std::string kid_for(const ClassicalSigner &signer) {
    return signer.public_key_hex().substr(0, 16);
}

} // namespace

SigningMode signing_mode_from_string(const std::string &mode) {
    if (mode == "classical") return SigningMode::Classical;
    if (mode == "hybrid") return SigningMode::Hybrid;
    throw std::invalid_argument("unknown signing_mode: " + mode);
}

std::string signing_mode_to_string(SigningMode mode) {
    switch (mode) {
    case SigningMode::Classical: return "classical";
    case SigningMode::Hybrid: return "hybrid";
    }
    return "classical";
}

std::shared_ptr<KeyMaterial> make_classical_key_material(std::int64_t now_unix) {
    auto km = std::make_shared<KeyMaterial>();
    km->mode = SigningMode::Classical;
    km->created_at = now_unix;
    km->classical = std::make_shared<const ClassicalSigner>();
    km->kid = kid_for(*km->classical);
    return km;
}

std::shared_ptr<KeyMaterial> make_hybrid_key_material(std::int64_t now_unix) {
    auto km = std::make_shared<KeyMaterial>();
    km->mode = SigningMode::Hybrid;
    km->created_at = now_unix;
    km->classical = std::make_shared<const ClassicalSigner>();
    km->quantum = std::make_shared<const QuantumSigner>();
    km->hybrid = std::make_shared<HybridSigner>(km->classical, km->quantum);
    km->kid = kid_for(*km->classical);
    return km;
}

std::shared_ptr<KeyMaterial> make_key_material(SigningMode mode, std::int64_t now_unix) {
    switch (mode) {
    case SigningMode::Classical:
        return make_classical_key_material(now_unix);
    case SigningMode::Hybrid:
        return make_hybrid_key_material(now_unix);
    }
    throw std::invalid_argument("unsupported signing mode");
}

} // namespace pqgate
