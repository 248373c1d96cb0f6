#pragma once

#include "algorithms.hpp"
#include "classical_signer.hpp"
#include "hybrid_signer.hpp"
#include "quantum_signer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace pqgate {

// One generation of token signing keys. Classical material carries only the
// Ed25519 signer; hybrid material carries both signers and the HybridSigner
// (with its signature cache) built over them.
struct KeyMaterial {
    std::string  kid;
    SigningMode  mode;
    std::int64_t created_at;

    std::shared_ptr<const ClassicalSigner> classical; // must not be null
    std::shared_ptr<const QuantumSigner>   quantum;   // null in classical mode
    std::shared_ptr<HybridSigner>          hybrid;    // null in classical mode
};

std::shared_ptr<KeyMaterial> make_classical_key_material(std::int64_t now_unix);
std::shared_ptr<KeyMaterial> make_hybrid_key_material(std::int64_t now_unix);
std::shared_ptr<KeyMaterial> make_key_material(SigningMode mode, std::int64_t now_unix);

} // namespace pqgate
