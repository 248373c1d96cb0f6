#pragma once

#include "classical_signer.hpp"
#include "quantum_signer.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pqgate {

struct HybridSignature {
    std::string classical; // Ed25519, hex
    std::string quantum;   // ML-DSA-44, hex
    std::string hybrid;    // classical + "." + quantum
};

struct HybridPublicKeys {
    std::string classical;
    std::string quantum;
};

// Composes an Ed25519 and an ML-DSA-44 signer. A hybrid signature only
// verifies when both halves verify.
class HybridSigner {
public:
    static constexpr char kDelimiter = '.';
    static constexpr std::size_t kDefaultCacheCapacity = 1000;

    HybridSigner(std::shared_ptr<const ClassicalSigner> classical,
                 std::shared_ptr<const QuantumSigner> quantum,
                 std::size_t cache_capacity = kDefaultCacheCapacity);

    // Both signatures are computed concurrently. Results are cached by the
    // SHA-256 of the message; eviction is first-in first-out.
    HybridSignature hybrid_sign(const std::string &message);

    bool hybrid_verify(const std::string &message,
                       const std::string &hybrid,
                       const HybridPublicKeys &keys) const;

    // Verifies against this signer's own keys.
    bool hybrid_verify(const std::string &message, const std::string &hybrid) const;

    HybridPublicKeys public_keys() const;

    const ClassicalSigner &classical() const { return *classical_; }
    const QuantumSigner &quantum() const { return *quantum_; }

    std::size_t cache_size() const;
    bool is_cached(const std::string &message) const;

    static std::string combine(const std::string &classical, const std::string &quantum);

private:
    std::shared_ptr<const ClassicalSigner> classical_;
    std::shared_ptr<const QuantumSigner> quantum_;

    std::size_t capacity_;
    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, HybridSignature> cache_;
    std::deque<std::string> insertion_order_;
};

} // namespace pqgate
