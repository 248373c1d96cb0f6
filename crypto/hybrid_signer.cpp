#include "hybrid_signer.hpp"

#include "primitives.hpp"

#include <future>
#include <stdexcept>

namespace pqgate {

HybridSigner::HybridSigner(std::shared_ptr<const ClassicalSigner> classical,
                           std::shared_ptr<const QuantumSigner> quantum,
                           std::size_t cache_capacity)
    : classical_(std::move(classical)),
      quantum_(std::move(quantum)),
      capacity_(cache_capacity) {
    if (!classical_ || !quantum_) {
        throw std::invalid_argument("HybridSigner requires both classical and quantum signers");
    }
}

HybridSignature HybridSigner::hybrid_sign(const std::string &message) {
    const std::string cache_key = sha256_hex(message);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(cache_key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    auto quantum_future = std::async(std::launch::async, [this, &message] {
        return quantum_->sign(message);
    });
    std::string classical_sig = classical_->sign(message);

    HybridSignature result;
    result.classical = std::move(classical_sig);
    result.quantum = quantum_future.get();
    result.hybrid = combine(result.classical, result.quantum);

    if (capacity_ > 0) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (cache_.find(cache_key) == cache_.end()) {
            if (cache_.size() >= capacity_) {
                cache_.erase(insertion_order_.front());
                insertion_order_.pop_front();
            }
            cache_.emplace(cache_key, result);
            insertion_order_.push_back(cache_key);
        }
    }
    return result;
}

bool HybridSigner::hybrid_verify(const std::string &message,
                                 const std::string &hybrid,
                                 const HybridPublicKeys &keys) const {
    const auto parts = split(hybrid, kDelimiter);
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
        return false;
    }

    auto quantum_future = std::async(std::launch::async, [this, &message, &parts, &keys] {
        return quantum_->verify(message, parts[1], keys.quantum);
    });
    const bool classical_ok = classical_->verify(message, parts[0], keys.classical);
    const bool quantum_ok = quantum_future.get();

    return classical_ok && quantum_ok;
}

bool HybridSigner::hybrid_verify(const std::string &message,
                                 const std::string &hybrid) const {
    return hybrid_verify(message, hybrid, HybridPublicKeys{});
}

HybridPublicKeys HybridSigner::public_keys() const {
    HybridPublicKeys keys;
    keys.classical = classical_->public_key_hex();
    keys.quantum = quantum_->public_key_hex();
    return keys;
}

std::size_t HybridSigner::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

bool HybridSigner::is_cached(const std::string &message) const {
    const std::string cache_key = sha256_hex(message);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.count(cache_key) != 0;
}

std::string HybridSigner::combine(const std::string &classical, const std::string &quantum) {
    std::string out;
    out.reserve(classical.size() + 1 + quantum.size());
    out += classical;
    out += kDelimiter;
    out += quantum;
    return out;
}

} // namespace pqgate
