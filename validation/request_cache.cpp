#include "request_cache.hpp"

#include "../crypto/primitives.hpp"

namespace pqgate {

std::string RequestCache::cache_key(const AuthenticationRequest &request) {
    nlohmann::json key;
    key["id"] = request.id;
    key["timestamp"] = request.timestamp / 1000;
    key["data"] = request.data;
    return sha256_hex(key.dump());
}

std::optional<ValidationResult> RequestCache::lookup(const AuthenticationRequest &request,
                                                     std::int64_t now) const {
    const std::string key = cache_key(request);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || now - it->second.stored_at >= kHitWindowMs) {
        return std::nullopt;
    }
    return it->second.result;
}

void RequestCache::store(const AuthenticationRequest &request,
                         const ValidationResult &result,
                         std::int64_t now) {
    const std::string key = cache_key(request);
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{result, now};
}

std::size_t RequestCache::purge_expired(std::int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.stored_at > kRetentionMs) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t RequestCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace pqgate
