#pragma once

#include "request.hpp"
#include "validation_result.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pqgate {

// Best-effort dedupe of identical recent requests. Concurrent identical
// requests may both validate; the last store wins.
class RequestCache {
public:
    static constexpr std::int64_t kHitWindowMs = 5000;
    static constexpr std::int64_t kRetentionMs = 60000;

    // SHA-256 over {id, timestamp rounded down to the second, data}.
    static std::string cache_key(const AuthenticationRequest &request);

    std::optional<ValidationResult> lookup(const AuthenticationRequest &request,
                                           std::int64_t now_ms) const;

    void store(const AuthenticationRequest &request,
               const ValidationResult &result,
               std::int64_t now_ms);

    // Drops entries older than the retention window; returns how many.
    std::size_t purge_expired(std::int64_t now_ms);

    std::size_t size() const;

private:
    struct Entry {
        ValidationResult result;
        std::int64_t stored_at;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace pqgate
