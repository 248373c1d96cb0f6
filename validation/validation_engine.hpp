#pragma once

#include "request.hpp"
#include "validation_check.hpp"
#include "validation_result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pqgate {

struct EngineOptions {
    double fraud_threshold{0.8};
    int minimum_quorum{3};
    int timeout_ms{100};
    // When false, checks run one after another, each with its own timeout.
    bool parallel_checks{true};
    std::int64_t max_clock_skew_ms{300000};
};

// Runs a fixed registry of weighted checks concurrently against one request.
// Each check is raced against its own timeout; a check that times out or
// throws scores zero and is recorded in the result details, and slow checks
// are simply no longer waited for.
class ValidationEngine {
public:
    // Throws ProcessingError for an empty registry, a null check, a
    // non-positive weight or a duplicate check name.
    ValidationEngine(EngineOptions options,
                     std::vector<std::shared_ptr<ValidationCheck>> checks);

    // Throws ValidationError when the request fails the format pre-check;
    // no check runs in that case. Never throws for per-check failures.
    ValidationResult validate(const AuthenticationRequest &request) const;
    ValidationResult validate(const AuthenticationRequest &request, int timeout_ms) const;
    ValidationResult validate(const AuthenticationRequest &request, int timeout_ms,
                              std::int64_t now_ms) const;

    // Missing id, non-positive timestamp, non-object data, or a timestamp
    // further than max_clock_skew_ms from now.
    void precheck(const AuthenticationRequest &request, std::int64_t now_ms) const;

    std::size_t check_count() const { return checks_.size(); }
    const EngineOptions &options() const { return options_; }

private:
    EngineOptions options_;
    std::vector<std::shared_ptr<ValidationCheck>> checks_;
};

} // namespace pqgate
