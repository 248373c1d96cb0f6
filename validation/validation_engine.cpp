#include "validation_engine.hpp"

#include "../common/clock.hpp"
#include "../common/errors.hpp"
#include "default_checks.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <set>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace pqgate {

namespace {

struct PendingCheck {
    std::shared_ptr<ValidationCheck> check;
    std::future<double> result;
    std::string launch_error;
};

// Runs the check on its own detached worker. The worker only holds shared
// state, so the caller can stop waiting for it at any point.
PendingCheck launch(const std::shared_ptr<ValidationCheck> &check,
                    const std::shared_ptr<const AuthenticationRequest> &request) {
    PendingCheck pending;
    pending.check = check;

    auto promise = std::make_shared<std::promise<double>>();
    pending.result = promise->get_future();
    try {
        std::thread([check, request, promise] {
            try {
                promise->set_value(check->execute(*request));
            } catch (const std::exception &) {
                promise->set_exception(std::current_exception());
            } catch (...) {
                promise->set_exception(std::make_exception_ptr(
                    std::runtime_error("check raised a non-standard exception")));
            }
        }).detach();
    } catch (const std::system_error &ex) {
        pending.launch_error = std::string("worker unavailable: ") + ex.what();
    }
    return pending;
}

CheckOutcome collect(PendingCheck &pending,
                     std::chrono::steady_clock::time_point deadline) {
    CheckOutcome outcome;
    if (!pending.launch_error.empty()) {
        outcome.error = pending.launch_error;
        return outcome;
    }
    if (pending.result.wait_until(deadline) != std::future_status::ready) {
        outcome.error = "timeout";
        return outcome;
    }

    double score = 0.0;
    try {
        score = pending.result.get();
    } catch (const std::exception &ex) {
        outcome.error = ex.what();
        return outcome;
    }

    if (std::isnan(score)) {
        outcome.error = "check returned NaN";
        return outcome;
    }
    outcome.completed = true;
    outcome.score = std::min(std::max(score, 0.0), 1.0);
    outcome.passed = outcome.score >= 0.5;
    return outcome;
}

} // namespace

ValidationEngine::ValidationEngine(EngineOptions options,
                                   std::vector<std::shared_ptr<ValidationCheck>> checks)
    : options_(options), checks_(std::move(checks)) {
    if (checks_.empty()) {
        throw ProcessingError("validation engine requires at least one check");
    }
    std::set<std::string> names;
    for (const auto &check : checks_) {
        if (!check) {
            throw ProcessingError("null validation check registered");
        }
        if (!(check->weight() > 0.0)) {
            throw ProcessingError("check '" + check->name() + "' must have a positive weight");
        }
        if (!names.insert(check->name()).second) {
            throw ProcessingError("duplicate validation check '" + check->name() + "'");
        }
    }
    if (options_.timeout_ms < 1) {
        options_.timeout_ms = 1;
    }
}

void ValidationEngine::precheck(const AuthenticationRequest &request, std::int64_t now) const {
    if (request.id.empty()) {
        throw ValidationError("Invalid request format: missing id");
    }
    if (request.timestamp <= 0) {
        throw ValidationError("Invalid request format: missing timestamp");
    }
    if (!request.data.is_object()) {
        throw ValidationError("Invalid request format: data must be an object");
    }
    if (std::llabs(now - request.timestamp) > options_.max_clock_skew_ms) {
        throw ValidationError("Invalid request format: timestamp outside accepted window");
    }
}

ValidationResult ValidationEngine::validate(const AuthenticationRequest &request) const {
    return validate(request, options_.timeout_ms, now_ms());
}

ValidationResult ValidationEngine::validate(const AuthenticationRequest &request,
                                            int timeout_ms) const {
    return validate(request, timeout_ms, now_ms());
}

ValidationResult ValidationEngine::validate(const AuthenticationRequest &request,
                                            int timeout_ms,
                                            std::int64_t now) const {
    const auto started = std::chrono::steady_clock::now();

    precheck(request, now);

    auto shared_request = std::make_shared<const AuthenticationRequest>(request);
    const auto deadline = started + std::chrono::milliseconds(std::max(timeout_ms, 1));

    std::vector<PendingCheck> pending;
    pending.reserve(checks_.size());
    std::vector<CheckOutcome> outcomes;
    outcomes.reserve(checks_.size());
    if (options_.parallel_checks) {
        for (const auto &check : checks_) {
            pending.push_back(launch(check, shared_request));
        }
        for (auto &p : pending) {
            outcomes.push_back(collect(p, deadline));
        }
    } else {
        for (const auto &check : checks_) {
            pending.push_back(launch(check, shared_request));
            const auto own_deadline = std::chrono::steady_clock::now() +
                std::chrono::milliseconds(std::max(timeout_ms, 1));
            outcomes.push_back(collect(pending.back(), own_deadline));
        }
    }

    ValidationResult result;
    result.total_checks = static_cast<int>(checks_.size());

    double weighted = 0.0;
    double completed_weight = 0.0;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        const PendingCheck &p = pending[i];
        CheckOutcome &outcome = outcomes[i];
        if (outcome.completed) {
            weighted += outcome.score * p.check->weight();
            completed_weight += p.check->weight();
            if (outcome.passed) {
                ++result.checks_passed;
            }
        }
        result.details.emplace(p.check->name(), std::move(outcome));
    }

    result.score = completed_weight > 0.0 ? weighted / completed_weight : 0.0;

    auto fraud = result.details.find(kFraudModelCheck);
    if (fraud != result.details.end() && fraud->second.completed) {
        result.fraud_score = 1.0 - fraud->second.score;
    }

    result.success = result.score >= options_.fraud_threshold &&
                     result.checks_passed >= options_.minimum_quorum;

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (result.duration_ms > 100) {
        std::cerr << "pq-gate: validation of " << request.id << " took "
                  << result.duration_ms << "ms (target: <100ms)" << std::endl;
    }
    return result;
}

} // namespace pqgate
