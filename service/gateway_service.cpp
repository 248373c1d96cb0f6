#include "gateway_service.hpp"

#include "../common/clock.hpp"
#include "../common/errors.hpp"
#include "../crypto/primitives.hpp"
#include "../validation/default_checks.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>

namespace pqgate {

nlohmann::json gateway_response_to_json(const GatewayResponse &response) {
    nlohmann::json j;
    j["requestId"] = response.request_id;
    j["validationResult"] = validation_result_to_json(response.validation);
    j["cached"] = response.cached;
    if (response.token) {
        j["token"] = *response.token;
    }
    if (response.anchor_index) {
        j["anchorIndex"] = *response.anchor_index;
    }
    if (response.consensus) {
        j["consensus"] = {{"recordId", response.consensus->record_id},
                          {"jti", response.consensus->jti},
                          {"acceptedAt", response.consensus->accepted_at}};
    }
    if (response.error) {
        j["error"] = {{"code", response.error->code},
                      {"message", response.error->message},
                      {"status", response.error->status}};
    }
    return j;
}

GatewayService::GatewayService(Config config, GatewayHandles handles)
    : config_(std::move(config)),
      engine_(std::move(handles.engine)),
      issuer_(std::move(handles.issuer)),
      scorer_(std::move(handles.scorer)),
      audit_(std::move(handles.audit)),
      consumer_(std::move(handles.consumer)) {
    if (!engine_) {
        throw ProcessingError("gateway requires a validation engine");
    }
    if (!issuer_) {
        throw ProcessingError("gateway requires a token issuer");
    }
}

ValidationResult GatewayService::failed_result(std::int64_t duration_ms) const {
    ValidationResult result;
    result.success = false;
    result.score = 0.0;
    result.checks_passed = 0;
    result.total_checks = static_cast<int>(engine_->check_count());
    result.fraud_score = 1.0;
    result.duration_ms = duration_ms;
    return result;
}

void GatewayService::maybe_purge_cache(std::int64_t now) {
    std::int64_t last = last_purge_ms_.load();
    if (now - last < kCachePurgeIntervalMs) {
        return;
    }
    if (last_purge_ms_.compare_exchange_strong(last, now)) {
        cache_.purge_expired(now);
    }
}

std::size_t GatewayService::anchor(const std::string &token) {
    std::lock_guard<std::mutex> lock(anchor_mutex_);
    if (anchored_.size() >= kAnchorBatchLimit) {
        MerkleAccumulator sealed(anchored_);
        if (audit_) {
            audit_->log_event("anchor_batch_sealed",
                              {{"batch", sealed_batches_},
                               {"root", sealed.root()},
                               {"leaves", sealed.leaf_count()}});
        }
        ++sealed_batches_;
        anchored_.clear();
    }
    anchored_.push_back(sha256_hex(token));
    return anchored_.size() - 1;
}

GatewayResponse GatewayService::process_request(const AuthenticationRequest &request,
                                                const std::optional<std::string> &department) {
    const auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
    };

    GatewayResponse response;
    response.request_id = request.id;

    try {
        const std::int64_t now = now_ms();
        maybe_purge_cache(now);

        if (auto cached = cache_.lookup(request, now)) {
            response.validation = *cached;
            response.cached = true;
        } else {
            response.validation = engine_->validate(request);
            cache_.store(request, response.validation, now);
        }

        if (response.validation.success) {
            std::string token = issuer_->generate_token(response.validation, department);
            // Only tokens the consumer accepted are anchored.
            if (consumer_) {
                const auto parts = split(token, '.');
                response.consensus = consumer_->accept_token(token, base64url_decode(parts.at(1)));
            }
            response.anchor_index = anchor(token);
            response.token = std::move(token);
        }
    } catch (const GateError &ex) {
        response.validation = failed_result(elapsed_ms());
        response.token.reset();
        response.anchor_index.reset();
        response.consensus.reset();
        response.error = ErrorInfo{ex.code(), ex.what(), ex.status()};
    } catch (const std::exception &ex) {
        std::cerr << "pq-gate: processing error for " << request.id << ": " << ex.what()
                  << std::endl;
        response.validation = failed_result(elapsed_ms());
        response.token.reset();
        response.anchor_index.reset();
        response.consensus.reset();
        response.error = ErrorInfo{"PROCESSING_ERROR", "Validation failed", 500};
    }

    const auto total = elapsed_ms();
    if (total > 100) {
        std::cerr << "pq-gate: request " << request.id << " took " << total
                  << "ms (target: <100ms)" << std::endl;
    }

    if (audit_) {
        nlohmann::json payload{{"id", request.id},
                               {"success", response.validation.success},
                               {"score", response.validation.score},
                               {"cached", response.cached},
                               {"duration_ms", total}};
        if (response.error) {
            payload["error"] = response.error->code;
        }
        audit_->log_event("request", payload);
    }
    return response;
}

std::vector<GatewayResponse> GatewayService::process_batch(
    const std::vector<AuthenticationRequest> &requests,
    const std::optional<std::string> &department) {
    std::vector<GatewayResponse> out;
    out.reserve(requests.size());

    for (std::size_t begin = 0; begin < requests.size(); begin += kBatchChunk) {
        const std::size_t end = std::min(begin + kBatchChunk, requests.size());
        std::vector<std::future<GatewayResponse>> chunk;
        chunk.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            chunk.push_back(std::async(std::launch::async, [this, &requests, &department, i] {
                return process_request(requests[i], department);
            }));
        }
        for (auto &f : chunk) {
            out.push_back(f.get());
        }
    }
    return out;
}

std::string GatewayService::process_emergency_request(const std::string &department,
                                                      const std::string &practitioner,
                                                      const std::string &patient_id,
                                                      const std::string &reason) {
    const auto &allowed = config_.emergency_departments;
    const bool authorised = !practitioner.empty() &&
        std::find(allowed.begin(), allowed.end(), department) != allowed.end();

    if (!authorised) {
        if (audit_) {
            audit_->log_event("emergency_denied",
                              {{"department", department}, {"practitioner", practitioner}});
        }
        throw AccessDeniedError("Invalid emergency access credentials");
    }

    std::string token = issuer_->generate_emergency_token(department, practitioner, reason);

    std::cout << "pq-gate: emergency access granted to " << practitioner << " ("
              << department << ")" << std::endl;
    if (audit_) {
        audit_->log_event("emergency_access",
                          {{"department", department},
                           {"practitioner", practitioner},
                           {"patient", patient_id},
                           {"reason", reason},
                           {"timestamp", now_unix()}});
    }
    return token;
}

TokenVerificationResult GatewayService::verify_token(const std::string &token) const {
    return issuer_->verify_token(token);
}

std::string GatewayService::rotate_keys() {
    const std::string kid = issuer_->rotate_keys();
    if (audit_) {
        audit_->log_event("key_rotation", {{"kid", kid}});
    }
    return kid;
}

MerkleProof GatewayService::anchor_proof(std::size_t index) const {
    std::lock_guard<std::mutex> lock(anchor_mutex_);
    if (index >= anchored_.size()) {
        throw std::out_of_range("anchor index " + std::to_string(index) + " out of range");
    }
    return MerkleAccumulator(anchored_).make_proof(index);
}

std::string GatewayService::anchor_leaf(std::size_t index) const {
    std::lock_guard<std::mutex> lock(anchor_mutex_);
    return anchored_.at(index);
}

std::string GatewayService::anchor_root() const {
    std::lock_guard<std::mutex> lock(anchor_mutex_);
    return MerkleAccumulator(anchored_).root();
}

std::size_t GatewayService::anchored_count() const {
    std::lock_guard<std::mutex> lock(anchor_mutex_);
    return anchored_.size();
}

nlohmann::json GatewayService::health() const {
    const IssuerPublicKeys keys = issuer_->public_keys();
    nlohmann::json j{{"status", "healthy"},
                     {"stage", "validation"},
                     {"checks", engine_->check_count()},
                     {"cache_size", cache_.size()},
                     {"signing_mode", signing_mode_to_string(keys.mode)},
                     {"kid", keys.kid},
                     {"token_validity_seconds", issuer_->token_validity_seconds()},
                     {"anchored", anchored_count()},
                     {"parallel_checks", engine_->options().parallel_checks},
                     {"regions", config_.regions},
                     {"validators", {{"min", config_.min_validators},
                                     {"max", config_.max_validators},
                                     {"scale_threshold_cpu", config_.scale_threshold_cpu}}}};
    if (scorer_) {
        const ModelWeights w = scorer_->weights();
        j["fraud_model_bias"] = w.bias;
    }
    return j;
}

std::unique_ptr<GatewayService> make_gateway_service(const Config &config,
                                                     std::shared_ptr<AuditLogger> audit,
                                                     std::shared_ptr<TokenConsumer> consumer) {
    auto scorer = std::make_shared<FraudScorer>();

    DefaultCheckOptions check_options;
    check_options.trusted_client_keys = config.trusted_client_keys;
    check_options.compliance_departments = config.compliance_departments;

    auto checks = make_default_checks(check_options,
                                      std::make_shared<const ClassicalSigner>(),
                                      scorer,
                                      std::make_shared<PlaceholderRecordStore>(config.record_success_rate),
                                      std::make_shared<AllowAllFrequencyGuard>());

    EngineOptions engine_options;
    engine_options.fraud_threshold = config.fraud_threshold;
    engine_options.minimum_quorum = config.minimum_quorum;
    engine_options.timeout_ms = config.timeout_ms;
    engine_options.parallel_checks = config.parallel_checks;

    IssuerOptions issuer_options;
    issuer_options.issuer = config.issuer;
    issuer_options.audience = config.audience;
    issuer_options.token_validity_seconds = config.token_validity_seconds;
    issuer_options.mode = config.signing_mode;

    GatewayHandles handles;
    handles.engine = std::make_shared<ValidationEngine>(engine_options, std::move(checks));
    handles.issuer = std::make_shared<TokenIssuer>(issuer_options);
    handles.scorer = std::move(scorer);
    handles.audit = std::move(audit);
    handles.consumer = std::move(consumer);

    return std::make_unique<GatewayService>(config, std::move(handles));
}

} // namespace pqgate
