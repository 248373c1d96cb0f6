#pragma once

#include "token_consumer.hpp"

#include "../audit/audit_logger.hpp"
#include "../crypto/merkle_accumulator.hpp"
#include "../policy/config.hpp"
#include "../token/token_issuer.hpp"
#include "../validation/fraud_scorer.hpp"
#include "../validation/request.hpp"
#include "../validation/request_cache.hpp"
#include "../validation/validation_engine.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pqgate {

struct ErrorInfo {
    std::string code;
    std::string message;
    int status{500};
};

struct GatewayResponse {
    std::string request_id;
    std::optional<std::string> token;
    ValidationResult validation;
    bool cached{false};
    std::optional<std::size_t> anchor_index; // leaf index of the token digest
    std::optional<ConsensusRecord> consensus;
    std::optional<ErrorInfo> error;
};

nlohmann::json gateway_response_to_json(const GatewayResponse &response);

// Explicit handles; nothing in the gateway is process-global.
struct GatewayHandles {
    std::shared_ptr<ValidationEngine> engine;   // required
    std::shared_ptr<TokenIssuer> issuer;        // required
    std::shared_ptr<FraudScorer> scorer;        // optional, reported in health()
    std::shared_ptr<AuditLogger> audit;         // optional
    std::shared_ptr<TokenConsumer> consumer;    // optional
};

class GatewayService {
public:
    static constexpr std::size_t kBatchChunk = 100;
    static constexpr std::size_t kAnchorBatchLimit = 4096;
    static constexpr std::int64_t kCachePurgeIntervalMs = 60000;

    // Throws ProcessingError when the engine or issuer is missing.
    GatewayService(Config config, GatewayHandles handles);

    // cache -> validate -> token. Never throws for request-level failures;
    // they come back in response.error with a failed validation verdict.
    GatewayResponse process_request(const AuthenticationRequest &request,
                                    const std::optional<std::string> &department = std::nullopt);

    // Processes chunks of kBatchChunk requests concurrently. Output order
    // matches input order.
    std::vector<GatewayResponse> process_batch(const std::vector<AuthenticationRequest> &requests,
                                               const std::optional<std::string> &department = std::nullopt);

    // Throws AccessDeniedError unless the department is on the emergency
    // allow-list and a practitioner is given. Grants and denials are audited.
    std::string process_emergency_request(const std::string &department,
                                          const std::string &practitioner,
                                          const std::string &patient_id,
                                          const std::string &reason);

    TokenVerificationResult verify_token(const std::string &token) const;

    std::string rotate_keys();

    // Inclusion proof for the token digest at index in the current anchor
    // batch. Throws std::out_of_range for an unknown index.
    MerkleProof anchor_proof(std::size_t index) const;
    std::string anchor_leaf(std::size_t index) const;
    std::string anchor_root() const;
    std::size_t anchored_count() const;

    nlohmann::json health() const;

    const Config &config() const { return config_; }
    const TokenIssuer &issuer() const { return *issuer_; }

private:
    std::size_t anchor(const std::string &token);
    void maybe_purge_cache(std::int64_t now);
    ValidationResult failed_result(std::int64_t duration_ms) const;

    Config config_;
    std::shared_ptr<ValidationEngine> engine_;
    std::shared_ptr<TokenIssuer> issuer_;
    std::shared_ptr<FraudScorer> scorer_;
    std::shared_ptr<AuditLogger> audit_;
    std::shared_ptr<TokenConsumer> consumer_;

    RequestCache cache_;
    std::atomic<std::int64_t> last_purge_ms_{0};

    mutable std::mutex anchor_mutex_;
    std::vector<std::string> anchored_;
    std::uint64_t sealed_batches_{0};
};

// Builds the default engine, issuer and scorer from config.
std::unique_ptr<GatewayService> make_gateway_service(const Config &config,
                                                     std::shared_ptr<AuditLogger> audit,
                                                     std::shared_ptr<TokenConsumer> consumer = nullptr);

} // namespace pqgate
