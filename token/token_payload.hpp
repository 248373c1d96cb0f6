#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pqgate {

// Permission bitmap bits.
enum Permission : std::uint32_t {
    kPermissionRead = 1u << 0,
    kPermissionWrite = 1u << 1,
    kPermissionAdmin = 1u << 2,
    kPermissionTransfer = 1u << 3
};

struct ValidationSummary {
    double score{0.0};
    int checks_passed{0}; // -1 marks an emergency override
    double fraud_score{0.0};
};

// Audit context embedded in emergency tokens.
struct EmergencyClaims {
    std::string practitioner;
    std::string reason;
    std::int64_t issued_at{0};
};

struct TokenPayload {
    std::string jti;
    std::string iss;
    std::vector<std::string> aud;
    std::int64_t iat{0};
    std::int64_t exp{0};
    ValidationSummary validation_results;
    std::uint32_t permissions{0};
    bool quantum_ready{true};
    std::optional<std::string> department;
    std::optional<EmergencyClaims> emergency;
};

struct TokenHeader {
    std::string alg{"EdDSA"};
    std::string typ{"JWT"};
    std::string kid;
};

void to_json(nlohmann::json &j, const ValidationSummary &v);
void from_json(const nlohmann::json &j, ValidationSummary &v);
void to_json(nlohmann::json &j, const EmergencyClaims &e);
void from_json(const nlohmann::json &j, EmergencyClaims &e);
void to_json(nlohmann::json &j, const TokenPayload &p);
void from_json(const nlohmann::json &j, TokenPayload &p);
void to_json(nlohmann::json &j, const TokenHeader &h);
void from_json(const nlohmann::json &j, TokenHeader &h);

} // namespace pqgate
