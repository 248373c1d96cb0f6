#include "token_issuer.hpp"

#include "../common/clock.hpp"
#include "../common/errors.hpp"
#include "../crypto/primitives.hpp"
#include "../validation/default_checks.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace pqgate {

namespace {

int clamp_validity(int seconds) {
    return std::min(std::max(seconds, 1), TokenIssuer::kMaxValiditySeconds);
}

TokenVerificationResult failed(TokenVerificationCode code) {
    TokenVerificationResult res;
    res.valid = false;
    res.code = code;
    return res;
}

} // namespace

const char *token_verification_code_name(TokenVerificationCode code) {
    switch (code) {
    case TokenVerificationCode::Ok: return "OK";
    case TokenVerificationCode::InvalidFormat: return "INVALID_FORMAT";
    case TokenVerificationCode::InvalidSignature: return "INVALID_SIGNATURE";
    case TokenVerificationCode::Expired: return "EXPIRED";
    case TokenVerificationCode::UnknownKey: return "UNKNOWN_KEY";
    }
    return "INVALID_FORMAT";
}

TokenIssuer::TokenIssuer(IssuerOptions options)
    : TokenIssuer(options, make_key_material(options.mode, now_unix())) {}

TokenIssuer::TokenIssuer(IssuerOptions options, std::shared_ptr<KeyMaterial> initial)
    : options_(std::move(options)),
      validity_seconds_(clamp_validity(options_.token_validity_seconds)) {
    if (!initial || !initial->classical) {
        throw TokenError(TokenErrorKind::NotInitialized, "token signer not initialized");
    }
    if (initial->mode == SigningMode::Hybrid && !initial->hybrid) {
        throw TokenError(TokenErrorKind::NotInitialized,
                         "hybrid key material is missing its quantum signer");
    }
    options_.token_validity_seconds = validity_seconds_;
    options_.mode = initial->mode;

    auto r = std::make_shared<KeyRing>();
    r->active = std::move(initial);
    ring_ = std::move(r);
}

std::shared_ptr<const TokenIssuer::KeyRing> TokenIssuer::ring() const {
    return std::atomic_load(&ring_);
}

std::uint32_t TokenIssuer::calculate_permissions(const ValidationResult &result) {
    std::uint32_t permissions = 0;
    if (result.success) {
        permissions |= kPermissionRead;
    }
    if (result.score >= 0.9) {
        permissions |= kPermissionWrite;
    }
    if (result.score >= 0.95 && result.fraud_score < 0.05) {
        permissions |= kPermissionAdmin;
    }
    if (result.check_passed(kSignatureCheck) && result.check_passed(kComplianceCheck)) {
        permissions |= kPermissionTransfer;
    }
    return permissions;
}

std::string TokenIssuer::generate_token(const ValidationResult &result,
                                        const std::optional<std::string> &department) {
    return generate_token(result, department, now_unix());
}

std::string TokenIssuer::generate_token(const ValidationResult &result,
                                        const std::optional<std::string> &department,
                                        std::int64_t now) {
    if (!result.success) {
        throw TokenError(TokenErrorKind::ValidationFailed,
                         "Cannot generate token for failed validation");
    }

    TokenPayload payload;
    payload.jti = ClassicalSigner::generate_id();
    payload.iss = options_.issuer;
    payload.aud = options_.audience;
    payload.iat = now;
    payload.exp = now + validity_seconds_;
    payload.validation_results.score = result.score;
    payload.validation_results.checks_passed = result.checks_passed;
    payload.validation_results.fraud_score = result.fraud_score;
    payload.permissions = calculate_permissions(result);
    payload.quantum_ready = true;
    payload.department = department;

    return sign_payload(payload);
}

std::string TokenIssuer::generate_emergency_token(const std::string &department,
                                                  const std::string &practitioner,
                                                  const std::string &reason) {
    return generate_emergency_token(department, practitioner, reason, now_unix());
}

std::string TokenIssuer::generate_emergency_token(const std::string &department,
                                                  const std::string &practitioner,
                                                  const std::string &reason,
                                                  std::int64_t now) {
    if (department.empty() || practitioner.empty()) {
        throw AccessDeniedError("Emergency access requires department and practitioner");
    }

    TokenPayload payload;
    payload.jti = ClassicalSigner::generate_id();
    payload.iss = options_.issuer;
    payload.aud = options_.audience;
    payload.iat = now;
    payload.exp = now + kEmergencyValiditySeconds;
    payload.validation_results.score = 1.0;
    payload.validation_results.checks_passed = -1;
    payload.validation_results.fraud_score = 0.0;
    payload.permissions = kPermissionRead;
    payload.quantum_ready = true;
    payload.department = department;
    payload.emergency = EmergencyClaims{practitioner, reason, now};

    return sign_payload(payload);
}

std::vector<std::string> TokenIssuer::generate_batch(
    const std::vector<ValidationResult> &results,
    const std::optional<std::string> &department) {
    std::vector<std::string> tokens;
    tokens.reserve(results.size());
    const std::int64_t now = now_unix();
    for (const auto &result : results) {
        tokens.push_back(generate_token(result, department, now));
    }
    return tokens;
}

std::string TokenIssuer::sign_payload(const TokenPayload &payload) {
    const auto started = std::chrono::steady_clock::now();
    auto keys = ring();
    const auto &km = keys->active;

    TokenHeader header;
    header.kid = km->kid;

    const std::string header_b64 = base64url_encode(nlohmann::json(header).dump());
    const std::string payload_b64 = base64url_encode(nlohmann::json(payload).dump());
    const std::string message = header_b64 + "." + payload_b64;

    std::string signature;
    if (km->mode == SigningMode::Hybrid) {
        signature = km->hybrid->hybrid_sign(message).hybrid;
    } else {
        signature = km->classical->sign(message);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (elapsed > 20) {
        std::cerr << "pq-gate: token signing took " << elapsed << "ms (target: <20ms)"
                  << std::endl;
    }

    return message + "." + base64url_encode(signature);
}

TokenVerificationResult TokenIssuer::verify_token(const std::string &token) const {
    return verify_token(token, now_unix());
}

TokenVerificationResult TokenIssuer::verify_token(const std::string &token,
                                                  std::int64_t now) const {
    const auto parts = split(token, '.');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        return failed(TokenVerificationCode::InvalidFormat);
    }

    TokenHeader header;
    std::string signature;
    try {
        header = nlohmann::json::parse(base64url_decode(parts[0])).get<TokenHeader>();
        signature = base64url_decode(parts[2]);
    } catch (const nlohmann::json::exception &) {
        return failed(TokenVerificationCode::InvalidFormat);
    } catch (const std::invalid_argument &) {
        return failed(TokenVerificationCode::InvalidFormat);
    }

    auto keys = ring();
    std::shared_ptr<KeyMaterial> km;
    if (keys->active->kid == header.kid) {
        km = keys->active;
    } else if (keys->previous && keys->previous->kid == header.kid &&
               now <= keys->previous_valid_until) {
        km = keys->previous;
    }
    if (!km) {
        TokenVerificationResult res = failed(TokenVerificationCode::UnknownKey);
        res.header = header;
        return res;
    }

    const std::string message = parts[0] + "." + parts[1];
    const bool signature_ok = km->mode == SigningMode::Hybrid
        ? km->hybrid->hybrid_verify(message, signature)
        : km->classical->verify(message, signature);
    if (!signature_ok) {
        TokenVerificationResult res = failed(TokenVerificationCode::InvalidSignature);
        res.header = header;
        return res;
    }

    TokenPayload payload;
    try {
        payload = nlohmann::json::parse(base64url_decode(parts[1])).get<TokenPayload>();
    } catch (const nlohmann::json::exception &) {
        return failed(TokenVerificationCode::InvalidFormat);
    } catch (const std::invalid_argument &) {
        return failed(TokenVerificationCode::InvalidFormat);
    }

    TokenVerificationResult res;
    res.header = header;
    if (now > payload.exp) {
        res.valid = false;
        res.code = TokenVerificationCode::Expired;
        return res;
    }
    res.valid = true;
    res.code = TokenVerificationCode::Ok;
    res.payload = std::move(payload);
    return res;
}

std::string TokenIssuer::rotate_keys() {
    return rotate_keys(now_unix());
}

std::string TokenIssuer::rotate_keys(std::int64_t now) {
    // Keygen happens outside the lock; only the swap is serialized.
    auto fresh = make_key_material(options_.mode, now);

    std::lock_guard<std::mutex> lock(rotation_mutex_);
    auto current = ring();
    auto next = std::make_shared<KeyRing>();
    next->active = std::move(fresh);
    next->previous = current->active;
    next->previous_valid_until = now + kMaxValiditySeconds;
    std::atomic_store(&ring_, std::shared_ptr<const KeyRing>(std::move(next)));

    auto installed = ring();
    std::cout << "pq-gate: rotated signing key " << installed->previous->kid
              << " -> " << installed->active->kid << std::endl;
    return installed->active->kid;
}

IssuerPublicKeys TokenIssuer::public_keys() const {
    auto keys = ring();
    IssuerPublicKeys out;
    out.kid = keys->active->kid;
    out.mode = keys->active->mode;
    out.classical = keys->active->classical->public_key_hex();
    if (keys->active->quantum) {
        out.quantum = keys->active->quantum->public_key_hex();
    }
    return out;
}

} // namespace pqgate
