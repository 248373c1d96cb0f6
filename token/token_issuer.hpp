#pragma once

#include "token_payload.hpp"

#include "../crypto/algorithms.hpp"
#include "../crypto/key_material.hpp"
#include "../validation/validation_result.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pqgate {

struct IssuerOptions {
    std::string issuer{"pq-gate"};
    std::vector<std::string> audience{"pq-gate-consensus"};
    int token_validity_seconds{300};
    SigningMode mode{SigningMode::Hybrid};
};

// Result codes for token verification.
enum class TokenVerificationCode {
    Ok,
    InvalidFormat,
    InvalidSignature,
    Expired,
    UnknownKey
};

struct TokenVerificationResult {
    bool valid{false};
    TokenVerificationCode code{TokenVerificationCode::InvalidFormat};
    TokenHeader header;   // filled once the header decodes
    TokenPayload payload; // filled when valid == true
};

struct IssuerPublicKeys {
    std::string kid;
    SigningMode mode{SigningMode::Hybrid};
    std::string classical; // Ed25519, hex
    std::string quantum;   // ML-DSA-44, hex; empty in classical mode
};

const char *token_verification_code_name(TokenVerificationCode code);

// Issues and verifies compact three-segment tokens:
//   base64url(header) "." base64url(payload) "." base64url(signature)
// In hybrid mode the signature segment carries "<ed25519>.<ml-dsa-44>" (hex),
// in classical mode the Ed25519 hex alone.
class TokenIssuer {
public:
    static constexpr int kMaxValiditySeconds = 300;
    static constexpr int kEmergencyValiditySeconds = 60;

    // Generates initial key material for options.mode.
    explicit TokenIssuer(IssuerOptions options);

    // Throws TokenError(NotInitialized) when key material is null.
    TokenIssuer(IssuerOptions options, std::shared_ptr<KeyMaterial> initial);

    // Throws TokenError(ValidationFailed) unless result.success.
    std::string generate_token(const ValidationResult &result,
                               const std::optional<std::string> &department = std::nullopt);
    std::string generate_token(const ValidationResult &result,
                               const std::optional<std::string> &department,
                               std::int64_t now_unix);

    // Short-lived read-only token for emergency access. Throws
    // AccessDeniedError on an empty department or practitioner.
    std::string generate_emergency_token(const std::string &department,
                                         const std::string &practitioner,
                                         const std::string &reason);
    std::string generate_emergency_token(const std::string &department,
                                         const std::string &practitioner,
                                         const std::string &reason,
                                         std::int64_t now_unix);

    // Tokens in input order. Throws on the first unsuccessful result.
    std::vector<std::string> generate_batch(const std::vector<ValidationResult> &results,
                                            const std::optional<std::string> &department = std::nullopt);

    // Never throws on untrusted input.
    TokenVerificationResult verify_token(const std::string &token) const;
    TokenVerificationResult verify_token(const std::string &token, std::int64_t now_unix) const;

    // Activates fresh key material. Tokens signed by the outgoing key keep
    // verifying until rotation time plus the maximum token lifetime.
    // Returns the new kid.
    std::string rotate_keys();
    std::string rotate_keys(std::int64_t now_unix);

    IssuerPublicKeys public_keys() const;

    int token_validity_seconds() const { return validity_seconds_; }
    const IssuerOptions &options() const { return options_; }

    static std::uint32_t calculate_permissions(const ValidationResult &result);

private:
    struct KeyRing {
        std::shared_ptr<KeyMaterial> active;
        std::shared_ptr<KeyMaterial> previous;
        std::int64_t previous_valid_until{0};
    };

    std::string sign_payload(const TokenPayload &payload);
    std::shared_ptr<const KeyRing> ring() const;

    IssuerOptions options_;
    int validity_seconds_;

    std::shared_ptr<const KeyRing> ring_; // accessed with std::atomic_load/store
    std::mutex rotation_mutex_;
};

} // namespace pqgate
