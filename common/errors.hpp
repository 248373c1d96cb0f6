#pragma once

#include <stdexcept>
#include <string>

namespace pqgate {

// Base for errors that cross the gateway boundary. status mirrors the HTTP
// class of the failure so outer layers can map it directly.
class GateError : public std::runtime_error {
public:
    GateError(std::string code, const std::string &message, int status)
        : std::runtime_error(message), code_(std::move(code)), status_(status) {}

    const std::string &code() const { return code_; }
    int status() const { return status_; }

private:
    std::string code_;
    int status_;
};

// Malformed input, rejected before any work is done.
class ValidationError : public GateError {
public:
    explicit ValidationError(const std::string &message)
        : GateError("VALIDATION_ERROR", message, 400) {}
};

enum class TokenErrorKind {
    ValidationFailed,
    InvalidFormat,
    InvalidSignature,
    Expired,
    NotInitialized
};

class TokenError : public GateError {
public:
    TokenError(TokenErrorKind kind, const std::string &message)
        : GateError("TOKEN_ERROR", message, 401), kind_(kind) {}

    TokenErrorKind kind() const { return kind_; }

private:
    TokenErrorKind kind_;
};

class AccessDeniedError : public GateError {
public:
    explicit AccessDeniedError(const std::string &message)
        : GateError("EMERGENCY_ACCESS_DENIED", message, 403) {}
};

// Unexpected internal fault or fatal misconfiguration.
class ProcessingError : public GateError {
public:
    explicit ProcessingError(const std::string &message)
        : GateError("PROCESSING_ERROR", message, 500) {}
};

} // namespace pqgate
