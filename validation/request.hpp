#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pqgate {

struct RequestMetadata {
    std::string origin;
    std::string user_agent;
    std::string ip_address;
    std::string department;
    std::string purpose;
};

// Incoming authentication request. Treated as immutable once parsed.
struct AuthenticationRequest {
    std::string id;
    std::int64_t timestamp{0}; // ms since epoch
    nlohmann::json data = nlohmann::json::object();
    std::vector<std::string> signatures; // hex Ed25519 signatures
    std::optional<RequestMetadata> metadata;
};

// Throws ValidationError when the JSON is not an object or a field has the
// wrong type. Missing fields are left empty for the validation pre-check.
AuthenticationRequest parse_auth_request(const nlohmann::json &j);
AuthenticationRequest parse_auth_request_json(const std::string &json);

nlohmann::json auth_request_to_json(const AuthenticationRequest &req);

// The message request signatures are made over:
//   {"id":<id>,"timestamp":<ms>,"data":<data>}
// in that key order, compact, with data keys sorted.
std::string signing_message(const AuthenticationRequest &req);

// Origin used for velocity tracking; "global" when none was supplied.
std::string origin_key(const AuthenticationRequest &req);

} // namespace pqgate
