#include "request.hpp"

#include "../common/errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace pqgate {

namespace {

std::string optional_string(const nlohmann::json &obj, const char *key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw ValidationError(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

AuthenticationRequest parse_auth_request(const nlohmann::json &j) {
    if (!j.is_object()) {
        throw ValidationError("authentication request must be a JSON object");
    }

    AuthenticationRequest req;
    req.id = optional_string(j, "id");

    auto ts = j.find("timestamp");
    if (ts != j.end() && !ts->is_null()) {
        if (!ts->is_number()) {
            throw ValidationError("field 'timestamp' must be a number");
        }
        if (ts->is_number_float()) {
            const double ms = ts->get<double>();
            if (!std::isfinite(ms) || ms < 0.0 || ms >= 9.2e18) {
                throw ValidationError("field 'timestamp' is out of range");
            }
            req.timestamp = static_cast<std::int64_t>(ms);
        } else if (ts->is_number_unsigned()) {
            const auto ms = ts->get<std::uint64_t>();
            if (ms > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw ValidationError("field 'timestamp' is out of range");
            }
            req.timestamp = static_cast<std::int64_t>(ms);
        } else {
            req.timestamp = ts->get<std::int64_t>();
        }
    }

    auto data = j.find("data");
    req.data = data != j.end() ? *data : nlohmann::json();

    auto sigs = j.find("signatures");
    if (sigs != j.end() && !sigs->is_null()) {
        if (!sigs->is_array()) {
            throw ValidationError("field 'signatures' must be an array");
        }
        for (const auto &s : *sigs) {
            if (!s.is_string()) {
                throw ValidationError("signatures must be strings");
            }
            req.signatures.push_back(s.get<std::string>());
        }
    }

    auto meta = j.find("metadata");
    if (meta != j.end() && !meta->is_null()) {
        if (!meta->is_object()) {
            throw ValidationError("field 'metadata' must be an object");
        }
        RequestMetadata m;
        m.origin = optional_string(*meta, "origin");
        m.user_agent = optional_string(*meta, "userAgent");
        m.ip_address = optional_string(*meta, "ipAddress");
        m.department = optional_string(*meta, "department");
        m.purpose = optional_string(*meta, "purpose");
        req.metadata = m;
    }

    return req;
}

AuthenticationRequest parse_auth_request_json(const std::string &json) {
    nlohmann::json j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded()) {
        throw ValidationError("authentication request is not valid JSON");
    }
    return parse_auth_request(j);
}

nlohmann::json auth_request_to_json(const AuthenticationRequest &req) {
    nlohmann::json j;
    j["id"] = req.id;
    j["timestamp"] = req.timestamp;
    j["data"] = req.data;
    if (!req.signatures.empty()) {
        j["signatures"] = req.signatures;
    }
    if (req.metadata) {
        nlohmann::json m;
        m["origin"] = req.metadata->origin;
        if (!req.metadata->user_agent.empty()) m["userAgent"] = req.metadata->user_agent;
        if (!req.metadata->ip_address.empty()) m["ipAddress"] = req.metadata->ip_address;
        if (!req.metadata->department.empty()) m["department"] = req.metadata->department;
        if (!req.metadata->purpose.empty()) m["purpose"] = req.metadata->purpose;
        j["metadata"] = m;
    }
    return j;
}

std::string signing_message(const AuthenticationRequest &req) {
    std::string out = "{\"id\":";
    out += nlohmann::json(req.id).dump();
    out += ",\"timestamp\":";
    out += std::to_string(req.timestamp);
    out += ",\"data\":";
    out += req.data.dump();
    out += "}";
    return out;
}

std::string origin_key(const AuthenticationRequest &req) {
    if (req.metadata && !req.metadata->origin.empty()) {
        return req.metadata->origin;
    }
    return "global";
}

} // namespace pqgate
