#include "command_dispatch.hpp"

#include "../common/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

namespace pqgate {

namespace {

using nlohmann::json;

json error_response(const std::string &kind, const std::string &status,
                    const std::string &code, const std::string &message, int http_status) {
    return json{{"kind", kind},
                {"status", status},
                {"error", {{"code", code}, {"message", message}, {"status", http_status}}}};
}

std::optional<std::string> optional_string(const json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ValidationError(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::string required_string(const json &j, const char *key) {
    auto value = optional_string(j, key);
    return value ? *value : std::string();
}

json handle_validate(GatewayService &gateway, const json &cmd) {
    const auto department = optional_string(cmd, "department");

    auto batch = cmd.find("requests");
    if (batch != cmd.end()) {
        if (!batch->is_array()) {
            throw ValidationError("'requests' must be an array");
        }
        std::vector<AuthenticationRequest> requests;
        requests.reserve(batch->size());
        for (const auto &r : *batch) {
            requests.push_back(parse_auth_request(r));
        }
        json results = json::array();
        for (const auto &resp : gateway.process_batch(requests, department)) {
            results.push_back(gateway_response_to_json(resp));
        }
        return json{{"kind", "VALIDATE"}, {"status", "OK"}, {"results", results}};
    }

    auto request = cmd.find("request");
    if (request == cmd.end()) {
        throw ValidationError("missing 'request'");
    }
    GatewayResponse resp = gateway.process_request(parse_auth_request(*request), department);
    json out = gateway_response_to_json(resp);
    out["kind"] = "VALIDATE";
    out["status"] = resp.token ? "OK" : "DENIED";
    return out;
}

json handle_verify(GatewayService &gateway, const json &cmd) {
    const std::string token = required_string(cmd, "token");
    if (token.empty()) {
        return error_response("VERIFY", "DENIED", "TOKEN_ERROR", "missing_token", 401);
    }
    TokenVerificationResult v = gateway.verify_token(token);
    json out{{"kind", "VERIFY"},
             {"status", v.valid ? "OK" : "DENIED"},
             {"valid", v.valid},
             {"code", token_verification_code_name(v.code)}};
    if (v.valid) {
        out["payload"] = v.payload;
    }
    return out;
}

json handle_emergency(GatewayService &gateway, const json &cmd) {
    const std::string token = gateway.process_emergency_request(
        required_string(cmd, "department"),
        required_string(cmd, "practitioner"),
        required_string(cmd, "patient"),
        required_string(cmd, "reason"));
    return json{{"kind", "EMERGENCY"}, {"status", "OK"}, {"token", token}};
}

json handle_merkle_proof(GatewayService &gateway, const json &cmd) {
    auto index = cmd.find("index");
    if (index == cmd.end() || !index->is_number_unsigned()) {
        throw ValidationError("'index' must be a non-negative integer");
    }
    const auto i = index->get<std::size_t>();
    try {
        MerkleProof proof = gateway.anchor_proof(i);
        return json{{"kind", "MERKLE_PROOF"},
                    {"status", "OK"},
                    {"leaf", gateway.anchor_leaf(i)},
                    {"proof", proof}};
    } catch (const std::out_of_range &ex) {
        return error_response("MERKLE_PROOF", "DENIED", "NOT_FOUND", ex.what(), 404);
    }
}

json handle_public_keys(GatewayService &gateway) {
    const IssuerPublicKeys keys = gateway.issuer().public_keys();
    return json{{"kind", "PUBLIC_KEYS"},
                {"status", "OK"},
                {"kid", keys.kid},
                {"mode", signing_mode_to_string(keys.mode)},
                {"classical", keys.classical},
                {"quantum", keys.quantum}};
}

} // namespace

bool CommandLineBuffer::next_line(std::string &line) {
    if (overflowed_) {
        return false;
    }
    const std::size_t pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        if (buffer_.size() > max_line_bytes_) {
            overflowed_ = true;
            buffer_.clear();
        }
        return false;
    }
    if (pos > max_line_bytes_) {
        overflowed_ = true;
        buffer_.clear();
        return false;
    }
    line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    return true;
}

std::string line_too_long_response() {
    return error_response("", "DENIED", "VALIDATION_ERROR", "line_too_long", 400).dump();
}

std::string handle_command_line(GatewayService &gateway, const std::string &line) {
    json cmd;
    try {
        cmd = json::parse(line);
    } catch (const json::parse_error &) {
        return error_response("", "DENIED", "VALIDATION_ERROR", "malformed_json", 400).dump();
    }
    if (!cmd.is_object() || !cmd.contains("kind") || !cmd["kind"].is_string()) {
        return error_response("", "DENIED", "VALIDATION_ERROR", "missing_kind", 400).dump();
    }
    const std::string kind = cmd["kind"].get<std::string>();

    json out;
    try {
        if (kind == "VALIDATE") {
            out = handle_validate(gateway, cmd);
        } else if (kind == "VERIFY") {
            out = handle_verify(gateway, cmd);
        } else if (kind == "EMERGENCY") {
            out = handle_emergency(gateway, cmd);
        } else if (kind == "ROTATE") {
            out = json{{"kind", "ROTATE"}, {"status", "OK"}, {"kid", gateway.rotate_keys()}};
        } else if (kind == "MERKLE_PROOF") {
            out = handle_merkle_proof(gateway, cmd);
        } else if (kind == "PUBLIC_KEYS") {
            out = handle_public_keys(gateway);
        } else if (kind == "HEALTH") {
            out = gateway.health();
            out["kind"] = "HEALTH";
        } else {
            out = error_response(kind, "DENIED", "VALIDATION_ERROR", "unknown_kind", 400);
        }
    } catch (const GateError &ex) {
        out = error_response(kind, "DENIED", ex.code(), ex.what(), ex.status());
    } catch (const std::exception &ex) {
        std::cerr << "pq-gated: " << kind << " failed: " << ex.what() << std::endl;
        out = error_response(kind, "ERROR", "PROCESSING_ERROR", "internal_error", 500);
    }
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace pqgate
