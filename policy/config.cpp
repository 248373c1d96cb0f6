#include "config.hpp"

#include "../common/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pqgate {

namespace {

template <typename T>
void read_key(const nlohmann::json &j, const char *key, T &out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        it->get_to(out);
    } catch (const nlohmann::json::type_error &) {
        throw ValidationError(std::string("config: wrong type for '") + key + "'");
    }
}

} // namespace

void clamp_config(Config &cfg) {
    cfg.token_validity_seconds = std::min(std::max(cfg.token_validity_seconds, 1), 300);
    cfg.fraud_threshold = std::min(std::max(cfg.fraud_threshold, 0.0), 1.0);
    cfg.timeout_ms = std::max(cfg.timeout_ms, 1);
    cfg.minimum_quorum = std::max(cfg.minimum_quorum, 0);
    cfg.record_success_rate = std::min(std::max(cfg.record_success_rate, 0.0), 1.0);
    cfg.min_validators = std::max(cfg.min_validators, 1);
    cfg.max_validators = std::max(cfg.max_validators, cfg.min_validators);
}

Config parse_config_json(const std::string &text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &ex) {
        throw ValidationError(std::string("config: ") + ex.what());
    }
    if (!j.is_object()) {
        throw ValidationError("config: top level must be an object");
    }

    Config cfg;
    read_key(j, "socket_path", cfg.socket_path);
    read_key(j, "log_path", cfg.log_path);
    read_key(j, "min_validators", cfg.min_validators);
    read_key(j, "max_validators", cfg.max_validators);
    read_key(j, "scale_threshold_cpu", cfg.scale_threshold_cpu);
    read_key(j, "regions", cfg.regions);
    read_key(j, "timeout_ms", cfg.timeout_ms);
    read_key(j, "parallel_checks", cfg.parallel_checks);
    read_key(j, "fraud_threshold", cfg.fraud_threshold);
    read_key(j, "minimum_quorum", cfg.minimum_quorum);
    read_key(j, "token_validity_seconds", cfg.token_validity_seconds);
    read_key(j, "issuer", cfg.issuer);
    read_key(j, "audience", cfg.audience);
    read_key(j, "record_success_rate", cfg.record_success_rate);
    read_key(j, "compliance_departments", cfg.compliance_departments);
    read_key(j, "emergency_departments", cfg.emergency_departments);
    read_key(j, "trusted_client_keys", cfg.trusted_client_keys);

    // camelCase spellings used by the deployment manifests.
    read_key(j, "minValidators", cfg.min_validators);
    read_key(j, "maxValidators", cfg.max_validators);
    read_key(j, "scaleThresholdCpu", cfg.scale_threshold_cpu);
    read_key(j, "timeoutMs", cfg.timeout_ms);
    read_key(j, "parallelChecks", cfg.parallel_checks);
    read_key(j, "fraudThreshold", cfg.fraud_threshold);
    read_key(j, "tokenValiditySeconds", cfg.token_validity_seconds);

    std::string mode;
    read_key(j, "signing_mode", mode);
    if (!mode.empty()) {
        try {
            cfg.signing_mode = signing_mode_from_string(mode);
        } catch (const std::invalid_argument &ex) {
            throw ValidationError(std::string("config: ") + ex.what());
        }
    }

    clamp_config(cfg);
    return cfg;
}

Config load_config_or_default(const std::string &path) {
    std::filesystem::path conf_path{path};
    std::error_code ec;
    if (!std::filesystem::exists(conf_path, ec)) {
        Config cfg;
        clamp_config(cfg);
        return cfg;
    }

    std::ifstream in(conf_path);
    if (!in.is_open()) {
        throw ValidationError("config: cannot open " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_config_json(buf.str());
}

} // namespace pqgate
