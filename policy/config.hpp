#pragma once

#include "../crypto/algorithms.hpp"

#include <string>
#include <vector>

namespace pqgate {

struct Config {
    std::string socket_path{"/run/pq-gated.sock"};
    std::string log_path{"/var/log/pq-gate/audit.log"};

    // Validator pool sizing. Carried for the deployment layer; the gateway
    // itself runs a single in-process engine.
    int min_validators{3};
    int max_validators{1000};
    double scale_threshold_cpu{0.7};
    std::vector<std::string> regions{"uk-south", "uk-west"};

    int timeout_ms{100};
    bool parallel_checks{true};
    double fraud_threshold{0.8};
    int minimum_quorum{3};
    int token_validity_seconds{300}; // clamped to [1, 300]

    std::string issuer{"pq-gate"};
    std::vector<std::string> audience{"pq-gate-consensus"};
    SigningMode signing_mode{SigningMode::Hybrid};

    double record_success_rate{0.99};
    std::vector<std::string> compliance_departments;
    std::vector<std::string> emergency_departments{"NHS", "NHS_EMERGENCY", "AMBULANCE"};
    std::vector<std::string> trusted_client_keys;
};

inline const char *kDefaultConfigPath = "/etc/pq-gate/pq-gated.json";

// Defaults overridden by the JSON file at path when it exists. Throws
// ValidationError when the file exists but is malformed.
Config load_config_or_default(const std::string &path = kDefaultConfigPath);

// Unknown keys are ignored; a key of the wrong type raises ValidationError.
Config parse_config_json(const std::string &text);

// Applies the documented bounds in place.
void clamp_config(Config &cfg);

} // namespace pqgate
