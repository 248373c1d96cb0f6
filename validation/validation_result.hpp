#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace pqgate {

// Outcome of a single check within one validate() call.
struct CheckOutcome {
    bool completed{false}; // false on timeout or exception
    bool passed{false};    // completed && score >= 0.5
    double score{0.0};
    std::string error;     // set when !completed
};

struct ValidationResult {
    bool success{false};
    double score{0.0};
    int checks_passed{0};
    int total_checks{0};
    double fraud_score{0.0};
    std::map<std::string, CheckOutcome> details;
    std::int64_t duration_ms{0};

    // True when the named check completed and passed.
    bool check_passed(const std::string &name) const;
};

nlohmann::json validation_result_to_json(const ValidationResult &result);

} // namespace pqgate
