#include "validation_result.hpp"

namespace pqgate {

bool ValidationResult::check_passed(const std::string &name) const {
    auto it = details.find(name);
    return it != details.end() && it->second.completed && it->second.passed;
}

nlohmann::json validation_result_to_json(const ValidationResult &result) {
    nlohmann::json details = nlohmann::json::object();
    for (const auto &entry : result.details) {
        nlohmann::json d;
        d["completed"] = entry.second.completed;
        d["passed"] = entry.second.passed;
        d["score"] = entry.second.score;
        if (!entry.second.error.empty()) {
            d["error"] = entry.second.error;
        }
        details[entry.first] = d;
    }

    nlohmann::json j;
    j["success"] = result.success;
    j["score"] = result.score;
    j["checksPassed"] = result.checks_passed;
    j["totalChecks"] = result.total_checks;
    j["fraudScore"] = result.fraud_score;
    j["details"] = details;
    j["duration"] = result.duration_ms;
    return j;
}

} // namespace pqgate
