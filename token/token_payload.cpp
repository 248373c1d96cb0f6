#include "token_payload.hpp"

namespace pqgate {

void to_json(nlohmann::json &j, const ValidationSummary &v) {
    j = nlohmann::json{{"score", v.score},
                       {"checks_passed", v.checks_passed},
                       {"fraud_score", v.fraud_score}};
}

void from_json(const nlohmann::json &j, ValidationSummary &v) {
    j.at("score").get_to(v.score);
    j.at("checks_passed").get_to(v.checks_passed);
    j.at("fraud_score").get_to(v.fraud_score);
}

void to_json(nlohmann::json &j, const EmergencyClaims &e) {
    j = nlohmann::json{{"practitioner", e.practitioner},
                       {"reason", e.reason},
                       {"issuedAt", e.issued_at}};
}

void from_json(const nlohmann::json &j, EmergencyClaims &e) {
    j.at("practitioner").get_to(e.practitioner);
    j.at("reason").get_to(e.reason);
    j.at("issuedAt").get_to(e.issued_at);
}

void to_json(nlohmann::json &j, const TokenPayload &p) {
    j = nlohmann::json{{"jti", p.jti},
                       {"iss", p.iss},
                       {"aud", p.aud},
                       {"iat", p.iat},
                       {"exp", p.exp},
                       {"validation_results", p.validation_results},
                       {"permissions", p.permissions},
                       {"quantum_ready", p.quantum_ready}};
    if (p.department) {
        j["department"] = *p.department;
    }
    if (p.emergency) {
        j["emergency"] = *p.emergency;
    }
}

void from_json(const nlohmann::json &j, TokenPayload &p) {
    j.at("jti").get_to(p.jti);
    j.at("iss").get_to(p.iss);
    j.at("aud").get_to(p.aud);
    j.at("iat").get_to(p.iat);
    j.at("exp").get_to(p.exp);
    j.at("validation_results").get_to(p.validation_results);
    j.at("permissions").get_to(p.permissions);
    p.quantum_ready = j.value("quantum_ready", false);

    auto dept = j.find("department");
    if (dept != j.end() && dept->is_string()) {
        p.department = dept->get<std::string>();
    } else {
        p.department.reset();
    }
    auto emergency = j.find("emergency");
    if (emergency != j.end() && emergency->is_object()) {
        p.emergency = emergency->get<EmergencyClaims>();
    } else {
        p.emergency.reset();
    }
}

void to_json(nlohmann::json &j, const TokenHeader &h) {
    j = nlohmann::json{{"alg", h.alg}, {"typ", h.typ}, {"kid", h.kid}};
}

void from_json(const nlohmann::json &j, TokenHeader &h) {
    j.at("alg").get_to(h.alg);
    j.at("typ").get_to(h.typ);
    h.kid = j.value("kid", std::string());
}

} // namespace pqgate
