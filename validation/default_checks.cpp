#include "default_checks.hpp"

#include "../common/clock.hpp"
#include "../common/errors.hpp"

#include <algorithm>
#include <cstdlib>

namespace pqgate {

PlaceholderRecordStore::PlaceholderRecordStore(double success_rate)
    : success_rate_(success_rate), rng_(std::random_device{}()) {}

bool PlaceholderRecordStore::lookup(const AuthenticationRequest &) {
    if (success_rate_ >= 1.0) {
        return true;
    }
    if (success_rate_ <= 0.0) {
        return false;
    }
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return dist(rng_) < success_rate_;
}

SignatureCheck::SignatureCheck(std::shared_ptr<const ClassicalSigner> verifier,
                               std::vector<std::string> trusted_public_keys,
                               double weight)
    : verifier_(std::move(verifier)),
      trusted_keys_(std::move(trusted_public_keys)),
      weight_(weight) {
    if (!verifier_) {
        throw ProcessingError("signature check requires a classical verifier");
    }
}

double SignatureCheck::execute(const AuthenticationRequest &request) {
    if (request.signatures.empty()) {
        return 0.0;
    }
    const std::string message = signing_message(request);
    for (const auto &sig : request.signatures) {
        if (trusted_keys_.empty()) {
            if (verifier_->verify(message, sig)) {
                return 1.0;
            }
            continue;
        }
        for (const auto &key : trusted_keys_) {
            if (verifier_->verify(message, sig, key)) {
                return 1.0;
            }
        }
    }
    return 0.0;
}

RecordLookupCheck::RecordLookupCheck(std::shared_ptr<RecordStore> store, double weight)
    : store_(std::move(store)), weight_(weight) {
    if (!store_) {
        throw ProcessingError("record lookup check requires a record store");
    }
}

double RecordLookupCheck::execute(const AuthenticationRequest &request) {
    return store_->lookup(request) ? 1.0 : 0.0;
}

FraudModelCheck::FraudModelCheck(std::shared_ptr<FraudScorer> scorer, double weight)
    : scorer_(std::move(scorer)), weight_(weight) {
    if (!scorer_) {
        throw ProcessingError("fraud model check requires a scorer");
    }
}

double FraudModelCheck::execute(const AuthenticationRequest &request) {
    return 1.0 - scorer_->analyze(request);
}

PatternCheck::PatternCheck(std::shared_ptr<FrequencyGuard> guard, double weight)
    : guard_(std::move(guard)), weight_(weight) {
    if (!guard_) {
        guard_ = std::make_shared<AllowAllFrequencyGuard>();
    }
}

double PatternCheck::execute(const AuthenticationRequest &request) {
    return evaluate(request, now_ms());
}

double PatternCheck::evaluate(const AuthenticationRequest &request, std::int64_t now) {
    const bool fresh = std::llabs(now - request.timestamp) < 60000;
    const bool frequency_ok = guard_->allow(request);
    const bool integrity_ok = request.data.is_object() &&
                              request.data.contains("type") &&
                              request.data.contains("source");

    int passed = 0;
    if (fresh) ++passed;
    if (frequency_ok) ++passed;
    if (integrity_ok) ++passed;
    return static_cast<double>(passed) / 3.0;
}

ComplianceCheck::ComplianceCheck(std::vector<std::string> departments, double weight)
    : departments_(std::move(departments)), weight_(weight) {}

double ComplianceCheck::execute(const AuthenticationRequest &request) {
    if (!request.metadata || request.metadata->purpose.empty()) {
        return 0.0;
    }
    const auto &dept = request.metadata->department;
    return std::find(departments_.begin(), departments_.end(), dept) != departments_.end()
        ? 1.0
        : 0.0;
}

std::vector<std::shared_ptr<ValidationCheck>> make_default_checks(
    const DefaultCheckOptions &options,
    std::shared_ptr<const ClassicalSigner> request_verifier,
    std::shared_ptr<FraudScorer> scorer,
    std::shared_ptr<RecordStore> store,
    std::shared_ptr<FrequencyGuard> guard) {
    std::vector<std::shared_ptr<ValidationCheck>> checks;
    checks.push_back(std::make_shared<SignatureCheck>(std::move(request_verifier),
                                                      options.trusted_client_keys));
    checks.push_back(std::make_shared<RecordLookupCheck>(std::move(store)));
    checks.push_back(std::make_shared<FraudModelCheck>(std::move(scorer)));
    checks.push_back(std::make_shared<PatternCheck>(std::move(guard)));
    if (!options.compliance_departments.empty()) {
        checks.push_back(std::make_shared<ComplianceCheck>(options.compliance_departments));
    }
    return checks;
}

} // namespace pqgate
