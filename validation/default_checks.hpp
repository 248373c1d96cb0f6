#pragma once

#include "../crypto/classical_signer.hpp"
#include "fraud_scorer.hpp"
#include "validation_check.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace pqgate {

// Check names; the token issuer reads "signature" and "compliance" from the
// result details when computing permissions.
inline const std::string kSignatureCheck = "signature";
inline const std::string kRecordLookupCheck = "record_lookup";
inline const std::string kFraudModelCheck = "fraud_model";
inline const std::string kPatternCheck = "pattern";
inline const std::string kComplianceCheck = "compliance";

// External record store consulted by the record lookup check.
class RecordStore {
public:
    virtual ~RecordStore() = default;
    virtual bool lookup(const AuthenticationRequest &request) = 0;
};

// Stand-in used when no real store is wired: succeeds with a fixed
// probability.
class PlaceholderRecordStore : public RecordStore {
public:
    explicit PlaceholderRecordStore(double success_rate = 0.99);
    bool lookup(const AuthenticationRequest &request) override;

private:
    double success_rate_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

// Rate sanity collaborator for the pattern check (distributed rate limiter).
class FrequencyGuard {
public:
    virtual ~FrequencyGuard() = default;
    virtual bool allow(const AuthenticationRequest &request) = 0;
};

class AllowAllFrequencyGuard : public FrequencyGuard {
public:
    bool allow(const AuthenticationRequest &) override { return true; }
};

// Passes when any attached signature verifies over signing_message(request),
// against one of the trusted client keys or, when none are configured, the
// verifier's own key.
class SignatureCheck : public ValidationCheck {
public:
    SignatureCheck(std::shared_ptr<const ClassicalSigner> verifier,
                   std::vector<std::string> trusted_public_keys,
                   double weight = 0.3);

    const std::string &name() const override { return kSignatureCheck; }
    double weight() const override { return weight_; }
    double execute(const AuthenticationRequest &request) override;

private:
    std::shared_ptr<const ClassicalSigner> verifier_;
    std::vector<std::string> trusted_keys_;
    double weight_;
};

class RecordLookupCheck : public ValidationCheck {
public:
    explicit RecordLookupCheck(std::shared_ptr<RecordStore> store, double weight = 0.2);

    const std::string &name() const override { return kRecordLookupCheck; }
    double weight() const override { return weight_; }
    double execute(const AuthenticationRequest &request) override;

private:
    std::shared_ptr<RecordStore> store_;
    double weight_;
};

// Legitimacy = 1 - fraud score.
class FraudModelCheck : public ValidationCheck {
public:
    explicit FraudModelCheck(std::shared_ptr<FraudScorer> scorer, double weight = 0.3);

    const std::string &name() const override { return kFraudModelCheck; }
    double weight() const override { return weight_; }
    double execute(const AuthenticationRequest &request) override;

private:
    std::shared_ptr<FraudScorer> scorer_;
    double weight_;
};

// Mean of three heuristics: freshness (< 60 s), structural integrity
// (data carries "type" and "source") and request-frequency sanity.
class PatternCheck : public ValidationCheck {
public:
    explicit PatternCheck(std::shared_ptr<FrequencyGuard> guard, double weight = 0.2);

    const std::string &name() const override { return kPatternCheck; }
    double weight() const override { return weight_; }
    double execute(const AuthenticationRequest &request) override;

    double evaluate(const AuthenticationRequest &request, std::int64_t now_ms);

private:
    std::shared_ptr<FrequencyGuard> guard_;
    double weight_;
};

// Department is on the configured list and a purpose was declared.
class ComplianceCheck : public ValidationCheck {
public:
    explicit ComplianceCheck(std::vector<std::string> departments, double weight = 0.1);

    const std::string &name() const override { return kComplianceCheck; }
    double weight() const override { return weight_; }
    double execute(const AuthenticationRequest &request) override;

private:
    std::vector<std::string> departments_;
    double weight_;
};

struct DefaultCheckOptions {
    std::vector<std::string> trusted_client_keys;
    std::vector<std::string> compliance_departments; // empty: no compliance check
};

// signature, record_lookup, fraud_model, pattern [, compliance].
std::vector<std::shared_ptr<ValidationCheck>> make_default_checks(
    const DefaultCheckOptions &options,
    std::shared_ptr<const ClassicalSigner> request_verifier,
    std::shared_ptr<FraudScorer> scorer,
    std::shared_ptr<RecordStore> store,
    std::shared_ptr<FrequencyGuard> guard);

} // namespace pqgate
