#include "common/errors.hpp"
#include "validation/default_checks.hpp"
#include "validation/validation_engine.hpp"

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace pqgate;

namespace {

const std::int64_t kNow = 1700000000123;

AuthenticationRequest make_request(std::int64_t timestamp = kNow)
{
    AuthenticationRequest req;
    req.id = "req-42";
    req.timestamp = timestamp;
    req.data = {{"type", "benefit_claim"}, {"source", "portal"}, {"reference", "AB123"}};
    return req;
}

std::shared_ptr<ValidationCheck> constant(const std::string &name, double weight, double value)
{
    return make_check(name, weight, [value](const AuthenticationRequest &) { return value; });
}

EngineOptions options(double threshold, int quorum, int timeout_ms = 100)
{
    EngineOptions o;
    o.fraud_threshold = threshold;
    o.minimum_quorum = quorum;
    o.timeout_ms = timeout_ms;
    return o;
}

} // namespace

BOOST_AUTO_TEST_SUITE(validation_engine_tests)

BOOST_AUTO_TEST_CASE(weighted_score_with_one_failing_check)
{
    ValidationEngine engine(options(0.7, 3),
                            {constant("a", 0.25, 1.0), constant("b", 0.25, 1.0),
                             constant("c", 0.25, 1.0), constant("d", 0.25, 0.0)});

    ValidationResult result = engine.validate(make_request(), 100, kNow);
    BOOST_CHECK_CLOSE(result.score, 0.75, 1e-9);
    BOOST_CHECK_EQUAL(result.checks_passed, 3);
    BOOST_CHECK_EQUAL(result.total_checks, 4);
    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(result.details.size(), 4u);
    BOOST_CHECK(result.check_passed("a"));
    BOOST_CHECK(!result.check_passed("d"));
    BOOST_CHECK(result.details.at("d").completed);
}

BOOST_AUTO_TEST_CASE(stale_request_rejected_before_any_check)
{
    auto executed = std::make_shared<std::atomic<int>>(0);
    auto counting = make_check("counting", 1.0, [executed](const AuthenticationRequest &) {
        ++*executed;
        return 1.0;
    });
    ValidationEngine engine(options(0.5, 1), {counting});

    BOOST_CHECK_THROW(engine.validate(make_request(kNow - 10 * 60 * 1000), 100, kNow),
                      ValidationError);
    BOOST_CHECK_EQUAL(executed->load(), 0);

    BOOST_CHECK_NO_THROW(engine.validate(make_request(kNow - 1000), 100, kNow));
    BOOST_CHECK_EQUAL(executed->load(), 1);
}

BOOST_AUTO_TEST_CASE(malformed_requests_rejected)
{
    ValidationEngine engine(options(0.5, 1), {constant("a", 1.0, 1.0)});

    AuthenticationRequest no_id = make_request();
    no_id.id.clear();
    BOOST_CHECK_THROW(engine.validate(no_id, 100, kNow), ValidationError);

    AuthenticationRequest no_ts = make_request();
    no_ts.timestamp = 0;
    BOOST_CHECK_THROW(engine.validate(no_ts, 100, kNow), ValidationError);

    AuthenticationRequest bad_data = make_request();
    bad_data.data = nlohmann::json::array({1, 2});
    BOOST_CHECK_THROW(engine.validate(bad_data, 100, kNow), ValidationError);

    AuthenticationRequest future = make_request(kNow + 6 * 60 * 1000);
    BOOST_CHECK_THROW(engine.validate(future, 100, kNow), ValidationError);
}

BOOST_AUTO_TEST_CASE(slow_check_times_out)
{
    auto slow = make_check("slow", 0.5, [](const AuthenticationRequest &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return 1.0;
    });
    ValidationEngine engine(options(0.9, 2),
                            {constant("a", 0.25, 1.0), constant("b", 0.25, 1.0), slow});

    const auto started = std::chrono::steady_clock::now();
    ValidationResult result = engine.validate(make_request(), 50, kNow);
    const auto waited = std::chrono::steady_clock::now() - started;

    BOOST_CHECK(waited < std::chrono::milliseconds(350));
    BOOST_CHECK(!result.details.at("slow").completed);
    BOOST_CHECK_EQUAL(result.details.at("slow").error, "timeout");
    BOOST_CHECK_EQUAL(result.checks_passed, 2);
    // Only completed checks count towards the denominator.
    BOOST_CHECK_CLOSE(result.score, 1.0, 1e-9);
    BOOST_CHECK(result.success);
}

BOOST_AUTO_TEST_CASE(throwing_check_is_recorded)
{
    auto broken = make_check("broken", 0.5, [](const AuthenticationRequest &) -> double {
        throw std::runtime_error("record store unavailable");
    });
    ValidationEngine engine(options(0.5, 1), {constant("a", 0.5, 1.0), broken});

    ValidationResult result = engine.validate(make_request(), 100, kNow);
    BOOST_CHECK(!result.details.at("broken").completed);
    BOOST_CHECK(!result.details.at("broken").passed);
    BOOST_CHECK_EQUAL(result.details.at("broken").error, "record store unavailable");
    BOOST_CHECK_EQUAL(result.checks_passed, 1);
    BOOST_CHECK(result.success);
}

BOOST_AUTO_TEST_CASE(nan_score_counts_as_failure)
{
    ValidationEngine engine(options(0.5, 1),
                            {constant("a", 1.0, 1.0),
                             constant("nan", 1.0, std::numeric_limits<double>::quiet_NaN())});
    ValidationResult result = engine.validate(make_request(), 100, kNow);
    BOOST_CHECK(!result.details.at("nan").completed);
    BOOST_CHECK(!std::isnan(result.score));
}

BOOST_AUTO_TEST_CASE(quorum_required)
{
    ValidationEngine engine(options(0.5, 3), {constant("a", 1.0, 1.0), constant("b", 1.0, 1.0)});
    ValidationResult result = engine.validate(make_request(), 100, kNow);
    BOOST_CHECK_CLOSE(result.score, 1.0, 1e-9);
    BOOST_CHECK(!result.success);
}

BOOST_AUTO_TEST_CASE(fraud_score_from_fraud_check)
{
    ValidationEngine engine(options(0.5, 1),
                            {constant("a", 1.0, 1.0), constant(kFraudModelCheck, 1.0, 0.8)});
    ValidationResult result = engine.validate(make_request(), 100, kNow);
    BOOST_CHECK_CLOSE(result.fraud_score, 0.2, 1e-9);

    ValidationEngine without(options(0.5, 1), {constant("a", 1.0, 1.0)});
    BOOST_CHECK_EQUAL(without.validate(make_request(), 100, kNow).fraud_score, 0.0);
}

BOOST_AUTO_TEST_CASE(scores_are_clamped)
{
    ValidationEngine engine(options(0.5, 1), {constant("high", 1.0, 7.0), constant("low", 1.0, -3.0)});
    ValidationResult result = engine.validate(make_request(), 100, kNow);
    BOOST_CHECK_EQUAL(result.details.at("high").score, 1.0);
    BOOST_CHECK_EQUAL(result.details.at("low").score, 0.0);
    BOOST_CHECK_CLOSE(result.score, 0.5, 1e-9);
}

BOOST_AUTO_TEST_CASE(misconfiguration_is_fatal)
{
    BOOST_CHECK_THROW(ValidationEngine(options(0.5, 1), {}), ProcessingError);
    BOOST_CHECK_THROW(ValidationEngine(options(0.5, 1), {nullptr}), ProcessingError);
    BOOST_CHECK_THROW(ValidationEngine(options(0.5, 1), {constant("a", 0.0, 1.0)}), ProcessingError);
    BOOST_CHECK_THROW(ValidationEngine(options(0.5, 1),
                                       {constant("a", 1.0, 1.0), constant("a", 1.0, 1.0)}),
                      ProcessingError);
}

BOOST_AUTO_TEST_CASE(result_json_uses_wire_names)
{
    ValidationEngine engine(options(0.5, 1), {constant("a", 1.0, 1.0)});
    nlohmann::json j = validation_result_to_json(engine.validate(make_request(), 100, kNow));
    BOOST_CHECK(j.contains("success"));
    BOOST_CHECK(j.contains("checksPassed"));
    BOOST_CHECK(j.contains("totalChecks"));
    BOOST_CHECK(j.contains("fraudScore"));
    BOOST_CHECK(j["details"].contains("a"));
}

BOOST_AUTO_TEST_CASE(sequential_mode_runs_one_check_at_a_time)
{
    auto running = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);
    auto tracked = [running, peak](const std::string &name) {
        return make_check(name, 1.0, [running, peak](const AuthenticationRequest &) {
            const int now_running = ++*running;
            int seen = peak->load();
            while (now_running > seen && !peak->compare_exchange_weak(seen, now_running)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --*running;
            return 1.0;
        });
    };

    EngineOptions o = options(0.5, 3, 1000);
    o.parallel_checks = false;
    ValidationEngine engine(o, {tracked("a"), tracked("b"), tracked("c")});

    ValidationResult result = engine.validate(make_request(), 1000, kNow);
    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(result.checks_passed, 3);
    BOOST_CHECK_EQUAL(peak->load(), 1);
}

BOOST_AUTO_TEST_CASE(sequential_mode_gives_each_check_its_own_timeout)
{
    auto medium = [](const std::string &name) {
        return make_check(name, 1.0, [](const AuthenticationRequest &) {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            return 1.0;
        });
    };

    EngineOptions o = options(0.5, 2, 400);
    o.parallel_checks = false;
    ValidationEngine engine(o, {medium("a"), medium("b")});

    // Together the checks outlast one timeout; separately each fits.
    ValidationResult result = engine.validate(make_request(), 250, kNow);
    BOOST_CHECK(result.details.at("a").completed);
    BOOST_CHECK(result.details.at("b").completed);
    BOOST_CHECK(result.success);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(default_checks_tests)

BOOST_AUTO_TEST_CASE(signature_check_accepts_trusted_client)
{
    ClassicalSigner client;
    auto verifier = std::make_shared<const ClassicalSigner>();

    AuthenticationRequest req = make_request();
    req.signatures = {"00", client.sign(signing_message(req))};

    SignatureCheck trusted(verifier, {client.public_key_hex()});
    BOOST_CHECK_EQUAL(trusted.execute(req), 1.0);

    SignatureCheck untrusted(verifier, {});
    BOOST_CHECK_EQUAL(untrusted.execute(req), 0.0);

    AuthenticationRequest unsigned_req = make_request();
    BOOST_CHECK_EQUAL(trusted.execute(unsigned_req), 0.0);

    // Altering the data invalidates the signature.
    AuthenticationRequest altered = req;
    altered.data["reference"] = "ZZ999";
    BOOST_CHECK_EQUAL(trusted.execute(altered), 0.0);
}

BOOST_AUTO_TEST_CASE(signing_message_layout)
{
    AuthenticationRequest req;
    req.id = "x";
    req.timestamp = 5;
    req.data = {{"b", 1}, {"a", "v"}};
    BOOST_CHECK_EQUAL(signing_message(req), R"({"id":"x","timestamp":5,"data":{"a":"v","b":1}})");
}

BOOST_AUTO_TEST_CASE(pattern_check_heuristics)
{
    PatternCheck check(std::make_shared<AllowAllFrequencyGuard>());

    BOOST_CHECK_CLOSE(check.evaluate(make_request(kNow - 1000), kNow), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(check.evaluate(make_request(kNow - 120000), kNow), 2.0 / 3.0, 1e-9);

    AuthenticationRequest missing_source = make_request(kNow - 1000);
    missing_source.data.erase("source");
    BOOST_CHECK_CLOSE(check.evaluate(missing_source, kNow), 2.0 / 3.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(record_lookup_with_placeholder_store)
{
    RecordLookupCheck always(std::make_shared<PlaceholderRecordStore>(1.0));
    RecordLookupCheck never(std::make_shared<PlaceholderRecordStore>(0.0));
    BOOST_CHECK_EQUAL(always.execute(make_request()), 1.0);
    BOOST_CHECK_EQUAL(never.execute(make_request()), 0.0);
}

BOOST_AUTO_TEST_CASE(compliance_check)
{
    ComplianceCheck check({"NHS", "HMRC"});

    AuthenticationRequest req = make_request();
    BOOST_CHECK_EQUAL(check.execute(req), 0.0);

    RequestMetadata meta;
    meta.department = "HMRC";
    meta.purpose = "tax_assessment";
    req.metadata = meta;
    BOOST_CHECK_EQUAL(check.execute(req), 1.0);

    req.metadata->purpose.clear();
    BOOST_CHECK_EQUAL(check.execute(req), 0.0);

    req.metadata->purpose = "audit";
    req.metadata->department = "DVLA";
    BOOST_CHECK_EQUAL(check.execute(req), 0.0);
}

BOOST_AUTO_TEST_CASE(default_registry)
{
    DefaultCheckOptions opts;
    auto checks = make_default_checks(opts,
                                      std::make_shared<const ClassicalSigner>(),
                                      std::make_shared<FraudScorer>(),
                                      std::make_shared<PlaceholderRecordStore>(1.0),
                                      std::make_shared<AllowAllFrequencyGuard>());
    BOOST_REQUIRE_EQUAL(checks.size(), 4u);
    BOOST_CHECK_EQUAL(checks[0]->name(), kSignatureCheck);
    BOOST_CHECK_EQUAL(checks[2]->name(), kFraudModelCheck);

    opts.compliance_departments = {"NHS"};
    auto with_compliance = make_default_checks(opts,
                                               std::make_shared<const ClassicalSigner>(),
                                               std::make_shared<FraudScorer>(),
                                               std::make_shared<PlaceholderRecordStore>(1.0),
                                               nullptr);
    BOOST_CHECK_EQUAL(with_compliance.size(), 5u);
    BOOST_CHECK_EQUAL(with_compliance.back()->name(), kComplianceCheck);

    double total = 0.0;
    for (const auto &c : with_compliance) {
        total += c->weight();
    }
    BOOST_CHECK_CLOSE(total, 1.1, 1e-9);
}

BOOST_AUTO_TEST_CASE(parse_request_json)
{
    AuthenticationRequest req = parse_auth_request_json(
        R"({"id":"r1","timestamp":1700000000123,"data":{"type":"t"},)"
        R"("signatures":["ab"],"metadata":{"origin":"o","userAgent":"ua","ipAddress":"81.1.1.1"}})");
    BOOST_CHECK_EQUAL(req.id, "r1");
    BOOST_CHECK_EQUAL(req.timestamp, 1700000000123);
    BOOST_REQUIRE(req.metadata);
    BOOST_CHECK_EQUAL(req.metadata->user_agent, "ua");
    BOOST_CHECK_EQUAL(req.metadata->ip_address, "81.1.1.1");
    BOOST_CHECK_EQUAL(origin_key(req), "o");

    BOOST_CHECK_THROW(parse_auth_request_json("not json"), ValidationError);
    BOOST_CHECK_THROW(parse_auth_request_json(R"({"id":5})"), ValidationError);
    BOOST_CHECK_THROW(parse_auth_request_json(R"({"id":"a","signatures":"ab"})"), ValidationError);
}

BOOST_AUTO_TEST_CASE(parse_request_timestamp_range)
{
    AuthenticationRequest fractional =
        parse_auth_request_json(R"({"id":"r1","timestamp":1700000000123.75,"data":{}})");
    BOOST_CHECK_EQUAL(fractional.timestamp, 1700000000123);

    BOOST_CHECK_THROW(parse_auth_request_json(R"({"id":"r1","timestamp":1e300,"data":{}})"),
                      ValidationError);
    BOOST_CHECK_THROW(parse_auth_request_json(R"({"id":"r1","timestamp":-1e300,"data":{}})"),
                      ValidationError);
    BOOST_CHECK_THROW(parse_auth_request_json(R"({"id":"r1","timestamp":-0.5e1,"data":{}})"),
                      ValidationError);
    BOOST_CHECK_THROW(
        parse_auth_request_json(R"({"id":"r1","timestamp":18446744073709551615,"data":{}})"),
        ValidationError);
}

BOOST_AUTO_TEST_SUITE_END()
