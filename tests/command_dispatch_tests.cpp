#include "common/clock.hpp"
#include "service/command_dispatch.hpp"

#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>

using namespace pqgate;
using nlohmann::json;

namespace {

struct DispatchFixture {
    DispatchFixture()
    {
        Config config;
        config.log_path.clear();

        EngineOptions eo;
        eo.fraud_threshold = 0.5;
        eo.minimum_quorum = 1;
        eo.timeout_ms = 1000;

        IssuerOptions io;
        io.mode = SigningMode::Classical;

        GatewayHandles handles;
        handles.engine = std::make_shared<ValidationEngine>(
            eo, std::vector<std::shared_ptr<ValidationCheck>>{
                    make_check("ok", 1.0, [](const AuthenticationRequest &) { return 1.0; })});
        handles.issuer = std::make_shared<TokenIssuer>(io);
        gateway = std::make_unique<GatewayService>(config, std::move(handles));
    }

    json send(const json &command)
    {
        return json::parse(handle_command_line(*gateway, command.dump()));
    }

    json request_json(const std::string &id) const
    {
        return json{{"id", id},
                    {"timestamp", now_ms()},
                    {"data", {{"type", "lookup"}, {"source", "portal"}}}};
    }

    std::unique_ptr<GatewayService> gateway;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(command_dispatch_tests, DispatchFixture)

BOOST_AUTO_TEST_CASE(validate_then_verify)
{
    json resp = send({{"kind", "VALIDATE"}, {"request", request_json("r-1")}, {"department", "NHS"}});
    BOOST_CHECK_EQUAL(resp["kind"].get<std::string>(), "VALIDATE");
    BOOST_CHECK_EQUAL(resp["status"].get<std::string>(), "OK");
    BOOST_REQUIRE(resp.contains("token"));

    json verified = send({{"kind", "VERIFY"}, {"token", resp["token"]}});
    BOOST_CHECK_EQUAL(verified["status"].get<std::string>(), "OK");
    BOOST_CHECK(verified["valid"].get<bool>());
    BOOST_CHECK_EQUAL(verified["code"].get<std::string>(), "OK");
    BOOST_CHECK_EQUAL(verified["payload"]["department"].get<std::string>(), "NHS");
}

BOOST_AUTO_TEST_CASE(validate_batch)
{
    json requests = json::array({request_json("b-1"), request_json("b-2"), request_json("b-3")});
    json resp = send({{"kind", "VALIDATE"}, {"requests", requests}});
    BOOST_CHECK_EQUAL(resp["status"].get<std::string>(), "OK");
    BOOST_REQUIRE_EQUAL(resp["results"].size(), 3u);
    BOOST_CHECK_EQUAL(resp["results"][1]["requestId"].get<std::string>(), "b-2");
}

BOOST_AUTO_TEST_CASE(verify_rejects_garbage)
{
    json resp = send({{"kind", "VERIFY"}, {"token", "a.b.c"}});
    BOOST_CHECK_EQUAL(resp["status"].get<std::string>(), "DENIED");
    BOOST_CHECK(!resp["valid"].get<bool>());
    BOOST_CHECK_EQUAL(resp["code"].get<std::string>(), "INVALID_FORMAT");

    json missing = send({{"kind", "VERIFY"}});
    BOOST_CHECK_EQUAL(missing["status"].get<std::string>(), "DENIED");
}

BOOST_AUTO_TEST_CASE(emergency_denied_for_unlisted_department)
{
    json resp = send({{"kind", "EMERGENCY"},
                      {"department", "DVLA"},
                      {"practitioner", "X-1"},
                      {"patient", "p"},
                      {"reason", "r"}});
    BOOST_CHECK_EQUAL(resp["status"].get<std::string>(), "DENIED");
    BOOST_CHECK_EQUAL(resp["error"]["code"].get<std::string>(), "EMERGENCY_ACCESS_DENIED");
    BOOST_CHECK_EQUAL(resp["error"]["status"].get<int>(), 403);

    json granted = send({{"kind", "EMERGENCY"},
                         {"department", "NHS"},
                         {"practitioner", "GMC-1"},
                         {"patient", "p"},
                         {"reason", "r"}});
    BOOST_CHECK_EQUAL(granted["status"].get<std::string>(), "OK");
    BOOST_CHECK(granted.contains("token"));
}

BOOST_AUTO_TEST_CASE(merkle_proof_for_issued_token)
{
    send({{"kind", "VALIDATE"}, {"request", request_json("m-1")}});
    send({{"kind", "VALIDATE"}, {"request", request_json("m-2")}});
    send({{"kind", "VALIDATE"}, {"request", request_json("m-3")}});

    json resp = send({{"kind", "MERKLE_PROOF"}, {"index", 2}});
    BOOST_REQUIRE_EQUAL(resp["status"].get<std::string>(), "OK");
    MerkleProof proof = resp["proof"].get<MerkleProof>();
    BOOST_CHECK_EQUAL(proof.leaf_index, 2u);
    BOOST_CHECK_EQUAL(proof.leaf_count, 3u);
    BOOST_CHECK(MerkleAccumulator::verify(resp["leaf"].get<std::string>(), proof));

    json missing = send({{"kind", "MERKLE_PROOF"}, {"index", 10}});
    BOOST_CHECK_EQUAL(missing["status"].get<std::string>(), "DENIED");
    json negative = send({{"kind", "MERKLE_PROOF"}, {"index", -1}});
    BOOST_CHECK_EQUAL(negative["error"]["code"].get<std::string>(), "VALIDATION_ERROR");
}

BOOST_AUTO_TEST_CASE(rotate_and_public_keys)
{
    json before = send({{"kind", "PUBLIC_KEYS"}});
    json rotated = send({{"kind", "ROTATE"}});
    json after = send({{"kind", "PUBLIC_KEYS"}});
    BOOST_CHECK_EQUAL(rotated["status"].get<std::string>(), "OK");
    BOOST_CHECK(before["kid"] != after["kid"]);
    BOOST_CHECK_EQUAL(after["kid"], rotated["kid"]);
    BOOST_CHECK_EQUAL(after["mode"].get<std::string>(), "classical");
}

BOOST_AUTO_TEST_CASE(health_command)
{
    json resp = send({{"kind", "HEALTH"}});
    BOOST_CHECK_EQUAL(resp["kind"].get<std::string>(), "HEALTH");
    BOOST_CHECK_EQUAL(resp["status"].get<std::string>(), "healthy");
}

BOOST_AUTO_TEST_CASE(bad_commands)
{
    json malformed = json::parse(handle_command_line(*gateway, "{not json"));
    BOOST_CHECK_EQUAL(malformed["status"].get<std::string>(), "DENIED");

    json no_kind = send({{"request", request_json("x")}});
    BOOST_CHECK_EQUAL(no_kind["error"]["message"].get<std::string>(), "missing_kind");

    json unknown = send({{"kind", "AS"}});
    BOOST_CHECK_EQUAL(unknown["error"]["message"].get<std::string>(), "unknown_kind");

    json bad_request = send({{"kind", "VALIDATE"}, {"request", "not an object"}});
    BOOST_CHECK_EQUAL(bad_request["error"]["status"].get<int>(), 400);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(command_line_buffer_tests)

BOOST_AUTO_TEST_CASE(splits_lines_across_chunks)
{
    CommandLineBuffer buffer;
    const std::string first = "{\"kind\":\"HEA";
    const std::string second = "LTH\"}\n{\"kind\":\"ROTATE\"}\npartial";
    buffer.append(first.data(), first.size());

    std::string line;
    BOOST_CHECK(!buffer.next_line(line));
    buffer.append(second.data(), second.size());
    BOOST_REQUIRE(buffer.next_line(line));
    BOOST_CHECK_EQUAL(line, "{\"kind\":\"HEALTH\"}");
    BOOST_REQUIRE(buffer.next_line(line));
    BOOST_CHECK_EQUAL(line, "{\"kind\":\"ROTATE\"}");
    BOOST_CHECK(!buffer.next_line(line));
    BOOST_CHECK_EQUAL(buffer.pending_bytes(), 7u);
    BOOST_CHECK(!buffer.overflowed());
}

BOOST_AUTO_TEST_CASE(unterminated_line_over_limit_overflows)
{
    CommandLineBuffer buffer(16);
    const std::string chunk(10, 'x');
    std::string line;

    buffer.append(chunk.data(), chunk.size());
    BOOST_CHECK(!buffer.next_line(line));
    BOOST_CHECK(!buffer.overflowed());

    buffer.append(chunk.data(), chunk.size());
    BOOST_CHECK(!buffer.next_line(line));
    BOOST_CHECK(buffer.overflowed());
    BOOST_CHECK_EQUAL(buffer.pending_bytes(), 0u);

    // Later input is not parsed once the stream has overflowed.
    const std::string tail = "\n{\"kind\":\"HEALTH\"}\n";
    buffer.append(tail.data(), tail.size());
    BOOST_CHECK(!buffer.next_line(line));
}

BOOST_AUTO_TEST_CASE(terminated_line_over_limit_overflows)
{
    CommandLineBuffer buffer(8);
    const std::string data = std::string(12, 'y') + "\n";
    buffer.append(data.data(), data.size());
    std::string line;
    BOOST_CHECK(!buffer.next_line(line));
    BOOST_CHECK(buffer.overflowed());
}

BOOST_AUTO_TEST_CASE(overflow_response_is_validation_error)
{
    json resp = json::parse(line_too_long_response());
    BOOST_CHECK_EQUAL(resp["status"].get<std::string>(), "DENIED");
    BOOST_CHECK_EQUAL(resp["error"]["code"].get<std::string>(), "VALIDATION_ERROR");
    BOOST_CHECK_EQUAL(resp["error"]["message"].get<std::string>(), "line_too_long");
    BOOST_CHECK_EQUAL(CommandLineBuffer::kMaxLineBytes, 1024u * 1024u);
}

BOOST_AUTO_TEST_SUITE_END()
