#pragma once

#include <cstdint>
#include <string>

namespace pqgate {

// What the downstream replication tier returns once it has accepted a token.
struct ConsensusRecord {
    std::string record_id;
    std::string jti;
    std::int64_t accepted_at{0};
};

// Downstream collaborator that consumes minted tokens. Implementations must
// re-verify signature and expiry and reject a repeated jti; the gateway does
// not provide replay protection on its own. Errors are reported by throwing.
class TokenConsumer {
public:
    virtual ~TokenConsumer() = default;

    virtual ConsensusRecord accept_token(const std::string &token,
                                         const std::string &payload_json) = 0;
};

} // namespace pqgate
