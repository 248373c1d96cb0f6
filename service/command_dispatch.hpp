#pragma once

#include "gateway_service.hpp"

#include <cstddef>
#include <string>

namespace pqgate {

// Splits a client byte stream into newline-terminated command lines. A line
// longer than the limit (terminated or not) marks the stream as overflowed
// and no further lines are returned.
class CommandLineBuffer {
public:
    static constexpr std::size_t kMaxLineBytes = 1024 * 1024;

    explicit CommandLineBuffer(std::size_t max_line_bytes = kMaxLineBytes)
        : max_line_bytes_(max_line_bytes) {}

    void append(const char *data, std::size_t size) { buffer_.append(data, size); }

    // Pops the next complete line without its '\n'.
    bool next_line(std::string &line);

    bool overflowed() const { return overflowed_; }
    std::size_t pending_bytes() const { return buffer_.size(); }

private:
    std::size_t max_line_bytes_;
    std::string buffer_;
    bool overflowed_{false};
};

// Response sent before dropping a client whose line exceeded the limit.
std::string line_too_long_response();

// Handles one newline-delimited JSON command from the daemon socket and
// returns the JSON response (without the trailing newline). Recognised
// kinds: VALIDATE, VERIFY, EMERGENCY, ROTATE, MERKLE_PROOF, PUBLIC_KEYS,
// HEALTH. Never throws; failures are reported as {"status":"DENIED"} or
// {"status":"ERROR"} with an error object.
std::string handle_command_line(GatewayService &gateway, const std::string &line);

} // namespace pqgate
