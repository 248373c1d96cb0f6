#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pqgate {

// Byte/encoding helpers shared by the signers, the Merkle accumulator and the
// token codec. Hashing and randomness are delegated to OpenSSL.

std::vector<std::uint8_t> to_bytes(const std::string &s);

std::string to_hex(const std::vector<std::uint8_t> &data);

// Throws std::invalid_argument on odd length or a non-hex digit.
std::vector<std::uint8_t> from_hex(const std::string &hex);

std::vector<std::uint8_t> random_bytes(std::size_t len);

std::vector<std::uint8_t> sha256(const std::vector<std::uint8_t> &data);
std::string sha256_hex(const std::string &data);

// RFC 2104 HMAC-SHA256.
std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t> &key,
                                      const std::vector<std::uint8_t> &msg);

// Unpadded RFC 4648 base64url.
std::string base64url_encode(const std::string &data);

// Accepts input with or without padding; throws std::invalid_argument on
// characters outside the base64url alphabet.
std::string base64url_decode(const std::string &data);

// Data-independent comparison for equal-length inputs. A length mismatch
// returns false immediately.
bool constant_time_equal(const std::string &a, const std::string &b);

std::vector<std::string> split(const std::string &s, char delim);

} // namespace pqgate
