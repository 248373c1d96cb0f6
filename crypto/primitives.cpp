#include "primitives.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>

namespace pqgate {

std::vector<std::uint8_t> to_bytes(const std::string &s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::string to_hex(const std::vector<std::uint8_t> &data) {
    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        out.push_back(hex[(b >> 4) & 0x0F]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> from_hex(const std::string &hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }
    auto nybble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        throw std::invalid_argument("invalid hex digit");
    };
    std::vector<std::uint8_t> out(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = nybble(hex[2 * i]);
        int lo = nybble(hex[2 * i + 1]);
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::vector<std::uint8_t> random_bytes(std::size_t len) {
    std::vector<std::uint8_t> out(len);
    if (len == 0) {
        return out;
    }
    if (RAND_bytes(out.data(), static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::vector<std::uint8_t> sha256(const std::vector<std::uint8_t> &data) {
    std::vector<std::uint8_t> digest(SHA256_DIGEST_LENGTH);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    digest.resize(len);
    return digest;
}

std::string sha256_hex(const std::string &data) {
    return to_hex(sha256(to_bytes(data)));
}

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t> &key,
                                      const std::vector<std::uint8_t> &msg) {
    std::vector<std::uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              msg.data(), msg.size(), mac.data(), &len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    mac.resize(len);
    return mac;
}

std::string base64url_encode(const std::string &data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                            reinterpret_cast<const unsigned char *>(data.data()),
                            static_cast<int>(data.size()));
    if (n < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(n));
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (auto &c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::string base64url_decode(const std::string &data) {
    std::string std_b64;
    std_b64.reserve(data.size() + 3);
    for (char c : data) {
        if (c == '-') {
            std_b64.push_back('+');
        } else if (c == '_') {
            std_b64.push_back('/');
        } else if (c == '+' || c == '/') {
            throw std::invalid_argument("invalid base64url character");
        } else {
            std_b64.push_back(c);
        }
    }
    while (!std_b64.empty() && std_b64.back() == '=') {
        std_b64.pop_back();
    }
    if (std_b64.size() % 4 == 1) {
        throw std::invalid_argument("invalid base64url length");
    }
    std::size_t padding = (4 - std_b64.size() % 4) % 4;
    std_b64.append(padding, '=');
    if (std_b64.empty()) {
        return {};
    }

    std::string out(3 * std_b64.size() / 4, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                            reinterpret_cast<const unsigned char *>(std_b64.data()),
                            static_cast<int>(std_b64.size()));
    if (n < 0) {
        throw std::invalid_argument("invalid base64url input");
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding.
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

bool constant_time_equal(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<std::string> split(const std::string &s, char delim) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace pqgate
