#include "hkdf_sha3.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <stdexcept>

namespace pqgate {

std::vector<std::uint8_t> HkdfSha3Provider::derive(
    const std::vector<std::uint8_t> &ikm,
    const std::vector<std::uint8_t> &salt,
    const std::vector<std::uint8_t> &info,
    std::size_t out_len) const {
    std::vector<std::uint8_t> out(out_len);

    // HKDF with SHA3-256 via OpenSSL EVP_PKEY API.
    EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    if (EVP_PKEY_derive_init(pctx) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha3_256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(pctx, info.data(), static_cast<int>(info.size())) <= 0) {
        EVP_PKEY_CTX_free(pctx);
        throw std::runtime_error("HKDF-SHA3-256 initialization failed");
    }

    size_t len = out_len;
    if (EVP_PKEY_derive(pctx, out.data(), &len) <= 0 || len != out_len) {
        EVP_PKEY_CTX_free(pctx);
        throw std::runtime_error("HKDF-SHA3-256 derive failed");
    }

    EVP_PKEY_CTX_free(pctx);
    return out;
}

std::vector<std::uint8_t> derive_channel_key(
    const std::vector<std::uint8_t> &shared_secret,
    const std::string &context,
    const HkdfProvider &hkdf) {
    if (shared_secret.empty()) {
        throw std::invalid_argument("empty shared secret");
    }

    const std::vector<std::uint8_t> salt; // empty salt

    const std::string info_str = "pq-gate/channel/" + context;
    std::vector<std::uint8_t> info(info_str.begin(), info_str.end());

    // 32-byte (256-bit) channel key
    return hkdf.derive(shared_secret, salt, info, 32);
}

} // namespace pqgate
