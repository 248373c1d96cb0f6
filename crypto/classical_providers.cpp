#include "interfaces.hpp"
#include "factories.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace pqgate {

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *p) const { EVP_MD_CTX_free(p); }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

class Ed25519SignatureProvider : public SignatureProvider {
public:
    // Fresh keypair.
    Ed25519SignatureProvider() : can_sign_(true) {
        EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
        if (!pctx) {
            throw std::runtime_error("EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519) failed");
        }
        if (EVP_PKEY_keygen_init(pctx) <= 0) {
            EVP_PKEY_CTX_free(pctx);
            throw std::runtime_error("EVP_PKEY_keygen_init failed");
        }
        EVP_PKEY *pkey = nullptr;
        if (EVP_PKEY_keygen(pctx, &pkey) <= 0) {
            EVP_PKEY_CTX_free(pctx);
            throw std::runtime_error("EVP_PKEY_keygen for Ed25519 failed");
        }
        EVP_PKEY_CTX_free(pctx);
        key_.reset(pkey);
        cache_public_key();
    }

    // Verify-only provider around a raw 32-byte public key.
    explicit Ed25519SignatureProvider(const std::vector<std::uint8_t> &pub)
        : can_sign_(false) {
        EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key(
            EVP_PKEY_ED25519, nullptr, pub.data(), pub.size());
        if (!pkey) {
            throw std::invalid_argument("EVP_PKEY_new_raw_public_key(Ed25519) failed");
        }
        key_.reset(pkey);
        pub_ = pub;
    }

    SigAlgorithm algorithm() const override { return SigAlgorithm::Ed25519; }

    std::vector<std::uint8_t> public_key() const override { return pub_; }

    Signature sign(const std::vector<std::uint8_t> &msg) const override {
        if (!can_sign_) {
            throw std::runtime_error("Ed25519 provider holds no private key");
        }

        MdCtxPtr mdctx(EVP_MD_CTX_new());
        if (!mdctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }

        Signature sig;
        sig.algorithm = SigAlgorithm::Ed25519;

        if (EVP_DigestSignInit(mdctx.get(), nullptr, nullptr, nullptr, key_.get()) <= 0) {
            throw std::runtime_error("EVP_DigestSignInit failed");
        }

        size_t siglen = 0;
        if (EVP_DigestSign(mdctx.get(), nullptr, &siglen, msg.data(), msg.size()) <= 0) {
            throw std::runtime_error("EVP_DigestSign size failed");
        }
        sig.bytes.resize(siglen);
        if (EVP_DigestSign(mdctx.get(), sig.bytes.data(), &siglen, msg.data(), msg.size()) <= 0) {
            throw std::runtime_error("EVP_DigestSign failed");
        }
        sig.bytes.resize(siglen);
        return sig;
    }

    bool verify(const std::vector<std::uint8_t> &msg,
                const Signature &sig) const override {
        if (sig.algorithm != SigAlgorithm::Ed25519) {
            return false;
        }

        MdCtxPtr mdctx(EVP_MD_CTX_new());
        if (!mdctx) {
            return false;
        }
        if (EVP_DigestVerifyInit(mdctx.get(), nullptr, nullptr, nullptr, key_.get()) <= 0) {
            return false;
        }
        int rc = EVP_DigestVerify(mdctx.get(), sig.bytes.data(), sig.bytes.size(),
                                  msg.data(), msg.size());
        return rc == 1;
    }

private:
    void cache_public_key() {
        size_t len = 0;
        if (EVP_PKEY_get_raw_public_key(key_.get(), nullptr, &len) <= 0) {
            throw std::runtime_error("EVP_PKEY_get_raw_public_key size failed");
        }
        pub_.resize(len);
        if (EVP_PKEY_get_raw_public_key(key_.get(), pub_.data(), &len) <= 0) {
            throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
        }
    }

    PKeyPtr key_;
    std::vector<std::uint8_t> pub_;
    bool can_sign_;
};

} // namespace

// Factory helpers that higher-level code can use.
std::unique_ptr<SignatureProvider> make_ed25519_signature_provider() {
    return std::make_unique<Ed25519SignatureProvider>();
}

std::unique_ptr<SignatureProvider> make_ed25519_verifier(
    const std::vector<std::uint8_t> &public_key) {
    return std::make_unique<Ed25519SignatureProvider>(public_key);
}

} // namespace pqgate
