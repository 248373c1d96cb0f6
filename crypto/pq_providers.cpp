#include "interfaces.hpp"
#include "factories.hpp"

#include <oqs/oqs.h>

#include <stdexcept>

namespace pqgate {

namespace {

class MlKem768Provider : public KemProvider {
public:
    MlKem768Provider() {
        if (!OQS_KEM_alg_is_enabled(OQS_KEM_alg_ml_kem_768)) {
            throw std::runtime_error("ML-KEM-768 not enabled in liboqs");
        }
        kem_ = OQS_KEM_new(OQS_KEM_alg_ml_kem_768);
        if (!kem_) {
            throw std::runtime_error("OQS_KEM_new(ml_kem_768) failed");
        }
    }

    ~MlKem768Provider() override {
        if (kem_) {
            OQS_KEM_free(kem_);
            kem_ = nullptr;
        }
    }

    MlKem768Provider(const MlKem768Provider &) = delete;
    MlKem768Provider &operator=(const MlKem768Provider &) = delete;

    KemAlgorithm algorithm() const override { return KemAlgorithm::ML_KEM_768; }

    KemKeyPair keypair() const override {
        KemKeyPair kp;
        kp.public_key.resize(kem_->length_public_key);
        kp.secret_key.resize(kem_->length_secret_key);
        if (OQS_KEM_keypair(kem_, kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_KEM_keypair failed");
        }
        return kp;
    }

    KemEncapsulation encapsulate(
        const std::vector<std::uint8_t> &public_key) const override {
        if (public_key.size() != kem_->length_public_key) {
            throw std::invalid_argument("ML-KEM-768 public key size mismatch");
        }

        KemEncapsulation out;
        out.ciphertext.resize(kem_->length_ciphertext);
        out.shared_secret.resize(kem_->length_shared_secret);
        if (OQS_KEM_encaps(kem_, out.ciphertext.data(), out.shared_secret.data(),
                           public_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_KEM_encaps failed");
        }
        return out;
    }

    std::vector<std::uint8_t> decapsulate(
        const std::vector<std::uint8_t> &ciphertext,
        const std::vector<std::uint8_t> &secret_key) const override {
        if (ciphertext.size() != kem_->length_ciphertext) {
            throw std::invalid_argument("ML-KEM-768 ciphertext size mismatch");
        }
        if (secret_key.size() != kem_->length_secret_key) {
            throw std::invalid_argument("ML-KEM-768 secret key size mismatch");
        }

        std::vector<std::uint8_t> shared(kem_->length_shared_secret);
        if (OQS_KEM_decaps(kem_, shared.data(), ciphertext.data(),
                           secret_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_KEM_decaps failed");
        }
        return shared;
    }

private:
    OQS_KEM *kem_{nullptr};
};

class MlDsa44SignatureProvider : public SignatureProvider {
public:
    // Fresh keypair.
    MlDsa44SignatureProvider() {
        init();
        pub_.resize(sig_->length_public_key);
        sk_.resize(sig_->length_secret_key);
        if (OQS_SIG_keypair(sig_, pub_.data(), sk_.data()) != OQS_SUCCESS) {
            OQS_SIG_free(sig_);
            sig_ = nullptr;
            throw std::runtime_error("OQS_SIG_keypair failed");
        }
    }

    // Verify-only provider around an encoded public key.
    explicit MlDsa44SignatureProvider(const std::vector<std::uint8_t> &pub) {
        init();
        if (pub.size() != sig_->length_public_key) {
            OQS_SIG_free(sig_);
            sig_ = nullptr;
            throw std::invalid_argument("ML-DSA-44 public key size mismatch");
        }
        pub_ = pub;
    }

    ~MlDsa44SignatureProvider() override {
        if (!sk_.empty()) {
            OQS_MEM_cleanse(sk_.data(), sk_.size());
        }
        if (sig_) {
            OQS_SIG_free(sig_);
            sig_ = nullptr;
        }
    }

    MlDsa44SignatureProvider(const MlDsa44SignatureProvider &) = delete;
    MlDsa44SignatureProvider &operator=(const MlDsa44SignatureProvider &) = delete;

    SigAlgorithm algorithm() const override { return SigAlgorithm::ML_DSA_44; }

    std::vector<std::uint8_t> public_key() const override { return pub_; }

    Signature sign(const std::vector<std::uint8_t> &msg) const override {
        if (sk_.empty()) {
            throw std::runtime_error("ML-DSA-44 provider holds no secret key");
        }
        Signature s;
        s.algorithm = SigAlgorithm::ML_DSA_44;

        size_t sig_len = sig_->length_signature;
        s.bytes.resize(sig_len);
        if (OQS_SIG_sign(sig_, s.bytes.data(), &sig_len,
                         msg.data(), msg.size(), sk_.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_SIG_sign failed");
        }
        s.bytes.resize(sig_len);
        return s;
    }

    bool verify(const std::vector<std::uint8_t> &msg,
                const Signature &signature) const override {
        if (signature.algorithm != SigAlgorithm::ML_DSA_44) {
            return false;
        }
        int rc = OQS_SIG_verify(sig_, msg.data(), msg.size(),
                                signature.bytes.data(), signature.bytes.size(),
                                pub_.data());
        return rc == OQS_SUCCESS;
    }

private:
    void init() {
        if (!OQS_SIG_alg_is_enabled(OQS_SIG_alg_ml_dsa_44)) {
            throw std::runtime_error("ML-DSA-44 not enabled in liboqs");
        }
        sig_ = OQS_SIG_new(OQS_SIG_alg_ml_dsa_44);
        if (!sig_) {
            throw std::runtime_error("OQS_SIG_new(ml_dsa_44) failed");
        }
    }

    OQS_SIG *sig_{nullptr};
    std::vector<std::uint8_t> pub_;
    std::vector<std::uint8_t> sk_;
};

} // namespace

std::unique_ptr<KemProvider> make_ml_kem_768_provider() {
    return std::make_unique<MlKem768Provider>();
}

std::unique_ptr<SignatureProvider> make_ml_dsa_44_signature_provider() {
    return std::make_unique<MlDsa44SignatureProvider>();
}

std::unique_ptr<SignatureProvider> make_ml_dsa_44_verifier(
    const std::vector<std::uint8_t> &public_key) {
    return std::make_unique<MlDsa44SignatureProvider>(public_key);
}

} // namespace pqgate
