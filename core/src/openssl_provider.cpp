#include "sealkit/openssl_provider.hpp"
#include <climits>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace sealkit {

// ── Key material ──────────────────────────────────────────────────────────────

namespace {

class OpenSslAesGcmKey : public ProviderKey {
public:
    explicit OpenSslAesGcmKey(const std::vector<uint8_t>& raw)
        : material_(raw), algorithm_("AES-GCM") {}

    ~OpenSslAesGcmKey() override {
        if (!material_.empty())
            OPENSSL_cleanse(material_.data(), material_.size());
    }

    const std::string& algorithm() const override { return algorithm_; }
    size_t size_bits() const override { return material_.size() * 8; }

    const uint8_t* data() const { return material_.data(); }
    size_t size() const { return material_.size(); }

private:
    std::vector<uint8_t> material_;
    std::string          algorithm_;
};

const EVP_CIPHER* gcm_cipher_for(size_t key_len) {
    switch (key_len) {
        case 16: return EVP_aes_128_gcm();
        case 24: return EVP_aes_192_gcm();
        case 32: return EVP_aes_256_gcm();
        default: return nullptr;
    }
}

bool legal_tag_bits(int tag_bits) {
    return tag_bits >= 96 && tag_bits <= 128 && tag_bits % 8 == 0;
}

Error provider_error(const std::string& what) {
    return make_error(ErrorKind::ProviderFailure, what);
}

// Shared checks for aead_encrypt / aead_decrypt.
Result<const OpenSslAesGcmKey*> check_aead_args(const ProviderKey& key,
                                                const std::vector<uint8_t>& iv,
                                                const std::optional<std::vector<uint8_t>>& aad,
                                                int tag_bits,
                                                size_t data_len)
{
    const auto* k = dynamic_cast<const OpenSslAesGcmKey*>(&key);
    if (!k)
        return provider_error("key was not imported by this provider");
    if (!legal_tag_bits(tag_bits))
        return provider_error("AES-GCM tag length must be 96..128 bits in steps of 8, got " +
                              std::to_string(tag_bits));
    if (iv.empty() || iv.size() > INT_MAX)
        return provider_error("AES-GCM nonce length out of range");
    if (data_len > INT_MAX || (aad && aad->size() > INT_MAX))
        return provider_error("AES-GCM input too large");
    return k;
}

} // namespace

// ── Random ────────────────────────────────────────────────────────────────────

Result<std::vector<uint8_t>> OpenSslProvider::random_bytes(size_t len) const {
    if (len > INT_MAX)
        return provider_error("RAND_bytes request too large");
    std::vector<uint8_t> out(len);
    if (len > 0 && RAND_bytes(out.data(), static_cast<int>(len)) != 1)
        return provider_error("RAND_bytes failed");
    return out;
}

// ── Key import ────────────────────────────────────────────────────────────────

Result<std::unique_ptr<ProviderKey>> OpenSslProvider::import_raw_key(
    const std::string& algorithm,
    const std::vector<uint8_t>& raw) const
{
    if (algorithm != "AES-GCM")
        return provider_error("unsupported key algorithm: " + algorithm);
    if (!gcm_cipher_for(raw.size()))
        return provider_error("AES-GCM key must be 16, 24 or 32 bytes");
    std::unique_ptr<ProviderKey> key = std::make_unique<OpenSslAesGcmKey>(raw);
    return std::move(key);
}

// ── AES-GCM ───────────────────────────────────────────────────────────────────

Result<std::vector<uint8_t>> OpenSslProvider::aead_encrypt(
    const ProviderKey& key,
    const std::vector<uint8_t>& iv,
    const std::optional<std::vector<uint8_t>>& aad,
    int tag_bits,
    const std::vector<uint8_t>& plaintext) const
{
    auto checked = check_aead_args(key, iv, aad, tag_bits, plaintext.size());
    if (!checked)
        return checked.error();
    const OpenSslAesGcmKey* k = checked.value();
    const int tag_len = tag_bits / 8;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return provider_error("EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_EncryptInit_ex(ctx, gcm_cipher_for(k->size()), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, k->data(), iv.data()) != 1) {
        cleanup(); return provider_error("AES-GCM encrypt init failed");
    }

    int len = 0;
    if (aad && !aad->empty()) {
        if (EVP_EncryptUpdate(ctx, nullptr, &len,
                              aad->data(), static_cast<int>(aad->size())) != 1) {
            cleanup(); return provider_error("AES-GCM EncryptUpdate (aad) failed");
        }
    }

    std::vector<uint8_t> out(plaintext.size() + static_cast<size_t>(tag_len));
    len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, out.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            cleanup(); return provider_error("AES-GCM EncryptUpdate failed");
        }
    }
    int flen = 0;
    if (EVP_EncryptFinal_ex(ctx, out.data() + len, &flen) != 1) {
        cleanup(); return provider_error("AES-GCM EncryptFinal failed");
    }
    size_t ct_len = static_cast<size_t>(len + flen);

    // Tag goes straight after the ciphertext
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, tag_len, out.data() + ct_len) != 1) {
        cleanup(); return provider_error("AES-GCM GET_TAG failed");
    }
    cleanup();

    out.resize(ct_len + static_cast<size_t>(tag_len));
    return out;
}

Result<std::vector<uint8_t>> OpenSslProvider::aead_decrypt(
    const ProviderKey& key,
    const std::vector<uint8_t>& iv,
    const std::optional<std::vector<uint8_t>>& aad,
    int tag_bits,
    const std::vector<uint8_t>& ciphertext) const
{
    auto checked = check_aead_args(key, iv, aad, tag_bits, ciphertext.size());
    if (!checked)
        return checked.error();
    const OpenSslAesGcmKey* k = checked.value();
    const size_t tag_len = static_cast<size_t>(tag_bits / 8);

    if (ciphertext.size() < tag_len)
        return make_error(ErrorKind::AuthenticationFailure, "AES-GCM authentication failed");

    const uint8_t* ct  = ciphertext.data();
    size_t ct_len      = ciphertext.size() - tag_len;
    const uint8_t* tag = ciphertext.data() + ct_len;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return provider_error("EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_DecryptInit_ex(ctx, gcm_cipher_for(k->size()), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, k->data(), iv.data()) != 1) {
        cleanup(); return provider_error("AES-GCM decrypt init failed");
    }

    int len = 0;
    if (aad && !aad->empty()) {
        if (EVP_DecryptUpdate(ctx, nullptr, &len,
                              aad->data(), static_cast<int>(aad->size())) != 1) {
            cleanup(); return provider_error("AES-GCM DecryptUpdate (aad) failed");
        }
    }

    std::vector<uint8_t> pt(ct_len);
    len = 0;
    if (ct_len > 0) {
        if (EVP_DecryptUpdate(ctx, pt.data(), &len, ct, static_cast<int>(ct_len)) != 1) {
            cleanup(); return provider_error("AES-GCM DecryptUpdate failed");
        }
    }

    // Set expected tag before finalising
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_len),
                            const_cast<uint8_t*>(tag)) != 1) {
        cleanup(); return provider_error("AES-GCM SET_TAG failed");
    }

    int flen = 0;
    int rc = EVP_DecryptFinal_ex(ctx, pt.data() + len, &flen);
    cleanup();

    if (rc != 1) {
        OPENSSL_cleanse(pt.data(), pt.size());
        return make_error(ErrorKind::AuthenticationFailure, "AES-GCM authentication failed");
    }

    pt.resize(static_cast<size_t>(len + flen));
    return pt;
}

// ── PBKDF2 ────────────────────────────────────────────────────────────────────

Result<std::vector<uint8_t>> OpenSslProvider::derive_bits(
    const std::string& algorithm,
    const std::string& hash,
    const std::vector<uint8_t>& password,
    const std::vector<uint8_t>& salt,
    uint32_t iterations,
    size_t out_bits) const
{
    if (algorithm != "PBKDF2")
        return provider_error("unsupported derivation algorithm: " + algorithm);
    if (hash != "SHA-256")
        return provider_error("unsupported PBKDF2 hash: " + hash);
    if (iterations < 1 || iterations > INT_MAX)
        return provider_error("PBKDF2 iteration count out of range");
    if (out_bits == 0 || out_bits % 8 != 0 || out_bits / 8 > INT_MAX)
        return provider_error("PBKDF2 output length must be a positive multiple of 8 bits");
    if (password.size() > INT_MAX || salt.size() > INT_MAX)
        return provider_error("PBKDF2 input too large");

    std::vector<uint8_t> key(out_bits / 8);
    int rc = PKCS5_PBKDF2_HMAC(
        reinterpret_cast<const char*>(password.data()), static_cast<int>(password.size()),
        salt.data(), static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha256(),
        static_cast<int>(key.size()), key.data()
    );
    if (rc != 1)
        return provider_error("PBKDF2 derivation failed");
    return key;
}

} // namespace sealkit
