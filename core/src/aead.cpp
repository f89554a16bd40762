#include "sealkit/aead.hpp"
#include <string>

namespace sealkit {

bool is_valid_tag_bits(int tag_bits) {
    switch (tag_bits) {
        case 96: case 104: case 112: case 120: case 128:
            return true;
        default:
            return false;
    }
}

static Error bad_iv(size_t got) {
    return make_error(ErrorKind::InvalidIvLength,
                      "AES-GCM IV must be 12 bytes, got " + std::to_string(got));
}

static Error bad_tag(int got) {
    return make_error(ErrorKind::InvalidTagLength,
                      "AES-GCM tag length must be one of 96, 104, 112, 120, 128 bits, got " +
                      std::to_string(got));
}

static Error empty_key() {
    return make_error(ErrorKind::InvalidKeyLength, "key is empty (moved from)");
}

Result<std::vector<uint8_t>> CipherEngine::random_iv() const {
    return provider_.random_bytes(SEALKIT_IV_LEN);
}

Result<EncryptionResult> CipherEngine::encrypt(const Key& key,
                                               const std::vector<uint8_t>& plaintext,
                                               const EncryptOptions& opts) const
{
    // Everything is validated here, before the provider is touched
    if (!key.valid())
        return empty_key();
    if (opts.iv && opts.iv->size() != SEALKIT_IV_LEN)
        return bad_iv(opts.iv->size());
    if (!is_valid_tag_bits(opts.tag_bits))
        return bad_tag(opts.tag_bits);

    EncryptionResult out;
    if (opts.iv) {
        out.iv = *opts.iv;
    } else {
        auto iv = random_iv();
        if (!iv)
            return iv.error();
        out.iv = std::move(iv).value();
    }

    auto ct = provider_.aead_encrypt(key.provider_key(), out.iv, opts.aad,
                                     opts.tag_bits, plaintext);
    if (!ct)
        return ct.error();
    out.ciphertext = std::move(ct).value();
    return out;
}

Result<std::vector<uint8_t>> CipherEngine::decrypt(const Key& key,
                                                   const std::vector<uint8_t>& iv,
                                                   const std::vector<uint8_t>& ciphertext,
                                                   const DecryptOptions& opts) const
{
    if (!key.valid())
        return empty_key();
    if (iv.size() != SEALKIT_IV_LEN)
        return bad_iv(iv.size());
    if (!is_valid_tag_bits(opts.tag_bits))
        return bad_tag(opts.tag_bits);
    if (ciphertext.size() < static_cast<size_t>(opts.tag_bits / 8))
        return make_error(ErrorKind::AuthenticationFailure, "AES-GCM authentication failed");

    auto pt = provider_.aead_decrypt(key.provider_key(), iv, opts.aad,
                                     opts.tag_bits, ciphertext);
    if (!pt && pt.kind() != ErrorKind::AuthenticationFailure) {
        // Decrypt has exactly one failure signal past parameter checks
        return make_error(ErrorKind::AuthenticationFailure, "AES-GCM authentication failed");
    }
    return pt;
}

} // namespace sealkit
