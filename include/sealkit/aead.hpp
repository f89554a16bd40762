#pragma once
#include "sealkit/keys.hpp"
#include "sealkit/provider.hpp"
#include "sealkit/result.hpp"
#include <cstdint>
#include <optional>
#include <vector>

// AES-256-GCM encrypt/decrypt over whole buffers.
// Nonce is 12 bytes (96-bit, GCM standard).
// Tag is 96..128 bits in steps of 8, appended to the ciphertext.

static constexpr size_t SEALKIT_IV_LEN           = 12;
static constexpr int    SEALKIT_DEFAULT_TAG_BITS = 128;

namespace sealkit {

struct EncryptOptions {
    std::optional<std::vector<uint8_t>> iv;    // generated when absent
    std::optional<std::vector<uint8_t>> aad;   // authenticated, never returned
    int tag_bits = SEALKIT_DEFAULT_TAG_BITS;
};

struct DecryptOptions {
    std::optional<std::vector<uint8_t>> aad;
    int tag_bits = SEALKIT_DEFAULT_TAG_BITS;
};

struct EncryptionResult {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;           // ciphertext || tag
};

// True for 96, 104, 112, 120 and 128.
bool is_valid_tag_bits(int tag_bits);

class CipherEngine {
public:
    explicit CipherEngine(const CryptoProvider& provider) : provider_(provider) {}

    Result<std::vector<uint8_t>> random_iv() const;

    Result<EncryptionResult> encrypt(const Key& key,
                                     const std::vector<uint8_t>& plaintext,
                                     const EncryptOptions& opts = {}) const;

    // Wrong key, wrong iv, wrong aad, wrong tag length and tampering all
    // report the same AuthenticationFailure.
    Result<std::vector<uint8_t>> decrypt(const Key& key,
                                         const std::vector<uint8_t>& iv,
                                         const std::vector<uint8_t>& ciphertext,
                                         const DecryptOptions& opts = {}) const;

private:
    const CryptoProvider& provider_;
};

} // namespace sealkit
