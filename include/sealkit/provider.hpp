#pragma once
#include "sealkit/result.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Capability interface for the cryptographic engine sealkit delegates to.
// A provider is constructed once by the application and handed to
// KeyAdmission / CipherEngine; sealkit never looks one up globally.
// Implementations must be safe to call from several threads at once.

namespace sealkit {

// Key material owned by a provider. Only the provider that created it can
// use it; everyone else sees an algorithm name and a size.
class ProviderKey {
public:
    virtual ~ProviderKey() = default;

    virtual const std::string& algorithm() const = 0;
    virtual size_t             size_bits() const = 0;
};

class CryptoProvider {
public:
    CryptoProvider() = default;
    CryptoProvider(const CryptoProvider&) = delete;
    CryptoProvider& operator=(const CryptoProvider&) = delete;
    virtual ~CryptoProvider() = default;

    virtual Result<std::vector<uint8_t>> random_bytes(size_t len) const = 0;

    // algorithm: "AES-GCM"
    virtual Result<std::unique_ptr<ProviderKey>> import_raw_key(
        const std::string& algorithm,
        const std::vector<uint8_t>& raw) const = 0;

    // Output: ciphertext || tag(tag_bits / 8)
    virtual Result<std::vector<uint8_t>> aead_encrypt(
        const ProviderKey& key,
        const std::vector<uint8_t>& iv,
        const std::optional<std::vector<uint8_t>>& aad,
        int tag_bits,
        const std::vector<uint8_t>& plaintext) const = 0;

    // Input: ciphertext || tag(tag_bits / 8)
    virtual Result<std::vector<uint8_t>> aead_decrypt(
        const ProviderKey& key,
        const std::vector<uint8_t>& iv,
        const std::optional<std::vector<uint8_t>>& aad,
        int tag_bits,
        const std::vector<uint8_t>& ciphertext) const = 0;

    // algorithm: "PBKDF2", hash: "SHA-256"
    virtual Result<std::vector<uint8_t>> derive_bits(
        const std::string& algorithm,
        const std::string& hash,
        const std::vector<uint8_t>& password,
        const std::vector<uint8_t>& salt,
        uint32_t iterations,
        size_t out_bits) const = 0;
};

} // namespace sealkit
