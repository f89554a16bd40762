#pragma once
#include "sealkit/provider.hpp"

// CryptoProvider backed by OpenSSL 3 libcrypto (EVP, no deprecated APIs).
// Stateless: every call allocates and frees its own EVP context.

namespace sealkit {

class OpenSslProvider : public CryptoProvider {
public:
    Result<std::vector<uint8_t>> random_bytes(size_t len) const override;

    Result<std::unique_ptr<ProviderKey>> import_raw_key(
        const std::string& algorithm,
        const std::vector<uint8_t>& raw) const override;

    Result<std::vector<uint8_t>> aead_encrypt(
        const ProviderKey& key,
        const std::vector<uint8_t>& iv,
        const std::optional<std::vector<uint8_t>>& aad,
        int tag_bits,
        const std::vector<uint8_t>& plaintext) const override;

    Result<std::vector<uint8_t>> aead_decrypt(
        const ProviderKey& key,
        const std::vector<uint8_t>& iv,
        const std::optional<std::vector<uint8_t>>& aad,
        int tag_bits,
        const std::vector<uint8_t>& ciphertext) const override;

    Result<std::vector<uint8_t>> derive_bits(
        const std::string& algorithm,
        const std::string& hash,
        const std::vector<uint8_t>& password,
        const std::vector<uint8_t>& salt,
        uint32_t iterations,
        size_t out_bits) const override;
};

} // namespace sealkit
