#pragma once
#include "sealkit/provider.hpp"
#include "sealkit/result.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

static constexpr size_t   SEALKIT_KEY_LEN            = 32;      // AES-256
static constexpr size_t   SEALKIT_DERIVED_KEY_BITS   = 256;
static constexpr uint32_t SEALKIT_PBKDF2_ITERATIONS  = 150000;

namespace sealkit {

// Admitted AES-256-GCM key. Move-only; the only way to get one is through
// KeyAdmission, so holding a Key means the 32-byte check already passed.
// A moved-from Key is empty: valid() is false and it must not be used
// for anything other than assignment or destruction.
class Key {
public:
    Key(Key&&) = default;
    Key& operator=(Key&&) = default;
    Key(const Key&) = delete;
    Key& operator=(const Key&) = delete;

    bool valid() const { return handle_ != nullptr; }
    const ProviderKey& provider_key() const { return *handle_; }
    size_t size_bits() const { return handle_->size_bits(); }

private:
    friend class KeyAdmission;
    explicit Key(std::unique_ptr<ProviderKey> handle) : handle_(std::move(handle)) {}

    std::unique_ptr<ProviderKey> handle_;
};

class KeyAdmission {
public:
    explicit KeyAdmission(const CryptoProvider& provider) : provider_(provider) {}

    // Fails with InvalidKeyLength unless raw is exactly 32 bytes. The bytes
    // are copied before the provider sees them.
    Result<Key> import_key(const std::vector<uint8_t>& raw) const;

    // 32 fresh provider-random bytes, admitted through import_key.
    Result<Key> generate_key() const;

    // PBKDF2-HMAC-SHA256, 256-bit output. Deterministic for identical
    // (password, salt, iterations). Salt and iteration count are forwarded
    // as given; choosing them well is the caller's job.
    Result<std::vector<uint8_t>> derive_key_from_password(
        const std::string& password,
        const std::vector<uint8_t>& salt,
        uint32_t iterations = SEALKIT_PBKDF2_ITERATIONS) const;

private:
    const CryptoProvider& provider_;
};

} // namespace sealkit
