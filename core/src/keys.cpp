#include "sealkit/keys.hpp"
#include "sealkit/encoding.hpp"
#include <openssl/crypto.h>

namespace sealkit {

Result<Key> KeyAdmission::import_key(const std::vector<uint8_t>& raw) const {
    if (raw.size() != SEALKIT_KEY_LEN)
        return make_error(ErrorKind::InvalidKeyLength,
                          "AES-GCM requires a 32-byte key (AES-256), got " +
                          std::to_string(raw.size()) + " bytes");

    // Private copy, so the caller's buffer can change without touching
    // what the provider admitted.
    std::vector<uint8_t> key_data(raw);
    auto imported = provider_.import_raw_key("AES-GCM", key_data);
    OPENSSL_cleanse(key_data.data(), key_data.size());
    if (!imported)
        return imported.error();

    return Key(std::move(imported).value());
}

Result<Key> KeyAdmission::generate_key() const {
    auto raw = provider_.random_bytes(SEALKIT_KEY_LEN);
    if (!raw)
        return raw.error();
    auto key = import_key(raw.value());
    OPENSSL_cleanse(raw.value().data(), raw.value().size());
    return key;
}

Result<std::vector<uint8_t>> KeyAdmission::derive_key_from_password(
    const std::string& password,
    const std::vector<uint8_t>& salt,
    uint32_t iterations) const
{
    std::vector<uint8_t> pw = encoding::utf8_to_bytes(password);
    std::vector<uint8_t> salt_copy(salt);

    auto bits = provider_.derive_bits("PBKDF2", "SHA-256", pw, salt_copy,
                                      iterations, SEALKIT_DERIVED_KEY_BITS);
    if (!pw.empty())
        OPENSSL_cleanse(pw.data(), pw.size());
    return bits;
}

} // namespace sealkit
