#include "sealkit/aead.hpp"
#include "sealkit/keys.hpp"
#include "sealkit/openssl_provider.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

// ── Recording provider ────────────────────────────────────────────────────────
// Counts calls and returns canned results, so tests can see exactly what
// reaches the provider.

class FakeKey : public sealkit::ProviderKey {
public:
    const std::string& algorithm() const override { return alg_; }
    size_t size_bits() const override { return 256; }
private:
    std::string alg_ = "AES-GCM";
};

class RecordingProvider : public sealkit::CryptoProvider {
public:
    mutable int random_calls  = 0;
    mutable int import_calls  = 0;
    mutable int encrypt_calls = 0;
    mutable int decrypt_calls = 0;
    mutable int derive_calls  = 0;

    mutable std::string last_algorithm;
    mutable std::string last_hash;
    mutable uint32_t    last_iterations = 0;
    mutable size_t      last_out_bits   = 0;
    mutable int         last_tag_bits   = 0;

    bool fail_random  = false;
    bool fail_decrypt = false;   // with ProviderFailure

    int total_calls() const {
        return random_calls + import_calls + encrypt_calls + decrypt_calls + derive_calls;
    }

    sealkit::Result<std::vector<uint8_t>> random_bytes(size_t len) const override {
        ++random_calls;
        if (fail_random)
            return sealkit::make_error(sealkit::ErrorKind::ProviderFailure, "no entropy");
        return std::vector<uint8_t>(len, 0x24);
    }

    sealkit::Result<std::unique_ptr<sealkit::ProviderKey>> import_raw_key(
        const std::string& algorithm, const std::vector<uint8_t>&) const override
    {
        ++import_calls;
        last_algorithm = algorithm;
        std::unique_ptr<sealkit::ProviderKey> key = std::make_unique<FakeKey>();
        return std::move(key);
    }

    sealkit::Result<std::vector<uint8_t>> aead_encrypt(
        const sealkit::ProviderKey&, const std::vector<uint8_t>&,
        const std::optional<std::vector<uint8_t>>&, int tag_bits,
        const std::vector<uint8_t>& plaintext) const override
    {
        ++encrypt_calls;
        last_tag_bits = tag_bits;
        std::vector<uint8_t> out(plaintext);
        out.resize(plaintext.size() + static_cast<size_t>(tag_bits / 8), 0xEE);
        return out;
    }

    sealkit::Result<std::vector<uint8_t>> aead_decrypt(
        const sealkit::ProviderKey&, const std::vector<uint8_t>&,
        const std::optional<std::vector<uint8_t>>&, int tag_bits,
        const std::vector<uint8_t>& ciphertext) const override
    {
        ++decrypt_calls;
        last_tag_bits = tag_bits;
        if (fail_decrypt)
            return sealkit::make_error(sealkit::ErrorKind::ProviderFailure, "engine exploded");
        return std::vector<uint8_t>(ciphertext.begin(),
                                    ciphertext.end() - tag_bits / 8);
    }

    sealkit::Result<std::vector<uint8_t>> derive_bits(
        const std::string& algorithm, const std::string& hash,
        const std::vector<uint8_t>&, const std::vector<uint8_t>&,
        uint32_t iterations, size_t out_bits) const override
    {
        ++derive_calls;
        last_algorithm  = algorithm;
        last_hash       = hash;
        last_iterations = iterations;
        last_out_bits   = out_bits;
        return std::vector<uint8_t>(out_bits / 8, 0x99);
    }
};

static bool test_validation_before_provider() {
    bool ok = true;
    RecordingProvider fake;
    sealkit::KeyAdmission admission(fake);
    sealkit::CipherEngine engine(fake);

    auto bad_key = admission.import_key(std::vector<uint8_t>(16, 0));
    ok &= check(!bad_key.ok() && bad_key.kind() == sealkit::ErrorKind::InvalidKeyLength,
                "16-byte key accepted");
    ok &= check(fake.total_calls() == 0, "provider called for a bad key length");

    auto key = admission.import_key(std::vector<uint8_t>(32, 0));
    ok &= check(key.ok() && fake.import_calls == 1, "good key not imported once");
    ok &= check(fake.last_algorithm == "AES-GCM", "import algorithm name");
    if (!key) return false;

    int before = fake.total_calls();

    sealkit::EncryptOptions bad_iv;
    bad_iv.iv = std::vector<uint8_t>(16, 0);
    auto e1 = engine.encrypt(key.value(), {1, 2, 3}, bad_iv);
    ok &= check(!e1.ok() && e1.kind() == sealkit::ErrorKind::InvalidIvLength, "16-byte IV accepted");

    sealkit::EncryptOptions bad_tag;
    bad_tag.tag_bits = 64;
    auto e2 = engine.encrypt(key.value(), {1, 2, 3}, bad_tag);
    ok &= check(!e2.ok() && e2.kind() == sealkit::ErrorKind::InvalidTagLength, "64-bit tag accepted");

    sealkit::DecryptOptions bad_dtag;
    bad_dtag.tag_bits = 32;
    auto d1 = engine.decrypt(key.value(), std::vector<uint8_t>(12, 0), std::vector<uint8_t>(20, 0), bad_dtag);
    ok &= check(!d1.ok() && d1.kind() == sealkit::ErrorKind::InvalidTagLength, "32-bit tag accepted");

    auto d2 = engine.decrypt(key.value(), std::vector<uint8_t>(8, 0), std::vector<uint8_t>(20, 0));
    ok &= check(!d2.ok() && d2.kind() == sealkit::ErrorKind::InvalidIvLength, "8-byte IV accepted");

    auto d3 = engine.decrypt(key.value(), std::vector<uint8_t>(12, 0), std::vector<uint8_t>(10, 0));
    ok &= check(!d3.ok() && d3.kind() == sealkit::ErrorKind::AuthenticationFailure,
                "ciphertext shorter than tag accepted");

    ok &= check(fake.total_calls() == before, "provider called for invalid parameters");
    return ok;
}

static bool test_forwarding() {
    bool ok = true;
    RecordingProvider fake;
    sealkit::KeyAdmission admission(fake);
    sealkit::CipherEngine engine(fake);

    auto key = admission.generate_key();
    ok &= check(key.ok() && fake.random_calls == 1 && fake.import_calls == 1,
                "generate_key should draw randomness once and import once");
    if (!key) return false;

    // No IV given: exactly one random draw of 12 bytes, used as the IV
    auto sealed = engine.encrypt(key.value(), {1, 2, 3});
    ok &= check(sealed.ok() && fake.random_calls == 2, "IV not drawn from the provider");
    if (sealed) {
        ok &= check(sealed.value().iv == std::vector<uint8_t>(12, 0x24), "provider IV not used");
        ok &= check(sealed.value().ciphertext.size() == 3 + 16, "tag not appended");
    }

    // Caller IV: no random draw
    sealkit::EncryptOptions eo;
    eo.iv = std::vector<uint8_t>(12, 0x01);
    eo.tag_bits = 112;
    auto sealed2 = engine.encrypt(key.value(), {1, 2, 3}, eo);
    ok &= check(sealed2.ok() && fake.random_calls == 2, "random drawn despite caller IV");
    ok &= check(fake.last_tag_bits == 112, "tag bits not forwarded");
    if (sealed2)
        ok &= check(sealed2.value().iv == *eo.iv, "caller IV not echoed");

    // Derivation parameters
    auto derived = admission.derive_key_from_password("pw", {1, 2, 3, 4}, 4242);
    ok &= check(derived.ok() && derived.value().size() == 32, "derive output size");
    ok &= check(fake.last_algorithm == "PBKDF2", "derive algorithm");
    ok &= check(fake.last_hash == "SHA-256", "derive hash");
    ok &= check(fake.last_iterations == 4242, "derive iterations");
    ok &= check(fake.last_out_bits == 256, "derive output bits");

    auto derived_default = admission.derive_key_from_password("pw", {1, 2, 3, 4});
    ok &= check(derived_default.ok() && fake.last_iterations == SEALKIT_PBKDF2_ITERATIONS,
                "default iteration count");
    return ok;
}

static bool test_provider_failures() {
    bool ok = true;
    RecordingProvider fake;
    sealkit::KeyAdmission admission(fake);
    sealkit::CipherEngine engine(fake);

    auto key = admission.import_key(std::vector<uint8_t>(32, 0));
    if (!key) return fail("import failed");

    fake.fail_random = true;
    auto g = admission.generate_key();
    ok &= check(!g.ok() && g.kind() == sealkit::ErrorKind::ProviderFailure,
                "random failure not surfaced by generate_key");
    auto e = engine.encrypt(key.value(), {1});
    ok &= check(!e.ok() && e.kind() == sealkit::ErrorKind::ProviderFailure,
                "random failure not surfaced by encrypt");
    fake.fail_random = false;

    fake.fail_decrypt = true;
    auto d = engine.decrypt(key.value(), std::vector<uint8_t>(12, 0), std::vector<uint8_t>(16, 0));
    ok &= check(!d.ok() && d.kind() == sealkit::ErrorKind::AuthenticationFailure,
                "provider decrypt error should surface as AuthenticationFailure");
    return ok;
}

static bool test_openssl_provider() {
    bool ok = true;
    sealkit::OpenSslProvider provider;

    auto r = provider.random_bytes(64);
    ok &= check(r.ok() && r.value().size() == 64, "random_bytes(64)");
    auto r0 = provider.random_bytes(0);
    ok &= check(r0.ok() && r0.value().empty(), "random_bytes(0)");

    auto unknown = provider.import_raw_key("ChaCha20", std::vector<uint8_t>(32, 0));
    ok &= check(!unknown.ok() && unknown.kind() == sealkit::ErrorKind::ProviderFailure,
                "unknown algorithm accepted");
    auto odd = provider.import_raw_key("AES-GCM", std::vector<uint8_t>(20, 0));
    ok &= check(!odd.ok() && odd.kind() == sealkit::ErrorKind::ProviderFailure,
                "20-byte AES key accepted by provider");

    // The provider itself also takes AES-128-GCM keys
    auto k128 = provider.import_raw_key("AES-GCM", std::vector<uint8_t>(16, 0));
    ok &= check(k128.ok() && k128.value()->size_bits() == 128, "AES-128 key import");
    if (k128) {
        // GCM test case 1: zero key and IV, empty message
        auto ct = provider.aead_encrypt(*k128.value(), std::vector<uint8_t>(12, 0),
                                        std::nullopt, 128, {});
        const std::vector<uint8_t> want = {0x58, 0xe2, 0xfc, 0xce, 0xfa, 0x7e, 0x30, 0x61,
                                           0x36, 0x7f, 0x1d, 0x57, 0xa4, 0xe7, 0x45, 0x5a};
        ok &= check(ct.ok() && ct.value() == want, "AES-128-GCM empty-message tag");

        auto bad = provider.aead_encrypt(*k128.value(), std::vector<uint8_t>(12, 0),
                                         std::nullopt, 40, {});
        ok &= check(!bad.ok() && bad.kind() == sealkit::ErrorKind::ProviderFailure,
                    "provider accepted a 40-bit tag");
    }

    FakeKey foreign;
    auto wrong = provider.aead_encrypt(foreign, std::vector<uint8_t>(12, 0), std::nullopt, 128, {});
    ok &= check(!wrong.ok() && wrong.kind() == sealkit::ErrorKind::ProviderFailure,
                "provider used a key it did not create");

    auto kdf_bad = provider.derive_bits("scrypt", "SHA-256", {1}, {1}, 1, 256);
    ok &= check(!kdf_bad.ok() && kdf_bad.kind() == sealkit::ErrorKind::ProviderFailure,
                "unknown KDF accepted");
    auto hash_bad = provider.derive_bits("PBKDF2", "MD5", {1}, {1}, 1, 256);
    ok &= check(!hash_bad.ok() && hash_bad.kind() == sealkit::ErrorKind::ProviderFailure,
                "unknown hash accepted");
    return ok;
}

int main() {
    bool ok = true;
    ok &= test_validation_before_provider();
    ok &= test_forwarding();
    ok &= test_provider_failures();
    ok &= test_openssl_provider();

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
