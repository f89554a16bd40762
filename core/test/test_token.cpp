#include "sealkit/aead.hpp"
#include "sealkit/keys.hpp"
#include "sealkit/openssl_provider.hpp"
#include "sealkit/token.hpp"
#include <iostream>
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

static bool is_bad_token(const std::string& token) {
    auto r = sealkit::unpack_token(token);
    return !r.ok() && r.kind() == sealkit::ErrorKind::InvalidEncoding;
}

int main() {
    bool ok = true;

    // Fixed layout
    {
        sealkit::EncryptionResult sealed;
        sealed.iv         = std::vector<uint8_t>(12, 0x00);
        sealed.ciphertext = {0xFB, 0xFF, 0x01};
        std::string token = sealkit::pack_token(sealed);
        ok &= check(token == "AAAAAAAAAAAAAAAA.-_8B", "token layout: got " + token);

        auto back = sealkit::unpack_token(token);
        ok &= check(back.ok(), "unpack of packed token failed");
        if (back) {
            ok &= check(back.value().iv == sealed.iv, "iv mismatch");
            ok &= check(back.value().ciphertext == sealed.ciphertext, "ciphertext mismatch");
        }
    }

    // Real encryption travels through a token
    {
        sealkit::OpenSslProvider provider;
        sealkit::KeyAdmission admission(provider);
        sealkit::CipherEngine engine(provider);

        auto key = admission.generate_key();
        ok &= check(key.ok(), "generate_key failed");
        if (key) {
            std::vector<uint8_t> msg = {'h', 'e', 'l', 'l', 'o'};
            auto sealed = engine.encrypt(key.value(), msg);
            ok &= check(sealed.ok(), "encrypt failed");
            if (sealed) {
                std::string token = sealkit::pack_token(sealed.value());
                ok &= check(token.find_first_of("+/=") == std::string::npos,
                            "token is not URL-safe");
                auto back = sealkit::unpack_token(token);
                ok &= check(back.ok(), "unpack failed");
                if (back) {
                    auto pt = engine.decrypt(key.value(), back.value().iv, back.value().ciphertext);
                    ok &= check(pt.ok() && pt.value() == msg, "decrypt after token transport failed");
                }
            }
        }
    }

    // Malformed tokens
    ok &= check(is_bad_token(""),                          "empty token accepted");
    ok &= check(is_bad_token("AAAAAAAAAAAAAAAA"),          "token without '.' accepted");
    ok &= check(is_bad_token("AAAAAAAAAAAAAAAA.AA.AA"),    "token with two '.' accepted");
    ok &= check(is_bad_token(".AAAA"),                     "token with empty IV accepted");
    ok &= check(is_bad_token("AAAA%AAAAAAAAAAA.AAAA"),     "bad IV characters accepted");
    ok &= check(is_bad_token("AAAAAAAAAAAAAAAA.AA#A"),     "bad ciphertext characters accepted");
    ok &= check(is_bad_token("AAAAA.AAAA"),                "1 mod 4 IV field accepted");

    // Field lengths are not checked here; decrypt does that
    {
        auto r = sealkit::unpack_token("AAAA.");
        ok &= check(r.ok(), "short IV / empty ciphertext should parse");
        if (r) {
            ok &= check(r.value().iv.size() == 3, "short IV length");
            ok &= check(r.value().ciphertext.empty(), "empty ciphertext field");
        }
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
