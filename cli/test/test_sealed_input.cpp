#include "sealed_input.hpp"
#include "sealkit/aead.hpp"
#include "sealkit/envelope.hpp"
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

static std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

int main() {
    bool ok = true;

    sealkit::OpenSslProvider provider;
    sealkit::KeyAdmission admission(provider);
    sealkit::CipherEngine engine(provider);

    auto key_r = admission.generate_key();
    if (!key_r) {
        std::cerr << "FAIL: generate_key: " << key_r.error().message << "\n";
        return 1;
    }
    const sealkit::Key key = std::move(key_r).value();
    const std::vector<uint8_t> msg = bytes("tokens starting with a dash");

    // ── Tokens whose first character is '-' ──────────────────────────────────
    // IV first bytes 0xF8..0xFB all encode to a leading '-'
    for (uint8_t lead : {0xF8, 0xF9, 0xFA, 0xFB}) {
        sealkit::EncryptOptions eo;
        eo.iv = std::vector<uint8_t>(12, 0x00);
        (*eo.iv)[0] = lead;
        auto sealed = engine.encrypt(key, msg, eo);
        if (!sealed) {
            ok &= fail("encrypt failed");
            continue;
        }
        std::string token = sealkit::pack_token(sealed.value()) + "\n";
        ok &= check(token[0] == '-', "IV did not give a leading '-'");

        auto in = read_sealed_input(bytes(token), 128);
        ok &= check(in.ok(), "token with leading '-' rejected: " +
                    (in.ok() ? std::string() : in.error().message));
        if (!in) continue;
        ok &= check(in.value().format == sealkit::InputFormat::Token, "not read as a token");
        ok &= check(key_mode_mismatch(in.value(), false).empty(), "raw key refused for a token");

        const auto& env = in.value().env;
        sealkit::DecryptOptions dopts;
        dopts.tag_bits = env.tag_bits;
        auto pt = engine.decrypt(key, env.iv, env.ciphertext, dopts);
        ok &= check(pt.ok() && pt.value() == msg, "token with leading '-' did not decrypt");
    }

    // ── Tag bits precedence ──────────────────────────────────────────────────
    {
        sealkit::EncryptOptions eo;
        eo.tag_bits = 96;
        auto sealed = engine.encrypt(key, msg, eo);
        if (sealed) {
            // Token: the caller's tag length is used
            auto tok = read_sealed_input(bytes(sealkit::pack_token(sealed.value())), 96);
            ok &= check(tok.ok() && tok.value().env.tag_bits == 96, "token tag bits not taken from caller");

            // Envelope: its own tag-bits wins over the caller's
            sealkit::Envelope env;
            env.tag_bits   = 96;
            env.iv         = sealed.value().iv;
            env.ciphertext = sealed.value().ciphertext;

            auto yaml = read_sealed_input(bytes(sealkit::emit_envelope_yaml(env)), 128);
            ok &= check(yaml.ok() && yaml.value().format == sealkit::InputFormat::Yaml,
                        "YAML envelope not detected");
            ok &= check(yaml.ok() && yaml.value().env.tag_bits == 96, "YAML envelope tag bits overridden");

            auto mp = read_sealed_input(sealkit::envelope_mp::pack(env), 128);
            ok &= check(mp.ok() && mp.value().format == sealkit::InputFormat::Msgpack,
                        "msgpack envelope not detected");
            ok &= check(mp.ok() && mp.value().env.tag_bits == 96, "msgpack envelope tag bits overridden");

            if (yaml) {
                sealkit::DecryptOptions dopts;
                dopts.tag_bits = yaml.value().env.tag_bits;
                auto pt = engine.decrypt(key, yaml.value().env.iv, yaml.value().env.ciphertext, dopts);
                ok &= check(pt.ok() && pt.value() == msg, "96-bit envelope did not decrypt");
            }
        } else {
            ok &= fail("encrypt with 96-bit tag failed");
        }
    }

    // ── Password vs raw-key mode ─────────────────────────────────────────────
    {
        sealkit::Envelope pw;
        pw.salt       = std::vector<uint8_t>(16, 0x01);
        pw.iterations = 1000;
        pw.iv         = std::vector<uint8_t>(12, 0x02);
        pw.ciphertext = std::vector<uint8_t>(20, 0x03);
        auto in = read_sealed_input(bytes(sealkit::emit_envelope_yaml(pw)), 128);
        ok &= check(in.ok(), "password envelope rejected");
        if (in) {
            ok &= check(key_mode_mismatch(in.value(), true).empty(), "password refused for password envelope");
            ok &= check(!key_mode_mismatch(in.value(), false).empty(), "raw key accepted for password envelope");
        }

        sealkit::EncryptionResult t;
        t.iv         = std::vector<uint8_t>(12, 0x04);
        t.ciphertext = std::vector<uint8_t>(20, 0x05);
        auto tok = read_sealed_input(bytes(sealkit::pack_token(t)), 128);
        ok &= check(tok.ok() && !key_mode_mismatch(tok.value(), true).empty(),
                    "password accepted for a token");
    }

    // ── Malformed input and exit codes ───────────────────────────────────────
    {
        auto junk = read_sealed_input(bytes("hello world"), 128);
        ok &= check(!junk.ok() && junk.kind() == sealkit::ErrorKind::InvalidEncoding, "free text accepted");
        ok &= check(!junk.ok() && exit_code_for(junk.kind()) == EXIT_IO, "malformed input is not an I/O exit");

        auto empty = read_sealed_input({}, 128);
        ok &= check(!empty.ok() && empty.kind() == sealkit::ErrorKind::InvalidEncoding, "empty input accepted");

        auto bad_yaml = read_sealed_input(bytes("---\nversion: 1\ntype: sealed\n"), 128);
        ok &= check(!bad_yaml.ok() && bad_yaml.kind() == sealkit::ErrorKind::InvalidEncoding,
                    "incomplete YAML envelope accepted");
    }

    ok &= check(exit_code_for(sealkit::ErrorKind::InvalidKeyLength) == EXIT_USAGE,      "InvalidKeyLength exit");
    ok &= check(exit_code_for(sealkit::ErrorKind::InvalidIvLength) == EXIT_USAGE,       "InvalidIvLength exit");
    ok &= check(exit_code_for(sealkit::ErrorKind::InvalidTagLength) == EXIT_USAGE,      "InvalidTagLength exit");
    ok &= check(exit_code_for(sealkit::ErrorKind::InvalidInputType) == EXIT_USAGE,      "InvalidInputType exit");
    ok &= check(exit_code_for(sealkit::ErrorKind::InvalidEncoding) == EXIT_IO,          "InvalidEncoding exit");
    ok &= check(exit_code_for(sealkit::ErrorKind::AuthenticationFailure) == EXIT_CRYPTO, "AuthenticationFailure exit");
    ok &= check(exit_code_for(sealkit::ErrorKind::ProviderFailure) == EXIT_CRYPTO,      "ProviderFailure exit");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
