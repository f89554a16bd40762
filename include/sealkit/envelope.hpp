#pragma once
#include "sealkit/aead.hpp"
#include "sealkit/result.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Self-describing sealed message. Carries everything a receiver needs
// besides the key (or password) and the associated data, which is never
// stored here.

namespace sealkit {

static constexpr char kEnvelopeAlg[] = "AES-256-GCM";

struct Envelope {
    int version = 1;
    std::string alg = kEnvelopeAlg;
    int tag_bits = SEALKIT_DEFAULT_TAG_BITS;
    std::vector<uint8_t> salt;        // PBKDF2 salt; empty in raw-key mode
    uint32_t iterations = 0;          // PBKDF2 iterations; 0 in raw-key mode
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;  // ciphertext || tag

    bool password_mode() const { return !salt.empty(); }
};

// ── YAML ──────────────────────────────────────────────────────────────────────

std::string emit_envelope_yaml(const Envelope& env);
Result<Envelope> parse_envelope_yaml(const std::string& text);

// ── msgpack ───────────────────────────────────────────────────────────────────

namespace envelope_mp {
    std::vector<uint8_t> pack(const Envelope& env);
    Result<Envelope>     unpack(const std::vector<uint8_t>& data);
}

// ── Format detection ──────────────────────────────────────────────────────────

enum class InputFormat { Token, Yaml, Msgpack, Unknown };

// msgpack: fixmap / map16 / map32 first byte.
// Token:   after trimming ASCII whitespace, only Base64URL characters and
//          exactly one '.' (a token may itself start with '-').
// YAML:    starts with the "---" document marker.
InputFormat detect_format(const std::vector<uint8_t>& data);

const char* input_format_name(InputFormat format);

// YAML or msgpack per detect_format. Tokens and anything else are
// InvalidEncoding.
Result<Envelope> load_envelope(const std::vector<uint8_t>& data);

// Shared field checks run after either decoder.
Result<Envelope> validate_envelope(Envelope env);

} // namespace sealkit
