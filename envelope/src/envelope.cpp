#include "sealkit/envelope.hpp"
#include <string>

namespace sealkit {

Result<Envelope> validate_envelope(Envelope env) {
    if (env.version != 1)
        return make_error(ErrorKind::InvalidEncoding,
                          "envelope: unsupported version " + std::to_string(env.version));
    if (env.alg != kEnvelopeAlg)
        return make_error(ErrorKind::InvalidEncoding,
                          "envelope: unsupported alg '" + env.alg + "'");
    if (!is_valid_tag_bits(env.tag_bits))
        return make_error(ErrorKind::InvalidEncoding,
                          "envelope: invalid tag-bits " + std::to_string(env.tag_bits));
    if (env.password_mode() && env.iterations == 0)
        return make_error(ErrorKind::InvalidEncoding, "envelope: salt present but iterations is 0");
    if (!env.password_mode() && env.iterations != 0)
        return make_error(ErrorKind::InvalidEncoding, "envelope: iterations present without salt");
    if (env.iv.size() != SEALKIT_IV_LEN)
        return make_error(ErrorKind::InvalidEncoding, "envelope: IV must be 12 bytes");
    if (env.ciphertext.size() < static_cast<size_t>(env.tag_bits / 8))
        return make_error(ErrorKind::InvalidEncoding, "envelope: ciphertext shorter than tag");
    return env;
}

// ── Format detection ──────────────────────────────────────────────────────────

static bool is_ascii_space(uint8_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool is_b64url_char(uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

InputFormat detect_format(const std::vector<uint8_t>& data) {
    if (data.empty())
        return InputFormat::Unknown;

    uint8_t first = data[0];
    if ((first >= 0x80 && first <= 0x8F) || first == 0xDE || first == 0xDF)
        return InputFormat::Msgpack;

    size_t b = 0, e = data.size();
    while (b < e && is_ascii_space(data[b]))     ++b;
    while (e > b && is_ascii_space(data[e - 1])) --e;
    if (b == e)
        return InputFormat::Unknown;

    // Token check runs before the YAML one: a token whose IV starts with
    // 0xF8..0xFB begins with '-'
    size_t dots = 0;
    bool token_chars = true;
    for (size_t i = b; i < e; ++i) {
        if (data[i] == '.') {
            ++dots;
        } else if (!is_b64url_char(data[i])) {
            token_chars = false;
            break;
        }
    }
    if (token_chars && dots == 1)
        return InputFormat::Token;

    if (e - b >= 3 && data[b] == '-' && data[b + 1] == '-' && data[b + 2] == '-')
        return InputFormat::Yaml;

    return InputFormat::Unknown;
}

const char* input_format_name(InputFormat format) {
    switch (format) {
        case InputFormat::Token:   return "token";
        case InputFormat::Yaml:    return "yaml";
        case InputFormat::Msgpack: return "msgpack";
        case InputFormat::Unknown: return "unknown";
    }
    return "unknown";
}

Result<Envelope> load_envelope(const std::vector<uint8_t>& data) {
    if (data.empty())
        return make_error(ErrorKind::InvalidEncoding, "envelope: empty input");

    switch (detect_format(data)) {
        case InputFormat::Yaml:
            return parse_envelope_yaml(std::string(data.begin(), data.end()));
        case InputFormat::Msgpack:
            return envelope_mp::unpack(data);
        case InputFormat::Token:
            return make_error(ErrorKind::InvalidEncoding, "envelope: input is a token, not an envelope");
        case InputFormat::Unknown:
            break;
    }
    return make_error(ErrorKind::InvalidEncoding, "envelope: unrecognised format");
}

} // namespace sealkit
