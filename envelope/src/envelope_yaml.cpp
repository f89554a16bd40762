#include "sealkit/envelope.hpp"
#include "sealkit/encoding.hpp"
#include <yaml-cpp/yaml.h>
#include <initializer_list>
#include <string>

namespace sealkit {

// ── Base64 helpers ────────────────────────────────────────────────────────────

// Returns base64 wrapped at 64 chars. If it fits on one line, returns a plain
// string (no newlines). Multi-line values have NO trailing newline so
// yaml-cpp emits '|-' (strip) rather than '|' (clip).
static std::string b64_for_yaml(const std::vector<uint8_t>& data) {
    std::string b64 = encoding::to_base64(data);
    if (b64.size() <= 64)
        return b64;

    std::string out;
    out.reserve(b64.size() + b64.size() / 64);
    for (size_t i = 0; i < b64.size(); i += 64) {
        if (i > 0) out += '\n';
        out += b64.substr(i, 64);
    }
    return out;
}

static void emit_b64_key(YAML::Emitter& out, const char* key,
                         const std::vector<uint8_t>& data)
{
    std::string val = b64_for_yaml(data);
    out << YAML::Key << key << YAML::Value;
    if (val.find('\n') != std::string::npos)
        out << YAML::Literal;
    out << val;
}

// Literal blocks keep their newlines; from_base64 skips whitespace.
static Result<std::vector<uint8_t>> decode_b64_yaml(const YAML::Node& node, const char* field) {
    auto bytes = encoding::from_base64(node.as<std::string>());
    if (!bytes)
        return make_error(ErrorKind::InvalidEncoding,
                          std::string("envelope '") + field + "': " + bytes.error().message);
    return bytes;
}

// ── Emission ──────────────────────────────────────────────────────────────────

std::string emit_envelope_yaml(const Envelope& env) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "version"  << YAML::Value << env.version;
    out << YAML::Key << "type"     << YAML::Value << "sealed";
    out << YAML::Key << "alg"      << YAML::Value << env.alg;
    out << YAML::Key << "tag-bits" << YAML::Value << env.tag_bits;

    if (env.password_mode()) {
        out << YAML::Key << "kdf" << YAML::Value;
        out << YAML::BeginMap;
        out << YAML::Key << "alg"        << YAML::Value << "PBKDF2-HMAC-SHA256";
        out << YAML::Key << "iterations" << YAML::Value << env.iterations;
        emit_b64_key(out, "salt", env.salt);
        out << YAML::EndMap;
    }

    emit_b64_key(out, "iv", env.iv);
    emit_b64_key(out, "ct", env.ciphertext);

    out << YAML::EndMap;
    out << YAML::EndDoc;

    return std::string(out.c_str()) + "\n";
}

// ── Parsing ───────────────────────────────────────────────────────────────────

Result<Envelope> parse_envelope_yaml(const std::string& text) {
    Envelope env;
    try {
        YAML::Node doc = YAML::Load(text);
        if (!doc.IsMap())
            return make_error(ErrorKind::InvalidEncoding, "envelope: YAML document is not a map");

        std::string doc_type = doc["type"].as<std::string>("");
        if (doc_type != "sealed")
            return make_error(ErrorKind::InvalidEncoding,
                              "envelope: 'type' field must be 'sealed' (got '" + doc_type + "')");

        for (const char* field : {"version", "alg", "tag-bits"}) {
            if (!doc[field])
                return make_error(ErrorKind::InvalidEncoding,
                                  std::string("envelope: missing '") + field + "'");
        }
        env.version  = doc["version"].as<int>();
        env.alg      = doc["alg"].as<std::string>();
        env.tag_bits = doc["tag-bits"].as<int>();

        YAML::Node kdf = doc["kdf"];
        if (kdf) {
            std::string kdf_alg = kdf["alg"].as<std::string>("");
            if (kdf_alg != "PBKDF2-HMAC-SHA256")
                return make_error(ErrorKind::InvalidEncoding,
                                  "envelope: unsupported kdf '" + kdf_alg + "'");
            if (!kdf["iterations"] || !kdf["salt"])
                return make_error(ErrorKind::InvalidEncoding,
                                  "envelope: kdf needs 'iterations' and 'salt'");
            env.iterations = kdf["iterations"].as<uint32_t>();
            auto salt = decode_b64_yaml(kdf["salt"], "kdf.salt");
            if (!salt)
                return salt.error();
            env.salt = std::move(salt).value();
        }

        if (!doc["iv"] || !doc["ct"])
            return make_error(ErrorKind::InvalidEncoding, "envelope: missing 'iv' or 'ct'");

        auto iv = decode_b64_yaml(doc["iv"], "iv");
        if (!iv)
            return iv.error();
        env.iv = std::move(iv).value();

        auto ct = decode_b64_yaml(doc["ct"], "ct");
        if (!ct)
            return ct.error();
        env.ciphertext = std::move(ct).value();
    } catch (const YAML::Exception& e) {
        return make_error(ErrorKind::InvalidEncoding, std::string("envelope: ") + e.what());
    }

    return validate_envelope(std::move(env));
}

} // namespace sealkit
