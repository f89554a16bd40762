#include "sealkit/envelope.hpp"
#include <msgpack.hpp>
#include <string>

namespace sealkit {
namespace envelope_mp {

// ── helpers ───────────────────────────────────────────────────────────────────

static Error bad(const std::string& what) {
    return make_error(ErrorKind::InvalidEncoding, "envelope unpack: " + what);
}

static void pack_bytes(msgpack::packer<msgpack::sbuffer>& pk,
                       const std::vector<uint8_t>& data)
{
    pk.pack_bin(static_cast<uint32_t>(data.size()));
    pk.pack_bin_body(reinterpret_cast<const char*>(data.data()), data.size());
}

static bool read_str(const msgpack::object& obj, std::string& out) {
    if (obj.type != msgpack::type::STR)
        return false;
    out.assign(obj.via.str.ptr, obj.via.str.size);
    return true;
}

static bool read_bin(const msgpack::object& obj, std::vector<uint8_t>& out) {
    if (obj.type != msgpack::type::BIN)
        return false;
    out.assign(reinterpret_cast<const uint8_t*>(obj.via.bin.ptr),
               reinterpret_cast<const uint8_t*>(obj.via.bin.ptr) + obj.via.bin.size);
    return true;
}

static bool read_uint(const msgpack::object& obj, uint64_t& out) {
    if (obj.type != msgpack::type::POSITIVE_INTEGER)
        return false;
    out = obj.via.u64;
    return true;
}

// ── pack ──────────────────────────────────────────────────────────────────────

std::vector<uint8_t> pack(const Envelope& env) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    pk.pack_map(7);

    // "v" → version
    pk.pack(std::string("v"));
    pk.pack_uint32(static_cast<uint32_t>(env.version));

    // "alg" → cipher name
    pk.pack(std::string("alg"));
    pk.pack(env.alg);

    // "tb" → tag bits
    pk.pack(std::string("tb"));
    pk.pack_uint32(static_cast<uint32_t>(env.tag_bits));

    // "s" → PBKDF2 salt (empty bin in raw-key mode)
    pk.pack(std::string("s"));
    pack_bytes(pk, env.salt);

    // "it" → PBKDF2 iterations (0 in raw-key mode)
    pk.pack(std::string("it"));
    pk.pack_uint32(env.iterations);

    // "iv" → nonce
    pk.pack(std::string("iv"));
    pack_bytes(pk, env.iv);

    // "ct" → ciphertext || tag
    pk.pack(std::string("ct"));
    pack_bytes(pk, env.ciphertext);

    return {reinterpret_cast<const uint8_t*>(buf.data()),
            reinterpret_cast<const uint8_t*>(buf.data()) + buf.size()};
}

// ── unpack ────────────────────────────────────────────────────────────────────

static Result<Envelope> unpack_object(const msgpack::object& obj) {
    if (obj.type != msgpack::type::MAP)
        return bad("top-level object must be a map");

    Envelope env;
    bool got_v = false, got_alg = false, got_tb = false, got_s = false,
         got_it = false, got_iv = false, got_ct = false;

    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string key;
        if (!read_str(kv.key, key))
            return bad("map key must be a string");
        const msgpack::object& val = kv.val;
        uint64_t n = 0;

        if (key == "v") {
            if (!read_uint(val, n) || n > INT32_MAX) return bad("'v' must be unsigned int");
            env.version = static_cast<int>(n);
            got_v = true;
        } else if (key == "alg") {
            if (!read_str(val, env.alg)) return bad("'alg' must be a string");
            got_alg = true;
        } else if (key == "tb") {
            if (!read_uint(val, n) || n > INT32_MAX) return bad("'tb' must be unsigned int");
            env.tag_bits = static_cast<int>(n);
            got_tb = true;
        } else if (key == "s") {
            if (!read_bin(val, env.salt)) return bad("'s' must be binary");
            got_s = true;
        } else if (key == "it") {
            if (!read_uint(val, n) || n > UINT32_MAX) return bad("'it' must be unsigned int");
            env.iterations = static_cast<uint32_t>(n);
            got_it = true;
        } else if (key == "iv") {
            if (!read_bin(val, env.iv)) return bad("'iv' must be binary");
            got_iv = true;
        } else if (key == "ct") {
            if (!read_bin(val, env.ciphertext)) return bad("'ct' must be binary");
            got_ct = true;
        }
    }

    if (!got_v || !got_alg || !got_tb || !got_s || !got_it || !got_iv || !got_ct)
        return bad("missing required fields in msgpack envelope");

    return validate_envelope(std::move(env));
}

Result<Envelope> unpack(const std::vector<uint8_t>& data) {
    try {
        msgpack::object_handle oh = msgpack::unpack(
            reinterpret_cast<const char*>(data.data()), data.size());
        return unpack_object(oh.get());
    } catch (const msgpack::unpack_error& e) {
        return bad(e.what());
    }
}

} // namespace envelope_mp
} // namespace sealkit
