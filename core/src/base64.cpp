#include "sealkit/encoding.hpp"

namespace sealkit {
namespace encoding {

static const char kTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
static const char kUrlTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// -1 = not in the alphabet, -2 = ASCII whitespace (skipped)
static const int8_t kDecode[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-2,-2,-1,-2,-2,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -2,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,-1,-1,63,
    52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
    15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,
    -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
    41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
};

static Error bad_base64(const std::string& why) {
    return make_error(ErrorKind::InvalidEncoding, "invalid base64: " + why);
}

// Both alphabets share this loop. A trailing group of 1 or 2 bytes yields
// 2 or 3 characters, plus '=' up to a multiple of four when pad is set.
static std::string encode(const uint8_t* data, size_t len, const char* table, bool pad) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t group = (uint32_t)data[i] << 16 | (uint32_t)data[i + 1] << 8 | data[i + 2];
        for (int shift = 18; shift >= 0; shift -= 6)
            out += table[(group >> shift) & 0x3F];
    }

    size_t rest = len - i;
    if (rest > 0) {
        uint32_t group = (uint32_t)data[i] << 16;
        if (rest == 2) group |= (uint32_t)data[i + 1] << 8;
        for (size_t k = 0; k <= rest; k++)
            out += table[(group >> (18 - 6 * k)) & 0x3F];
        if (pad) out.append(3 - rest, '=');
    }
    return out;
}

std::string to_base64(const uint8_t* data, size_t len) {
    return encode(data, len, kTable, true);
}

std::string to_base64(const std::vector<uint8_t>& bytes) {
    return to_base64(bytes.data(), bytes.size());
}

Result<std::vector<uint8_t>> from_base64(std::string_view text) {
    // Drop whitespace first; padding rules apply to what is left
    std::string clean;
    clean.reserve(text.size());
    for (unsigned char c : text) {
        if (kDecode[c] != -2)
            clean += static_cast<char>(c);
    }

    if (clean.size() % 4 == 0 && !clean.empty() && clean.back() == '=') {
        clean.pop_back();
        if (!clean.empty() && clean.back() == '=')
            clean.pop_back();
    }
    if (clean.size() % 4 == 1)
        return bad_base64("length leaves a dangling character");

    std::vector<uint8_t> out;
    out.reserve((clean.size() / 4) * 3 + 2);

    uint32_t buf = 0;
    int bits = 0;

    for (unsigned char c : clean) {
        int val = kDecode[c];
        if (val < 0) {
            if (c == '=')
                return bad_base64("misplaced padding");
            return bad_base64("character outside the alphabet");
        }
        buf = (buf << 6) | (uint32_t)val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((uint8_t)((buf >> bits) & 0xFF));
        }
    }
    return out;
}

std::string to_base64_url(const std::vector<uint8_t>& bytes) {
    return encode(bytes.data(), bytes.size(), kUrlTable, false);
}

Result<std::vector<uint8_t>> from_base64_url(std::string_view text) {
    std::string b64(text);
    for (char& c : b64) {
        if      (c == '-') c = '+';
        else if (c == '_') c = '/';
    }

    // 0 -> "", 1 -> "===", 2 -> "==", 3 -> "="
    static const char* kPad = "===";
    b64 += (kPad + (text.size() + 3) % 4);
    return from_base64(b64);
}

} // namespace encoding
} // namespace sealkit
