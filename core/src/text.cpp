#include "sealkit/encoding.hpp"

namespace sealkit {
namespace encoding {

static void append_replacement(std::string& out) {
    out += "\xEF\xBF\xBD";  // U+FFFD
}

static void append_code_point(std::vector<uint8_t>& out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = 0xFFFD;

    if (cp < 0x80) {
        out.push_back(static_cast<uint8_t>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<uint8_t>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<uint8_t>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<uint8_t>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<uint8_t>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
    }
}

std::vector<uint8_t> utf8_to_bytes(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::vector<uint8_t> utf8_to_bytes(std::u32string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size());
    for (char32_t cp : text)
        append_code_point(out, cp);
    return out;
}

Result<std::string> bytes_to_utf8(const uint8_t* data, size_t len) {
    if (!data && len != 0)
        return make_error(ErrorKind::InvalidInputType,
                          "bytes_to_utf8 expects a byte sequence, got a null pointer");

    std::string out;
    out.reserve(len);

    size_t i = 0;
    while (i < len) {
        uint8_t b = data[i];
        if (b < 0x80) {
            out += static_cast<char>(b);
            ++i;
            continue;
        }

        // Continuation count and the allowed range of the first continuation
        // byte (excludes overlongs, surrogates and > U+10FFFF)
        size_t need = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (b >= 0xC2 && b <= 0xDF) {
            need = 1;
        } else if (b >= 0xE0 && b <= 0xEF) {
            need = 2;
            if (b == 0xE0) lo = 0xA0;
            if (b == 0xED) hi = 0x9F;
        } else if (b >= 0xF0 && b <= 0xF4) {
            need = 3;
            if (b == 0xF0) lo = 0x90;
            if (b == 0xF4) hi = 0x8F;
        } else {
            append_replacement(out);
            ++i;
            continue;
        }

        size_t seen = 1;
        while (seen <= need && i + seen < len) {
            uint8_t c = data[i + seen];
            if (c < lo || c > hi) break;
            lo = 0x80; hi = 0xBF;
            ++seen;
        }

        if (seen > need) {
            out.append(reinterpret_cast<const char*>(data + i), need + 1);
            i += need + 1;
        } else {
            // Maximal subpart replaced once; the offending byte is re-read
            append_replacement(out);
            i += seen;
        }
    }
    return out;
}

std::vector<uint8_t> concat_bytes(const std::vector<uint8_t>& a,
                                  const std::vector<uint8_t>& b)
{
    std::vector<uint8_t> out;
    out.reserve(a.size() + b.size());
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

} // namespace encoding
} // namespace sealkit
