#pragma once
#include "sealkit/result.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

// Byte <-> text conversions used to move IVs and ciphertexts through
// text-only channels.

namespace sealkit {
namespace encoding {

// ── UTF-8 ─────────────────────────────────────────────────────────────────────

// UTF-8 text is copied byte for byte.
std::vector<uint8_t> utf8_to_bytes(std::string_view text);

// Code points are encoded as UTF-8; surrogates and values above U+10FFFF
// become U+FFFD.
std::vector<uint8_t> utf8_to_bytes(std::u32string_view text);

// Decodes (pointer, length). A null pointer with non-zero length is
// InvalidInputType. Malformed sequences become U+FFFD.
Result<std::string> bytes_to_utf8(const uint8_t* data, size_t len);

namespace detail {

template <typename T>
struct is_byte_element
    : std::bool_constant<std::is_same_v<T, uint8_t>     ||
                         std::is_same_v<T, char>        ||
                         std::is_same_v<T, signed char> ||
                         std::is_same_v<T, std::byte>> {};

template <typename T, typename = void>
struct is_byte_sequence : std::false_type {};

template <typename T>
struct is_byte_sequence<T, std::void_t<decltype(std::data(std::declval<const T&>())),
                                       decltype(std::size(std::declval<const T&>()))>>
    : is_byte_element<std::remove_cv_t<std::remove_pointer_t<
          decltype(std::data(std::declval<const T&>()))>>> {};

} // namespace detail

// Accepts any contiguous sequence of 1-byte elements (vector<uint8_t>,
// std::string, std::array<std::byte, N>, ...). Anything else is rejected
// with InvalidInputType before decoding starts; nothing is coerced.
template <typename Bytes>
Result<std::string> bytes_to_utf8(const Bytes& bytes) {
    if constexpr (detail::is_byte_sequence<Bytes>::value) {
        return bytes_to_utf8(reinterpret_cast<const uint8_t*>(std::data(bytes)),
                             static_cast<size_t>(std::size(bytes)));
    } else {
        return make_error(ErrorKind::InvalidInputType,
                          "bytes_to_utf8 expects a byte sequence");
    }
}

// ── Bytes ─────────────────────────────────────────────────────────────────────

std::vector<uint8_t> concat_bytes(const std::vector<uint8_t>& a,
                                  const std::vector<uint8_t>& b);

// ── Base64 (RFC 4648, '=' padding) ────────────────────────────────────────────

std::string to_base64(const uint8_t* data, size_t len);
std::string to_base64(const std::vector<uint8_t>& bytes);

// ASCII whitespace is ignored. Characters outside the alphabet, stray '='
// and a length of 1 mod 4 are InvalidEncoding.
Result<std::vector<uint8_t>> from_base64(std::string_view text);

// ── Base64URL ('-' and '_', no padding) ───────────────────────────────────────

std::string to_base64_url(const std::vector<uint8_t>& bytes);
Result<std::vector<uint8_t>> from_base64_url(std::string_view text);

} // namespace encoding
} // namespace sealkit
