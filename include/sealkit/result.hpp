#pragma once
#include <string>
#include <utility>
#include <variant>

// Error taxonomy and the value-or-error return type used by every fallible
// sealkit operation. Nothing in the library throws for these conditions.

namespace sealkit {

enum class ErrorKind {
    InvalidKeyLength,       // key admission: raw key is not 32 bytes
    InvalidIvLength,        // encrypt/decrypt: nonce is not 12 bytes
    InvalidTagLength,       // encrypt/decrypt: tag bits not in {96,104,112,120,128}
    AuthenticationFailure,  // decrypt: tag mismatch (cause deliberately not reported)
    InvalidEncoding,        // malformed Base64 / Base64URL / token / envelope
    InvalidInputType,       // non-byte input handed to a byte decoder
    ProviderFailure,        // the crypto provider refused or failed
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind   kind;
    std::string message;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value)     : v_(std::move(value)) {}
    Result(Error error) : v_(std::move(error)) {}

    bool ok() const { return v_.index() == 0; }
    explicit operator bool() const { return ok(); }

    // Calling value() on an error result throws std::bad_variant_access.
    T&       value() &       { return std::get<0>(v_); }
    const T& value() const & { return std::get<0>(v_); }
    T&&      value() &&      { return std::get<0>(std::move(v_)); }

    const Error& error() const { return std::get<1>(v_); }
    ErrorKind    kind()  const { return error().kind; }

private:
    std::variant<T, Error> v_;
};

} // namespace sealkit
