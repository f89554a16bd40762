#include "sealkit/token.hpp"
#include "sealkit/encoding.hpp"

namespace sealkit {

std::string pack_token(const EncryptionResult& sealed) {
    return encoding::to_base64_url(sealed.iv) + "." +
           encoding::to_base64_url(sealed.ciphertext);
}

Result<EncryptionResult> unpack_token(std::string_view token) {
    size_t dot = token.find('.');
    if (dot == std::string_view::npos)
        return make_error(ErrorKind::InvalidEncoding, "token: missing '.' separator");
    if (token.find('.', dot + 1) != std::string_view::npos)
        return make_error(ErrorKind::InvalidEncoding, "token: more than one '.' separator");
    if (dot == 0)
        return make_error(ErrorKind::InvalidEncoding, "token: empty IV field");

    auto iv = encoding::from_base64_url(token.substr(0, dot));
    if (!iv)
        return make_error(ErrorKind::InvalidEncoding, "token: IV field: " + iv.error().message);
    auto ct = encoding::from_base64_url(token.substr(dot + 1));
    if (!ct)
        return make_error(ErrorKind::InvalidEncoding, "token: ciphertext field: " + ct.error().message);

    EncryptionResult out;
    out.iv         = std::move(iv).value();
    out.ciphertext = std::move(ct).value();
    return out;
}

} // namespace sealkit
