#pragma once
#include "sealkit/aead.hpp"
#include "sealkit/result.hpp"
#include <string>
#include <string_view>

// Transport token: base64url(iv) "." base64url(ciphertext || tag)
// Not versioned; the only framing is the single dot.

namespace sealkit {

std::string pack_token(const EncryptionResult& sealed);

// Exactly one '.', a non-empty IV field and valid Base64URL on both sides,
// otherwise InvalidEncoding. The IV length is checked later by decrypt.
Result<EncryptionResult> unpack_token(std::string_view token);

} // namespace sealkit
