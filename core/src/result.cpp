#include "sealkit/result.hpp"

namespace sealkit {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidKeyLength:      return "InvalidKeyLength";
        case ErrorKind::InvalidIvLength:       return "InvalidIvLength";
        case ErrorKind::InvalidTagLength:      return "InvalidTagLength";
        case ErrorKind::AuthenticationFailure: return "AuthenticationFailure";
        case ErrorKind::InvalidEncoding:       return "InvalidEncoding";
        case ErrorKind::InvalidInputType:      return "InvalidInputType";
        case ErrorKind::ProviderFailure:       return "ProviderFailure";
    }
    return "Unknown";
}

} // namespace sealkit
