#include "sealed_input.hpp"
#include "sealkit/token.hpp"
#include <string_view>
#include <utility>

int exit_code_for(sealkit::ErrorKind kind) {
    switch (kind) {
        case sealkit::ErrorKind::InvalidKeyLength:
        case sealkit::ErrorKind::InvalidIvLength:
        case sealkit::ErrorKind::InvalidTagLength:
        case sealkit::ErrorKind::InvalidInputType:
            return EXIT_USAGE;
        case sealkit::ErrorKind::InvalidEncoding:
            return EXIT_IO;
        case sealkit::ErrorKind::AuthenticationFailure:
        case sealkit::ErrorKind::ProviderFailure:
            return EXIT_CRYPTO;
    }
    return EXIT_CRYPTO;
}

sealkit::Result<SealedInput> read_sealed_input(const std::vector<uint8_t>& input,
                                               int token_tag_bits)
{
    SealedInput out;
    out.format = sealkit::detect_format(input);

    switch (out.format) {
        case sealkit::InputFormat::Yaml:
        case sealkit::InputFormat::Msgpack: {
            auto loaded = sealkit::load_envelope(input);
            if (!loaded)
                return loaded.error();
            out.env = std::move(loaded).value();
            return out;
        }
        case sealkit::InputFormat::Token: {
            std::string text(input.begin(), input.end());
            size_t b = text.find_first_not_of(" \t\r\n\f\v");
            size_t e = text.find_last_not_of(" \t\r\n\f\v");
            auto unpacked = sealkit::unpack_token(std::string_view(text).substr(b, e - b + 1));
            if (!unpacked)
                return unpacked.error();
            out.env.iv         = std::move(unpacked.value().iv);
            out.env.ciphertext = std::move(unpacked.value().ciphertext);
            out.env.tag_bits   = token_tag_bits;
            return out;
        }
        case sealkit::InputFormat::Unknown:
            break;
    }
    return sealkit::make_error(sealkit::ErrorKind::InvalidEncoding,
                               "input is neither a token nor an envelope");
}

std::string key_mode_mismatch(const SealedInput& in, bool use_password) {
    if (in.env.password_mode() && !use_password)
        return "input was sealed with a password; use --password";
    if (!in.env.password_mode() && use_password) {
        if (in.format == sealkit::InputFormat::Token)
            return "a token carries no salt; decrypt it with --key or --key-file";
        return "input was sealed with a raw key; use --key or --key-file";
    }
    return "";
}
