#pragma once
#include "sealkit/envelope.hpp"
#include "sealkit/result.hpp"
#include <cstdint>
#include <string>
#include <vector>

// ── Exit codes ────────────────────────────────────────────────────────────────
static const int EXIT_OK      = 0;
static const int EXIT_USAGE   = 1;
static const int EXIT_CRYPTO  = 2;
static const int EXIT_IO      = 3;

// Bad key/IV/tag parameters are usage errors, malformed input is I/O,
// everything else is a crypto failure.
int exit_code_for(sealkit::ErrorKind kind);

// What decrypt works from. A token is lifted into an Envelope with no salt.
struct SealedInput {
    sealkit::Envelope    env;
    sealkit::InputFormat format = sealkit::InputFormat::Unknown;
};

// Detects the format and decodes. token_tag_bits only applies to tokens;
// an envelope's own tag-bits always wins.
sealkit::Result<SealedInput> read_sealed_input(const std::vector<uint8_t>& input,
                                               int token_tag_bits);

// Empty when the key source matches how the input was sealed, otherwise
// the message to print.
std::string key_mode_mismatch(const SealedInput& in, bool use_password);
