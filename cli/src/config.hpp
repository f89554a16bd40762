#pragma once
#include "sealkit/aead.hpp"
#include "sealkit/keys.hpp"
#include <cstdint>
#include <string>

// Defaults for the sealkit tool. Command-line flags override these.
struct Config {
    uint32_t    iterations = SEALKIT_PBKDF2_ITERATIONS;
    int         tag_bits   = SEALKIT_DEFAULT_TAG_BITS;
    size_t      salt_bytes = 16;
    std::string format     = "token";   // token | yaml | msgpack
};

// Resolution order: explicit path, $SEALKIT_CONFIG, ~/.config/sealkit/config.yaml.
// Returns "" when none applies (built-in defaults are used).
std::string resolve_config_path(const std::string& explicit_path);

// Loads a YAML config. Unknown keys are ignored.
// Throws std::runtime_error on an unreadable file or an invalid value.
Config load_config(const std::string& path);

bool is_known_format(const std::string& format);
