#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>
#include <sys/stat.h>

static bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool is_known_format(const std::string& format) {
    return format == "token" || format == "yaml" || format == "msgpack";
}

std::string resolve_config_path(const std::string& explicit_path) {
    if (!explicit_path.empty())
        return explicit_path;

    const char* env = std::getenv("SEALKIT_CONFIG");
    if (env && *env)
        return env;

    const char* home = std::getenv("HOME");
    if (home && *home) {
        std::string path = std::string(home) + "/.config/sealkit/config.yaml";
        if (file_exists(path))
            return path;
    }
    return "";
}

Config load_config(const std::string& path) {
    Config cfg;
    if (path.empty())
        return cfg;

    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("cannot load config " + path + ": " + e.what());
    }
    if (doc.IsNull())
        return cfg;
    if (!doc.IsMap())
        throw std::runtime_error("config " + path + ": top level must be a map");

    try {
        if (doc["iterations"]) cfg.iterations = doc["iterations"].as<uint32_t>();
        if (doc["tag-bits"])   cfg.tag_bits   = doc["tag-bits"].as<int>();
        if (doc["salt-bytes"]) cfg.salt_bytes = doc["salt-bytes"].as<size_t>();
        if (doc["format"])     cfg.format     = doc["format"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("config " + path + ": " + e.what());
    }

    if (cfg.iterations == 0)
        throw std::runtime_error("config " + path + ": 'iterations' must be at least 1");
    if (!sealkit::is_valid_tag_bits(cfg.tag_bits))
        throw std::runtime_error("config " + path + ": 'tag-bits' must be 96, 104, 112, 120 or 128");
    if (cfg.salt_bytes < 8 || cfg.salt_bytes > 64)
        throw std::runtime_error("config " + path + ": 'salt-bytes' must be between 8 and 64");
    if (!is_known_format(cfg.format))
        throw std::runtime_error("config " + path + ": 'format' must be token, yaml or msgpack");

    return cfg;
}
