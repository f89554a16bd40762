#include "config.hpp"
#include "password.hpp"
#include "sealed_input.hpp"
#include "sealkit/aead.hpp"
#include "sealkit/encoding.hpp"
#include "sealkit/envelope.hpp"
#include "sealkit/keys.hpp"
#include "sealkit/openssl_provider.hpp"
#include "sealkit/token.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <optional>
#include <string>
#include <vector>
#include <cstdlib>
#include <cerrno>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <openssl/crypto.h>

// ── Usage ─────────────────────────────────────────────────────────────────────
static void print_usage(const char* prog) {
    std::cerr <<
        "Usage: " << prog << " <command> [options]\n"
        "\n"
        "Commands:\n"
        "  keygen    Print a fresh 256-bit key (Base64URL)\n"
        "  derive    Derive a 256-bit key from a password (PBKDF2-HMAC-SHA256)\n"
        "  encrypt   Encrypt a file with AES-256-GCM\n"
        "  decrypt   Decrypt a token or envelope (format auto-detected)\n"
        "\n"
        "Options:\n"
        "  --key <b64url>          32-byte key, Base64URL\n"
        "  --key-file <file>       File holding a Base64URL key (as written by keygen)\n"
        "  --password              Prompt for a password instead of using a key\n"
        "  --pass-stdin            Read the password as one line from stdin\n"
        "  --salt <b64url>         Salt for derive\n"
        "  --iterations <n>        PBKDF2 iterations (default: 150000)\n"
        "  --aad <text>            Associated data; must match on decrypt, never stored\n"
        "  --tag-bits <n>          96, 104, 112, 120 or 128 (default: 128)\n"
        "  --format <fmt>          token | yaml | msgpack (encrypt; default: token)\n"
        "  --config <file>         YAML config (default: $SEALKIT_CONFIG or\n"
        "                          ~/.config/sealkit/config.yaml)\n"
        "  --in <file>             Input file (default: stdin)\n"
        "  --out <file>            Output file (default: stdout)\n"
        "  --verbose               Print a summary to stderr\n"
        "\n"
        "Examples:\n"
        "  " << prog << " keygen --out k.key\n"
        "  " << prog << " encrypt --key-file k.key --in plain.txt\n"
        "  " << prog << " encrypt --password --format yaml --in plain.txt --out plain.sealed\n"
        "  " << prog << " decrypt --password --in plain.sealed\n"
        "  " << prog << " derive --salt c2FsdHNhbHQ\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto, 3=I/O\n";
}

// ── Argument parser ───────────────────────────────────────────────────────────
struct Args {
    std::string command;
    std::string key, key_file;
    bool        use_password = false;
    bool        pass_stdin   = false;
    std::string salt;
    uint32_t    iterations = 0;          // 0 = from config
    std::optional<std::string> aad;
    int         tag_bits = 0;            // 0 = from config
    std::string format;                  // "" = from config
    std::string config_path;
    std::string in_file, out_file;
    bool        verbose = false;
};

static bool parse_uint(const char* s, unsigned long max, unsigned long& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || s[0] == '-' || v > max)
        return false;
    out = v;
    return true;
}

static bool parse_args(int argc, char** argv, Args& args, const char* prog) {
    if (argc < 2) {
        print_usage(prog);
        return false;
    }
    args.command = argv[1];
    if (args.command == "--help" || args.command == "-h") {
        print_usage(prog);
        return false;
    }
    if (args.command != "keygen" &&
        args.command != "derive" &&
        args.command != "encrypt" &&
        args.command != "decrypt") {
        std::cerr << "Error: unknown command '" << args.command << "'\n\n";
        print_usage(prog);
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string opt = argv[i];
        auto need_val = [&]() -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Error: option " << opt << " requires a value\n";
                return false;
            }
            return true;
        };

        if (opt == "--key") {
            if (!need_val()) return false;
            args.key = argv[++i];
        } else if (opt == "--key-file") {
            if (!need_val()) return false;
            args.key_file = argv[++i];
        } else if (opt == "--password") {
            args.use_password = true;
        } else if (opt == "--pass-stdin") {
            args.use_password = true;
            args.pass_stdin   = true;
        } else if (opt == "--salt") {
            if (!need_val()) return false;
            args.salt = argv[++i];
        } else if (opt == "--iterations") {
            if (!need_val()) return false;
            unsigned long v = 0;
            if (!parse_uint(argv[++i], INT32_MAX, v) || v == 0) {
                std::cerr << "Error: invalid --iterations '" << argv[i] << "'\n";
                return false;
            }
            args.iterations = static_cast<uint32_t>(v);
        } else if (opt == "--aad") {
            if (!need_val()) return false;
            args.aad = std::string(argv[++i]);
        } else if (opt == "--tag-bits") {
            if (!need_val()) return false;
            unsigned long v = 0;
            if (!parse_uint(argv[++i], 1024, v) || !sealkit::is_valid_tag_bits(static_cast<int>(v))) {
                std::cerr << "Error: invalid --tag-bits '" << argv[i]
                          << "' (must be 96, 104, 112, 120 or 128)\n";
                return false;
            }
            args.tag_bits = static_cast<int>(v);
        } else if (opt == "--format") {
            if (!need_val()) return false;
            args.format = argv[++i];
            if (!is_known_format(args.format)) {
                std::cerr << "Error: invalid --format '" << args.format
                          << "' (must be token, yaml or msgpack)\n";
                return false;
            }
        } else if (opt == "--config") {
            if (!need_val()) return false;
            args.config_path = argv[++i];
        } else if (opt == "--in") {
            if (!need_val()) return false;
            args.in_file = argv[++i];
        } else if (opt == "--out") {
            if (!need_val()) return false;
            args.out_file = argv[++i];
        } else if (opt == "--verbose" || opt == "-v") {
            args.verbose = true;
        } else {
            std::cerr << "Error: unknown option '" << opt << "'\n\n";
            print_usage(prog);
            return false;
        }
    }
    return true;
}

// ── Error reporting ───────────────────────────────────────────────────────────
static int report(const sealkit::Error& err, const std::string& what) {
    std::cerr << "Error: " << what << ": " << err.message
              << " [" << sealkit::error_kind_name(err.kind) << "]\n";
    return exit_code_for(err.kind);
}

// ── File I/O ──────────────────────────────────────────────────────────────────
static std::vector<uint8_t> read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(std::cin)),
                                     std::istreambuf_iterator<char>());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("cannot open file: " + path);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                 std::istreambuf_iterator<char>());
}

static void write_output(const std::string& path, const std::vector<uint8_t>& data) {
    if (path.empty() || path == "-") {
        std::cout.write(reinterpret_cast<const char*>(data.data()),
                        static_cast<std::streamsize>(data.size()));
        std::cout.flush();
        if (!std::cout)
            throw std::runtime_error("write error on stdout");
        return;
    }
    std::ofstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("cannot open output file: " + path);
    f.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
    if (!f)
        throw std::runtime_error("write error: " + path);
}

static void write_output(const std::string& path, const std::string& text) {
    write_output(path, std::vector<uint8_t>(text.begin(), text.end()));
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// ── Key material ──────────────────────────────────────────────────────────────

// --key / --key-file -> raw bytes. Returns an exit code, EXIT_OK on success.
static int load_raw_key(const Args& args, std::vector<uint8_t>& raw) {
    std::string text = args.key;
    if (!args.key_file.empty()) {
        try {
            std::vector<uint8_t> file = read_input(args.key_file);
            text = trim(std::string(file.begin(), file.end()));
        } catch (const std::exception& e) {
            std::cerr << "I/O error: " << e.what() << "\n";
            return EXIT_IO;
        }
    }

    auto decoded = sealkit::encoding::from_base64_url(text);
    if (!decoded) {
        std::cerr << "Error: key is not valid Base64URL\n";
        return EXIT_USAGE;
    }
    raw = std::move(decoded).value();
    return EXIT_OK;
}

static std::string obtain_password(const Args& args, bool warn_weak) {
    std::string pw = args.pass_stdin ? read_password_line()
                                     : read_hidden("Enter password: ");
    if (warn_weak && password_entropy_bits(pw) < PASSWORD_MIN_ENTROPY_BITS) {
        std::cerr << std::fixed << std::setprecision(2)
                  << "Warning: password entropy is low ("
                  << password_entropy_bits(pw) << " bits; 80 bits recommended)\n";
    }
    return pw;
}

// Password + salt -> admitted key. Returns an exit code, EXIT_OK on success.
static int key_from_password(const sealkit::KeyAdmission& admission,
                             const std::string& password,
                             const std::vector<uint8_t>& salt,
                             uint32_t iterations,
                             std::optional<sealkit::Key>& key)
{
    auto derived = admission.derive_key_from_password(password, salt, iterations);
    if (!derived)
        return report(derived.error(), "key derivation failed");

    auto admitted = admission.import_key(derived.value());
    OPENSSL_cleanse(derived.value().data(), derived.value().size());
    if (!admitted)
        return report(admitted.error(), "key import failed");

    key.emplace(std::move(admitted).value());
    return EXIT_OK;
}

// ── Commands ──────────────────────────────────────────────────────────────────

static int cmd_keygen(const Args& args, const sealkit::CryptoProvider& provider) {
    auto raw = provider.random_bytes(SEALKIT_KEY_LEN);
    if (!raw)
        return report(raw.error(), "key generation failed");

    std::string text = sealkit::encoding::to_base64_url(raw.value()) + "\n";
    OPENSSL_cleanse(raw.value().data(), raw.value().size());
    try {
        write_output(args.out_file, text);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }
    if (args.verbose)
        std::cerr << "Generated 256-bit key\n"
                  << "  Output: " << (args.out_file.empty() ? "stdout" : args.out_file) << "\n";
    return EXIT_OK;
}

static int cmd_derive(const Args& args, const Config& cfg,
                      const sealkit::CryptoProvider& provider)
{
    if (args.salt.empty()) {
        std::cerr << "Error: derive requires --salt\n";
        return EXIT_USAGE;
    }
    auto salt = sealkit::encoding::from_base64_url(args.salt);
    if (!salt) {
        std::cerr << "Error: --salt is not valid Base64URL\n";
        return EXIT_USAGE;
    }
    uint32_t iterations = args.iterations ? args.iterations : cfg.iterations;

    std::string password = obtain_password(args, true);

    sealkit::KeyAdmission admission(provider);
    auto derived = admission.derive_key_from_password(password, salt.value(), iterations);
    if (!derived)
        return report(derived.error(), "key derivation failed");

    std::string text = sealkit::encoding::to_base64_url(derived.value()) + "\n";
    OPENSSL_cleanse(derived.value().data(), derived.value().size());
    try {
        write_output(args.out_file, text);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }
    if (args.verbose)
        std::cerr << "Derived key\n"
                  << "  KDF:        PBKDF2-HMAC-SHA256\n"
                  << "  Iterations: " << iterations << "\n"
                  << "  Salt:       " << salt.value().size() << " bytes\n";
    return EXIT_OK;
}

static int cmd_encrypt(const Args& args, const Config& cfg,
                       const sealkit::CryptoProvider& provider)
{
    bool have_key = !args.key.empty() || !args.key_file.empty();
    if (have_key == args.use_password) {
        std::cerr << "Error: encrypt requires exactly one of --key, --key-file or --password\n";
        return EXIT_USAGE;
    }
    if (args.pass_stdin && args.in_file.empty()) {
        std::cerr << "Error: --pass-stdin requires --in (stdin carries the password)\n";
        return EXIT_USAGE;
    }

    std::string format = args.format.empty() ? cfg.format : args.format;
    int tag_bits       = args.tag_bits ? args.tag_bits : cfg.tag_bits;
    uint32_t iterations = args.iterations ? args.iterations : cfg.iterations;

    if (args.use_password && format == "token") {
        std::cerr << "Error: password mode needs --format yaml or msgpack "
                     "(a token has no room for the salt)\n";
        return EXIT_USAGE;
    }

    sealkit::KeyAdmission admission(provider);
    sealkit::CipherEngine engine(provider);

    // Resolve key
    std::optional<sealkit::Key> key;
    sealkit::Envelope env;
    if (args.use_password) {
        std::string password = obtain_password(args, true);

        auto salt = provider.random_bytes(cfg.salt_bytes);
        if (!salt)
            return report(salt.error(), "salt generation failed");
        env.salt       = std::move(salt).value();
        env.iterations = iterations;

        int rc = key_from_password(admission, password, env.salt, iterations, key);
        if (rc != EXIT_OK) return rc;
    } else {
        std::vector<uint8_t> raw;
        int rc = load_raw_key(args, raw);
        if (rc != EXIT_OK) return rc;

        auto admitted = admission.import_key(raw);
        OPENSSL_cleanse(raw.data(), raw.size());
        if (!admitted)
            return report(admitted.error(), "key import failed");
        key.emplace(std::move(admitted).value());
    }

    // Read plaintext
    std::vector<uint8_t> plaintext;
    try {
        plaintext = read_input(args.in_file);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    // Encrypt
    sealkit::EncryptOptions opts;
    opts.tag_bits = tag_bits;
    if (args.aad)
        opts.aad = sealkit::encoding::utf8_to_bytes(*args.aad);

    auto sealed = engine.encrypt(*key, plaintext, opts);
    if (!sealed)
        return report(sealed.error(), "encryption failed");

    // Serialise
    std::vector<uint8_t> out;
    if (format == "token") {
        std::string token = sealkit::pack_token(sealed.value()) + "\n";
        out.assign(token.begin(), token.end());
    } else {
        env.tag_bits   = tag_bits;
        env.iv         = sealed.value().iv;
        env.ciphertext = sealed.value().ciphertext;
        if (format == "yaml") {
            std::string yaml = sealkit::emit_envelope_yaml(env);
            out.assign(yaml.begin(), yaml.end());
        } else {
            out = sealkit::envelope_mp::pack(env);
        }
    }

    try {
        write_output(args.out_file, out);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    if (args.verbose) {
        std::cerr << "Encrypted\n"
                  << "  Mode:      " << (args.use_password ? "password" : "raw key") << "\n";
        if (args.use_password)
            std::cerr << "  KDF:       PBKDF2-HMAC-SHA256, " << iterations << " iterations\n";
        std::cerr << "  Tag bits:  " << tag_bits << "\n"
                  << "  AAD:       " << (args.aad ? "yes" : "no") << "\n"
                  << "  Format:    " << format << "\n"
                  << "  Input:     " << plaintext.size() << " bytes\n"
                  << "  Output:    " << (args.out_file.empty() ? "stdout" : args.out_file)
                  << " (" << out.size() << " bytes)\n";
    }
    return EXIT_OK;
}

static int cmd_decrypt(const Args& args, const Config& cfg,
                       const sealkit::CryptoProvider& provider)
{
    bool have_key = !args.key.empty() || !args.key_file.empty();
    if (have_key == args.use_password) {
        std::cerr << "Error: decrypt requires exactly one of --key, --key-file or --password\n";
        return EXIT_USAGE;
    }
    if (args.pass_stdin && args.in_file.empty()) {
        std::cerr << "Error: --pass-stdin requires --in (stdin carries the password)\n";
        return EXIT_USAGE;
    }

    // Read and parse input
    std::vector<uint8_t> input;
    try {
        input = read_input(args.in_file);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    auto sealed = read_sealed_input(input, args.tag_bits ? args.tag_bits : cfg.tag_bits);
    if (!sealed)
        return report(sealed.error(), "failed to parse input");
    const sealkit::Envelope& env = sealed.value().env;
    const char* format = sealkit::input_format_name(sealed.value().format);

    std::string mismatch = key_mode_mismatch(sealed.value(), args.use_password);
    if (!mismatch.empty()) {
        std::cerr << "Error: " << mismatch << "\n";
        return EXIT_USAGE;
    }
    if (sealed.value().format != sealkit::InputFormat::Token &&
        args.tag_bits && args.tag_bits != env.tag_bits)
        std::cerr << "Warning: ignoring --tag-bits " << args.tag_bits
                  << "; envelope says " << env.tag_bits << "\n";

    sealkit::KeyAdmission admission(provider);
    sealkit::CipherEngine engine(provider);

    // Resolve key
    std::optional<sealkit::Key> key;
    if (args.use_password) {
        std::string password = obtain_password(args, false);
        int rc = key_from_password(admission, password, env.salt, env.iterations, key);
        if (rc != EXIT_OK) return rc;
    } else {
        std::vector<uint8_t> raw;
        int rc = load_raw_key(args, raw);
        if (rc != EXIT_OK) return rc;

        auto admitted = admission.import_key(raw);
        OPENSSL_cleanse(raw.data(), raw.size());
        if (!admitted)
            return report(admitted.error(), "key import failed");
        key.emplace(std::move(admitted).value());
    }

    // Decrypt
    sealkit::DecryptOptions opts;
    opts.tag_bits = env.tag_bits;
    if (args.aad)
        opts.aad = sealkit::encoding::utf8_to_bytes(*args.aad);

    auto plaintext = engine.decrypt(*key, env.iv, env.ciphertext, opts);
    if (!plaintext)
        return report(plaintext.error(), "decryption/authentication failed");

    try {
        write_output(args.out_file, plaintext.value());
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    if (args.verbose)
        std::cerr << "Decrypted\n"
                  << "  Format:   " << format << "\n"
                  << "  Tag bits: " << env.tag_bits << "\n"
                  << "  Output:   " << (args.out_file.empty() ? "stdout" : args.out_file)
                  << " (" << plaintext.value().size() << " bytes)\n";
    return EXIT_OK;
}

// ── main ──────────────────────────────────────────────────────────────────────
int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args, argv[0]))
        return (argc >= 2 && (std::string(argv[1]) == "--help" ||
                              std::string(argv[1]) == "-h")) ? EXIT_OK : EXIT_USAGE;

    Config cfg;
    try {
        cfg = load_config(resolve_config_path(args.config_path));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    sealkit::OpenSslProvider provider;

    if (args.command == "keygen")  return cmd_keygen(args, provider);
    if (args.command == "derive")  return cmd_derive(args, cfg, provider);
    if (args.command == "encrypt") return cmd_encrypt(args, cfg, provider);
    if (args.command == "decrypt") return cmd_decrypt(args, cfg, provider);

    // Should be unreachable
    return EXIT_USAGE;
}
