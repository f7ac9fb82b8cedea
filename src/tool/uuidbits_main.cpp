// src/tool/uuidbits_main.cpp
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <getopt.h>

#include "bits/bitfield.hpp"
#include "bits/mask.hpp"
#include "config/codec_config.hpp"
#include "hex/hex_codec.hpp"
#include "octets/byte_vector.hpp"
#include "utils/logging.hpp"

// Decimal, 0x-hex or 0-octal. Hex literals up to 0xffffffffffffffff are
// accepted and wrap into the negative range.
static bool parse_i64(const std::string& s, int64_t& out) {
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 0);
    if (errno == 0 && end != s.c_str() && *end == '\0') {
        out = static_cast<int64_t>(v);
        return true;
    }

    if (errno == ERANGE && s.rfind("0x", 0) == 0) {
        errno = 0;
        unsigned long long u = std::strtoull(s.c_str(), &end, 16);
        if (errno == 0 && *end == '\0') {
            out = static_cast<int64_t>(u);
            return true;
        }
    }
    return false;
}

static int64_t require_i64(const std::string& s, const char* what) {
    int64_t v = 0;
    if (!parse_i64(s, v)) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + s);
    }
    return v;
}

// Range-checked before narrowing so out-of-range values are rejected, not wrapped
static int require_int(const std::string& s, const char* what, int64_t lo, int64_t hi) {
    const int64_t v = require_i64(s, what);
    if (v < lo || v > hi) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + s + " (must be in [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) + "])");
    }
    return static_cast<int>(v);
}

static bits::Mask require_mask(const std::string& s) {
    const bits::Mask m = static_cast<bits::Mask>(require_i64(s, "mask"));
    if (!bits::is_contiguous(m)) {
        throw std::invalid_argument("Invalid mask: " + s + " (not a contiguous run of bits)");
    }
    return m;
}

static void print_usage(const char* prog_name) {
    printf("Usage: %s [options] COMMAND ARGS...\n", prog_name);
    printf("\nCommands:\n");
    printf("  hex INT                 Integer -> big-endian hex\n");
    printf("  unhex HEX               Hex -> signed 64-bit integer\n");
    printf("  hexstr TEXT             Text (UTF-8 bytes) -> hex\n");
    printf("  unhexstr HEX            Hex -> text\n");
    printf("  octets INT              Integer -> unsigned byte list\n");
    printf("  mask WIDTH OFFSET       Build a mask\n");
    printf("  ldb MASK WORD           Load the field selected by MASK\n");
    printf("  dpb MASK WORD VALUE     Deposit VALUE into the field selected by MASK\n");
    printf("  popcount INT            Count set bits\n");
    printf("  pp INT                  Hex and binary view of a word\n");
    printf("\nOptions:\n");
    printf("  --config PATH, -c       Codec config YAML (default: built-in)\n");
    printf("  --pad N, -p             Bytes per integer (overrides config)\n");
    printf("  --upper, -U             Uppercase hex digits (overrides config)\n");
    printf("  --verbose, -v           Debug logging\n");
    printf("  --help, -h              Show this help\n");
    printf("\nIntegers accept decimal or 0x-prefixed hex.\n");
    printf("\nExamples:\n");
    printf("  %s hex 256                 # 0000000000000100\n", prog_name);
    printf("  %s --pad 2 octets 256      # 1 0\n", prog_name);
    printf("  %s ldb 0xff00 0x1234       # 18 (0x12)\n\n", prog_name);
}

static void require_args(const std::vector<std::string>& args, size_t n, const std::string& cmd) {
    if (args.size() != n) {
        throw std::invalid_argument("'" + cmd + "' expects " + std::to_string(n) +
                                    " argument(s), got " + std::to_string(args.size()));
    }
}

static int run_command(const std::string& cmd, const std::vector<std::string>& args,
                       const config::CodecConfig& cfg) {
    using hex::HexCodec;

    if (cmd == "hex") {
        require_args(args, 1, cmd);
        const int64_t v = require_i64(args[0], "integer");
        printf("%s\n", HexCodec::to_hex_padded(v, cfg.pad_count, cfg.hex_case).c_str());
    } else if (cmd == "unhex") {
        require_args(args, 1, cmd);
        printf("%lld\n", static_cast<long long>(HexCodec::from_hex(args[0])));
    } else if (cmd == "hexstr") {
        require_args(args, 1, cmd);
        printf("%s\n", HexCodec::hex_of_text(args[0], cfg.hex_case).c_str());
    } else if (cmd == "unhexstr") {
        require_args(args, 1, cmd);
        printf("%s\n", HexCodec::text_of_hex(args[0]).c_str());
    } else if (cmd == "octets") {
        require_args(args, 1, cmd);
        const int64_t v = require_i64(args[0], "integer");
        const octets::UByteVector bytes = octets::long_to_octets(v, cfg.pad_count);
        for (size_t i = 0; i < bytes.size(); ++i) {
            printf(i == 0 ? "%u" : " %u", static_cast<unsigned>(bytes[i]));
        }
        printf("\n");
    } else if (cmd == "mask") {
        require_args(args, 2, cmd);
        const int w = require_int(args[0], "width", 0, bits::kWordBits);
        const int o = require_int(args[1], "offset", 0, bits::kWordBits - 1);
        const bits::Mask m = bits::mask(w, o);
        printf("0x%s\n", HexCodec::to_hex(static_cast<int64_t>(m), cfg.hex_case).c_str());
    } else if (cmd == "ldb") {
        require_args(args, 2, cmd);
        const bits::Mask m = require_mask(args[0]);
        const int64_t word = require_i64(args[1], "word");
        printf("%llu\n", static_cast<unsigned long long>(bits::ldb(m, word)));
    } else if (cmd == "dpb") {
        require_args(args, 3, cmd);
        const bits::Mask m = require_mask(args[0]);
        const int64_t word = require_i64(args[1], "word");
        const int64_t value = require_i64(args[2], "value");
        printf("%lld\n", static_cast<long long>(bits::dpb(m, word, value)));
    } else if (cmd == "popcount") {
        require_args(args, 1, cmd);
        printf("%d\n", bits::bit_count(require_i64(args[0], "integer")));
    } else if (cmd == "pp") {
        require_args(args, 1, cmd);
        printf("%s\n", HexCodec::pphex(require_i64(args[0], "integer")).c_str());
    } else {
        LOG_ERROR("Unknown command: %s", cmd.c_str());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    std::string config_path;
    int pad_override = -1;
    bool upper = false;
    bool verbose = false;

    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},
        {"pad",     required_argument, 0, 'p'},
        {"upper",   no_argument,       0, 'U'},
        {"verbose", no_argument,       0, 'v'},
        {"help",    no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    // '+' stops at the first command word so negative integers pass through
    while ((opt = getopt_long(argc, argv, "+c:p:Uvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'p': {
                int64_t pad = 0;
                if (!parse_i64(optarg, pad) || pad <= 0 || pad > 16) {
                    fprintf(stderr, "Error: Invalid pad count: %s\n", optarg);
                    return 1;
                }
                pad_override = static_cast<int>(pad);
                break;
            }
            case 'U':
                upper = true;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (optind >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string cmd = argv[optind];
    std::vector<std::string> args(argv + optind + 1, argv + argc);

    try {
        config::CodecConfig cfg = config_path.empty()
            ? config::CodecConfig::get_default()
            : config::CodecConfig::load(config_path);

        if (pad_override > 0) cfg.pad_count = pad_override;
        if (upper) cfg.hex_case = hex::HexCase::Upper;
        if (verbose) cfg.log_level = utils::LogLevel::Debug;

        cfg.validate();
        cfg.apply_logging();
        if (verbose) cfg.print_summary();

        return run_command(cmd, args, cfg);

    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }
}
