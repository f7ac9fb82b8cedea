// src/config/codec_config.hpp
#pragma once

#include <string>

#include "hex/hex_codec.hpp"
#include "utils/logging.hpp"

namespace config {

/**
 * CodecConfig - Loads codec and logging settings from a YAML file
 *
 * Usage:
 *   auto cfg = CodecConfig::load("config/uuidbits.yaml");
 *   cfg.apply_logging();
 *   std::string h = hex::HexCodec::to_hex_padded(v, cfg.pad_count, cfg.hex_case);
 *
 * Falls back to defaults if the file is not found.
 */
class CodecConfig {
public:
    // codec:
    int pad_count = 8;
    hex::HexCase hex_case = hex::HexCase::Lower;

    // logging:
    utils::LogLevel log_level = utils::LogLevel::Info;
    std::string log_file;

    /**
     * Load settings from a YAML file
     * @throws std::runtime_error if the file exists but is invalid
     *
     * A missing file yields get_default() with a warning.
     */
    static CodecConfig load(const std::string& yaml_path);

    static CodecConfig get_default();

    /**
     * @throws std::runtime_error if any setting is out of range
     */
    void validate() const;

    // Set the global log level and open the log file, if any
    void apply_logging() const;

    void print_summary() const;

    static hex::HexCase parse_hex_case(const std::string& s);
    static const char* to_string(hex::HexCase hc);
};

} // namespace config
