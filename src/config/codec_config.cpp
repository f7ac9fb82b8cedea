// src/config/codec_config.cpp
#include "config/codec_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <fstream>
#include <stdexcept>

#include "octets/byte_vector.hpp"

namespace config {

// No codec needs more than a UUID's worth of padding
static constexpr int kMaxPadCount = 16;

CodecConfig CodecConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[CodecConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[CodecConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[CodecConfig] Loading config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        CodecConfig cfg = get_default();

        // Keys that are present must convert; absent keys keep the defaults
        if (root["codec"]) {
            auto codec = root["codec"];
            if (codec["pad_count"])
                cfg.pad_count = codec["pad_count"].as<int>();
            if (codec["hex_case"])
                cfg.hex_case = parse_hex_case(codec["hex_case"].as<std::string>());
        }

        if (root["logging"]) {
            auto logging = root["logging"];
            if (logging["level"])
                cfg.log_level = utils::parse_level(logging["level"].as<std::string>());
            if (logging["file"])
                cfg.log_file = logging["file"].as<std::string>();
        }

        cfg.validate();

        LOG_DEBUG("[CodecConfig] Successfully loaded: %s", yaml_path.c_str());
        return cfg;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[CodecConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[CodecConfig] Load error: ") + e.what()
        );
    }
}

CodecConfig CodecConfig::get_default() {
    CodecConfig cfg;
    cfg.pad_count = octets::kDefaultPadCount;
    cfg.hex_case = hex::HexCase::Lower;
    cfg.log_level = utils::LogLevel::Info;
    cfg.log_file.clear();
    return cfg;
}

void CodecConfig::validate() const {
    if (pad_count < 1 || pad_count > kMaxPadCount) {
        throw std::runtime_error("Invalid pad_count: must be 1 <= pad_count <= 16 (got " +
                                 std::to_string(pad_count) + ")");
    }
    LOG_DEBUG("[CodecConfig] Validation passed");
}

void CodecConfig::apply_logging() const {
    utils::set_level(log_level);
    if (!log_file.empty() && !utils::open_log_file(log_file)) {
        throw std::runtime_error("[CodecConfig] Cannot open log file: " + log_file);
    }
}

void CodecConfig::print_summary() const {
    LOG_INFO("----------------------------------------");
    LOG_INFO("Codec pad_count: %d bytes (%d hex digits)", pad_count, pad_count * 2);
    LOG_INFO("Codec hex_case:  %s", to_string(hex_case));
    LOG_INFO("Log level:       %s", utils::to_string(log_level));
    if (!log_file.empty()) {
        LOG_INFO("Log file:        %s", log_file.c_str());
    }
    LOG_INFO("----------------------------------------");
}

hex::HexCase CodecConfig::parse_hex_case(const std::string& s) {
    std::string lc;
    for (char c : s)
        lc.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lc == "lower")
        return hex::HexCase::Lower;
    if (lc == "upper")
        return hex::HexCase::Upper;
    throw std::runtime_error("Invalid hex_case: '" + s + "' (expected lower or upper)");
}

const char* CodecConfig::to_string(hex::HexCase hc) {
    return (hc == hex::HexCase::Upper) ? "upper" : "lower";
}

} // namespace config
