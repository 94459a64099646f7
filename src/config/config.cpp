#include "config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace mavgw {
namespace config {

using json = nlohmann::json;

namespace {

// Read a 0..255 ID field
Result<uint8_t> readId(const json& section, const char* key) {
    int value = section[key].get<int>();
    if (value < 0 || value > 0xFF) {
        return Result<uint8_t>::failure(
            ErrorCode::ConfigError,
            std::string(key) + " out of range (0-255): " + std::to_string(value)
        );
    }
    return Result<uint8_t>::success(static_cast<uint8_t>(value));
}

}  // namespace

AppConfig getDefaultConfig() {
    AppConfig config;

    // Session defaults
    config.session.gcs_sysid = DEFAULT_GCS_SYSID;
    config.session.gcs_compid = DEFAULT_GCS_COMPID;
    config.session.target_sysid = DEFAULT_TARGET_SYSID;
    config.session.allow_empty_data = false;

    // Logging defaults
    config.log_level = "info";

    return config;
}

Result<AppConfig> loadConfig(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return Result<AppConfig>::failure(
            ErrorCode::ConfigError,
            "Cannot open config file: " + filepath
        );
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        return Result<AppConfig>::failure(
            ErrorCode::ConfigError,
            "JSON parse error in config: " + std::string(e.what())
        );
    }

    AppConfig config = getDefaultConfig();

    try {
        // Session settings
        if (j.contains("session")) {
            const auto& session = j["session"];
            if (session.contains("gcs_sysid")) {
                auto id = readId(session, "gcs_sysid");
                if (!id.ok()) {
                    return Result<AppConfig>::failure(id.error, id.message);
                }
                config.session.gcs_sysid = id.value;
            }
            if (session.contains("gcs_compid")) {
                auto id = readId(session, "gcs_compid");
                if (!id.ok()) {
                    return Result<AppConfig>::failure(id.error, id.message);
                }
                config.session.gcs_compid = id.value;
            }
            if (session.contains("target_sysid")) {
                auto id = readId(session, "target_sysid");
                if (!id.ok()) {
                    return Result<AppConfig>::failure(id.error, id.message);
                }
                config.session.target_sysid = id.value;
            }
            if (session.contains("allow_empty_data")) {
                config.session.allow_empty_data = session["allow_empty_data"].get<bool>();
            }
        }

        // CRC_EXTRA data file
        if (j.contains("crc_extra")) {
            const auto& crc_extra = j["crc_extra"];
            if (crc_extra.contains("file")) {
                config.crc_extra_file = crc_extra["file"].get<std::string>();
            }
        }

        // Logging settings
        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                config.log_level = logging["level"].get<std::string>();
            }
            if (logging.contains("file")) {
                config.log_file = logging["file"].get<std::string>();
            }
        }

    } catch (const json::exception& e) {
        return Result<AppConfig>::failure(
            ErrorCode::ConfigError,
            "Error reading config values: " + std::string(e.what())
        );
    }

    return Result<AppConfig>::success(config);
}

}  // namespace config
}  // namespace mavgw
