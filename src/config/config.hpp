#pragma once

#include <string>

#include "mavlink_gateway/types.hpp"
#include "protocol/session.hpp"

namespace mavgw {
namespace config {

// Application configuration
struct AppConfig {
    // Session identity and filter
    protocol::SessionConfig session;

    // Extra CRC_EXTRA entries generated for another dialect (empty = built-in only)
    std::string crc_extra_file;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

// Load configuration from JSON file
Result<AppConfig> loadConfig(const std::string& filepath);

// Get default configuration
AppConfig getDefaultConfig();

}  // namespace config
}  // namespace mavgw
