#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "capture/capture_loader.hpp"
#include "config/config.hpp"
#include "mavlink/crc.hpp"
#include "mavlink/crc_extra.hpp"
#include "mavlink/frame.hpp"
#include "protocol/session.hpp"

using namespace mavgw;

// Version
constexpr const char* VERSION = "0.1.0";

// Print help
void printHelp(const char* program) {
    std::cout << "MAVLink Gateway v" << VERSION << "\n\n"
        << "Usage: " << program << " [options] <command> [command-options]\n\n"
        << "Global Options:\n"
        << "  -c, --config <file>    Config file (default: config/default.json)\n"
        << "  --gcs-sysid <id>       Ground station system ID (default: 255)\n"
        << "  --gcs-compid <id>      Ground station component ID (default: 0)\n"
        << "  --target-sysid <id>    Accept frames from this system only (0 = all)\n"
        << "  --crc-extra <file>     Additional CRC_EXTRA entries (JSON)\n"
        << "  -v, --verbose          Verbose output\n"
        << "  -q, --quiet            Quiet mode (errors only)\n"
        << "  -h, --help             Show this help\n"
        << "  -V, --version          Show version\n\n"
        << "Commands:\n"
        << "  decode     Extract validated frames from a capture\n"
        << "  encode     Build and stamp an outgoing frame\n"
        << "  crc        Compute CRC-16/MCRF4XX over hex bytes\n"
        << "  table      Show CRC_EXTRA entries\n\n"
        << "Run '" << program << " <command> --help' for command-specific options.\n";
}

void printDecodeHelp(const char* program) {
    std::cout << "Usage: " << program << " decode [options] -i <file>\n\n"
        << "Options:\n"
        << "  -i, --input <file>     Capture file (.bin, .hex or .json)\n"
        << "  --chunk <bytes>        Re-split the stream into fixed-size deliveries\n"
        << "  --expand               Print header + payload zero-padded to full length\n";
}

void printEncodeHelp(const char* program) {
    std::cout << "Usage: " << program << " encode [options] --msgid <id>\n\n"
        << "Options:\n"
        << "  --msgid <id>           Message ID (required)\n"
        << "  -p, --payload <hex>    Payload bytes\n"
        << "  --count <n>            Frames to stamp (default: 1)\n";
}

// Parse an unsigned decimal or 0x-prefixed argument no larger than max
bool parseUnsigned(const char* text, unsigned long max, unsigned long& out) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 0);
    if (errno != 0 || *end != '\0' || value > max) {
        return false;
    }
    out = value;
    return true;
}

// Setup logging
void setupLogging(const std::string& level, const std::string& log_file) {
    spdlog::level::level_enum log_level = spdlog::level::info;

    if (level == "trace") log_level = spdlog::level::trace;
    else if (level == "debug") log_level = spdlog::level::debug;
    else if (level == "info") log_level = spdlog::level::info;
    else if (level == "warn") log_level = spdlog::level::warn;
    else if (level == "error") log_level = spdlog::level::err;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(log_level);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("mavgw", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
}

// Command: decode
int cmdDecode(const config::AppConfig& config,
              const std::shared_ptr<const mavlink::CrcExtraTable>& table,
              int argc, char* argv[]) {
    std::string input_file;
    unsigned long chunk_size = 0;
    bool expand = false;

    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], "-i") == 0 || strcmp(argv[i], "--input") == 0) {
            if (i + 1 < argc) input_file = argv[++i];
        } else if (strcmp(argv[i], "--chunk") == 0) {
            if (i + 1 >= argc || !parseUnsigned(argv[++i], 1UL << 20, chunk_size)) {
                spdlog::error("Invalid --chunk value");
                return static_cast<int>(ErrorCode::ArgumentError);
            }
        } else if (strcmp(argv[i], "--expand") == 0) {
            expand = true;
        } else if (strcmp(argv[i], "--help") == 0) {
            printDecodeHelp("mavlink_gateway");
            return 0;
        }
    }

    if (input_file.empty()) {
        spdlog::error("Capture file is required (-i)");
        return static_cast<int>(ErrorCode::ArgumentError);
    }

    capture::CaptureLoader loader;
    auto load_result = loader.load(input_file);
    if (!load_result.ok()) {
        spdlog::error("Failed to load capture: {}", load_result.message);
        return static_cast<int>(load_result.error);
    }

    const auto& metadata = loader.getMetadata();
    spdlog::info("Loaded {} bytes in {} chunks from {} ({})",
        metadata.byte_count, metadata.chunk_count, metadata.name, metadata.format);

    // Optionally re-split into fixed-size deliveries
    std::vector<ByteBuffer> deliveries;
    if (chunk_size > 0) {
        ByteBuffer stream;
        for (const auto& chunk : load_result.value) {
            stream.insert(stream.end(), chunk.begin(), chunk.end());
        }
        for (size_t offset = 0; offset < stream.size(); offset += chunk_size) {
            size_t end = std::min(stream.size(), offset + static_cast<size_t>(chunk_size));
            deliveries.emplace_back(stream.begin() + static_cast<ptrdiff_t>(offset),
                                    stream.begin() + static_cast<ptrdiff_t>(end));
        }
    } else {
        deliveries = std::move(load_result.value);
    }

    protocol::Session session(config.session, table);

    for (const auto& delivery : deliveries) {
        for (const auto& frame : session.readData(delivery)) {
            const uint8_t* data = frame.data();
            char line[96];
            snprintf(line, sizeof(line), "seq=%3u sysid=%3u compid=%3u msgid=%-6u len=%3u  ",
                     static_cast<unsigned>(mavlink::getSequence(data)),
                     static_cast<unsigned>(mavlink::getSystemId(data)),
                     static_cast<unsigned>(mavlink::getComponentId(data)),
                     static_cast<unsigned>(mavlink::getMessageId(data)),
                     static_cast<unsigned>(mavlink::getPayloadLength(data)));
            if (expand) {
                std::cout << line << capture::formatHex(mavlink::expandFrame(frame.data(), frame.size(), *table)) << "\n";
            } else {
                std::cout << line << capture::formatHex(frame) << "\n";
            }
        }
    }

    auto stats = session.reader().getStats();
    std::cout << "--- decode statistics ---\n"
        << stats.frames_received << " frames, "
        << stats.crc_errors << " CRC errors, "
        << stats.unknown_messages << " unknown IDs, "
        << stats.filtered_frames << " filtered, "
        << stats.resync_bytes << " resync bytes, "
        << session.reader().buffered() << " bytes pending\n";

    return 0;
}

// Command: encode
int cmdEncode(const config::AppConfig& config,
              const std::shared_ptr<const mavlink::CrcExtraTable>& table,
              int argc, char* argv[]) {
    unsigned long msg_id = 0;
    bool have_msg_id = false;
    unsigned long count = 1;
    ByteBuffer payload;

    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], "--msgid") == 0) {
            if (i + 1 >= argc || !parseUnsigned(argv[++i], MAVLINK_MAX_MSG_ID, msg_id)) {
                spdlog::error("Invalid --msgid value");
                return static_cast<int>(ErrorCode::ArgumentError);
            }
            have_msg_id = true;
        } else if (strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--payload") == 0) {
            if (i + 1 < argc) {
                auto parsed = capture::parseHex(argv[++i]);
                if (!parsed.ok()) {
                    spdlog::error("Invalid payload: {}", parsed.message);
                    return static_cast<int>(parsed.error);
                }
                payload = std::move(parsed.value);
            }
        } else if (strcmp(argv[i], "--count") == 0) {
            if (i + 1 >= argc || !parseUnsigned(argv[++i], 65536, count)) {
                spdlog::error("Invalid --count value");
                return static_cast<int>(ErrorCode::ArgumentError);
            }
        } else if (strcmp(argv[i], "--help") == 0) {
            printEncodeHelp("mavlink_gateway");
            return 0;
        }
    }

    if (!have_msg_id) {
        spdlog::error("Message ID is required (--msgid)");
        return static_cast<int>(ErrorCode::ArgumentError);
    }

    if (!table->contains(static_cast<uint32_t>(msg_id))) {
        spdlog::warn("Message ID {} has no CRC_EXTRA entry; receivers with a complete table will reject it",
            msg_id);
    }

    auto frame = mavlink::buildFrame(static_cast<uint32_t>(msg_id), payload);
    if (!frame.ok()) {
        spdlog::error("{}", frame.message);
        return static_cast<int>(frame.error);
    }

    protocol::Session session(config.session, table);
    for (unsigned long n = 0; n < count; n++) {
        std::cout << capture::formatHex(session.writeData(frame.value)) << "\n";
    }

    return 0;
}

// Command: crc
int cmdCrc(const std::shared_ptr<const mavlink::CrcExtraTable>& table, int argc, char* argv[]) {
    std::string text;
    unsigned long msg_id = 0;
    bool seed = false;

    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], "--msgid") == 0) {
            if (i + 1 >= argc || !parseUnsigned(argv[++i], MAVLINK_MAX_MSG_ID, msg_id)) {
                spdlog::error("Invalid --msgid value");
                return static_cast<int>(ErrorCode::ArgumentError);
            }
            seed = true;
        } else {
            text += argv[i];
            text += ' ';
        }
    }

    auto bytes = capture::parseHex(text);
    if (!bytes.ok()) {
        spdlog::error("{}", bytes.message);
        return static_cast<int>(bytes.error);
    }

    uint16_t crc = mavlink::crcCalculate(bytes.value);

    if (seed) {
        auto extra = table->lookup(static_cast<uint32_t>(msg_id));
        if (!extra) {
            spdlog::error("No CRC_EXTRA entry for message {}", msg_id);
            return static_cast<int>(ErrorCode::TableError);
        }
        crc = mavlink::crcAccumulate(*extra, crc);
    }

    char out[16];
    snprintf(out, sizeof(out), "0x%04X", static_cast<unsigned>(crc));
    std::cout << out << "\n";
    return 0;
}

// Command: table
int cmdTable(const std::shared_ptr<const mavlink::CrcExtraTable>& table, int argc, char* argv[]) {
    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], "--msgid") == 0) {
            unsigned long msg_id = 0;
            if (i + 1 >= argc || !parseUnsigned(argv[++i], MAVLINK_MAX_MSG_ID, msg_id)) {
                spdlog::error("Invalid --msgid value");
                return static_cast<int>(ErrorCode::ArgumentError);
            }
            auto extra = table->lookup(static_cast<uint32_t>(msg_id));
            if (!extra) {
                std::cout << "Message " << msg_id << ": unknown (CRC check skipped on receive)\n";
                return static_cast<int>(ErrorCode::TableError);
            }
            std::cout << "Message " << msg_id << ": CRC_EXTRA " << static_cast<int>(*extra);
            auto length = table->payloadLength(static_cast<uint32_t>(msg_id));
            if (length) {
                std::cout << ", payload " << static_cast<int>(*length) << " bytes";
            }
            std::cout << "\n";
            return 0;
        }
    }

    std::cout << "CRC_EXTRA table (" << table->dialect() << ", " << table->size() << " entries):\n\n"
        << "  MSGID     CRC_EXTRA\n"
        << "  --------  ---------\n";

    for (const auto& entry : table->entries()) {
        char line[64];
        snprintf(line, sizeof(line), "  %-8u  %u",
                 static_cast<unsigned>(entry.first), static_cast<unsigned>(entry.second));
        std::cout << line << "\n";
    }

    return 0;
}

int main(int argc, char* argv[]) {
    // Default configuration
    config::AppConfig config = config::getDefaultConfig();
    std::string config_file;
    std::string log_level;
    std::string command;
    int cmd_argc = 0;
    char** cmd_argv = nullptr;

    // CLI overrides (applied after config file loading)
    long cli_gcs_sysid = -1;
    long cli_gcs_compid = -1;
    long cli_target_sysid = -1;
    std::string cli_crc_extra;

    auto parseId = [](const char* text, long& out) {
        unsigned long value = 0;
        if (!parseUnsigned(text, 0xFF, value)) {
            return false;
        }
        out = static_cast<long>(value);
        return true;
    };

    // Parse global arguments
    int i = 1;
    while (i < argc) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 < argc) config_file = argv[++i];
        } else if (strcmp(argv[i], "--gcs-sysid") == 0) {
            if (i + 1 >= argc || !parseId(argv[++i], cli_gcs_sysid)) {
                std::cerr << "Invalid --gcs-sysid (0-255)\n";
                return static_cast<int>(ErrorCode::ArgumentError);
            }
        } else if (strcmp(argv[i], "--gcs-compid") == 0) {
            if (i + 1 >= argc || !parseId(argv[++i], cli_gcs_compid)) {
                std::cerr << "Invalid --gcs-compid (0-255)\n";
                return static_cast<int>(ErrorCode::ArgumentError);
            }
        } else if (strcmp(argv[i], "--target-sysid") == 0) {
            if (i + 1 >= argc || !parseId(argv[++i], cli_target_sysid)) {
                std::cerr << "Invalid --target-sysid (0-255)\n";
                return static_cast<int>(ErrorCode::ArgumentError);
            }
        } else if (strcmp(argv[i], "--crc-extra") == 0) {
            if (i + 1 < argc) cli_crc_extra = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            log_level = "debug";
        } else if (strcmp(argv[i], "-q") == 0 || strcmp(argv[i], "--quiet") == 0) {
            log_level = "error";
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printHelp(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "MAVLink Gateway v" << VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            // This is the command
            command = argv[i];
            cmd_argc = argc - i - 1;
            cmd_argv = &argv[i + 1];
            break;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return static_cast<int>(ErrorCode::ArgumentError);
        }
        i++;
    }

    // Load config file if specified
    if (!config_file.empty()) {
        auto config_result = config::loadConfig(config_file);
        if (!config_result.ok()) {
            std::cerr << "Error loading config: " << config_result.message << "\n";
            return static_cast<int>(config_result.error);
        }
        config = config_result.value;
    }

    // Apply CLI overrides (take precedence over config file)
    if (cli_gcs_sysid >= 0) {
        config.session.gcs_sysid = static_cast<uint8_t>(cli_gcs_sysid);
    }
    if (cli_gcs_compid >= 0) {
        config.session.gcs_compid = static_cast<uint8_t>(cli_gcs_compid);
    }
    if (cli_target_sysid >= 0) {
        config.session.target_sysid = static_cast<uint8_t>(cli_target_sysid);
    }
    if (!cli_crc_extra.empty()) {
        config.crc_extra_file = cli_crc_extra;
    }
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    // Setup logging
    setupLogging(config.log_level, config.log_file);

    // No command specified
    if (command.empty()) {
        printHelp(argv[0]);
        return static_cast<int>(ErrorCode::ArgumentError);
    }

    // CRC_EXTRA table is built once and shared read-only
    std::shared_ptr<const mavlink::CrcExtraTable> table = mavlink::defaultCrcExtraTable();
    if (!config.crc_extra_file.empty()) {
        auto table_result = mavlink::CrcExtraTable::loadFile(config.crc_extra_file, *table);
        if (!table_result.ok()) {
            spdlog::error("Failed to load CRC_EXTRA file: {}", table_result.message);
            return static_cast<int>(table_result.error);
        }
        table = std::make_shared<const mavlink::CrcExtraTable>(std::move(table_result.value));
        spdlog::info("Loaded CRC_EXTRA table '{}' ({} entries)", table->dialect(), table->size());
    }

    // Dispatch command
    if (command == "decode") {
        return cmdDecode(config, table, cmd_argc, cmd_argv);
    } else if (command == "encode") {
        return cmdEncode(config, table, cmd_argc, cmd_argv);
    } else if (command == "crc") {
        return cmdCrc(table, cmd_argc, cmd_argv);
    } else if (command == "table") {
        return cmdTable(table, cmd_argc, cmd_argv);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        printHelp(argv[0]);
        return static_cast<int>(ErrorCode::ArgumentError);
    }
}
