#include "crc_extra.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

namespace mavgw {
namespace mavlink {

using json = nlohmann::json;

namespace {

struct MessageEntry {
    uint32_t msg_id;
    uint8_t value;
};

// Generated from common.xml
constexpr MessageEntry COMMON_CRC_EXTRA[] = {
    {0, 50},      // HEARTBEAT
    {1, 124},     // SYS_STATUS
    {2, 137},     // SYSTEM_TIME
    {4, 237},     // PING
    {5, 217},     // CHANGE_OPERATOR_CONTROL
    {6, 104},     // CHANGE_OPERATOR_CONTROL_ACK
    {7, 119},     // AUTH_KEY
    {8, 117},     // LINK_NODE_STATUS
    {11, 89},     // SET_MODE
    {20, 214},    // PARAM_REQUEST_READ
    {21, 159},    // PARAM_REQUEST_LIST
    {22, 220},    // PARAM_VALUE
    {23, 168},    // PARAM_SET
    {24, 24},     // GPS_RAW_INT
    {25, 23},     // GPS_STATUS
    {26, 170},    // SCALED_IMU
    {27, 144},    // RAW_IMU
    {28, 67},     // RAW_PRESSURE
    {29, 115},    // SCALED_PRESSURE
    {30, 39},     // ATTITUDE
    {31, 246},    // ATTITUDE_QUATERNION
    {32, 185},    // LOCAL_POSITION_NED
    {33, 104},    // GLOBAL_POSITION_INT
    {34, 237},    // RC_CHANNELS_SCALED
    {35, 244},    // RC_CHANNELS_RAW
    {36, 222},    // SERVO_OUTPUT_RAW
    {37, 212},    // MISSION_REQUEST_PARTIAL_LIST
    {38, 9},      // MISSION_WRITE_PARTIAL_LIST
    {39, 254},    // MISSION_ITEM
    {40, 230},    // MISSION_REQUEST
    {41, 28},     // MISSION_SET_CURRENT
    {42, 28},     // MISSION_CURRENT
    {43, 132},    // MISSION_REQUEST_LIST
    {44, 221},    // MISSION_COUNT
    {45, 232},    // MISSION_CLEAR_ALL
    {46, 11},     // MISSION_ITEM_REACHED
    {47, 153},    // MISSION_ACK
    {48, 41},     // SET_GPS_GLOBAL_ORIGIN
    {49, 39},     // GPS_GLOBAL_ORIGIN
    {50, 78},     // PARAM_MAP_RC
    {51, 196},    // MISSION_REQUEST_INT
    {54, 15},     // SAFETY_SET_ALLOWED_AREA
    {55, 3},      // SAFETY_ALLOWED_AREA
    {61, 167},    // ATTITUDE_QUATERNION_COV
    {62, 183},    // NAV_CONTROLLER_OUTPUT
    {63, 119},    // GLOBAL_POSITION_INT_COV
    {64, 191},    // LOCAL_POSITION_NED_COV
    {65, 118},    // RC_CHANNELS
    {66, 148},    // REQUEST_DATA_STREAM
    {67, 21},     // DATA_STREAM
    {69, 243},    // MANUAL_CONTROL
    {70, 124},    // RC_CHANNELS_OVERRIDE
    {73, 38},     // MISSION_ITEM_INT
    {74, 20},     // VFR_HUD
    {75, 158},    // COMMAND_INT
    {76, 152},    // COMMAND_LONG
    {77, 143},    // COMMAND_ACK
    {80, 14},     // COMMAND_CANCEL
    {81, 106},    // MANUAL_SETPOINT
    {82, 49},     // SET_ATTITUDE_TARGET
    {83, 22},     // ATTITUDE_TARGET
    {84, 143},    // SET_POSITION_TARGET_LOCAL_NED
    {85, 140},    // POSITION_TARGET_LOCAL_NED
    {86, 5},      // SET_POSITION_TARGET_GLOBAL_INT
    {87, 150},    // POSITION_TARGET_GLOBAL_INT
    {89, 231},    // LOCAL_POSITION_NED_SYSTEM_GLOBAL_OFFSET
    {90, 183},    // HIL_STATE
    {91, 63},     // HIL_CONTROLS
    {92, 54},     // HIL_RC_INPUTS_RAW
    {93, 47},     // HIL_ACTUATOR_CONTROLS
    {100, 175},   // OPTICAL_FLOW
    {101, 102},   // GLOBAL_VISION_POSITION_ESTIMATE
    {102, 158},   // VISION_POSITION_ESTIMATE
    {103, 208},   // VISION_SPEED_ESTIMATE
    {104, 56},    // VICON_POSITION_ESTIMATE
    {105, 93},    // HIGHRES_IMU
    {106, 138},   // OPTICAL_FLOW_RAD
    {107, 108},   // HIL_SENSOR
    {108, 32},    // SIM_STATE
    {109, 185},   // RADIO_STATUS
    {110, 84},    // FILE_TRANSFER_PROTOCOL
    {111, 34},    // TIMESYNC
    {112, 174},   // CAMERA_TRIGGER
    {113, 124},   // HIL_GPS
    {114, 237},   // HIL_OPTICAL_FLOW
    {115, 4},     // HIL_STATE_QUATERNION
    {116, 76},    // SCALED_IMU2
    {117, 128},   // LOG_REQUEST_LIST
    {118, 56},    // LOG_ENTRY
    {119, 116},   // LOG_REQUEST_DATA
    {120, 134},   // LOG_DATA
    {121, 237},   // LOG_ERASE
    {122, 203},   // LOG_REQUEST_END
    {123, 250},   // GPS_INJECT_DATA
    {124, 87},    // GPS2_RAW
    {125, 203},   // POWER_STATUS
    {126, 220},   // SERIAL_CONTROL
    {127, 25},    // GPS_RTK
    {128, 226},   // GPS2_RTK
    {129, 46},    // SCALED_IMU3
    {130, 29},    // DATA_TRANSMISSION_HANDSHAKE
    {131, 223},   // ENCAPSULATED_DATA
    {132, 85},    // DISTANCE_SENSOR
    {133, 6},     // TERRAIN_REQUEST
    {134, 229},   // TERRAIN_DATA
    {135, 203},   // TERRAIN_CHECK
    {136, 1},     // TERRAIN_REPORT
    {137, 195},   // SCALED_PRESSURE2
    {138, 109},   // ATT_POS_MOCAP
    {139, 168},   // SET_ACTUATOR_CONTROL_TARGET
    {140, 181},   // ACTUATOR_CONTROL_TARGET
    {141, 47},    // ALTITUDE
    {142, 72},    // RESOURCE_REQUEST
    {143, 131},   // SCALED_PRESSURE3
    {144, 127},   // FOLLOW_TARGET
    {146, 103},   // CONTROL_SYSTEM_STATE
    {147, 154},   // BATTERY_STATUS
    {148, 178},   // AUTOPILOT_VERSION
    {149, 200},   // LANDING_TARGET
    {162, 189},   // FENCE_STATUS
    {192, 36},    // MAG_CAL_REPORT
    {225, 208},   // EFI_STATUS
    {230, 163},   // ESTIMATOR_STATUS
    {231, 105},   // WIND_COV
    {232, 151},   // GPS_INPUT
    {233, 35},    // GPS_RTCM_DATA
    {234, 150},   // HIGH_LATENCY
    {235, 179},   // HIGH_LATENCY2
    {241, 90},    // VIBRATION
    {242, 104},   // HOME_POSITION
    {243, 85},    // SET_HOME_POSITION
    {244, 95},    // MESSAGE_INTERVAL
    {245, 130},   // EXTENDED_SYS_STATE
    {246, 184},   // ADSB_VEHICLE
    {247, 81},    // COLLISION
    {248, 8},     // V2_EXTENSION
    {249, 204},   // MEMORY_VECT
    {250, 49},    // DEBUG_VECT
    {251, 170},   // NAMED_VALUE_FLOAT
    {252, 44},    // NAMED_VALUE_INT
    {253, 83},    // STATUSTEXT
    {254, 46},    // DEBUG
    {256, 71},    // SETUP_SIGNING
    {257, 131},   // BUTTON_CHANGE
    {258, 187},   // PLAY_TUNE
    {259, 92},    // CAMERA_INFORMATION
    {260, 146},   // CAMERA_SETTINGS
    {261, 179},   // STORAGE_INFORMATION
    {262, 12},    // CAMERA_CAPTURE_STATUS
    {263, 133},   // CAMERA_IMAGE_CAPTURED
    {264, 49},    // FLIGHT_INFORMATION
    {265, 26},    // MOUNT_ORIENTATION
    {266, 193},   // LOGGING_DATA
    {267, 35},    // LOGGING_DATA_ACKED
    {268, 14},    // LOGGING_ACK
    {269, 109},   // VIDEO_STREAM_INFORMATION
    {270, 59},    // VIDEO_STREAM_STATUS
    {280, 70},    // GIMBAL_MANAGER_INFORMATION
    {281, 48},    // GIMBAL_MANAGER_STATUS
    {282, 123},   // GIMBAL_MANAGER_SET_ATTITUDE
    {283, 74},    // GIMBAL_DEVICE_INFORMATION
    {284, 99},    // GIMBAL_DEVICE_SET_ATTITUDE
    {285, 137},   // GIMBAL_DEVICE_ATTITUDE_STATUS
    {286, 210},   // AUTOPILOT_STATE_FOR_GIMBAL_DEVICE
    {287, 1},     // GIMBAL_MANAGER_SET_PITCHYAW
    {288, 20},    // GIMBAL_MANAGER_SET_MANUAL_CONTROL
    {290, 251},   // ESC_INFO
    {291, 10},    // ESC_STATUS
    {299, 19},    // WIFI_CONFIG_AP
    {301, 243},   // AIS_VESSEL
    {310, 28},    // UAVCAN_NODE_STATUS
    {311, 95},    // UAVCAN_NODE_INFO
    {320, 243},   // PARAM_EXT_REQUEST_READ
    {321, 88},    // PARAM_EXT_REQUEST_LIST
    {322, 243},   // PARAM_EXT_VALUE
    {323, 78},    // PARAM_EXT_SET
    {324, 132},   // PARAM_EXT_ACK
    {330, 23},    // OBSTACLE_DISTANCE
    {331, 91},    // ODOMETRY
    {332, 236},   // TRAJECTORY_REPRESENTATION_WAYPOINTS
    {333, 231},   // TRAJECTORY_REPRESENTATION_BEZIER
    {334, 72},    // CELLULAR_STATUS
    {335, 225},   // ISBD_LINK_STATUS
    {336, 245},   // CELLULAR_CONFIG
    {339, 199},   // RAW_RPM
    {340, 99},    // UTM_GLOBAL_POSITION
    {350, 232},   // DEBUG_FLOAT_ARRAY
    {360, 11},    // ORBIT_EXECUTION_STATUS
    {370, 75},    // SMART_BATTERY_INFO
    {373, 117},   // GENERATOR_STATUS
    {375, 251},   // ACTUATOR_OUTPUT_STATUS
    {380, 232},   // TIME_ESTIMATE_TO_TARGET
    {385, 147},   // TUNNEL
    {9000, 113},  // WHEEL_DISTANCE
    {9005, 117},  // WINCH_STATUS
    {12900, 114}, // OPEN_DRONE_ID_BASIC_ID
    {12901, 254}, // OPEN_DRONE_ID_LOCATION
    {12902, 140}, // OPEN_DRONE_ID_AUTHENTICATION
    {12903, 249}, // OPEN_DRONE_ID_SELF_ID
    {12904, 77},  // OPEN_DRONE_ID_SYSTEM
    {12905, 49},  // OPEN_DRONE_ID_OPERATOR_ID
    {12915, 94},  // OPEN_DRONE_ID_MESSAGE_PACK
};

// Full payload lengths (including extensions) from common.xml
constexpr MessageEntry COMMON_PAYLOAD_LENGTH[] = {
    {0, 9},       // HEARTBEAT
    {2, 12},      // SYSTEM_TIME
    {4, 14},      // PING
    {11, 6},      // SET_MODE
    {20, 20},     // PARAM_REQUEST_READ
    {21, 2},      // PARAM_REQUEST_LIST
    {22, 25},     // PARAM_VALUE
    {23, 23},     // PARAM_SET
    {24, 52},     // GPS_RAW_INT
    {26, 24},     // SCALED_IMU
    {27, 29},     // RAW_IMU
    {29, 16},     // SCALED_PRESSURE
    {30, 28},     // ATTITUDE
    {31, 48},     // ATTITUDE_QUATERNION
    {32, 28},     // LOCAL_POSITION_NED
    {33, 28},     // GLOBAL_POSITION_INT
    {35, 22},     // RC_CHANNELS_RAW
    {36, 37},     // SERVO_OUTPUT_RAW
    {39, 38},     // MISSION_ITEM
    {40, 5},      // MISSION_REQUEST
    {41, 4},      // MISSION_SET_CURRENT
    {46, 2},      // MISSION_ITEM_REACHED
    {62, 26},     // NAV_CONTROLLER_OUTPUT
    {65, 42},     // RC_CHANNELS
    {66, 6},      // REQUEST_DATA_STREAM
    {70, 38},     // RC_CHANNELS_OVERRIDE
    {73, 38},     // MISSION_ITEM_INT
    {74, 20},     // VFR_HUD
    {75, 35},     // COMMAND_INT
    {76, 33},     // COMMAND_LONG
    {77, 10},     // COMMAND_ACK
    {84, 53},     // SET_POSITION_TARGET_LOCAL_NED
    {85, 51},     // POSITION_TARGET_LOCAL_NED
    {86, 53},     // SET_POSITION_TARGET_GLOBAL_INT
    {87, 51},     // POSITION_TARGET_GLOBAL_INT
    {105, 63},    // HIGHRES_IMU
    {109, 9},     // RADIO_STATUS
    {125, 6},     // POWER_STATUS
    {141, 32},    // ALTITUDE
    {241, 32},    // VIBRATION
    {242, 60},    // HOME_POSITION
    {244, 6},     // MESSAGE_INTERVAL
    {245, 2},     // EXTENDED_SYS_STATE
    {251, 18},    // NAMED_VALUE_FLOAT
    {252, 18},    // NAMED_VALUE_INT
    {253, 54},    // STATUSTEXT
    {254, 9},     // DEBUG
};

// Merge one {"<msgid>": <byte>, ...} object into entries.
// Keys must be plain decimal digits; values must fit in a byte.
Result<void> mergeEntries(const json& object, const std::string& section,
                          std::map<uint32_t, uint8_t>& entries) {
    for (const auto& item : object.items()) {
        const std::string& key = item.key();

        bool digits = !key.empty() && key.size() <= 8 &&
            std::all_of(key.begin(), key.end(), [](char c) { return c >= '0' && c <= '9'; });
        unsigned long msg_id = digits ? std::stoul(key) : 0;

        if (!digits || msg_id > MAVLINK_MAX_MSG_ID) {
            return Result<void>::failure(
                ErrorCode::TableError,
                "Invalid message ID in " + section + ": \"" + key + "\""
            );
        }

        int value = item.value().get<int>();
        if (value < 0 || value > 0xFF) {
            return Result<void>::failure(
                ErrorCode::TableError,
                section + " out of range for message " + key + ": " + std::to_string(value)
            );
        }

        entries[static_cast<uint32_t>(msg_id)] = static_cast<uint8_t>(value);
    }

    return Result<void>::success();
}

}  // namespace

CrcExtraTable::CrcExtraTable(std::map<uint32_t, uint8_t> entries, std::string dialect)
    : m_entries(std::move(entries)), m_dialect(std::move(dialect)) {}

CrcExtraTable::CrcExtraTable(std::map<uint32_t, uint8_t> entries,
                             std::map<uint32_t, uint8_t> payload_lengths,
                             std::string dialect)
    : m_entries(std::move(entries)),
      m_payload_lengths(std::move(payload_lengths)),
      m_dialect(std::move(dialect)) {}

CrcExtraTable CrcExtraTable::builtin() {
    std::map<uint32_t, uint8_t> entries;
    for (const auto& entry : COMMON_CRC_EXTRA) {
        entries.emplace(entry.msg_id, entry.value);
    }

    std::map<uint32_t, uint8_t> lengths;
    for (const auto& entry : COMMON_PAYLOAD_LENGTH) {
        lengths.emplace(entry.msg_id, entry.value);
    }

    return CrcExtraTable(std::move(entries), std::move(lengths), "common");
}

Result<CrcExtraTable> CrcExtraTable::loadFile(const std::string& filepath, const CrcExtraTable& base) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return Result<CrcExtraTable>::failure(
            ErrorCode::TableError,
            "Cannot open CRC_EXTRA file: " + filepath
        );
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        return Result<CrcExtraTable>::failure(
            ErrorCode::TableError,
            "JSON parse error in CRC_EXTRA file: " + std::string(e.what())
        );
    }

    if (!j.is_object() || !j.contains("crc_extra") || !j["crc_extra"].is_object()) {
        return Result<CrcExtraTable>::failure(
            ErrorCode::TableError,
            "CRC_EXTRA file has no \"crc_extra\" object: " + filepath
        );
    }

    std::map<uint32_t, uint8_t> entries = base.entries();
    std::map<uint32_t, uint8_t> lengths = base.payloadLengths();
    std::string dialect = base.dialect();

    try {
        if (j.contains("dialect")) {
            dialect = j["dialect"].get<std::string>();
        }

        auto merged = mergeEntries(j["crc_extra"], "crc_extra", entries);
        if (!merged.ok()) {
            return Result<CrcExtraTable>::failure(merged.error, merged.message);
        }

        // Payload lengths are optional in the data file
        if (j.contains("payload_length")) {
            if (!j["payload_length"].is_object()) {
                return Result<CrcExtraTable>::failure(
                    ErrorCode::TableError,
                    "\"payload_length\" must be an object: " + filepath
                );
            }
            merged = mergeEntries(j["payload_length"], "payload_length", lengths);
            if (!merged.ok()) {
                return Result<CrcExtraTable>::failure(merged.error, merged.message);
            }
        }
    } catch (const json::exception& e) {
        return Result<CrcExtraTable>::failure(
            ErrorCode::TableError,
            "Error reading CRC_EXTRA values: " + std::string(e.what())
        );
    }

    return Result<CrcExtraTable>::success(
        CrcExtraTable(std::move(entries), std::move(lengths), dialect));
}

std::optional<uint8_t> CrcExtraTable::lookup(uint32_t msg_id) const {
    auto it = m_entries.find(msg_id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CrcExtraTable::contains(uint32_t msg_id) const {
    return m_entries.find(msg_id) != m_entries.end();
}

std::optional<uint8_t> CrcExtraTable::payloadLength(uint32_t msg_id) const {
    auto it = m_payload_lengths.find(msg_id);
    if (it == m_payload_lengths.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<const CrcExtraTable> defaultCrcExtraTable() {
    static const auto table = std::make_shared<const CrcExtraTable>(CrcExtraTable::builtin());
    return table;
}

}  // namespace mavlink
}  // namespace mavgw
