#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mavgw {

// MAVLink v2 framing
constexpr uint8_t MAVLINK_STX = 0xFD;                 // v2 magic
constexpr size_t MAVLINK_HEADER_LEN = 10;             // Magic .. MsgID
constexpr size_t MAVLINK_CRC_LEN = 2;
constexpr size_t MAVLINK_MAX_PAYLOAD_LEN = 255;
constexpr size_t MAVLINK_MAX_FRAME_LEN = MAVLINK_HEADER_LEN + MAVLINK_MAX_PAYLOAD_LEN + MAVLINK_CRC_LEN;
constexpr uint32_t MAVLINK_MAX_MSG_ID = 0xFFFFFF;     // 24-bit

// Header offsets
constexpr size_t MAVLINK_OFFSET_LEN = 1;
constexpr size_t MAVLINK_OFFSET_INCOMPAT_FLAGS = 2;
constexpr size_t MAVLINK_OFFSET_COMPAT_FLAGS = 3;
constexpr size_t MAVLINK_OFFSET_SEQ = 4;
constexpr size_t MAVLINK_OFFSET_SYSID = 5;
constexpr size_t MAVLINK_OFFSET_COMPID = 6;
constexpr size_t MAVLINK_OFFSET_MSGID = 7;

// Well-known message IDs
constexpr uint32_t MAVLINK_MSG_ID_HEARTBEAT = 0;
constexpr uint32_t MAVLINK_MSG_ID_COMMAND_LONG = 76;
constexpr uint32_t MAVLINK_MSG_ID_COMMAND_ACK = 77;

// Default session identity
constexpr uint8_t DEFAULT_GCS_SYSID = 255;
constexpr uint8_t DEFAULT_GCS_COMPID = 0;
constexpr uint8_t DEFAULT_TARGET_SYSID = 0;   // 0 = accept all

// Raw on-wire bytes
using ByteBuffer = std::vector<uint8_t>;

// Error codes (matching CLI exit codes)
enum class ErrorCode : int {
    Success = 0,
    GeneralError = 1,
    ArgumentError = 2,
    ConfigError = 3,
    CaptureError = 4,
    TableError = 5
};

// Result type for operations that can fail
template <typename T>
struct Result {
    T value;
    ErrorCode error;
    std::string message;

    bool ok() const { return error == ErrorCode::Success; }

    static Result success(T val) {
        return Result{std::move(val), ErrorCode::Success, ""};
    }

    static Result failure(ErrorCode err, const std::string& msg) {
        return Result{T{}, err, msg};
    }
};

// Specialization for void
template <>
struct Result<void> {
    ErrorCode error;
    std::string message;

    bool ok() const { return error == ErrorCode::Success; }

    static Result success() {
        return Result{ErrorCode::Success, ""};
    }

    static Result failure(ErrorCode err, const std::string& msg) {
        return Result{err, msg};
    }
};

}  // namespace mavgw
