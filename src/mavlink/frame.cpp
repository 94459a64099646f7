#include "frame.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

#include "mavlink/crc.hpp"

namespace mavgw {
namespace mavlink {

bool isFrameStart(const uint8_t* data, size_t len) {
    return len >= MAVLINK_HEADER_LEN && data[0] == MAVLINK_STX;
}

uint8_t getPayloadLength(const uint8_t* data) {
    return data[MAVLINK_OFFSET_LEN];
}

uint8_t getSequence(const uint8_t* data) {
    return data[MAVLINK_OFFSET_SEQ];
}

uint8_t getSystemId(const uint8_t* data) {
    return data[MAVLINK_OFFSET_SYSID];
}

uint8_t getComponentId(const uint8_t* data) {
    return data[MAVLINK_OFFSET_COMPID];
}

uint32_t getMessageId(const uint8_t* data) {
    // 24-bit little-endian
    return static_cast<uint32_t>(data[MAVLINK_OFFSET_MSGID]) |
           (static_cast<uint32_t>(data[MAVLINK_OFFSET_MSGID + 1]) << 8) |
           (static_cast<uint32_t>(data[MAVLINK_OFFSET_MSGID + 2]) << 16);
}

ByteBuffer getPayload(const uint8_t* data, size_t len) {
    if (len < MAVLINK_HEADER_LEN) {
        return {};
    }
    size_t payload_len = getPayloadLength(data);
    if (len < MAVLINK_HEADER_LEN + payload_len) {
        return {};
    }
    return ByteBuffer(data + MAVLINK_HEADER_LEN, data + MAVLINK_HEADER_LEN + payload_len);
}

ByteBuffer expandPayload(const uint8_t* data, size_t len, size_t full_len) {
    ByteBuffer payload = getPayload(data, len);
    if (payload.size() < full_len) {
        payload.resize(full_len, 0x00);
    }
    return payload;
}

ByteBuffer expandFrame(const uint8_t* data, size_t len, const CrcExtraTable& table) {
    if (len < MAVLINK_HEADER_LEN || len < frameLength(getPayloadLength(data))) {
        return {};
    }

    size_t full_len = table.payloadLength(getMessageId(data)).value_or(0);
    ByteBuffer payload = expandPayload(data, len, full_len);

    ByteBuffer out(data, data + MAVLINK_HEADER_LEN);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

uint16_t computeFrameCrc(const uint8_t* data, const CrcExtraTable& table) {
    // Magic byte is excluded
    size_t crc_len = MAVLINK_HEADER_LEN - 1 + getPayloadLength(data);
    uint16_t crc = crcCalculate(&data[1], crc_len);

    auto extra = table.lookup(getMessageId(data));
    if (extra) {
        crc = crcAccumulate(*extra, crc);
    }
    return crc;
}

uint16_t getFrameCrc(const uint8_t* data) {
    size_t crc_offset = MAVLINK_HEADER_LEN + getPayloadLength(data);
    return static_cast<uint16_t>(data[crc_offset] | (data[crc_offset + 1] << 8));
}

CrcStatus checkFrameCrc(const uint8_t* data, size_t len, const CrcExtraTable& table) {
    if (len < MAVLINK_HEADER_LEN || len < frameLength(getPayloadLength(data))) {
        return CrcStatus::Truncated;
    }

    if (!table.contains(getMessageId(data))) {
        return CrcStatus::UnknownMessage;
    }

    return computeFrameCrc(data, table) == getFrameCrc(data) ? CrcStatus::Valid : CrcStatus::Mismatch;
}

Result<ByteBuffer> buildFrame(uint32_t msg_id, const ByteBuffer& payload,
                              uint8_t incompat_flags, uint8_t compat_flags) {
    if (msg_id > MAVLINK_MAX_MSG_ID) {
        return Result<ByteBuffer>::failure(
            ErrorCode::ArgumentError,
            "Message ID out of range: " + std::to_string(msg_id)
        );
    }
    if (payload.size() > MAVLINK_MAX_PAYLOAD_LEN) {
        return Result<ByteBuffer>::failure(
            ErrorCode::ArgumentError,
            "Payload too long: " + std::to_string(payload.size()) + " bytes"
        );
    }

    // Trailing zero truncation keeps at least one byte
    size_t payload_len = payload.size();
    while (payload_len > 1 && payload[payload_len - 1] == 0x00) {
        payload_len--;
    }

    ByteBuffer frame(frameLength(static_cast<uint8_t>(payload_len)), 0x00);

    frame[0] = MAVLINK_STX;
    frame[MAVLINK_OFFSET_LEN] = static_cast<uint8_t>(payload_len);
    frame[MAVLINK_OFFSET_INCOMPAT_FLAGS] = incompat_flags;
    frame[MAVLINK_OFFSET_COMPAT_FLAGS] = compat_flags;

    // Sequence, system and component ID are stamped by the writer
    frame[MAVLINK_OFFSET_MSGID] = static_cast<uint8_t>(msg_id & 0xFF);
    frame[MAVLINK_OFFSET_MSGID + 1] = static_cast<uint8_t>((msg_id >> 8) & 0xFF);
    frame[MAVLINK_OFFSET_MSGID + 2] = static_cast<uint8_t>((msg_id >> 16) & 0xFF);

    std::copy(payload.begin(), payload.begin() + static_cast<ptrdiff_t>(payload_len),
              frame.begin() + MAVLINK_HEADER_LEN);

    return Result<ByteBuffer>::success(std::move(frame));
}

}  // namespace mavlink
}  // namespace mavgw
