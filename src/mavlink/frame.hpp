#pragma once

#include <cstdint>
#include <vector>

#include "mavlink/crc_extra.hpp"
#include "mavlink_gateway/types.hpp"

namespace mavgw {
namespace mavlink {

// Outcome of checking a frame's trailing CRC
enum class CrcStatus {
    Valid,
    Mismatch,
    UnknownMessage,   // No CRC_EXTRA entry, check skipped
    Truncated         // Shorter than its header claims
};

// Total on-wire length for a given payload length
inline size_t frameLength(uint8_t payload_len) {
    return MAVLINK_HEADER_LEN + payload_len + MAVLINK_CRC_LEN;
}

// True when data starts with the v2 magic and holds a full header
bool isFrameStart(const uint8_t* data, size_t len);

// Header accessors; caller guarantees at least MAVLINK_HEADER_LEN bytes
uint8_t getPayloadLength(const uint8_t* data);
uint8_t getSequence(const uint8_t* data);
uint8_t getSystemId(const uint8_t* data);
uint8_t getComponentId(const uint8_t* data);
uint32_t getMessageId(const uint8_t* data);

// Payload bytes of a complete frame (empty if truncated)
ByteBuffer getPayload(const uint8_t* data, size_t len);

// Payload zero-padded to full_len, undoing v2 trailing-zero truncation
ByteBuffer expandPayload(const uint8_t* data, size_t len, size_t full_len);

// Header followed by the payload padded to the table's full length for
// this message ID. Unknown lengths leave the payload as received; the CRC
// is dropped. Empty if the frame is truncated.
ByteBuffer expandFrame(const uint8_t* data, size_t len, const CrcExtraTable& table);

// CRC over header bytes 1..9 plus payload, seeded with CRC_EXTRA when known.
// Requires MAVLINK_HEADER_LEN + payload_len bytes.
uint16_t computeFrameCrc(const uint8_t* data, const CrcExtraTable& table);

// CRC stored in the last two bytes of a complete frame
uint16_t getFrameCrc(const uint8_t* data);

// Validate a complete frame against the table
CrcStatus checkFrameCrc(const uint8_t* data, size_t len, const CrcExtraTable& table);

// Build a placeholder frame (seq/sysid/compid and CRC zeroed) for the writer.
// Trailing zero payload bytes are truncated per MAVLink v2.
Result<ByteBuffer> buildFrame(uint32_t msg_id, const ByteBuffer& payload,
                              uint8_t incompat_flags = 0, uint8_t compat_flags = 0);

}  // namespace mavlink
}  // namespace mavgw
