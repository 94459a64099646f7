#include "frame_writer.hpp"

#include <spdlog/spdlog.h>

#include "mavlink/frame.hpp"

namespace mavgw {
namespace protocol {

FrameWriter::FrameWriter(const WriterOptions& options,
                         std::shared_ptr<const mavlink::CrcExtraTable> table)
    : m_options(options),
      m_table(table ? std::move(table) : mavlink::defaultCrcExtraTable()),
      m_sequence(0),
      m_stats{} {}

ByteBuffer FrameWriter::prepareForSend(ByteBuffer frame) {
    if (!mavlink::isFrameStart(frame.data(), frame.size())) {
        m_stats.passthrough++;
        return frame;
    }

    // Sequence (byte 4), then identity (bytes 5 and 6)
    frame[MAVLINK_OFFSET_SEQ] = m_sequence;
    m_sequence = static_cast<uint8_t>((m_sequence + 1) & 0xFF);

    frame[MAVLINK_OFFSET_SYSID] = m_options.gcs_sysid;
    frame[MAVLINK_OFFSET_COMPID] = m_options.gcs_compid;

    uint8_t payload_len = mavlink::getPayloadLength(frame.data());
    size_t body_len = MAVLINK_HEADER_LEN + payload_len;

    if (frame.size() < body_len) {
        spdlog::debug("MAVLink frame shorter than its length field ({} < {}), zero-padding payload",
            frame.size(), body_len);
    }

    // Drop stale trailing bytes (old CRC) or pad a short payload
    frame.resize(body_len, 0x00);

    uint32_t msg_id = mavlink::getMessageId(frame.data());
    if (!m_table->contains(msg_id)) {
        spdlog::debug("MAVLink message ID {} has no CRC_EXTRA, computing CRC without seed", msg_id);
    }

    uint16_t crc = mavlink::computeFrameCrc(frame.data(), *m_table);
    frame.push_back(static_cast<uint8_t>(crc & 0xFF));
    frame.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));

    m_stats.frames_sent++;
    return frame;
}

void FrameWriter::reset() {
    m_sequence = 0;
    m_stats = WriterStats{};
}

}  // namespace protocol
}  // namespace mavgw
