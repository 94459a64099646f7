#include "frame_reader.hpp"

#include <cstddef>

#include <spdlog/spdlog.h>

#include "mavlink/frame.hpp"

namespace mavgw {
namespace protocol {

FrameReader::FrameReader(const ReaderOptions& options,
                         std::shared_ptr<const mavlink::CrcExtraTable> table)
    : m_options(options),
      m_table(table ? std::move(table) : mavlink::defaultCrcExtraTable()),
      m_head(0),
      m_stats{} {}

void FrameReader::append(const uint8_t* data, size_t len) {
    // Compact consumed prefix before growing
    if (m_head > 0) {
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<ptrdiff_t>(m_head));
        m_head = 0;
    }
    if (len > 0) {
        m_buffer.insert(m_buffer.end(), data, data + len);
    }
}

void FrameReader::consume(size_t n) {
    m_head += n;
    if (m_head >= m_buffer.size()) {
        m_buffer.clear();
        m_head = 0;
    }
}

ReadOutcome FrameReader::next() {
    while (true) {
        size_t available = buffered();
        if (available == 0) {
            return ReadOutcome{ReadStatus::NeedMoreData, {}};
        }

        const uint8_t* data = m_buffer.data() + m_head;

        // Resync: drop a single non-magic byte and look again
        if (data[0] != MAVLINK_STX) {
            spdlog::trace("MAVLink resync, dropping byte 0x{:02X}", data[0]);
            consume(1);
            m_stats.resync_bytes++;
            continue;
        }

        // Header carries the payload length
        if (available < MAVLINK_HEADER_LEN) {
            return ReadOutcome{ReadStatus::NeedMoreData, {}};
        }

        size_t total_len = mavlink::frameLength(mavlink::getPayloadLength(data));
        if (available < total_len) {
            return ReadOutcome{ReadStatus::NeedMoreData, {}};
        }

        ByteBuffer frame(data, data + total_len);
        consume(total_len);

        uint32_t msg_id = mavlink::getMessageId(frame.data());
        auto status = mavlink::checkFrameCrc(frame.data(), frame.size(), *m_table);

        if (status == mavlink::CrcStatus::Mismatch) {
            m_stats.crc_errors++;
            spdlog::warn("MAVLink CRC validation failed (msgid {}, seq {}, expected 0x{:04X}, got 0x{:04X}), discarding frame",
                msg_id, mavlink::getSequence(frame.data()),
                mavlink::computeFrameCrc(frame.data(), *m_table),
                mavlink::getFrameCrc(frame.data()));
            continue;
        }

        if (status == mavlink::CrcStatus::UnknownMessage) {
            m_stats.unknown_messages++;
            spdlog::debug("MAVLink unknown message ID {}, skipping CRC validation", msg_id);
        }

        if (m_options.target_sysid != 0 &&
            mavlink::getSystemId(frame.data()) != m_options.target_sysid) {
            m_stats.filtered_frames++;
            continue;
        }

        m_stats.frames_received++;
        return ReadOutcome{ReadStatus::Frame, std::move(frame)};
    }
}

std::vector<ByteBuffer> FrameReader::feed(const uint8_t* data, size_t len) {
    std::vector<ByteBuffer> frames;

    // An empty delivery still drains frames left by append()
    append(data, len);

    for (auto outcome = next(); outcome.status == ReadStatus::Frame; outcome = next()) {
        frames.push_back(std::move(outcome.frame));
    }

    return frames;
}

std::vector<ByteBuffer> FrameReader::feed(const ByteBuffer& data) {
    return feed(data.data(), data.size());
}

void FrameReader::reset() {
    m_buffer.clear();
    m_head = 0;
    m_stats = ReaderStats{};
}

}  // namespace protocol
}  // namespace mavgw
