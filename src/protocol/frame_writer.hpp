#pragma once

#include <cstdint>
#include <memory>

#include "mavlink/crc_extra.hpp"
#include "mavlink_gateway/types.hpp"

namespace mavgw {
namespace protocol {

// Writer options (identity stamped into outgoing frames)
struct WriterOptions {
    uint8_t gcs_sysid = DEFAULT_GCS_SYSID;
    uint8_t gcs_compid = DEFAULT_GCS_COMPID;
};

// Writer statistics
struct WriterStats {
    uint64_t frames_sent;
    uint64_t passthrough;   // Non-v2 buffers returned unchanged
};

// Fills the mutable header fields of outgoing frames and appends the CRC.
// Not thread-safe: concurrent callers must serialize access.
class FrameWriter {
public:
    explicit FrameWriter(const WriterOptions& options = WriterOptions{},
                         std::shared_ptr<const mavlink::CrcExtraTable> table = nullptr);

    // Stamp sequence/sysid/compid, truncate to header + payload and append CRC.
    // Buffers shorter than a header or without the v2 magic pass through
    // unchanged and do not advance the sequence.
    ByteBuffer prepareForSend(ByteBuffer frame);

    // Sequence number the next frame will carry
    uint8_t getSequence() const { return m_sequence; }

    // Zero the sequence counter and statistics
    void reset();

    const WriterOptions& getOptions() const { return m_options; }
    WriterStats getStats() const { return m_stats; }

private:
    WriterOptions m_options;
    std::shared_ptr<const mavlink::CrcExtraTable> m_table;

    uint8_t m_sequence;
    WriterStats m_stats;
};

}  // namespace protocol
}  // namespace mavgw
