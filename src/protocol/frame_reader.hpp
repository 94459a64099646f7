#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "mavlink/crc_extra.hpp"
#include "mavlink_gateway/types.hpp"

namespace mavgw {
namespace protocol {

// Reader options
struct ReaderOptions {
    uint8_t target_sysid = DEFAULT_TARGET_SYSID;  // 0 = accept all
    bool allow_empty_data = false;                // Transport hint, carried unchanged
};

enum class ReadStatus {
    Frame,
    NeedMoreData
};

// One step of the extraction sequence
struct ReadOutcome {
    ReadStatus status;
    ByteBuffer frame;   // Validated frame when status == Frame
};

// Reader statistics
struct ReaderStats {
    uint64_t frames_received;
    uint64_t crc_errors;
    uint64_t unknown_messages;
    uint64_t filtered_frames;
    uint64_t resync_bytes;
};

// Streaming MAVLink v2 deframer.
//
// Bytes are copied into an owned accumulation buffer. next() scans for the
// magic byte one byte at a time, waits for a full header and then for the
// full frame, validates the CRC and applies the system ID filter. It returns
// NeedMoreData once nothing more can be extracted; state is kept so that a
// later append() resumes where it stopped.
//
// Not thread-safe: one reader per connection.
class FrameReader {
public:
    explicit FrameReader(const ReaderOptions& options = ReaderOptions{},
                         std::shared_ptr<const mavlink::CrcExtraTable> table = nullptr);

    // Append bytes to the accumulation buffer
    void append(const uint8_t* data, size_t len);

    // Extract the next validated frame, or NeedMoreData
    ReadOutcome next();

    // append() then drain every extractable frame
    std::vector<ByteBuffer> feed(const uint8_t* data, size_t len);
    std::vector<ByteBuffer> feed(const ByteBuffer& data);

    // Drop buffered bytes and statistics
    void reset();

    // Bytes waiting for the rest of a frame
    size_t buffered() const { return m_buffer.size() - m_head; }

    const ReaderOptions& getOptions() const { return m_options; }
    ReaderStats getStats() const { return m_stats; }

private:
    ReaderOptions m_options;
    std::shared_ptr<const mavlink::CrcExtraTable> m_table;

    ByteBuffer m_buffer;
    size_t m_head;      // Start of unconsumed data
    ReaderStats m_stats;

    // Remove n bytes from the front
    void consume(size_t n);
};

}  // namespace protocol
}  // namespace mavgw
