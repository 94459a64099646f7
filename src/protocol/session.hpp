#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "mavlink/crc_extra.hpp"
#include "mavlink_gateway/types.hpp"
#include "protocol/frame_reader.hpp"
#include "protocol/frame_writer.hpp"

namespace mavgw {
namespace protocol {

// Session identity and filter
struct SessionConfig {
    uint8_t gcs_sysid = DEFAULT_GCS_SYSID;        // Stamped into outgoing frames
    uint8_t gcs_compid = DEFAULT_GCS_COMPID;
    uint8_t target_sysid = DEFAULT_TARGET_SYSID;  // Inbound filter, 0 = all
    bool allow_empty_data = false;
};

// One logical MAVLink connection: a reader and a writer sharing one
// CRC_EXTRA table. Callers keep one session per connection.
class Session {
public:
    explicit Session(const SessionConfig& config = SessionConfig{},
                     std::shared_ptr<const mavlink::CrcExtraTable> table = nullptr);

    // Inbound bytes -> validated frames
    std::vector<ByteBuffer> readData(const uint8_t* data, size_t len);
    std::vector<ByteBuffer> readData(const ByteBuffer& data);

    // Outbound frame -> on-wire bytes
    ByteBuffer writeData(ByteBuffer frame);

    // Reconnect: clear buffer and sequence, keep identity and filter
    void reset();

    FrameReader& reader() { return m_reader; }
    FrameWriter& writer() { return m_writer; }
    const SessionConfig& getConfig() const { return m_config; }
    const mavlink::CrcExtraTable& getCrcExtraTable() const { return *m_table; }

private:
    SessionConfig m_config;
    std::shared_ptr<const mavlink::CrcExtraTable> m_table;
    FrameReader m_reader;
    FrameWriter m_writer;
};

}  // namespace protocol
}  // namespace mavgw
