#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "mavlink_gateway/types.hpp"

namespace mavgw {
namespace mavlink {

// Immutable per-message data generated from a dialect:
// message ID -> CRC_EXTRA seed, and message ID -> full (untruncated)
// payload length including extension fields.
// A missing seed means the message is unknown to this build.
class CrcExtraTable {
public:
    CrcExtraTable() = default;
    explicit CrcExtraTable(std::map<uint32_t, uint8_t> entries, std::string dialect = "");
    CrcExtraTable(std::map<uint32_t, uint8_t> entries,
                  std::map<uint32_t, uint8_t> payload_lengths,
                  std::string dialect);

    // Entries generated from the MAVLink "common" dialect
    static CrcExtraTable builtin();

    // Merge a generated JSON data file over `base`
    static Result<CrcExtraTable> loadFile(const std::string& filepath, const CrcExtraTable& base);

    std::optional<uint8_t> lookup(uint32_t msg_id) const;
    bool contains(uint32_t msg_id) const;

    // Full payload length, if the data was generated for this message
    std::optional<uint8_t> payloadLength(uint32_t msg_id) const;

    size_t size() const { return m_entries.size(); }
    const std::map<uint32_t, uint8_t>& entries() const { return m_entries; }
    const std::map<uint32_t, uint8_t>& payloadLengths() const { return m_payload_lengths; }
    const std::string& dialect() const { return m_dialect; }

private:
    std::map<uint32_t, uint8_t> m_entries;
    std::map<uint32_t, uint8_t> m_payload_lengths;
    std::string m_dialect;
};

// Process-wide built-in table, shared read-only
std::shared_ptr<const CrcExtraTable> defaultCrcExtraTable();

}  // namespace mavlink
}  // namespace mavgw
