#pragma once

#include <string>
#include <vector>

#include "mavlink_gateway/types.hpp"

namespace mavgw {
namespace capture {

// Metadata for a loaded capture
struct CaptureMetadata {
    std::string name;
    std::string format;        // "bin", "hex" or "json"
    size_t chunk_count;        // Datagrams (json), lines (hex) or 1 (bin)
    size_t byte_count;
};

// Loads recorded link traffic. Each returned chunk is one transport
// delivery (a UDP datagram or one hex line); raw binary files load as a
// single chunk.
class CaptureLoader {
public:
    CaptureLoader() = default;

    // Load capture from file (auto-detect format)
    Result<std::vector<ByteBuffer>> load(const std::string& filepath);

    // Load specific format
    Result<std::vector<ByteBuffer>> loadBinary(const std::string& filepath);
    Result<std::vector<ByteBuffer>> loadHex(const std::string& filepath);
    Result<std::vector<ByteBuffer>> loadJson(const std::string& filepath);

    // Get metadata after loading
    const CaptureMetadata& getMetadata() const { return m_metadata; }

private:
    CaptureMetadata m_metadata{};

    // Detect file format from extension or content
    std::string detectFormat(const std::string& filepath);

    void calculateMetadata(const std::vector<ByteBuffer>& chunks, const std::string& format);
};

// Parse hex text: whitespace/comma separated bytes, optional 0x prefix,
// runs like "FD0900" split into byte pairs, '#' starts a comment
Result<ByteBuffer> parseHex(const std::string& text);

// Format bytes as space separated upper-case hex
std::string formatHex(const uint8_t* data, size_t len);
std::string formatHex(const ByteBuffer& data);

}  // namespace capture
}  // namespace mavgw
