#include "capture_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

namespace mavgw {
namespace capture {

using json = nlohmann::json;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string baseName(const std::string& filepath) {
    size_t slash = filepath.find_last_of('/');
    return slash == std::string::npos ? filepath : filepath.substr(slash + 1);
}

}  // namespace

Result<ByteBuffer> parseHex(const std::string& text) {
    ByteBuffer bytes;
    std::string token;

    auto flushToken = [&]() -> Result<void> {
        if (token.empty()) {
            return Result<void>::success();
        }

        std::string digits = token;
        if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            digits = digits.substr(2);
        }

        if (digits.empty() || digits.size() % 2 != 0) {
            return Result<void>::failure(
                ErrorCode::ArgumentError,
                "Invalid hex token \"" + token + "\""
            );
        }

        for (size_t i = 0; i < digits.size(); i += 2) {
            int hi = hexValue(digits[i]);
            int lo = hexValue(digits[i + 1]);
            if (hi < 0 || lo < 0) {
                return Result<void>::failure(
                    ErrorCode::ArgumentError,
                    "Invalid hex token \"" + token + "\""
                );
            }
            bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }

        token.clear();
        return Result<void>::success();
    };

    bool in_comment = false;
    for (char c : text) {
        if (in_comment) {
            if (c == '\n') {
                in_comment = false;
            }
            continue;
        }

        if (c == '#' || c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            auto flushed = flushToken();
            if (!flushed.ok()) {
                return Result<ByteBuffer>::failure(flushed.error, flushed.message);
            }
            in_comment = (c == '#');
            continue;
        }

        token.push_back(c);
    }

    auto flushed = flushToken();
    if (!flushed.ok()) {
        return Result<ByteBuffer>::failure(flushed.error, flushed.message);
    }

    return Result<ByteBuffer>::success(std::move(bytes));
}

std::string formatHex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 3);

    char buf[4];
    for (size_t i = 0; i < len; i++) {
        snprintf(buf, sizeof(buf), "%02X", data[i]);
        if (i > 0) {
            out.push_back(' ');
        }
        out.append(buf);
    }
    return out;
}

std::string formatHex(const ByteBuffer& data) {
    return formatHex(data.data(), data.size());
}

std::string CaptureLoader::detectFormat(const std::string& filepath) {
    // Check extension
    size_t dot_pos = filepath.rfind('.');
    if (dot_pos != std::string::npos) {
        std::string ext = filepath.substr(dot_pos + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        if (ext == "bin" || ext == "raw") return "bin";
        if (ext == "hex" || ext == "txt") return "hex";
        if (ext == "json") return "json";
    }

    // Try to detect from content
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }

    char head[256];
    file.read(head, sizeof(head));
    size_t count = static_cast<size_t>(file.gcount());

    size_t first = 0;
    while (first < count && std::isspace(static_cast<unsigned char>(head[first]))) {
        first++;
    }
    if (first < count && head[first] == '{') {
        return "json";
    }

    // Printable text is treated as a hex dump
    for (size_t i = 0; i < count; i++) {
        unsigned char c = static_cast<unsigned char>(head[i]);
        if (!std::isprint(c) && !std::isspace(c)) {
            return "bin";
        }
    }

    return "hex";
}

Result<std::vector<ByteBuffer>> CaptureLoader::load(const std::string& filepath) {
    std::string format = detectFormat(filepath);

    if (format == "bin") {
        return loadBinary(filepath);
    } else if (format == "hex") {
        return loadHex(filepath);
    } else if (format == "json") {
        return loadJson(filepath);
    }

    return Result<std::vector<ByteBuffer>>::failure(
        ErrorCode::CaptureError,
        "Cannot open file: " + filepath
    );
}

Result<std::vector<ByteBuffer>> CaptureLoader::loadBinary(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "Cannot open file: " + filepath
        );
    }

    ByteBuffer data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (data.empty()) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "Capture file is empty: " + filepath
        );
    }

    std::vector<ByteBuffer> chunks;
    chunks.push_back(std::move(data));

    m_metadata.name = baseName(filepath);
    calculateMetadata(chunks, "bin");

    return Result<std::vector<ByteBuffer>>::success(std::move(chunks));
}

Result<std::vector<ByteBuffer>> CaptureLoader::loadHex(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "Cannot open file: " + filepath
        );
    }

    std::vector<ByteBuffer> chunks;
    std::string line;
    size_t line_num = 0;

    while (std::getline(file, line)) {
        line_num++;

        auto result = parseHex(line);
        if (!result.ok()) {
            return Result<std::vector<ByteBuffer>>::failure(
                ErrorCode::CaptureError,
                "Line " + std::to_string(line_num) + ": " + result.message
            );
        }

        // Blank and comment-only lines carry no datagram
        if (!result.value.empty()) {
            chunks.push_back(std::move(result.value));
        }
    }

    if (chunks.empty()) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "No data found in file"
        );
    }

    m_metadata.name = baseName(filepath);
    calculateMetadata(chunks, "hex");

    return Result<std::vector<ByteBuffer>>::success(std::move(chunks));
}

Result<std::vector<ByteBuffer>> CaptureLoader::loadJson(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "Cannot open file: " + filepath
        );
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "JSON parse error: " + std::string(e.what())
        );
    }

    // Check for required fields
    if (!j.contains("datagrams") || !j["datagrams"].is_array()) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "Missing 'datagrams' array in JSON"
        );
    }

    std::vector<ByteBuffer> chunks;

    try {
        size_t index = 0;
        for (const auto& datagram : j["datagrams"]) {
            auto result = parseHex(datagram.get<std::string>());
            if (!result.ok()) {
                return Result<std::vector<ByteBuffer>>::failure(
                    ErrorCode::CaptureError,
                    "Datagram " + std::to_string(index) + ": " + result.message
                );
            }
            chunks.push_back(std::move(result.value));
            index++;
        }
    } catch (const json::exception& e) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "JSON error: " + std::string(e.what())
        );
    }

    if (chunks.empty()) {
        return Result<std::vector<ByteBuffer>>::failure(
            ErrorCode::CaptureError,
            "No datagrams found in file"
        );
    }

    m_metadata.name = baseName(filepath);
    if (j.contains("metadata")) {
        const auto& meta = j["metadata"];
        if (meta.contains("name") && meta["name"].is_string()) {
            m_metadata.name = meta["name"].get<std::string>();
        }
    }

    calculateMetadata(chunks, "json");

    return Result<std::vector<ByteBuffer>>::success(std::move(chunks));
}

void CaptureLoader::calculateMetadata(const std::vector<ByteBuffer>& chunks, const std::string& format) {
    m_metadata.format = format;
    m_metadata.chunk_count = chunks.size();
    m_metadata.byte_count = 0;
    for (const auto& chunk : chunks) {
        m_metadata.byte_count += chunk.size();
    }
}

}  // namespace capture
}  // namespace mavgw
