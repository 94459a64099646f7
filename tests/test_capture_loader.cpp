#include <gtest/gtest.h>

#include <fstream>
#include <filesystem>

#include "capture/capture_loader.hpp"

using namespace mavgw;
using namespace mavgw::capture;

class CaptureLoaderTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "mavgw_capture_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::string createFile(const std::string& name, const std::string& content) {
        std::string path = test_dir + "/" + name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }
};

// HEX-001: Parse spaced hex
TEST_F(CaptureLoaderTest, ParseHexSpaced) {
    auto result = parseHex("FD 09 00 0a");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, (ByteBuffer{0xFD, 0x09, 0x00, 0x0A}));
}

// HEX-002: Parse runs, 0x prefixes and commas
TEST_F(CaptureLoaderTest, ParseHexMixed) {
    auto result = parseHex("0xFD,0x01 AABB\tcc");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, (ByteBuffer{0xFD, 0x01, 0xAA, 0xBB, 0xCC}));
}

// HEX-003: Comments are ignored
TEST_F(CaptureLoaderTest, ParseHexComment) {
    auto result = parseHex("01 02 # heartbeat 03\n04");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, (ByteBuffer{0x01, 0x02, 0x04}));
}

// HEX-004: Invalid tokens
TEST_F(CaptureLoaderTest, ParseHexInvalid) {
    EXPECT_FALSE(parseHex("FG").ok());
    EXPECT_FALSE(parseHex("ABC").ok());
    EXPECT_FALSE(parseHex("0x").ok());
    EXPECT_EQ(parseHex("zz").error, ErrorCode::ArgumentError);
}

// HEX-005: Empty text parses to nothing
TEST_F(CaptureLoaderTest, ParseHexEmpty) {
    auto result = parseHex("   ");

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value.empty());
}

// HEX-006: Format is upper case with spaces
TEST_F(CaptureLoaderTest, FormatHex) {
    EXPECT_EQ(formatHex(ByteBuffer{0xFD, 0x0a, 0x00}), "FD 0A 00");
    EXPECT_EQ(formatHex(ByteBuffer{}), "");
}

// CAP-001: Hex capture, one chunk per line
TEST_F(CaptureLoaderTest, LoadHex) {
    std::string content =
        "# recorded from 14550\n"
        "FD 01 00 00 00 01 01 00 00 00 03 AA BB\n"
        "\n"
        "FD 01 00 00 01 01 01 00 00 00 03\n";

    auto path = createFile("link.hex", content);

    CaptureLoader loader;
    auto result = loader.load(path);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[0].size(), 13u);
    EXPECT_EQ(result.value[1].size(), 11u);

    const auto& meta = loader.getMetadata();
    EXPECT_EQ(meta.format, "hex");
    EXPECT_EQ(meta.name, "link.hex");
    EXPECT_EQ(meta.chunk_count, 2u);
    EXPECT_EQ(meta.byte_count, 24u);
}

// CAP-002: Bad hex line reports its number
TEST_F(CaptureLoaderTest, LoadHexBadLine) {
    auto path = createFile("bad.txt", "FD 01\nFD XY\n");

    CaptureLoader loader;
    auto result = loader.load(path);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::CaptureError);
    EXPECT_NE(result.message.find("Line 2"), std::string::npos);
}

// CAP-003: Hex file with only comments
TEST_F(CaptureLoaderTest, LoadHexNoData) {
    auto path = createFile("empty.hex", "# nothing\n\n");

    CaptureLoader loader;
    EXPECT_FALSE(loader.load(path).ok());
}

// CAP-004: Binary capture is one chunk
TEST_F(CaptureLoaderTest, LoadBinary) {
    std::string content("\xFD\x00\x00\x00\x00\x00\x00\x00\x00\x00\x16\x8E", 12);
    auto path = createFile("link.bin", content);

    CaptureLoader loader;
    auto result = loader.load(path);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value.size(), 1u);
    EXPECT_EQ(result.value[0].size(), 12u);
    EXPECT_EQ(result.value[0][0], 0xFD);
    EXPECT_EQ(result.value[0][11], 0x8E);
    EXPECT_EQ(loader.getMetadata().format, "bin");
}

// CAP-005: Empty binary capture
TEST_F(CaptureLoaderTest, LoadBinaryEmpty) {
    auto path = createFile("empty.bin", "");

    CaptureLoader loader;
    auto result = loader.load(path);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::CaptureError);
}

// CAP-006: JSON datagram capture
TEST_F(CaptureLoaderTest, LoadJson) {
    std::string content = R"({
        "metadata": {"name": "bench test"},
        "datagrams": [
            "FD 01 00 00 00 01 01 00 00 00 03 AA BB",
            "FD0100000101010000000311 22"
        ]
    })";

    auto path = createFile("link.json", content);

    CaptureLoader loader;
    auto result = loader.load(path);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[1].size(), 13u);
    EXPECT_EQ(loader.getMetadata().name, "bench test");
    EXPECT_EQ(loader.getMetadata().format, "json");
}

// CAP-007: JSON syntax error
TEST_F(CaptureLoaderTest, JsonInvalidSyntax) {
    auto path = createFile("bad.json", R"({"datagrams": [)");

    CaptureLoader loader;
    auto result = loader.load(path);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::CaptureError);
}

// CAP-008: JSON without datagrams
TEST_F(CaptureLoaderTest, JsonMissingDatagrams) {
    auto path = createFile("nodg.json", R"({"frames": []})");

    CaptureLoader loader;
    auto result = loader.load(path);

    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.message.find("datagrams"), std::string::npos);
}

// CAP-009: JSON datagram of the wrong type
TEST_F(CaptureLoaderTest, JsonDatagramWrongType) {
    auto path = createFile("type.json", R"({"datagrams": [253, 0]})");

    CaptureLoader loader;
    auto result = loader.load(path);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::CaptureError);
}

// CAP-010: File not found
TEST_F(CaptureLoaderTest, FileNotFound) {
    CaptureLoader loader;
    auto result = loader.load("/nonexistent/capture.bin");

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::CaptureError);
}

// CAP-011: Auto-detect JSON without extension
TEST_F(CaptureLoaderTest, AutoDetectJson) {
    auto path = createFile("capture", R"({"datagrams": ["FD 00"]})");

    CaptureLoader loader;
    auto result = loader.load(path);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(loader.getMetadata().format, "json");
}

// CAP-012: Auto-detect binary without extension
TEST_F(CaptureLoaderTest, AutoDetectBinary) {
    std::string content("\xFD\x00\x01\x02", 4);
    auto path = createFile("dump", content);

    CaptureLoader loader;
    auto result = loader.load(path);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(loader.getMetadata().format, "bin");
}

// CAP-013: Auto-detect hex text without extension
TEST_F(CaptureLoaderTest, AutoDetectHex) {
    auto path = createFile("trace", "FD 00 01\n");

    CaptureLoader loader;
    auto result = loader.load(path);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(loader.getMetadata().format, "hex");
}
