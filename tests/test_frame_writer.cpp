#include <gtest/gtest.h>

#include "mavlink/crc.hpp"
#include "mavlink/frame.hpp"
#include "protocol/frame_reader.hpp"
#include "protocol/frame_writer.hpp"

using namespace mavgw;
using namespace mavgw::protocol;

class FrameWriterTest : public ::testing::Test {
protected:
    WriterOptions identity(uint8_t sysid, uint8_t compid) {
        WriterOptions options;
        options.gcs_sysid = sysid;
        options.gcs_compid = compid;
        return options;
    }

    ByteBuffer placeholder(uint32_t msg_id, const ByteBuffer& payload) {
        return mavlink::buildFrame(msg_id, payload).value;
    }
};

// WR-001: Identity and sequence are stamped
TEST_F(FrameWriterTest, StampsHeader) {
    FrameWriter writer(identity(42, 190));

    auto out = writer.prepareForSend(placeholder(MAVLINK_MSG_ID_COMMAND_LONG, {0x01, 0x02}));

    ASSERT_EQ(out.size(), mavlink::frameLength(2));
    EXPECT_EQ(mavlink::getSequence(out.data()), 0);
    EXPECT_EQ(mavlink::getSystemId(out.data()), 42);
    EXPECT_EQ(mavlink::getComponentId(out.data()), 190);
    EXPECT_EQ(writer.getStats().frames_sent, 1u);
}

// WR-002: Default identity
TEST_F(FrameWriterTest, DefaultIdentity) {
    FrameWriter writer;

    auto out = writer.prepareForSend(placeholder(MAVLINK_MSG_ID_HEARTBEAT, {0x01}));

    EXPECT_EQ(mavlink::getSystemId(out.data()), DEFAULT_GCS_SYSID);
    EXPECT_EQ(mavlink::getComponentId(out.data()), DEFAULT_GCS_COMPID);
}

// WR-003: Appended CRC validates
TEST_F(FrameWriterTest, CrcValidates) {
    FrameWriter writer;
    auto table = mavlink::defaultCrcExtraTable();

    auto out = writer.prepareForSend(placeholder(33, {0x10, 0x20, 0x30}));

    EXPECT_EQ(mavlink::checkFrameCrc(out.data(), out.size(), *table), mavlink::CrcStatus::Valid);
}

// WR-004: Known HEARTBEAT output
TEST_F(FrameWriterTest, HeartbeatVector) {
    FrameWriter writer(identity(0, 0));
    ByteBuffer expected = {0xFD, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x16, 0x8E};

    auto out = writer.prepareForSend(placeholder(MAVLINK_MSG_ID_HEARTBEAT, {}));

    EXPECT_EQ(out, expected);
}

// WR-005: Sequence counts up and wraps after 255
TEST_F(FrameWriterTest, SequenceWraps) {
    FrameWriter writer;
    auto frame = placeholder(MAVLINK_MSG_ID_HEARTBEAT, {0x01});

    for (int i = 0; i < 256; i++) {
        auto out = writer.prepareForSend(frame);
        ASSERT_EQ(mavlink::getSequence(out.data()), static_cast<uint8_t>(i));
    }

    EXPECT_EQ(writer.getSequence(), 0);
    auto wrapped = writer.prepareForSend(frame);
    EXPECT_EQ(mavlink::getSequence(wrapped.data()), 0);
    EXPECT_EQ(writer.getSequence(), 1);
}

// WR-006: Non-v2 buffers pass through unchanged
TEST_F(FrameWriterTest, Passthrough) {
    FrameWriter writer;
    ByteBuffer v1 = {0xFE, 0x09, 0x00, 0x01, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    ByteBuffer short_buf = {0xFD, 0x01, 0x00};
    ByteBuffer empty;

    EXPECT_EQ(writer.prepareForSend(v1), v1);
    EXPECT_EQ(writer.prepareForSend(short_buf), short_buf);
    EXPECT_EQ(writer.prepareForSend(empty), empty);

    EXPECT_EQ(writer.getSequence(), 0);
    EXPECT_EQ(writer.getStats().passthrough, 3u);
    EXPECT_EQ(writer.getStats().frames_sent, 0u);
}

// WR-007: Stale trailing bytes are replaced by the CRC
TEST_F(FrameWriterTest, TruncatesStaleBytes) {
    FrameWriter writer;
    auto frame = placeholder(30, {0x01, 0x02});
    frame.push_back(0xEE);
    frame.push_back(0xEE);
    frame.push_back(0xEE);

    auto out = writer.prepareForSend(frame);

    EXPECT_EQ(out.size(), mavlink::frameLength(2));
    EXPECT_EQ(mavlink::checkFrameCrc(out.data(), out.size(), *mavlink::defaultCrcExtraTable()),
              mavlink::CrcStatus::Valid);
}

// WR-008: Short payload is zero-padded to its length field
TEST_F(FrameWriterTest, PadsShortPayload) {
    FrameWriter writer;
    ByteBuffer frame = {0xFD, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x1E, 0x00, 0x00, 0x07};

    auto out = writer.prepareForSend(frame);

    ASSERT_EQ(out.size(), mavlink::frameLength(4));
    EXPECT_EQ(out[10], 0x07);
    EXPECT_EQ(out[11], 0x00);
    EXPECT_EQ(out[13], 0x00);
}

// WR-009: Unknown ID gets an unseeded CRC
TEST_F(FrameWriterTest, UnknownIdUnseeded) {
    FrameWriter writer;

    auto out = writer.prepareForSend(placeholder(9999, {0x05}));

    size_t body_len = MAVLINK_HEADER_LEN + 1;
    uint16_t expected = mavlink::crcCalculate(&out[1], body_len - 1);
    EXPECT_EQ(mavlink::getFrameCrc(out.data()), expected);
}

// WR-010: Reset zeroes sequence only
TEST_F(FrameWriterTest, Reset) {
    FrameWriter writer(identity(7, 8));
    auto frame = placeholder(MAVLINK_MSG_ID_HEARTBEAT, {0x01});

    writer.prepareForSend(frame);
    writer.prepareForSend(frame);
    writer.reset();

    EXPECT_EQ(writer.getSequence(), 0);
    EXPECT_EQ(writer.getStats().frames_sent, 0u);

    auto out = writer.prepareForSend(frame);
    EXPECT_EQ(mavlink::getSequence(out.data()), 0);
    EXPECT_EQ(mavlink::getSystemId(out.data()), 7);
}

// WR-011: Writer output round-trips through a reader
TEST_F(FrameWriterTest, ReaderAcceptsOutput) {
    FrameWriter writer(identity(9, 1));
    FrameReader reader;

    ByteBuffer stream;
    for (uint32_t msg_id : {MAVLINK_MSG_ID_HEARTBEAT, MAVLINK_MSG_ID_COMMAND_LONG, 9999u}) {
        auto out = writer.prepareForSend(placeholder(msg_id, {0x01, 0x02, 0x03}));
        stream.insert(stream.end(), out.begin(), out.end());
    }

    auto frames = reader.feed(stream);

    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(mavlink::getSequence(frames[2].data()), 2);
    EXPECT_EQ(mavlink::getMessageId(frames[1].data()), MAVLINK_MSG_ID_COMMAND_LONG);
}
