#include "session.hpp"

#include <spdlog/spdlog.h>

namespace mavgw {
namespace protocol {

namespace {

ReaderOptions readerOptions(const SessionConfig& config) {
    ReaderOptions options;
    options.target_sysid = config.target_sysid;
    options.allow_empty_data = config.allow_empty_data;
    return options;
}

WriterOptions writerOptions(const SessionConfig& config) {
    WriterOptions options;
    options.gcs_sysid = config.gcs_sysid;
    options.gcs_compid = config.gcs_compid;
    return options;
}

}  // namespace

Session::Session(const SessionConfig& config, std::shared_ptr<const mavlink::CrcExtraTable> table)
    : m_config(config),
      m_table(table ? std::move(table) : mavlink::defaultCrcExtraTable()),
      m_reader(readerOptions(config), m_table),
      m_writer(writerOptions(config), m_table) {
    spdlog::info("Initialized MAVLink session: sysid={}, compid={}, target_sysid={} ({} CRC_EXTRA entries)",
        config.gcs_sysid, config.gcs_compid, config.target_sysid, m_table->size());
}

std::vector<ByteBuffer> Session::readData(const uint8_t* data, size_t len) {
    return m_reader.feed(data, len);
}

std::vector<ByteBuffer> Session::readData(const ByteBuffer& data) {
    return m_reader.feed(data);
}

ByteBuffer Session::writeData(ByteBuffer frame) {
    return m_writer.prepareForSend(std::move(frame));
}

void Session::reset() {
    spdlog::debug("MAVLink session reset ({} buffered bytes dropped)", m_reader.buffered());
    m_reader.reset();
    m_writer.reset();
}

}  // namespace protocol
}  // namespace mavgw
