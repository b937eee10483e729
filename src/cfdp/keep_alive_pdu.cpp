#include "cfdp/keep_alive_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

KeepAlivePdu::KeepAlivePdu(const PduConfig& config, uint64_t progress)
    : m_base(DirectiveCode::KeepAlive, config)
    , m_progress(progress)
{}

std::vector<uint8_t> KeepAlivePdu::pack() const {
    utils::BufferWriter params;
    m_base.writeFssField(params, m_progress, "progress");
    auto raw = m_base.packWithParams(params.data());
    LOG_TRACE("Packed Keep Alive PDU, {} bytes", raw.size());
    return raw;
}

KeepAlivePdu KeepAlivePdu::unpack(const uint8_t* data, size_t size) {
    FileDirectivePduBase base = FileDirectivePduBase::unpack(data, size, DirectiveCode::KeepAlive);
    utils::BufferReader reader = base.paramReader(data);

    uint64_t progress = base.parseFssField(reader);
    if (reader.hasMore()) {
        throw ValueError(fmt::format("{} unexpected bytes after the Keep Alive progress", reader.remaining()));
    }

    KeepAlivePdu pdu(base.header().pduConfig(), progress);
    pdu.m_base = base;
    return pdu;
}

std::string KeepAlivePdu::toString() const {
    return fmt::format("KeepAlivePdu(progress={}, {})", m_progress, header().toString());
}

} // namespace cfdp
