#include "cfdp/eof_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

PduConfig towardsReceiver(PduConfig config) {
    config.direction = Direction::TowardsReceiver;
    return config;
}

} // namespace

EofPdu::EofPdu(const PduConfig& config, uint32_t fileChecksum, uint64_t fileSize,
               ConditionCode conditionCode, std::optional<EntityIdTlv> faultLocation)
    : m_base(DirectiveCode::Eof, towardsReceiver(config))
    , m_conditionCode(conditionCode)
    , m_fileChecksum(fileChecksum)
    , m_fileSize(fileSize)
    , m_faultLocation(std::move(faultLocation))
{}

size_t EofPdu::packetLen() const {
    size_t params = 1 + 4 + m_base.fssLen();
    if (m_faultLocation) {
        params += 2 + m_faultLocation->entityId().byteLen();
    }
    return m_base.packetLen(params);
}

std::vector<uint8_t> EofPdu::pack() const {
    utils::BufferWriter params;
    params.writeU8(static_cast<uint8_t>(static_cast<uint8_t>(m_conditionCode) << 4));
    params.writeU32(m_fileChecksum);
    m_base.writeFssField(params, m_fileSize, "file size");
    if (m_faultLocation) {
        params.writeBytes(m_faultLocation->pack());
    }
    auto raw = m_base.packWithParams(params.data());
    LOG_TRACE("Packed EOF PDU, {} bytes", raw.size());
    return raw;
}

EofPdu EofPdu::unpack(const uint8_t* data, size_t size) {
    FileDirectivePduBase base = FileDirectivePduBase::unpack(data, size, DirectiveCode::Eof);
    utils::BufferReader reader = base.paramReader(data);

    auto conditionCode = conditionCodeFromRaw(reader.readU8() >> 4);
    uint32_t checksum = reader.readU32();
    uint64_t fileSize = base.parseFssField(reader);
    std::optional<EntityIdTlv> faultLocation;
    if (reader.hasMore()) {
        Tlv tlv = Tlv::unpack(reader.current(), reader.remaining());
        reader.skip(tlv.packetLen());
        faultLocation = tlv.asEntityId();
    }
    if (reader.hasMore()) {
        throw ValueError(fmt::format("{} unexpected bytes after the EOF fault location", reader.remaining()));
    }

    EofPdu pdu(base.header().pduConfig(), checksum, fileSize, conditionCode, std::move(faultLocation));
    pdu.m_base = base;
    LOG_TRACE("Unpacked EOF PDU, {} bytes", size);
    return pdu;
}

std::string EofPdu::toString() const {
    return fmt::format("EofPdu(cc={}, checksum={:#010x}, size={}, fault_location={}, {})",
                       cfdp::toString(m_conditionCode), m_fileChecksum, m_fileSize,
                       m_faultLocation ? m_faultLocation->entityId().hexStr() : "none",
                       header().toString());
}

bool EofPdu::operator==(const EofPdu& other) const {
    return pduConfig() == other.pduConfig() &&
           m_conditionCode == other.m_conditionCode &&
           m_fileChecksum == other.m_fileChecksum &&
           m_fileSize == other.m_fileSize &&
           m_faultLocation == other.m_faultLocation;
}

} // namespace cfdp
