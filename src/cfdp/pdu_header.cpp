#include "cfdp/pdu_header.hpp"
#include "cfdp/crc.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

uint8_t widthToCode(size_t width) {
    return static_cast<uint8_t>(width & 0b111);
}

size_t codeToWidth(uint8_t code, const char* what) {
    switch (code) {
        case 0b000: return 8;
        case 0b001: return 1;
        case 0b010: return 2;
        case 0b100: return 4;
        default:
            throw RangeError(fmt::format("invalid {} length code {:#05b}", what, code));
    }
}

} // namespace

PduHeader::PduHeader(PduType pduType, const PduConfig& config, SegmentMetadataFlag segMetadataFlag)
    : m_pduType(pduType)
    , m_config(config)
    , m_segMetadataFlag(segMetadataFlag)
{
    setPduConfig(config);
}

void PduHeader::checkHeaderWidth(size_t width, const char* what) {
    if (width != 1 && width != 2 && width != 4 && width != 8) {
        throw RangeError(fmt::format("{} width must be 1, 2, 4 or 8 bytes, got {}", what, width));
    }
}

void PduHeader::setPduConfig(const PduConfig& config) {
    checkHeaderWidth(config.sourceEntityId.byteLen(), "entity ID");
    checkHeaderWidth(config.transactionSeqNum.byteLen(), "sequence number");
    if (config.sourceEntityId.byteLen() != config.destEntityId.byteLen()) {
        throw ValueError(fmt::format("source and destination entity ID widths differ ({} and {})",
                                     config.sourceEntityId.byteLen(), config.destEntityId.byteLen()));
    }
    m_config = config;
}

void PduHeader::setEntityIds(const UnsignedByteField& source, const UnsignedByteField& dest) {
    if (source.byteLen() != dest.byteLen()) {
        throw ValueError(fmt::format("source and destination entity ID widths differ ({} and {})",
                                     source.byteLen(), dest.byteLen()));
    }
    checkHeaderWidth(source.byteLen(), "entity ID");
    m_config.sourceEntityId = source;
    m_config.destEntityId = dest;
}

void PduHeader::setTransactionSeqNum(const UnsignedByteField& seqNum) {
    checkHeaderWidth(seqNum.byteLen(), "sequence number");
    m_config.transactionSeqNum = seqNum;
}

void PduHeader::setTransactionSeqNum(const std::vector<uint8_t>& raw) {
    checkHeaderWidth(raw.size(), "sequence number");
    m_config.transactionSeqNum = UnsignedByteField::fromBytes(raw);
}

void PduHeader::setPduDataFieldLength(size_t len) {
    if (len > UINT16_MAX) {
        throw LengthError(fmt::format("PDU data field length {} exceeds 65535", len));
    }
    m_dataFieldLen = static_cast<uint16_t>(len);
}

size_t PduHeader::headerLen() const {
    return FIXED_LENGTH + 2 * m_config.sourceEntityId.byteLen() + m_config.transactionSeqNum.byteLen();
}

size_t PduHeader::packetLen(size_t dataFieldLen) const {
    return headerLen() + dataFieldLen + crcLen();
}

void PduHeader::writeFssField(utils::BufferWriter& writer, uint64_t value, const char* what) const {
    if (m_config.fileFlag == LargeFileFlag::Normal && value > UINT32_MAX) {
        throw RangeError(fmt::format("{} {} does not fit a 32 bit field, set the large file flag",
                                     what, value));
    }
    writer.writeUnsigned(value, fssLen());
}

// =============================================================================
// Serialization
// =============================================================================

void PduHeader::packInto(std::vector<uint8_t>& out, uint16_t dataFieldLen) const {
    utils::BufferWriter writer(headerLen());
    writer.writeU8(static_cast<uint8_t>(
        (CFDP_VERSION << 5) |
        (static_cast<uint8_t>(m_pduType) << 4) |
        (static_cast<uint8_t>(m_config.direction) << 3) |
        (static_cast<uint8_t>(m_config.transMode) << 2) |
        (static_cast<uint8_t>(m_config.crcFlag) << 1) |
        static_cast<uint8_t>(m_config.fileFlag)));
    writer.writeU16(dataFieldLen);
    writer.writeU8(static_cast<uint8_t>(
        (static_cast<uint8_t>(m_config.segCtrl) << 7) |
        (widthToCode(m_config.sourceEntityId.byteLen()) << 4) |
        (static_cast<uint8_t>(m_segMetadataFlag) << 3) |
        widthToCode(m_config.transactionSeqNum.byteLen())));
    writer.writeUnsigned(m_config.sourceEntityId.value(), m_config.sourceEntityId.byteLen());
    writer.writeUnsigned(m_config.transactionSeqNum.value(), m_config.transactionSeqNum.byteLen());
    writer.writeUnsigned(m_config.destEntityId.value(), m_config.destEntityId.byteLen());
    out.insert(out.end(), writer.data().begin(), writer.data().end());
}

std::vector<uint8_t> PduHeader::pack() const {
    std::vector<uint8_t> out;
    packInto(out, m_dataFieldLen);
    return out;
}

std::vector<uint8_t> PduHeader::packPdu(const std::vector<uint8_t>& dataField) const {
    if (dataField.size() > UINT16_MAX) {
        throw LengthError(fmt::format("PDU data field length {} exceeds 65535", dataField.size()));
    }
    std::vector<uint8_t> out;
    out.reserve(packetLen(dataField.size()));
    packInto(out, static_cast<uint16_t>(dataField.size()));
    out.insert(out.end(), dataField.begin(), dataField.end());
    if (m_config.crcFlag == CrcFlag::WithCrc) {
        uint16_t crc = crc16(out);
        out.push_back(static_cast<uint8_t>(crc >> 8));
        out.push_back(static_cast<uint8_t>(crc & 0xFF));
    }
    return out;
}

PduHeader PduHeader::unpack(const uint8_t* data, size_t size) {
    if (size < FIXED_LENGTH) {
        throw LengthError(fmt::format("PDU header needs at least {} bytes, got {}", FIXED_LENGTH, size));
    }
    utils::BufferReader reader(data, size);
    uint8_t first = reader.readU8();
    uint8_t version = first >> 5;
    if (version != CFDP_VERSION) {
        LOG_DEBUG("Rejecting PDU with version {}", version);
        throw ValueError(fmt::format("unsupported CFDP version {}, expected {}", version, CFDP_VERSION));
    }
    uint16_t dataFieldLen = reader.readU16();
    uint8_t widths = reader.readU8();
    size_t entityIdLen = codeToWidth((widths >> 4) & 0b111, "entity ID");
    size_t seqNumLen = codeToWidth(widths & 0b111, "sequence number");
    if (reader.remaining() < 2 * entityIdLen + seqNumLen) {
        throw LengthError(fmt::format("PDU header needs {} bytes, got {}",
                                      FIXED_LENGTH + 2 * entityIdLen + seqNumLen, size));
    }

    PduConfig config;
    config.direction = static_cast<Direction>((first >> 3) & 1);
    config.transMode = static_cast<TransmissionMode>((first >> 2) & 1);
    config.crcFlag = static_cast<CrcFlag>((first >> 1) & 1);
    config.fileFlag = static_cast<LargeFileFlag>(first & 1);
    config.segCtrl = static_cast<SegmentationControl>(widths >> 7);
    config.sourceEntityId = UnsignedByteField(reader.readUnsigned(entityIdLen), entityIdLen);
    config.transactionSeqNum = UnsignedByteField(reader.readUnsigned(seqNumLen), seqNumLen);
    config.destEntityId = UnsignedByteField(reader.readUnsigned(entityIdLen), entityIdLen);

    PduHeader header(static_cast<PduType>((first >> 4) & 1), config,
                     static_cast<SegmentMetadataFlag>((widths >> 3) & 1));
    header.m_dataFieldLen = dataFieldLen;
    return header;
}

void PduHeader::verifyPacket(const uint8_t* data, size_t size) const {
    size_t expected = packetLen();
    if (size < expected) {
        throw LengthError(fmt::format("PDU declares {} bytes, buffer holds {}", expected, size));
    }
    if (size > expected) {
        throw ValueError(fmt::format("{} trailing bytes after the declared PDU length {}",
                                     size - expected, expected));
    }
    if (m_config.crcFlag == CrcFlag::WithCrc) {
        uint16_t residue = crc16(data, size);
        if (residue != 0) {
            LOG_DEBUG("CRC check failed for PDU {}", utils::toHex(data, size));
            throw ChecksumError(residue);
        }
    }
}

std::string PduHeader::toString() const {
    return fmt::format(
        "PduHeader(type={}, dir={}, mode={}, crc={}, large={}, len={}, src={}, seq={}, dest={})",
        m_pduType == PduType::FileDirective ? "directive" : "file-data",
        m_config.direction == Direction::TowardsReceiver ? "to-receiver" : "to-sender",
        m_config.transMode == TransmissionMode::Acknowledged ? "ack" : "unack",
        m_config.crcFlag == CrcFlag::WithCrc,
        m_config.fileFlag == LargeFileFlag::Large,
        m_dataFieldLen,
        m_config.sourceEntityId.hexStr(),
        m_config.transactionSeqNum.hexStr(),
        m_config.destEntityId.hexStr());
}

} // namespace cfdp
