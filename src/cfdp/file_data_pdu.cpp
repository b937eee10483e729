#include "cfdp/file_data_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

FileDataPdu::FileDataPdu(const PduConfig& config, uint64_t offset, std::vector<uint8_t> fileData,
                         std::optional<SegmentMetadata> segmentMetadata)
    : m_header(PduType::FileData, config)
    , m_offset(offset)
    , m_fileData(std::move(fileData))
{
    setSegmentMetadata(std::move(segmentMetadata));
}

void FileDataPdu::setSegmentMetadata(std::optional<SegmentMetadata> metadata) {
    m_header.setSegMetadataFlag(metadata ? SegmentMetadataFlag::Present : SegmentMetadataFlag::NotPresent);
    m_segmentMetadata = std::move(metadata);
}

size_t FileDataPdu::dataFieldLen() const {
    size_t len = m_header.fssLen() + m_fileData.size();
    if (m_segmentMetadata) {
        len += 1 + m_segmentMetadata->metadata.size();
    }
    return len;
}

size_t FileDataPdu::maxFileSegmentLength(size_t maxPacketSize) const {
    size_t overhead = m_header.packetLen(dataFieldLen() - m_fileData.size());
    return maxPacketSize > overhead ? maxPacketSize - overhead : 0;
}

std::vector<uint8_t> FileDataPdu::pack() const {
    bool flagSet = m_header.segMetadataFlag() == SegmentMetadataFlag::Present;
    if (flagSet != m_segmentMetadata.has_value()) {
        throw ValueError(flagSet ? "segment metadata flag set, but no record continuation state given"
                                 : "segment metadata given, but the header flag is not set");
    }
    utils::BufferWriter dataField(dataFieldLen());
    if (m_segmentMetadata) {
        size_t metadataLen = m_segmentMetadata->metadata.size();
        if (metadataLen > SegmentMetadata::MAX_LEN) {
            throw LengthError(fmt::format("segment metadata of {} bytes exceeds {} bytes",
                                          metadataLen, SegmentMetadata::MAX_LEN));
        }
        dataField.writeU8(static_cast<uint8_t>(
            (static_cast<uint8_t>(m_segmentMetadata->recordContState) << 6) | metadataLen));
        dataField.writeBytes(m_segmentMetadata->metadata);
    }
    m_header.writeFssField(dataField, m_offset, "offset");
    dataField.writeBytes(m_fileData);
    auto raw = m_header.packPdu(dataField.data());
    LOG_TRACE("Packed File Data PDU, offset {}, {} bytes", m_offset, raw.size());
    return raw;
}

FileDataPdu FileDataPdu::unpack(const uint8_t* data, size_t size) {
    PduHeader header = PduHeader::unpack(data, size);
    if (header.pduType() != PduType::FileData) {
        throw ValueError("PDU type bit marks a file directive PDU, expected file data");
    }
    header.verifyPacket(data, size);
    utils::BufferReader reader(data + header.headerLen(), header.pduDataFieldLen());

    std::optional<SegmentMetadata> segmentMetadata;
    if (header.segMetadataFlag() == SegmentMetadataFlag::Present) {
        uint8_t first = reader.readU8();
        SegmentMetadata metadata;
        metadata.recordContState = static_cast<RecordContinuationState>(first >> 6);
        metadata.metadata = reader.readBytes(first & 0x3F);
        segmentMetadata = std::move(metadata);
    }
    uint64_t offset = header.parseFssField(reader);
    std::vector<uint8_t> fileData = reader.readBytes(reader.remaining());

    FileDataPdu pdu(header.pduConfig(), offset, std::move(fileData), std::move(segmentMetadata));
    pdu.m_header = header;
    LOG_TRACE("Unpacked File Data PDU, offset {}, {} bytes", offset, size);
    return pdu;
}

std::string FileDataPdu::toString() const {
    return fmt::format("FileDataPdu(offset={}, len={}, segment_metadata={}, {})",
                       m_offset, m_fileData.size(),
                       m_segmentMetadata ? std::to_string(m_segmentMetadata->metadata.size()) + " bytes" : "none",
                       m_header.toString());
}

} // namespace cfdp
