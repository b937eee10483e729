#pragma once

#include "cfdp/pdu_header.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cfdp {

struct SegmentMetadata {
    static constexpr size_t MAX_LEN = 63;

    RecordContinuationState recordContState = RecordContinuationState::NoStartNoEnd;
    std::vector<uint8_t> metadata;

    bool operator==(const SegmentMetadata& other) const {
        return recordContState == other.recordContState && metadata == other.metadata;
    }
    bool operator!=(const SegmentMetadata& other) const { return !(*this == other); }
};

/**
 * File Data PDU (CCSDS 727.0-B-5 5.3)
 *
 * Data field: [record continuation state(2) | metadata length(6), metadata]
 * when the segment metadata flag is set, then the offset (4 or 8 bytes) and
 * the file data up to the end of the data field.
 */
class FileDataPdu {
public:
    FileDataPdu(const PduConfig& config, uint64_t offset, std::vector<uint8_t> fileData,
                std::optional<SegmentMetadata> segmentMetadata = std::nullopt);

    std::vector<uint8_t> pack() const;
    static FileDataPdu unpack(const uint8_t* data, size_t size);
    static FileDataPdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const { return m_header.packetLen(dataFieldLen()); }

    // Room for file data in a PDU of at most maxPacketSize bytes, 0 if none
    size_t maxFileSegmentLength(size_t maxPacketSize) const;

    PduHeader& header() { return m_header; }
    const PduHeader& header() const { return m_header; }
    const PduConfig& pduConfig() const { return m_header.pduConfig(); }

    uint64_t offset() const { return m_offset; }
    void setOffset(uint64_t offset) { m_offset = offset; }

    const std::vector<uint8_t>& fileData() const { return m_fileData; }
    void setFileData(std::vector<uint8_t> data) { m_fileData = std::move(data); }

    bool hasSegmentMetadata() const { return m_segmentMetadata.has_value(); }
    const std::optional<SegmentMetadata>& segmentMetadata() const { return m_segmentMetadata; }
    // Also sets or clears the header's segment metadata flag
    void setSegmentMetadata(std::optional<SegmentMetadata> metadata);

    std::string toString() const;

    bool operator==(const FileDataPdu& other) const {
        return pduConfig() == other.pduConfig() &&
               m_offset == other.m_offset &&
               m_fileData == other.m_fileData &&
               m_segmentMetadata == other.m_segmentMetadata;
    }
    bool operator!=(const FileDataPdu& other) const { return !(*this == other); }

private:
    size_t dataFieldLen() const;

    PduHeader m_header;
    uint64_t m_offset;
    std::vector<uint8_t> m_fileData;
    std::optional<SegmentMetadata> m_segmentMetadata;
};

} // namespace cfdp
