#pragma once

#include "cfdp/defs.hpp"
#include "cfdp/pdu_config.hpp"
#include "cfdp/unsigned_byte_field.hpp"

#include "utils/buffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cfdp {

/**
 * PDU Header
 *
 * Common header of every CFDP PDU (CCSDS 727.0-B-5 5.1):
 *   [0]    version(3) | pdu_type(1) | direction(1) | trans_mode(1) | crc(1) | large_file(1)
 *   [1..2] PDU data field length, big-endian, excludes the CRC trailer
 *   [3]    seg_ctrl(1) | entity_id_len(3) | seg_metadata(1) | seq_num_len(3)
 *   source entity ID, transaction sequence number, destination entity ID
 *
 * The length codes hold the literal byte count. Width 8 does not fit the
 * three bits and is stored as 0.
 */
class PduHeader {
public:
    static constexpr size_t FIXED_LENGTH = 4;
    static constexpr size_t CRC_LEN = 2;

    PduHeader(PduType pduType, const PduConfig& config,
              SegmentMetadataFlag segMetadataFlag = SegmentMetadataFlag::NotPresent);

    // Header bytes only, with the stored data field length
    std::vector<uint8_t> pack() const;

    /**
     * Serialize a complete PDU: header, data field and the CRC trailer if
     * the CRC flag is set. The data field length is taken from dataField.
     */
    std::vector<uint8_t> packPdu(const std::vector<uint8_t>& dataField) const;

    static PduHeader unpack(const uint8_t* data, size_t size);
    static PduHeader unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    /**
     * Check a raw PDU against this (already parsed) header: the buffer must
     * hold exactly the declared length, and the CRC must verify if present.
     */
    void verifyPacket(const uint8_t* data, size_t size) const;

    // Lengths
    size_t headerLen() const;
    size_t packetLen() const { return packetLen(m_dataFieldLen); }
    size_t packetLen(size_t dataFieldLen) const;
    size_t crcLen() const { return m_config.crcFlag == CrcFlag::WithCrc ? CRC_LEN : 0; }
    uint16_t pduDataFieldLen() const { return m_dataFieldLen; }
    // Throws LengthError above 65535
    void setPduDataFieldLength(size_t len);

    // Field access
    PduType pduType() const { return m_pduType; }
    void setPduType(PduType type) { m_pduType = type; }

    const PduConfig& pduConfig() const { return m_config; }
    void setPduConfig(const PduConfig& config);

    Direction direction() const { return m_config.direction; }
    void setDirection(Direction direction) { m_config.direction = direction; }

    TransmissionMode transMode() const { return m_config.transMode; }
    void setTransMode(TransmissionMode mode) { m_config.transMode = mode; }

    CrcFlag crcFlag() const { return m_config.crcFlag; }
    void setCrcFlag(CrcFlag flag) { m_config.crcFlag = flag; }

    LargeFileFlag largeFileFlag() const { return m_config.fileFlag; }
    void setLargeFileFlag(LargeFileFlag flag) { m_config.fileFlag = flag; }

    SegmentationControl segCtrl() const { return m_config.segCtrl; }
    void setSegCtrl(SegmentationControl segCtrl) { m_config.segCtrl = segCtrl; }

    SegmentMetadataFlag segMetadataFlag() const { return m_segMetadataFlag; }
    void setSegMetadataFlag(SegmentMetadataFlag flag) { m_segMetadataFlag = flag; }

    const UnsignedByteField& sourceEntityId() const { return m_config.sourceEntityId; }
    const UnsignedByteField& destEntityId() const { return m_config.destEntityId; }
    // Both IDs at once; throws ValueError on differing widths
    void setEntityIds(const UnsignedByteField& source, const UnsignedByteField& dest);

    const UnsignedByteField& transactionSeqNum() const { return m_config.transactionSeqNum; }
    void setTransactionSeqNum(const UnsignedByteField& seqNum);
    // Width taken from the buffer length, which must be 1, 2, 4 or 8
    void setTransactionSeqNum(const std::vector<uint8_t>& raw);

    // File size sensitive fields, 4 or 8 bytes depending on the large file flag
    size_t fssLen() const { return fssWidth(m_config.fileFlag); }
    uint64_t parseFssField(utils::BufferReader& reader) const { return reader.readUnsigned(fssLen()); }
    // Throws RangeError if the value does not fit a normal (32 bit) field
    void writeFssField(utils::BufferWriter& writer, uint64_t value, const char* what) const;

    TransactionId transactionId() const { return {m_config.sourceEntityId, m_config.transactionSeqNum}; }

    std::string toString() const;

    bool operator==(const PduHeader& other) const {
        return m_pduType == other.m_pduType && m_config == other.m_config &&
               m_segMetadataFlag == other.m_segMetadataFlag &&
               m_dataFieldLen == other.m_dataFieldLen;
    }
    bool operator!=(const PduHeader& other) const { return !(*this == other); }

private:
    void packInto(std::vector<uint8_t>& out, uint16_t dataFieldLen) const;
    static void checkHeaderWidth(size_t width, const char* what);

    PduType m_pduType;
    PduConfig m_config;
    SegmentMetadataFlag m_segMetadataFlag;
    uint16_t m_dataFieldLen = 0;
};

} // namespace cfdp
