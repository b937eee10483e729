#pragma once

#include "cfdp/defs.hpp"
#include "cfdp/unsigned_byte_field.hpp"

namespace cfdp {

/**
 * PDU configuration
 *
 * The header parameters every PDU is built from. Source and destination
 * entity IDs must share one width; the sequence number width is free.
 */
struct PduConfig {
    UnsignedByteField sourceEntityId{0, 1};
    UnsignedByteField destEntityId{0, 1};
    UnsignedByteField transactionSeqNum{0, 1};
    TransmissionMode transMode = TransmissionMode::Acknowledged;
    LargeFileFlag fileFlag = LargeFileFlag::Normal;
    CrcFlag crcFlag = CrcFlag::NoCrc;
    Direction direction = Direction::TowardsReceiver;
    SegmentationControl segCtrl = SegmentationControl::NoRecordBoundaries;

    // 1-byte zero IDs and sequence number, acknowledged mode
    static PduConfig empty() { return PduConfig{}; }

    // Zero IDs with the widths and flags of the process-wide codec config
    static PduConfig defaultConfig();

    bool operator==(const PduConfig& other) const {
        return sourceEntityId == other.sourceEntityId &&
               destEntityId == other.destEntityId &&
               transactionSeqNum == other.transactionSeqNum &&
               transMode == other.transMode &&
               fileFlag == other.fileFlag &&
               crcFlag == other.crcFlag &&
               direction == other.direction &&
               segCtrl == other.segCtrl;
    }
    bool operator!=(const PduConfig& other) const { return !(*this == other); }
};

} // namespace cfdp
