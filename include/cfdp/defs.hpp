#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace cfdp {

constexpr uint8_t CFDP_VERSION = 0b001;

// =============================================================================
// Header flags
// =============================================================================
enum class PduType : uint8_t {
    FileDirective = 0,
    FileData      = 1,
};

enum class Direction : uint8_t {
    TowardsReceiver = 0,
    TowardsSender   = 1,
};

enum class TransmissionMode : uint8_t {
    Acknowledged   = 0,
    Unacknowledged = 1,
};

enum class CrcFlag : uint8_t {
    NoCrc   = 0,
    WithCrc = 1,
};

enum class LargeFileFlag : uint8_t {
    Normal = 0,
    Large  = 1,
};

enum class SegmentationControl : uint8_t {
    NoRecordBoundaries = 0,
    RecordBoundaries   = 1,
};

enum class SegmentMetadataFlag : uint8_t {
    NotPresent = 0,
    Present    = 1,
};

// =============================================================================
// File directive codes (CCSDS 727.0-B-5 table 5-4)
// =============================================================================
enum class DirectiveCode : uint8_t {
    Eof       = 0x04,
    Finished  = 0x05,
    Ack       = 0x06,
    Metadata  = 0x07,
    Nak       = 0x08,
    Prompt    = 0x09,
    KeepAlive = 0x0C,
};

bool isValidDirectiveCode(uint8_t raw);

// =============================================================================
// Directive field enumerations
// =============================================================================
enum class ConditionCode : uint8_t {
    NoError                  = 0b0000,
    PositiveAckLimitReached  = 0b0001,
    KeepAliveLimitReached    = 0b0010,
    InvalidTransmissionMode  = 0b0011,
    FilestoreRejection       = 0b0100,
    FileChecksumFailure      = 0b0101,
    FileSizeError            = 0b0110,
    NakLimitReached          = 0b0111,
    InactivityDetected       = 0b1000,
    CheckLimitReached        = 0b1010,
    UnsupportedChecksumType  = 0b1011,
    SuspendRequestReceived   = 0b1110,
    CancelRequestReceived    = 0b1111,
};

enum class ChecksumType : uint8_t {
    Modular         = 0,
    Crc32Proximity1 = 1,
    Crc32C          = 2,
    Crc32           = 3,
    NullChecksum    = 15,
};

// Range checks for raw nibbles read off the wire
bool isValidConditionCode(uint8_t raw);
bool isValidChecksumType(uint8_t raw);

// Throw UnrecognizedCodeError for a value outside the enumeration
ConditionCode conditionCodeFromRaw(uint8_t raw);
ChecksumType checksumTypeFromRaw(uint8_t raw);

enum class FaultHandlerCode : uint8_t {
    NoticeOfCancellation = 0b0001,
    NoticeOfSuspension   = 0b0010,
    IgnoreError          = 0b0011,
    AbandonTransaction   = 0b0100,
};

enum class DeliveryCode : uint8_t {
    DataComplete   = 0,
    DataIncomplete = 1,
};

enum class FileStatus : uint8_t {
    DiscardedDeliberately       = 0b00,
    DiscardedFilestoreRejection = 0b01,
    Retained                    = 0b10,
    Unreported                  = 0b11,
};

enum class TransactionStatus : uint8_t {
    Undefined    = 0b00,
    Active       = 0b01,
    Terminated   = 0b10,
    Unrecognized = 0b11,
};

enum class ResponseRequired : uint8_t {
    Nak       = 0,
    KeepAlive = 1,
};

enum class RecordContinuationState : uint8_t {
    NoStartNoEnd  = 0b00,
    StartWithoutEnd = 0b01,
    EndWithoutStart = 0b10,
    StartAndEnd   = 0b11,
};

/** Size of a file-size-sensitive field (FSS) for the given flag. */
constexpr std::size_t fssWidth(LargeFileFlag flag) {
    return flag == LargeFileFlag::Large ? 8 : 4;
}

std::string toString(DirectiveCode code);
std::string toString(ConditionCode code);

} // namespace cfdp
