#include "cfdp/defs.hpp"
#include "cfdp/exceptions.hpp"

#include <fmt/format.h>

namespace cfdp {

ChecksumError::ChecksumError(uint16_t residue)
    : std::runtime_error(fmt::format("invalid CRC-16 trailer, residue {:#06x}", residue))
    , m_residue(residue)
{}

bool isValidDirectiveCode(uint8_t raw) {
    switch (static_cast<DirectiveCode>(raw)) {
        case DirectiveCode::Eof:
        case DirectiveCode::Finished:
        case DirectiveCode::Ack:
        case DirectiveCode::Metadata:
        case DirectiveCode::Nak:
        case DirectiveCode::Prompt:
        case DirectiveCode::KeepAlive:
            return true;
    }
    return false;
}

bool isValidConditionCode(uint8_t raw) {
    switch (static_cast<ConditionCode>(raw)) {
        case ConditionCode::NoError:
        case ConditionCode::PositiveAckLimitReached:
        case ConditionCode::KeepAliveLimitReached:
        case ConditionCode::InvalidTransmissionMode:
        case ConditionCode::FilestoreRejection:
        case ConditionCode::FileChecksumFailure:
        case ConditionCode::FileSizeError:
        case ConditionCode::NakLimitReached:
        case ConditionCode::InactivityDetected:
        case ConditionCode::CheckLimitReached:
        case ConditionCode::UnsupportedChecksumType:
        case ConditionCode::SuspendRequestReceived:
        case ConditionCode::CancelRequestReceived:
            return true;
    }
    return false;
}

bool isValidChecksumType(uint8_t raw) {
    switch (static_cast<ChecksumType>(raw)) {
        case ChecksumType::Modular:
        case ChecksumType::Crc32Proximity1:
        case ChecksumType::Crc32C:
        case ChecksumType::Crc32:
        case ChecksumType::NullChecksum:
            return true;
    }
    return false;
}

ConditionCode conditionCodeFromRaw(uint8_t raw) {
    if (!isValidConditionCode(raw)) {
        throw UnrecognizedCodeError(fmt::format("unrecognized condition code {:#06b}", raw));
    }
    return static_cast<ConditionCode>(raw);
}

ChecksumType checksumTypeFromRaw(uint8_t raw) {
    if (!isValidChecksumType(raw)) {
        throw UnrecognizedCodeError(fmt::format("unrecognized checksum type {}", raw));
    }
    return static_cast<ChecksumType>(raw);
}

std::string toString(DirectiveCode code) {
    switch (code) {
        case DirectiveCode::Eof:       return "EOF";
        case DirectiveCode::Finished:  return "Finished";
        case DirectiveCode::Ack:       return "ACK";
        case DirectiveCode::Metadata:  return "Metadata";
        case DirectiveCode::Nak:       return "NAK";
        case DirectiveCode::Prompt:    return "Prompt";
        case DirectiveCode::KeepAlive: return "KeepAlive";
    }
    return fmt::format("Directive({:#04x})", static_cast<uint8_t>(code));
}

std::string toString(ConditionCode code) {
    switch (code) {
        case ConditionCode::NoError:                 return "NoError";
        case ConditionCode::PositiveAckLimitReached: return "PositiveAckLimitReached";
        case ConditionCode::KeepAliveLimitReached:   return "KeepAliveLimitReached";
        case ConditionCode::InvalidTransmissionMode: return "InvalidTransmissionMode";
        case ConditionCode::FilestoreRejection:      return "FilestoreRejection";
        case ConditionCode::FileChecksumFailure:     return "FileChecksumFailure";
        case ConditionCode::FileSizeError:           return "FileSizeError";
        case ConditionCode::NakLimitReached:         return "NakLimitReached";
        case ConditionCode::InactivityDetected:      return "InactivityDetected";
        case ConditionCode::CheckLimitReached:       return "CheckLimitReached";
        case ConditionCode::UnsupportedChecksumType: return "UnsupportedChecksumType";
        case ConditionCode::SuspendRequestReceived:  return "SuspendRequestReceived";
        case ConditionCode::CancelRequestReceived:   return "CancelRequestReceived";
    }
    return fmt::format("ConditionCode({})", static_cast<int>(code));
}

} // namespace cfdp
