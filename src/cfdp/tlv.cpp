#include "cfdp/tlv.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>
#include <cstring>

namespace cfdp {

namespace {

void expectType(const Tlv& tlv, TlvType expected) {
    if (tlv.type() != expected) {
        throw TypeMismatchError(toString(expected) + " TLV", toString(tlv.type()) + " TLV");
    }
}

std::string lvString(utils::BufferReader& reader) {
    Lv lv = Lv::unpack(reader.current(), reader.remaining());
    reader.skip(lv.packetLen());
    return lv.valueAsString();
}

FilestoreActionCode parseActionCode(uint8_t raw) {
    if (raw > static_cast<uint8_t>(FilestoreActionCode::DenyDirectory)) {
        throw UnrecognizedCodeError(fmt::format("invalid filestore action code {}", raw));
    }
    return static_cast<FilestoreActionCode>(raw);
}

void checkSecondName(FilestoreActionCode action, const std::optional<std::string>& second) {
    if (hasSecondFileName(action) && !second) {
        throw ValueError(fmt::format("filestore action {} requires a second file name",
                                     static_cast<int>(action)));
    }
    if (!hasSecondFileName(action) && second) {
        throw ValueError(fmt::format("filestore action {} takes no second file name",
                                     static_cast<int>(action)));
    }
}

} // namespace

// =============================================================================
// Type tables
// =============================================================================

bool isValidTlvType(uint8_t raw) {
    switch (static_cast<TlvType>(raw)) {
        case TlvType::FilestoreRequest:
        case TlvType::FilestoreResponse:
        case TlvType::MessageToUser:
        case TlvType::FaultHandler:
        case TlvType::FlowLabel:
        case TlvType::EntityId:
            return true;
    }
    return false;
}

std::string toString(TlvType type) {
    switch (type) {
        case TlvType::FilestoreRequest:  return "FilestoreRequest";
        case TlvType::FilestoreResponse: return "FilestoreResponse";
        case TlvType::MessageToUser:     return "MessageToUser";
        case TlvType::FaultHandler:      return "FaultHandler";
        case TlvType::FlowLabel:         return "FlowLabel";
        case TlvType::EntityId:          return "EntityId";
    }
    return fmt::format("TlvType({:#04x})", static_cast<uint8_t>(type));
}

bool hasSecondFileName(FilestoreActionCode action) {
    return action == FilestoreActionCode::RenameFile ||
           action == FilestoreActionCode::AppendFile ||
           action == FilestoreActionCode::ReplaceFile;
}

bool isValidFilestoreStatus(FilestoreActionCode action, uint8_t status) {
    if (status == FILESTORE_STATUS_SUCCESS || status == FILESTORE_STATUS_NOT_PERFORMED) {
        return true;
    }
    switch (action) {
        case FilestoreActionCode::CreateFile:
        case FilestoreActionCode::DeleteFile:
        case FilestoreActionCode::CreateDirectory:
            return status == 0b0001;
        case FilestoreActionCode::RenameFile:
        case FilestoreActionCode::AppendFile:
        case FilestoreActionCode::ReplaceFile:
            return status >= 0b0001 && status <= 0b0011;
        case FilestoreActionCode::RemoveDirectory:
            return status == 0b0001 || status == 0b0010;
        case FilestoreActionCode::DenyFile:
        case FilestoreActionCode::DenyDirectory:
            return status == 0b0010;
    }
    return false;
}

// =============================================================================
// Tlv
// =============================================================================

void Tlv::packInto(std::vector<uint8_t>& out) const {
    if (m_value.size() > MAX_VALUE_LEN) {
        throw LengthError(fmt::format("TLV value of {} bytes exceeds {} bytes", m_value.size(), MAX_VALUE_LEN));
    }
    out.push_back(static_cast<uint8_t>(m_type));
    out.push_back(static_cast<uint8_t>(m_value.size()));
    out.insert(out.end(), m_value.begin(), m_value.end());
}

std::vector<uint8_t> Tlv::pack() const {
    std::vector<uint8_t> out;
    out.reserve(packetLen());
    packInto(out);
    return out;
}

Tlv Tlv::unpack(const uint8_t* data, size_t size) {
    if (size < 2) {
        throw LengthError(fmt::format("TLV needs at least 2 bytes, got {}", size));
    }
    utils::BufferReader reader(data, size);
    uint8_t rawType = reader.readU8();
    if (!isValidTlvType(rawType)) {
        LOG_DEBUG("Rejecting TLV with type {:#04x}", rawType);
        throw UnrecognizedCodeError(fmt::format("unrecognized TLV type {:#04x}", rawType));
    }
    uint8_t len = reader.readU8();
    if (reader.remaining() < len) {
        throw LengthError(fmt::format("TLV declares {} value bytes, only {} available", len, reader.remaining()));
    }
    return Tlv(static_cast<TlvType>(rawType), reader.readBytes(len));
}

EntityIdTlv Tlv::asEntityId() const { return EntityIdTlv::fromTlv(*this); }
FilestoreRequestTlv Tlv::asFilestoreRequest() const { return FilestoreRequestTlv::fromTlv(*this); }
FilestoreResponseTlv Tlv::asFilestoreResponse() const { return FilestoreResponseTlv::fromTlv(*this); }
FaultHandlerOverrideTlv Tlv::asFaultHandlerOverride() const { return FaultHandlerOverrideTlv::fromTlv(*this); }
MessageToUserTlv Tlv::asMessageToUser() const { return MessageToUserTlv::fromTlv(*this); }
FlowLabelTlv Tlv::asFlowLabel() const { return FlowLabelTlv::fromTlv(*this); }

std::string Tlv::toString() const {
    return fmt::format("{} TLV [{}]", cfdp::toString(m_type), utils::toHex(m_value));
}

// =============================================================================
// Entity ID
// =============================================================================

EntityIdTlv EntityIdTlv::fromTlv(const Tlv& tlv) {
    expectType(tlv, TlvType::EntityId);
    return EntityIdTlv(UnsignedByteField::fromBytes(tlv.value()));
}

Tlv EntityIdTlv::toTlv() const {
    return Tlv(TlvType::EntityId, m_entityId.toBytes());
}

// =============================================================================
// Filestore request / response
// =============================================================================

FilestoreRequestTlv::FilestoreRequestTlv(FilestoreActionCode action, std::string firstFileName,
                                         std::optional<std::string> secondFileName)
    : m_action(action)
    , m_firstFileName(std::move(firstFileName))
    , m_secondFileName(std::move(secondFileName))
{
    checkSecondName(m_action, m_secondFileName);
}

FilestoreRequestTlv FilestoreRequestTlv::fromTlv(const Tlv& tlv) {
    expectType(tlv, TlvType::FilestoreRequest);
    utils::BufferReader reader(tlv.value());
    FilestoreActionCode action = parseActionCode(reader.readU8() >> 4);
    std::string first = lvString(reader);
    std::optional<std::string> second;
    if (hasSecondFileName(action)) {
        second = lvString(reader);
    }
    return FilestoreRequestTlv(action, std::move(first), std::move(second));
}

Tlv FilestoreRequestTlv::toTlv() const {
    std::vector<uint8_t> value;
    value.push_back(static_cast<uint8_t>(static_cast<uint8_t>(m_action) << 4));
    Lv::fromString(m_firstFileName).packInto(value);
    if (m_secondFileName) {
        Lv::fromString(*m_secondFileName).packInto(value);
    }
    return Tlv(TlvType::FilestoreRequest, std::move(value));
}

FilestoreResponseTlv::FilestoreResponseTlv(FilestoreActionCode action, uint8_t statusCode,
                                           std::string firstFileName,
                                           std::optional<std::string> secondFileName,
                                           std::string filestoreMessage)
    : m_action(action)
    , m_status(statusCode)
    , m_firstFileName(std::move(firstFileName))
    , m_secondFileName(std::move(secondFileName))
    , m_message(std::move(filestoreMessage))
{
    if (!isValidFilestoreStatus(m_action, m_status)) {
        throw UnrecognizedCodeError(fmt::format("status code {:#06b} is invalid for filestore action {}",
                                                m_status, static_cast<int>(m_action)));
    }
    checkSecondName(m_action, m_secondFileName);
}

FilestoreResponseTlv FilestoreResponseTlv::fromTlv(const Tlv& tlv) {
    expectType(tlv, TlvType::FilestoreResponse);
    utils::BufferReader reader(tlv.value());
    uint8_t codes = reader.readU8();
    FilestoreActionCode action = parseActionCode(codes >> 4);
    std::string first = lvString(reader);
    std::optional<std::string> second;
    if (hasSecondFileName(action)) {
        second = lvString(reader);
    }
    std::string message;
    if (reader.hasMore()) {
        message = lvString(reader);
    }
    return FilestoreResponseTlv(action, codes & 0x0F, std::move(first), std::move(second),
                                std::move(message));
}

Tlv FilestoreResponseTlv::toTlv() const {
    std::vector<uint8_t> value;
    value.push_back(static_cast<uint8_t>((static_cast<uint8_t>(m_action) << 4) | m_status));
    Lv::fromString(m_firstFileName).packInto(value);
    if (m_secondFileName) {
        Lv::fromString(*m_secondFileName).packInto(value);
    }
    Lv::fromString(m_message).packInto(value);
    return Tlv(TlvType::FilestoreResponse, std::move(value));
}

// =============================================================================
// Fault handler override
// =============================================================================

FaultHandlerOverrideTlv FaultHandlerOverrideTlv::fromTlv(const Tlv& tlv) {
    expectType(tlv, TlvType::FaultHandler);
    if (tlv.valueLen() != 1) {
        throw LengthError(fmt::format("fault handler override TLV needs 1 value byte, got {}", tlv.valueLen()));
    }
    uint8_t raw = tlv.value()[0];
    uint8_t handler = raw & 0x0F;
    if (handler < static_cast<uint8_t>(FaultHandlerCode::NoticeOfCancellation) ||
        handler > static_cast<uint8_t>(FaultHandlerCode::AbandonTransaction)) {
        throw UnrecognizedCodeError(fmt::format("invalid fault handler code {}", handler));
    }
    return FaultHandlerOverrideTlv(conditionCodeFromRaw(raw >> 4),
                                   static_cast<FaultHandlerCode>(handler));
}

Tlv FaultHandlerOverrideTlv::toTlv() const {
    uint8_t raw = static_cast<uint8_t>((static_cast<uint8_t>(m_conditionCode) << 4) |
                                       static_cast<uint8_t>(m_handlerCode));
    return Tlv(TlvType::FaultHandler, {raw});
}

// =============================================================================
// Message to user / flow label
// =============================================================================

MessageToUserTlv MessageToUserTlv::fromTlv(const Tlv& tlv) {
    expectType(tlv, TlvType::MessageToUser);
    return MessageToUserTlv(tlv.value());
}

bool MessageToUserTlv::isStandardProxyDirOpsMsg() const {
    return m_value.size() >= RESERVED_MESSAGE_MARKER_LEN &&
           std::memcmp(m_value.data(), RESERVED_MESSAGE_MARKER, RESERVED_MESSAGE_MARKER_LEN) == 0;
}

std::optional<uint8_t> MessageToUserTlv::reservedMessageType() const {
    if (!isStandardProxyDirOpsMsg() || m_value.size() <= RESERVED_MESSAGE_MARKER_LEN) {
        return std::nullopt;
    }
    return m_value[RESERVED_MESSAGE_MARKER_LEN];
}

FlowLabelTlv FlowLabelTlv::fromTlv(const Tlv& tlv) {
    expectType(tlv, TlvType::FlowLabel);
    return FlowLabelTlv(tlv.value());
}

} // namespace cfdp
