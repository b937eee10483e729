#pragma once

#include "cfdp/defs.hpp"
#include "cfdp/lv.hpp"
#include "cfdp/unsigned_byte_field.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cfdp {

// =============================================================================
// TLV types (CCSDS 727.0-B-5 table 5-3)
// =============================================================================
enum class TlvType : uint8_t {
    FilestoreRequest  = 0x00,
    FilestoreResponse = 0x01,
    MessageToUser     = 0x02,
    FaultHandler      = 0x04,
    FlowLabel         = 0x05,
    EntityId          = 0x06,
};

bool isValidTlvType(uint8_t raw);
std::string toString(TlvType type);

enum class FilestoreActionCode : uint8_t {
    CreateFile      = 0b0000,
    DeleteFile      = 0b0001,
    RenameFile      = 0b0010,
    AppendFile      = 0b0011,
    ReplaceFile     = 0b0100,
    CreateDirectory = 0b0101,
    RemoveDirectory = 0b0110,
    DenyFile        = 0b0111,
    DenyDirectory   = 0b1000,
};

// Only rename, append and replace carry a second file name
bool hasSecondFileName(FilestoreActionCode action);

constexpr uint8_t FILESTORE_STATUS_SUCCESS = 0b0000;
constexpr uint8_t FILESTORE_STATUS_NOT_PERFORMED = 0b1111;

// Legal (action, status) pairs for filestore responses
bool isValidFilestoreStatus(FilestoreActionCode action, uint8_t status);

enum class ProxyMessageType : uint8_t {
    PutRequest           = 0x00,
    MsgToUser            = 0x01,
    FilestoreRequest     = 0x02,
    FaultHandlerOverride = 0x03,
    TransmissionMode     = 0x04,
    FlowLabel            = 0x05,
    SegmentationControl  = 0x06,
    PutResponse          = 0x07,
    FilestoreResponse    = 0x08,
    PutCancel            = 0x09,
    ClosureRequest       = 0x0B,
};

// Leading bytes of every reserved CFDP message
inline constexpr char RESERVED_MESSAGE_MARKER[] = "cfdp";
constexpr size_t RESERVED_MESSAGE_MARKER_LEN = 4;

// Reserved message type outside both the proxy and directory sets
constexpr uint8_t ORIGINATING_TRANSACTION_ID_MSG_TYPE = 0x0A;

enum class DirectoryOperationMessageType : uint8_t {
    ListingRequest          = 0x10,
    ListingResponse         = 0x11,
    CustomListingParameters = 0x15,
};

class EntityIdTlv;
class FilestoreRequestTlv;
class FilestoreResponseTlv;
class FaultHandlerOverrideTlv;
class MessageToUserTlv;
class FlowLabelTlv;
class ReservedCfdpMessage;

/**
 * Generic Type-Length-Value field
 *
 * Envelope for the optional parameters of Metadata, EOF and Finished PDUs.
 * The typed wrappers below give structured access and refuse a TLV of the
 * wrong type.
 */
class Tlv {
public:
    static constexpr size_t MAX_VALUE_LEN = 255;

    Tlv(TlvType type, std::vector<uint8_t> value)
        : m_type(type)
        , m_value(std::move(value))
    {}

    // Throws LengthError if the value exceeds 255 bytes
    std::vector<uint8_t> pack() const;
    void packInto(std::vector<uint8_t>& out) const;

    // Parses one TLV from the front of the buffer; trailing bytes are ignored
    static Tlv unpack(const uint8_t* data, size_t size);
    static Tlv unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    TlvType type() const { return m_type; }
    const std::vector<uint8_t>& value() const { return m_value; }
    size_t valueLen() const { return m_value.size(); }
    size_t packetLen() const { return 2 + m_value.size(); }

    // Typed views, each throws TypeMismatchError on a type tag mismatch
    EntityIdTlv asEntityId() const;
    FilestoreRequestTlv asFilestoreRequest() const;
    FilestoreResponseTlv asFilestoreResponse() const;
    FaultHandlerOverrideTlv asFaultHandlerOverride() const;
    MessageToUserTlv asMessageToUser() const;
    FlowLabelTlv asFlowLabel() const;

    std::string toString() const;

    bool operator==(const Tlv& other) const {
        return m_type == other.m_type && m_value == other.m_value;
    }
    bool operator!=(const Tlv& other) const { return !(*this == other); }

private:
    TlvType m_type;
    std::vector<uint8_t> m_value;
};

// =============================================================================
// Typed TLVs
// =============================================================================

class EntityIdTlv {
public:
    explicit EntityIdTlv(UnsignedByteField entityId) : m_entityId(entityId) {}

    static EntityIdTlv fromTlv(const Tlv& tlv);
    Tlv toTlv() const;
    std::vector<uint8_t> pack() const { return toTlv().pack(); }

    const UnsignedByteField& entityId() const { return m_entityId; }

    bool operator==(const EntityIdTlv& other) const { return m_entityId == other.m_entityId; }
    bool operator!=(const EntityIdTlv& other) const { return !(*this == other); }

private:
    UnsignedByteField m_entityId;
};

class FilestoreRequestTlv {
public:
    FilestoreRequestTlv(FilestoreActionCode action, std::string firstFileName,
                        std::optional<std::string> secondFileName = std::nullopt);

    static FilestoreRequestTlv fromTlv(const Tlv& tlv);
    Tlv toTlv() const;
    std::vector<uint8_t> pack() const { return toTlv().pack(); }

    FilestoreActionCode actionCode() const { return m_action; }
    const std::string& firstFileName() const { return m_firstFileName; }
    const std::optional<std::string>& secondFileName() const { return m_secondFileName; }

private:
    FilestoreActionCode m_action;
    std::string m_firstFileName;
    std::optional<std::string> m_secondFileName;
};

class FilestoreResponseTlv {
public:
    // Throws UnrecognizedCodeError for an illegal (action, status) pair
    FilestoreResponseTlv(FilestoreActionCode action, uint8_t statusCode,
                         std::string firstFileName,
                         std::optional<std::string> secondFileName = std::nullopt,
                         std::string filestoreMessage = {});

    static FilestoreResponseTlv fromTlv(const Tlv& tlv);
    Tlv toTlv() const;
    std::vector<uint8_t> pack() const { return toTlv().pack(); }

    FilestoreActionCode actionCode() const { return m_action; }
    uint8_t statusCode() const { return m_status; }
    const std::string& firstFileName() const { return m_firstFileName; }
    const std::optional<std::string>& secondFileName() const { return m_secondFileName; }
    const std::string& filestoreMessage() const { return m_message; }

    bool operator==(const FilestoreResponseTlv& other) const {
        return m_action == other.m_action && m_status == other.m_status &&
               m_firstFileName == other.m_firstFileName &&
               m_secondFileName == other.m_secondFileName && m_message == other.m_message;
    }
    bool operator!=(const FilestoreResponseTlv& other) const { return !(*this == other); }

private:
    FilestoreActionCode m_action;
    uint8_t m_status;
    std::string m_firstFileName;
    std::optional<std::string> m_secondFileName;
    std::string m_message;
};

class FaultHandlerOverrideTlv {
public:
    FaultHandlerOverrideTlv(ConditionCode conditionCode, FaultHandlerCode handlerCode)
        : m_conditionCode(conditionCode)
        , m_handlerCode(handlerCode)
    {}

    static FaultHandlerOverrideTlv fromTlv(const Tlv& tlv);
    Tlv toTlv() const;
    std::vector<uint8_t> pack() const { return toTlv().pack(); }

    ConditionCode conditionCode() const { return m_conditionCode; }
    FaultHandlerCode handlerCode() const { return m_handlerCode; }

private:
    ConditionCode m_conditionCode;
    FaultHandlerCode m_handlerCode;
};

/**
 * Message to User TLV
 *
 * Opaque to the codec, except that messages starting with "cfdp" are the
 * reserved proxy and directory operation messages of the standard. Byte 4
 * of those carries the message type; toReservedMessage() (defined with
 * ReservedCfdpMessage in cfdp/reserved_message.hpp) decodes them.
 */
class MessageToUserTlv {
public:
    explicit MessageToUserTlv(std::vector<uint8_t> value) : m_value(std::move(value)) {}

    static MessageToUserTlv fromTlv(const Tlv& tlv);
    Tlv toTlv() const { return Tlv(TlvType::MessageToUser, m_value); }
    std::vector<uint8_t> pack() const { return toTlv().pack(); }

    const std::vector<uint8_t>& value() const { return m_value; }

    bool isStandardProxyDirOpsMsg() const;
    std::optional<uint8_t> reservedMessageType() const;

    // Empty unless the value holds the marker and a message type byte
    std::optional<ReservedCfdpMessage> toReservedMessage() const;

private:
    std::vector<uint8_t> m_value;
};

class FlowLabelTlv {
public:
    explicit FlowLabelTlv(std::vector<uint8_t> value) : m_value(std::move(value)) {}

    static FlowLabelTlv fromTlv(const Tlv& tlv);
    Tlv toTlv() const { return Tlv(TlvType::FlowLabel, m_value); }
    std::vector<uint8_t> pack() const { return toTlv().pack(); }

    const std::vector<uint8_t>& value() const { return m_value; }

private:
    std::vector<uint8_t> m_value;
};

} // namespace cfdp
