#include "cfdp/reserved_message.hpp"
#include "cfdp/exceptions.hpp"
#include "cfdp/lv.hpp"
#include "utils/buffer.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

std::string readLvString(utils::BufferReader& reader) {
    Lv lv = Lv::unpack(reader.current(), reader.remaining());
    reader.skip(lv.packetLen());
    return lv.valueAsString();
}

void writeLvString(std::vector<uint8_t>& out, const std::string& str) {
    Lv::fromString(str).packInto(out);
}

void checkTransactionIdWidth(const UnsignedByteField& field, const char* what) {
    if (field.byteLen() == 0) {
        throw RangeError(fmt::format("originating transaction ID {} needs a width of 1, 2, 4 or 8 bytes", what));
    }
}

} // namespace

// =============================================================================
// Message to user conversion
// =============================================================================

std::optional<ReservedCfdpMessage> MessageToUserTlv::toReservedMessage() const {
    std::optional<uint8_t> type = reservedMessageType();
    if (!type) {
        return std::nullopt;
    }
    return ReservedCfdpMessage(*type, std::vector<uint8_t>(
        m_value.begin() + RESERVED_MESSAGE_MARKER_LEN + 1, m_value.end()));
}

MessageToUserTlv ReservedCfdpMessage::toMessageToUser() const {
    std::vector<uint8_t> value(RESERVED_MESSAGE_MARKER, RESERVED_MESSAGE_MARKER + RESERVED_MESSAGE_MARKER_LEN);
    value.push_back(m_type);
    value.insert(value.end(), m_params.begin(), m_params.end());
    return MessageToUserTlv(std::move(value));
}

// =============================================================================
// Builders
// =============================================================================

ReservedCfdpMessage ReservedCfdpMessage::proxyPutRequest(const ProxyPutRequestParams& params) {
    std::vector<uint8_t> value;
    Lv(params.destEntityId.toBytes()).packInto(value);
    writeLvString(value, params.sourceFileName);
    writeLvString(value, params.destFileName);
    return ReservedCfdpMessage(static_cast<uint8_t>(ProxyMessageType::PutRequest), std::move(value));
}

ReservedCfdpMessage ReservedCfdpMessage::proxyPutResponse(const ProxyPutResponseParams& params) {
    uint8_t raw = static_cast<uint8_t>((static_cast<uint8_t>(params.conditionCode) << 4) |
                                       (static_cast<uint8_t>(params.deliveryCode) << 2) |
                                       static_cast<uint8_t>(params.fileStatus));
    return ReservedCfdpMessage(static_cast<uint8_t>(ProxyMessageType::PutResponse), {raw});
}

ReservedCfdpMessage ReservedCfdpMessage::proxyPutCancel() {
    return ReservedCfdpMessage(static_cast<uint8_t>(ProxyMessageType::PutCancel), {});
}

ReservedCfdpMessage ReservedCfdpMessage::proxyClosureRequest(bool closureRequested) {
    return ReservedCfdpMessage(static_cast<uint8_t>(ProxyMessageType::ClosureRequest),
                               {static_cast<uint8_t>(closureRequested ? 1 : 0)});
}

ReservedCfdpMessage ReservedCfdpMessage::proxyTransmissionMode(TransmissionMode mode) {
    return ReservedCfdpMessage(static_cast<uint8_t>(ProxyMessageType::TransmissionMode),
                               {static_cast<uint8_t>(mode)});
}

ReservedCfdpMessage ReservedCfdpMessage::originatingTransactionId(const TransactionId& id) {
    checkTransactionIdWidth(id.sourceId, "source entity ID");
    checkTransactionIdWidth(id.seqNum, "sequence number");
    utils::BufferWriter writer;
    writer.writeU8(static_cast<uint8_t>(((id.sourceId.byteLen() - 1) << 4) | (id.seqNum.byteLen() - 1)));
    writer.writeBytes(id.sourceId.toBytes());
    writer.writeBytes(id.seqNum.toBytes());
    return ReservedCfdpMessage(ORIGINATING_TRANSACTION_ID_MSG_TYPE, writer.take());
}

ReservedCfdpMessage ReservedCfdpMessage::directoryListingRequest(const DirectoryParams& params) {
    std::vector<uint8_t> value;
    writeLvString(value, params.dirPath);
    writeLvString(value, params.dirFileName);
    return ReservedCfdpMessage(static_cast<uint8_t>(DirectoryOperationMessageType::ListingRequest),
                               std::move(value));
}

ReservedCfdpMessage ReservedCfdpMessage::directoryListingResponse(bool listingSuccess,
                                                                  const DirectoryParams& params) {
    std::vector<uint8_t> value{static_cast<uint8_t>(listingSuccess ? 0x80 : 0x00)};
    writeLvString(value, params.dirPath);
    writeLvString(value, params.dirFileName);
    return ReservedCfdpMessage(static_cast<uint8_t>(DirectoryOperationMessageType::ListingResponse),
                               std::move(value));
}

ReservedCfdpMessage ReservedCfdpMessage::directoryListingOptions(const DirListingOptions& options) {
    uint8_t raw = static_cast<uint8_t>((options.recursive ? 0b10 : 0) | (options.all ? 0b01 : 0));
    return ReservedCfdpMessage(static_cast<uint8_t>(DirectoryOperationMessageType::CustomListingParameters),
                               {raw});
}

// =============================================================================
// Message type classification
// =============================================================================

std::optional<ProxyMessageType> ReservedCfdpMessage::proxyMessageType() const {
    if (m_type > static_cast<uint8_t>(ProxyMessageType::ClosureRequest) ||
        m_type == ORIGINATING_TRANSACTION_ID_MSG_TYPE) {
        return std::nullopt;
    }
    return static_cast<ProxyMessageType>(m_type);
}

std::optional<DirectoryOperationMessageType> ReservedCfdpMessage::directoryOperationType() const {
    switch (static_cast<DirectoryOperationMessageType>(m_type)) {
        case DirectoryOperationMessageType::ListingRequest:
        case DirectoryOperationMessageType::ListingResponse:
        case DirectoryOperationMessageType::CustomListingParameters:
            return static_cast<DirectoryOperationMessageType>(m_type);
    }
    return std::nullopt;
}

bool ReservedCfdpMessage::isProxy(ProxyMessageType type) const {
    return proxyMessageType() == type;
}

bool ReservedCfdpMessage::isDirectory(DirectoryOperationMessageType type) const {
    return directoryOperationType() == type;
}

uint8_t ReservedCfdpMessage::firstParamByte() const {
    if (m_params.empty()) {
        throw LengthError(fmt::format("reserved CFDP message type {:#04x} has an empty parameter field", m_type));
    }
    return m_params[0];
}

// =============================================================================
// Parameter accessors
// =============================================================================

std::optional<TransactionId> ReservedCfdpMessage::originatingTransactionIdParams() const {
    if (!isOriginatingTransactionId()) {
        return std::nullopt;
    }
    utils::BufferReader reader(m_params);
    uint8_t widths = reader.readU8();
    size_t sourceLen = ((widths >> 4) & 0b111) + 1;
    size_t seqLen = (widths & 0b111) + 1;
    if (!UnsignedByteField::isValidWidth(sourceLen) || !UnsignedByteField::isValidWidth(seqLen)) {
        throw RangeError(fmt::format("originating transaction ID widths {} and {} are not 1, 2, 4 or 8",
                                     sourceLen, seqLen));
    }
    UnsignedByteField sourceId(reader.readUnsigned(sourceLen), sourceLen);
    UnsignedByteField seqNum(reader.readUnsigned(seqLen), seqLen);
    return TransactionId{sourceId, seqNum};
}

std::optional<ProxyPutRequestParams> ReservedCfdpMessage::proxyPutRequestParams() const {
    if (!isProxy(ProxyMessageType::PutRequest)) {
        return std::nullopt;
    }
    utils::BufferReader reader(m_params);
    Lv destId = Lv::unpack(reader.current(), reader.remaining());
    reader.skip(destId.packetLen());
    std::string sourceFileName = readLvString(reader);
    std::string destFileName = readLvString(reader);
    return ProxyPutRequestParams{UnsignedByteField::fromBytes(destId.value()),
                                 std::move(sourceFileName), std::move(destFileName)};
}

std::optional<ProxyPutResponseParams> ReservedCfdpMessage::proxyPutResponseParams() const {
    if (!isProxy(ProxyMessageType::PutResponse)) {
        return std::nullopt;
    }
    uint8_t raw = firstParamByte();
    ProxyPutResponseParams params;
    params.conditionCode = conditionCodeFromRaw(raw >> 4);
    params.deliveryCode = static_cast<DeliveryCode>((raw >> 2) & 1);
    params.fileStatus = static_cast<FileStatus>(raw & 0b11);
    return params;
}

std::optional<bool> ReservedCfdpMessage::proxyClosureRequested() const {
    if (!isProxy(ProxyMessageType::ClosureRequest)) {
        return std::nullopt;
    }
    return (firstParamByte() & 1) != 0;
}

std::optional<TransmissionMode> ReservedCfdpMessage::proxyTransmissionModeParam() const {
    if (!isProxy(ProxyMessageType::TransmissionMode)) {
        return std::nullopt;
    }
    return static_cast<TransmissionMode>(firstParamByte() & 1);
}

std::optional<DirectoryParams> ReservedCfdpMessage::dirListingRequestParams() const {
    if (!isDirectory(DirectoryOperationMessageType::ListingRequest)) {
        return std::nullopt;
    }
    utils::BufferReader reader(m_params);
    DirectoryParams params;
    params.dirPath = readLvString(reader);
    params.dirFileName = readLvString(reader);
    return params;
}

std::optional<DirListingResponse> ReservedCfdpMessage::dirListingResponseParams() const {
    if (!isDirectory(DirectoryOperationMessageType::ListingResponse)) {
        return std::nullopt;
    }
    utils::BufferReader reader(m_params);
    DirListingResponse response;
    response.listingSuccess = (reader.readU8() >> 7) & 1;
    response.params.dirPath = readLvString(reader);
    response.params.dirFileName = readLvString(reader);
    return response;
}

std::optional<DirListingOptions> ReservedCfdpMessage::dirListingOptionsParams() const {
    if (!isDirectory(DirectoryOperationMessageType::CustomListingParameters)) {
        return std::nullopt;
    }
    uint8_t raw = firstParamByte();
    DirListingOptions options;
    options.recursive = (raw >> 1) & 1;
    options.all = raw & 1;
    return options;
}

std::string ReservedCfdpMessage::toString() const {
    return fmt::format("ReservedCfdpMessage(type={:#04x}, params=[{}])", m_type, utils::toHex(m_params));
}

} // namespace cfdp
