#pragma once

#include "cfdp/defs.hpp"
#include "cfdp/tlv.hpp"
#include "cfdp/unsigned_byte_field.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cfdp {

struct ProxyPutRequestParams {
    UnsignedByteField destEntityId;
    std::string sourceFileName;
    std::string destFileName;

    bool operator==(const ProxyPutRequestParams& other) const {
        return destEntityId == other.destEntityId && sourceFileName == other.sourceFileName &&
               destFileName == other.destFileName;
    }
};

struct ProxyPutResponseParams {
    ConditionCode conditionCode = ConditionCode::NoError;
    DeliveryCode deliveryCode = DeliveryCode::DataComplete;
    FileStatus fileStatus = FileStatus::Unreported;
};

struct DirectoryParams {
    std::string dirPath;
    std::string dirFileName;

    bool operator==(const DirectoryParams& other) const {
        return dirPath == other.dirPath && dirFileName == other.dirFileName;
    }
};

struct DirListingResponse {
    bool listingSuccess = false;
    DirectoryParams params;
};

struct DirListingOptions {
    bool recursive = false;
    bool all = false;
};

/**
 * Reserved CFDP message (CCSDS 727.0-B-5 6.1)
 *
 * A Message to User whose value is "cfdp", one message type byte, then
 * type specific parameters. Covers the proxy operations, the originating
 * transaction ID and the directory operations.
 *
 * The accessors return std::nullopt when the message is of another type.
 * A parameter field too short for its type throws LengthError; an illegal
 * code in it throws UnrecognizedCodeError.
 */
class ReservedCfdpMessage {
public:
    ReservedCfdpMessage(uint8_t messageType, std::vector<uint8_t> params)
        : m_type(messageType)
        , m_params(std::move(params))
    {}

    static ReservedCfdpMessage proxyPutRequest(const ProxyPutRequestParams& params);
    static ReservedCfdpMessage proxyPutResponse(const ProxyPutResponseParams& params);
    static ReservedCfdpMessage proxyPutCancel();
    static ReservedCfdpMessage proxyClosureRequest(bool closureRequested);
    static ReservedCfdpMessage proxyTransmissionMode(TransmissionMode mode);
    static ReservedCfdpMessage originatingTransactionId(const TransactionId& id);
    static ReservedCfdpMessage directoryListingRequest(const DirectoryParams& params);
    static ReservedCfdpMessage directoryListingResponse(bool listingSuccess, const DirectoryParams& params);
    static ReservedCfdpMessage directoryListingOptions(const DirListingOptions& options);

    MessageToUserTlv toMessageToUser() const;
    Tlv toTlv() const { return toMessageToUser().toTlv(); }
    std::vector<uint8_t> pack() const { return toTlv().pack(); }

    uint8_t messageType() const { return m_type; }
    const std::vector<uint8_t>& params() const { return m_params; }

    bool isProxyOperation() const { return proxyMessageType().has_value(); }
    bool isDirectoryOperation() const { return directoryOperationType().has_value(); }
    bool isOriginatingTransactionId() const { return m_type == ORIGINATING_TRANSACTION_ID_MSG_TYPE; }

    std::optional<ProxyMessageType> proxyMessageType() const;
    std::optional<DirectoryOperationMessageType> directoryOperationType() const;

    std::optional<TransactionId> originatingTransactionIdParams() const;
    std::optional<ProxyPutRequestParams> proxyPutRequestParams() const;
    std::optional<ProxyPutResponseParams> proxyPutResponseParams() const;
    std::optional<bool> proxyClosureRequested() const;
    std::optional<TransmissionMode> proxyTransmissionModeParam() const;
    std::optional<DirectoryParams> dirListingRequestParams() const;
    std::optional<DirListingResponse> dirListingResponseParams() const;
    std::optional<DirListingOptions> dirListingOptionsParams() const;

    std::string toString() const;

    bool operator==(const ReservedCfdpMessage& other) const {
        return m_type == other.m_type && m_params == other.m_params;
    }
    bool operator!=(const ReservedCfdpMessage& other) const { return !(*this == other); }

private:
    bool isProxy(ProxyMessageType type) const;
    bool isDirectory(DirectoryOperationMessageType type) const;
    uint8_t firstParamByte() const;

    uint8_t m_type;
    std::vector<uint8_t> m_params;
};

} // namespace cfdp
