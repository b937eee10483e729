#include "test_framework.hpp"
#include "test_helpers.hpp"
#include "cfdp/exceptions.hpp"
#include "cfdp/reserved_message.hpp"
#include "cfdp/tlv.hpp"

using namespace cfdp;
using namespace cfdp::test;

// =============================================================================
// Proxy operations
// =============================================================================

TEST(Reserved_PutRequestThroughMessageToUser) {
    ProxyPutRequestParams params{UnsignedByteField(5, 2), "local.bin", "remote.bin"};
    auto msg = ReservedCfdpMessage::proxyPutRequest(params);
    ASSERT_TRUE(msg.isProxyOperation());
    ASSERT_FALSE(msg.isDirectoryOperation());

    MessageToUserTlv userMsg = msg.toMessageToUser();
    ASSERT_TRUE(userMsg.isStandardProxyDirOpsMsg());
    ASSERT_EQ(*userMsg.reservedMessageType(), 0x00);
    ASSERT_EQ(userMsg.value()[5], 0x02);
    ASSERT_EQ(userMsg.value()[6], 0x00);
    ASSERT_EQ(userMsg.value()[7], 0x05);

    auto parsed = Tlv::unpack(msg.pack()).asMessageToUser().toReservedMessage();
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(*parsed == msg);
    ASSERT_EQ(parsed->proxyMessageType(), ProxyMessageType::PutRequest);
    auto decoded = parsed->proxyPutRequestParams();
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(*decoded == params);
    ASSERT_EQ(decoded->destEntityId.byteLen(), 2u);
    PASS();
}

TEST(Reserved_PutRequestTruncated) {
    // Destination ID LV claims two bytes, only one follows
    ReservedCfdpMessage truncated(static_cast<uint8_t>(ProxyMessageType::PutRequest), {0x02, 0x05});
    ASSERT_THROWS(truncated.proxyPutRequestParams(), LengthError);

    ReservedCfdpMessage noNames(static_cast<uint8_t>(ProxyMessageType::PutRequest), {0x01, 0x05});
    ASSERT_THROWS(noNames.proxyPutRequestParams(), LengthError);
    PASS();
}

TEST(Reserved_PutResponse) {
    ProxyPutResponseParams params;
    params.conditionCode = ConditionCode::FileChecksumFailure;
    params.deliveryCode = DeliveryCode::DataIncomplete;
    params.fileStatus = FileStatus::Retained;
    auto msg = ReservedCfdpMessage::proxyPutResponse(params);
    ASSERT_EQ(msg.params().size(), 1u);
    ASSERT_EQ(msg.params()[0], 0x56);

    auto decoded = msg.proxyPutResponseParams();
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->conditionCode, ConditionCode::FileChecksumFailure);
    ASSERT_EQ(decoded->deliveryCode, DeliveryCode::DataIncomplete);
    ASSERT_EQ(decoded->fileStatus, FileStatus::Retained);

    ReservedCfdpMessage undefinedCode(static_cast<uint8_t>(ProxyMessageType::PutResponse), {0x90});
    ASSERT_THROWS(undefinedCode.proxyPutResponseParams(), UnrecognizedCodeError);
    ReservedCfdpMessage empty(static_cast<uint8_t>(ProxyMessageType::PutResponse), {});
    ASSERT_THROWS(empty.proxyPutResponseParams(), LengthError);
    PASS();
}

TEST(Reserved_ClosureAndTransmissionMode) {
    auto closure = ReservedCfdpMessage::proxyClosureRequest(true);
    ASSERT_EQ(closure.messageType(), 0x0B);
    ASSERT_TRUE(closure.isProxyOperation());
    ASSERT_EQ(closure.proxyClosureRequested(), std::optional<bool>(true));
    ASSERT_EQ(ReservedCfdpMessage::proxyClosureRequest(false).proxyClosureRequested(),
              std::optional<bool>(false));

    auto mode = ReservedCfdpMessage::proxyTransmissionMode(TransmissionMode::Unacknowledged);
    ASSERT_EQ(mode.params()[0], 0x01);
    ASSERT_EQ(mode.proxyTransmissionModeParam(), TransmissionMode::Unacknowledged);

    auto cancel = ReservedCfdpMessage::proxyPutCancel();
    ASSERT_TRUE(cancel.params().empty());
    ASSERT_EQ(cancel.proxyMessageType(), ProxyMessageType::PutCancel);
    PASS();
}

TEST(Reserved_AccessorsOfOtherTypes) {
    auto closure = ReservedCfdpMessage::proxyClosureRequest(true);
    ASSERT_FALSE(closure.proxyPutRequestParams().has_value());
    ASSERT_FALSE(closure.proxyTransmissionModeParam().has_value());
    ASSERT_FALSE(closure.dirListingRequestParams().has_value());
    ASSERT_FALSE(closure.originatingTransactionIdParams().has_value());
    ASSERT_FALSE(closure.directoryOperationType().has_value());

    auto listing = ReservedCfdpMessage::directoryListingRequest({"/data", "list.txt"});
    ASSERT_FALSE(listing.proxyMessageType().has_value());
    ASSERT_FALSE(listing.proxyClosureRequested().has_value());
    ASSERT_FALSE(listing.dirListingResponseParams().has_value());
    PASS();
}

// =============================================================================
// Originating transaction ID
// =============================================================================

TEST(Reserved_OriginatingTransactionId) {
    TransactionId id{UnsignedByteField(0x0102, 2), UnsignedByteField(0xDEADBEEF, 4)};
    auto msg = ReservedCfdpMessage::originatingTransactionId(id);
    ASSERT_EQ(msg.messageType(), 0x0A);
    ASSERT_TRUE(msg.isOriginatingTransactionId());
    ASSERT_FALSE(msg.isProxyOperation());
    ASSERT_FALSE(msg.isDirectoryOperation());

    std::vector<uint8_t> expected{0x13, 0x01, 0x02, 0xDE, 0xAD, 0xBE, 0xEF};
    ASSERT_EQ(msg.params(), expected);

    auto parsed = msg.toMessageToUser().toReservedMessage();
    ASSERT_TRUE(parsed.has_value());
    auto decoded = parsed->originatingTransactionIdParams();
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(*decoded == id);
    PASS();
}

TEST(Reserved_OriginatingTransactionIdMalformed) {
    // Width code 2 means a three byte source ID
    ReservedCfdpMessage badWidth(ORIGINATING_TRANSACTION_ID_MSG_TYPE, {0x20, 0x01, 0x02, 0x03, 0x04});
    ASSERT_THROWS(badWidth.originatingTransactionIdParams(), RangeError);

    ReservedCfdpMessage shortField(ORIGINATING_TRANSACTION_ID_MSG_TYPE, {0x11, 0x01, 0x02, 0x03});
    ASSERT_THROWS(shortField.originatingTransactionIdParams(), LengthError);

    TransactionId zeroWidth{UnsignedByteField(), UnsignedByteField(1, 1)};
    ASSERT_THROWS(ReservedCfdpMessage::originatingTransactionId(zeroWidth), RangeError);
    PASS();
}

// =============================================================================
// Directory operations
// =============================================================================

TEST(Reserved_DirectoryListing) {
    DirectoryParams params{"/var/data", "/tmp/listing.txt"};
    auto request = ReservedCfdpMessage::directoryListingRequest(params);
    ASSERT_EQ(request.directoryOperationType(), DirectoryOperationMessageType::ListingRequest);
    ASSERT_EQ(request.params()[0], 9);
    auto decodedRequest = request.toMessageToUser().toReservedMessage()->dirListingRequestParams();
    ASSERT_TRUE(decodedRequest.has_value());
    ASSERT_TRUE(*decodedRequest == params);

    auto response = ReservedCfdpMessage::directoryListingResponse(true, params);
    ASSERT_EQ(response.params()[0], 0x80);
    auto decodedResponse = response.dirListingResponseParams();
    ASSERT_TRUE(decodedResponse.has_value());
    ASSERT_TRUE(decodedResponse->listingSuccess);
    ASSERT_TRUE(decodedResponse->params == params);
    ASSERT_FALSE(ReservedCfdpMessage::directoryListingResponse(false, params)
                     .dirListingResponseParams()->listingSuccess);

    DirListingOptions options;
    options.recursive = true;
    auto custom = ReservedCfdpMessage::directoryListingOptions(options);
    ASSERT_EQ(custom.messageType(), 0x15);
    ASSERT_EQ(custom.params()[0], 0x02);
    ASSERT_TRUE(custom.dirListingOptionsParams()->recursive);
    ASSERT_FALSE(custom.dirListingOptionsParams()->all);
    PASS();
}

TEST(Reserved_PlainMessageHasNoReservedView) {
    ASSERT_FALSE(MessageToUserTlv(bytesOf("hello world")).toReservedMessage().has_value());
    ASSERT_FALSE(MessageToUserTlv(bytesOf("cfdp")).toReservedMessage().has_value());

    auto unknown = bytesOf("cfdp");
    unknown.push_back(0x30);
    unknown.push_back(0xAB);
    auto msg = MessageToUserTlv(unknown).toReservedMessage();
    ASSERT_TRUE(msg.has_value());
    ASSERT_EQ(msg->messageType(), 0x30);
    ASSERT_FALSE(msg->isProxyOperation());
    ASSERT_FALSE(msg->isDirectoryOperation());
    ASSERT_STREQ(msg->toString(), "ReservedCfdpMessage(type=0x30, params=[ab])");
    PASS();
}
