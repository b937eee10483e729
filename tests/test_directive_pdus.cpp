#include "test_framework.hpp"
#include "test_helpers.hpp"
#include "cfdp/ack_pdu.hpp"
#include "cfdp/crc.hpp"
#include "cfdp/eof_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "cfdp/finished_pdu.hpp"
#include "cfdp/keep_alive_pdu.hpp"
#include "cfdp/metadata_pdu.hpp"
#include "cfdp/nak_pdu.hpp"
#include "cfdp/prompt_pdu.hpp"

using namespace cfdp;
using namespace cfdp::test;

// =============================================================================
// Directive base
// =============================================================================

TEST(Directive_UnknownCodeRejected) {
    EofPdu eof(makeConfig(), 0, 0);
    auto raw = eof.pack();
    raw[eof.header().headerLen()] = 0x00;
    ASSERT_THROWS(EofPdu::unpack(raw), UnrecognizedCodeError);
    ASSERT_THROWS(FileDirectivePduBase::unpack(raw.data(), raw.size()), UnrecognizedCodeError);
    PASS();
}

TEST(Directive_WrongConcreteType) {
    PromptPdu prompt(makeConfig(), ResponseRequired::Nak);
    ASSERT_THROWS(KeepAlivePdu::unpack(prompt.pack()), TypeMismatchError);
    PASS();
}

TEST(Directive_BufferLengthChecks) {
    AckPdu ack(makeConfig(), DirectiveCode::Eof, ConditionCode::NoError, TransactionStatus::Active);
    auto raw = ack.pack();

    auto truncated = raw;
    truncated.pop_back();
    ASSERT_THROWS(AckPdu::unpack(truncated), LengthError);

    auto trailing = raw;
    trailing.push_back(0x00);
    ASSERT_THROWS(AckPdu::unpack(trailing), ValueError);

    // Declared length covers an extra byte after the fixed fields
    auto padded = raw;
    padded.push_back(0x00);
    bumpDataFieldLen(padded, 1);
    ASSERT_THROWS(AckPdu::unpack(padded), ValueError);
    PASS();
}

TEST(Directive_CrcRoundTrip) {
    PduConfig config = makeConfig();
    config.crcFlag = CrcFlag::WithCrc;
    EofPdu eof(config, 0xCAFEBABE, 1000);
    auto raw = eof.pack();
    ASSERT_EQ(raw.size(), 19u);
    ASSERT_EQ(raw.size(), eof.packetLen());
    ASSERT_EQ(crc16(raw), 0);
    // Data field length excludes the CRC
    ASSERT_EQ((raw[1] << 8 | raw[2]), 10);

    EofPdu parsed = EofPdu::unpack(raw);
    ASSERT_TRUE(parsed == eof);
    PASS();
}

TEST(Directive_CrcMismatch) {
    PduConfig config = makeConfig();
    config.crcFlag = CrcFlag::WithCrc;
    auto raw = EofPdu(config, 0, 1000).pack();
    raw[16] ^= 0x01;
    ASSERT_THROWS(EofPdu::unpack(raw), ChecksumError);
    PASS();
}

// =============================================================================
// ACK
// =============================================================================

TEST(Ack_PackFinishedAck) {
    AckPdu ack(makeConfig(2, 2, 2, 3, 1), DirectiveCode::Finished, ConditionCode::NoError,
               TransactionStatus::Terminated);
    auto raw = ack.pack();
    std::vector<uint8_t> expected{0x20, 0x00, 0x03, 0x22, 0x00, 0x02, 0x00, 0x01, 0x00, 0x03,
                                  0x06, 0x51, 0x02};
    ASSERT_EQ(raw.size(), 13u);
    ASSERT_EQ(raw, expected);
    ASSERT_EQ(ack.packetLen(), 13u);
    ASSERT_EQ(ack.directiveSubtypeCode(), 1);
    PASS();
}

TEST(Ack_EofAckRoundTrip) {
    AckPdu ack(makeConfig(), DirectiveCode::Eof, ConditionCode::CancelRequestReceived,
               TransactionStatus::Active);
    ASSERT_EQ(ack.header().direction(), Direction::TowardsSender);
    ASSERT_EQ(ack.directiveSubtypeCode(), 0);

    auto raw = ack.pack();
    ASSERT_EQ(raw[8], 0x40);
    ASSERT_EQ(raw[9], 0xF1);
    AckPdu parsed = AckPdu::unpack(raw);
    ASSERT_TRUE(parsed == ack);
    ASSERT_EQ(parsed.ackedDirective(), DirectiveCode::Eof);
    ASSERT_EQ(parsed.conditionCode(), ConditionCode::CancelRequestReceived);
    ASSERT_EQ(parsed.transactionStatus(), TransactionStatus::Active);
    PASS();
}

TEST(Ack_OnlyEofOrFinished) {
    ASSERT_THROWS(AckPdu(makeConfig(), DirectiveCode::Metadata, ConditionCode::NoError,
                         TransactionStatus::Active), ValueError);

    auto raw = AckPdu(makeConfig(), DirectiveCode::Eof, ConditionCode::NoError,
                      TransactionStatus::Active).pack();
    raw[8] = 0x70;
    ASSERT_THROWS(AckPdu::unpack(raw), ValueError);
    PASS();
}

TEST(Ack_SubtypeMustMatchDirective) {
    auto finishedAck = AckPdu(makeConfig(), DirectiveCode::Finished, ConditionCode::NoError,
                              TransactionStatus::Terminated).pack();
    ASSERT_EQ(finishedAck[8], 0x51);
    finishedAck[8] = 0x50;
    ASSERT_THROWS(AckPdu::unpack(finishedAck), ValueError);

    auto eofAck = AckPdu(makeConfig(), DirectiveCode::Eof, ConditionCode::NoError,
                         TransactionStatus::Active).pack();
    eofAck[8] = 0x41;
    ASSERT_THROWS(AckPdu::unpack(eofAck), ValueError);
    PASS();
}

TEST(Ack_UndefinedConditionCode) {
    auto raw = AckPdu(makeConfig(), DirectiveCode::Eof, ConditionCode::NoError,
                      TransactionStatus::Active).pack();
    raw[9] = 0xD1;
    ASSERT_THROWS(AckPdu::unpack(raw), UnrecognizedCodeError);
    PASS();
}

// =============================================================================
// EOF
// =============================================================================

TEST(Eof_PackLayout) {
    EofPdu eof(makeConfig(), 0, 0);
    auto raw = eof.pack();
    std::vector<uint8_t> expected{0x20, 0x00, 0x0A, 0x11, 0x01, 0x03, 0x02,
                                  0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    ASSERT_EQ(raw.size(), 17u);
    ASSERT_EQ(raw, expected);
    ASSERT_EQ(eof.packetLen(), 17u);
    PASS();
}

TEST(Eof_FaultLocationGrowsPacket) {
    EofPdu eof(makeConfig(), 0, 0);
    size_t plainLen = eof.pack().size();
    eof.setConditionCode(ConditionCode::FileChecksumFailure);
    eof.setFaultLocation(EntityIdTlv(UnsignedByteField(2, 2)));
    auto raw = eof.pack();
    ASSERT_EQ(raw.size(), plainLen + 4);
    ASSERT_EQ(eof.packetLen(), raw.size());

    EofPdu parsed = EofPdu::unpack(raw);
    ASSERT_TRUE(parsed == eof);
    ASSERT_TRUE(parsed.faultLocation().has_value());
    ASSERT_EQ(parsed.faultLocation()->entityId(), UnsignedByteField(2, 2));
    PASS();
}

TEST(Eof_LargeFileRoundTrip) {
    PduConfig config = makeConfig(2, 4);
    config.fileFlag = LargeFileFlag::Large;
    config.direction = Direction::TowardsSender;
    EofPdu eof(config, 0x12345678, (1ULL << 40) + 5, ConditionCode::NoError);
    ASSERT_EQ(eof.header().direction(), Direction::TowardsReceiver);

    auto raw = eof.pack();
    ASSERT_EQ(raw.size(), eof.header().headerLen() + 1u + 1u + 4u + 8u);
    EofPdu parsed = EofPdu::unpack(raw);
    ASSERT_EQ(parsed.fileSize(), (1ULL << 40) + 5);
    ASSERT_EQ(parsed.fileChecksum(), 0x12345678u);
    ASSERT_EQ(raw, parsed.pack());

    EofPdu normal(makeConfig(), 0, 1ULL << 32);
    ASSERT_THROWS(normal.pack(), RangeError);
    PASS();
}

TEST(Eof_FaultLocationMustBeEntityId) {
    auto raw = EofPdu(makeConfig(), 0, 0).pack();
    std::vector<uint8_t> flowLabel{0x05, 0x01, 0xAA};
    raw.insert(raw.end(), flowLabel.begin(), flowLabel.end());
    bumpDataFieldLen(raw, 3);
    ASSERT_THROWS(EofPdu::unpack(raw), TypeMismatchError);
    PASS();
}

TEST(Eof_UndefinedConditionCode) {
    auto raw = EofPdu(makeConfig(), 0, 0).pack();
    raw[8] = 0xC0;
    ASSERT_THROWS(EofPdu::unpack(raw), UnrecognizedCodeError);
    PASS();
}

// =============================================================================
// Finished
// =============================================================================

TEST(Finished_PackMinimal) {
    FinishedPdu finished(makeConfig(), DeliveryCode::DataComplete, FileStatus::Retained);
    auto raw = finished.pack();
    std::vector<uint8_t> expected{0x28, 0x00, 0x02, 0x11, 0x01, 0x03, 0x02, 0x05, 0x02};
    ASSERT_EQ(raw, expected);
    ASSERT_EQ(finished.packetLen(), 9u);
    ASSERT_TRUE(FinishedPdu::unpack(raw) == finished);
    PASS();
}

TEST(Finished_ResponsesAndFaultLocation) {
    std::vector<FilestoreResponseTlv> responses{
        FilestoreResponseTlv(FilestoreActionCode::CreateFile, FILESTORE_STATUS_SUCCESS, "hello.txt"),
        FilestoreResponseTlv(FilestoreActionCode::RenameFile, 0b0010, "a.txt", std::string("b.txt"), "exists"),
    };
    FinishedPdu finished(makeConfig(), DeliveryCode::DataIncomplete, FileStatus::DiscardedFilestoreRejection,
                         ConditionCode::FilestoreRejection, responses, EntityIdTlv(UnsignedByteField(1, 1)));
    auto raw = finished.pack();
    ASSERT_EQ(raw[8], 0x45);
    ASSERT_EQ(raw.size(), finished.packetLen());

    FinishedPdu parsed = FinishedPdu::unpack(raw);
    ASSERT_TRUE(parsed == finished);
    ASSERT_EQ(parsed.filestoreResponses().size(), 2u);
    ASSERT_STREQ(parsed.filestoreResponses()[1].filestoreMessage(), "exists");
    ASSERT_EQ(parsed.faultLocation()->entityId(), UnsignedByteField(1, 1));
    PASS();
}

TEST(Finished_FaultLocationNeedsFault) {
    ASSERT_THROWS(FinishedPdu(makeConfig(), DeliveryCode::DataComplete, FileStatus::Retained,
                              ConditionCode::NoError, {}, EntityIdTlv(UnsignedByteField(1, 1))),
                  ValueError);

    FinishedPdu finished(makeConfig(), DeliveryCode::DataComplete, FileStatus::Retained,
                         ConditionCode::InactivityDetected, {}, EntityIdTlv(UnsignedByteField(1, 1)));
    ASSERT_THROWS(finished.setConditionCode(ConditionCode::UnsupportedChecksumType), ValueError);
    ASSERT_EQ(finished.conditionCode(), ConditionCode::InactivityDetected);

    // Clear the condition code on the wire, keep the fault location
    auto raw = finished.pack();
    raw[8] &= 0x0F;
    ASSERT_THROWS(FinishedPdu::unpack(raw), ValueError);
    PASS();
}

TEST(Finished_UnexpectedTlv) {
    auto raw = FinishedPdu(makeConfig(), DeliveryCode::DataComplete, FileStatus::Retained).pack();
    std::vector<uint8_t> flowLabel{0x05, 0x01, 0xAA};
    raw.insert(raw.end(), flowLabel.begin(), flowLabel.end());
    bumpDataFieldLen(raw, 3);
    ASSERT_THROWS(FinishedPdu::unpack(raw), ValueError);
    PASS();
}

TEST(Finished_UndefinedConditionCode) {
    auto raw = FinishedPdu(makeConfig(), DeliveryCode::DataComplete, FileStatus::Retained).pack();
    raw[8] = 0x92;
    ASSERT_THROWS(FinishedPdu::unpack(raw), UnrecognizedCodeError);
    PASS();
}

// =============================================================================
// Metadata
// =============================================================================

TEST(Metadata_RoundTripWithOptions) {
    auto proxyMsg = bytesOf("cfdp");
    proxyMsg.push_back(static_cast<uint8_t>(DirectoryOperationMessageType::ListingRequest));
    std::vector<Tlv> options{
        FilestoreRequestTlv(FilestoreActionCode::CreateFile, "new.bin").toTlv(),
        MessageToUserTlv(proxyMsg).toTlv(),
        FaultHandlerOverrideTlv(ConditionCode::FileChecksumFailure, FaultHandlerCode::IgnoreError).toTlv(),
        FlowLabelTlv(std::vector<uint8_t>{0x01}).toTlv(),
    };
    MetadataPdu metadata(makeConfig(2, 2), true, ChecksumType::Crc32, 1024,
                         std::string("src.txt"), std::string("dst.txt"), options);
    auto raw = metadata.pack();
    ASSERT_EQ(raw.size(), metadata.packetLen());
    ASSERT_EQ(raw[metadata.header().headerLen() + 1], 0x43);

    MetadataPdu parsed = MetadataPdu::unpack(raw);
    ASSERT_TRUE(parsed == metadata);
    ASSERT_TRUE(parsed.closureRequested());
    ASSERT_EQ(parsed.checksumType(), ChecksumType::Crc32);
    ASSERT_STREQ(*parsed.sourceFileName(), "src.txt");
    ASSERT_STREQ(*parsed.destFileName(), "dst.txt");
    ASSERT_EQ(parsed.options().size(), 4u);
    ASSERT_EQ(parsed.filestoreRequests().size(), 1u);
    ASSERT_EQ(parsed.faultHandlerOverrides()[0].handlerCode(), FaultHandlerCode::IgnoreError);
    ASSERT_TRUE(parsed.messagesToUser()[0].isStandardProxyDirOpsMsg());
    ASSERT_TRUE(parsed.flowLabel().has_value());
    PASS();
}

TEST(Metadata_NoFileNames) {
    MetadataPdu metadata(makeConfig(), false, ChecksumType::NullChecksum, 0, std::nullopt, std::nullopt);
    auto raw = metadata.pack();
    ASSERT_EQ(raw.size(), 15u);
    ASSERT_EQ(raw[8], 0x0F);

    MetadataPdu parsed = MetadataPdu::unpack(raw);
    ASSERT_FALSE(parsed.sourceFileName().has_value());
    ASSERT_FALSE(parsed.destFileName().has_value());
    ASSERT_TRUE(parsed.options().empty());
    PASS();
}

TEST(Metadata_ParameterFieldTooShort) {
    auto raw = MetadataPdu(makeConfig(), false, ChecksumType::Modular, 0, std::nullopt, std::nullopt).pack();
    raw.pop_back();
    bumpDataFieldLen(raw, -1);
    ASSERT_THROWS(MetadataPdu::unpack(raw), LengthError);
    PASS();
}

TEST(Metadata_UndefinedChecksumType) {
    auto raw = MetadataPdu(makeConfig(), false, ChecksumType::Modular, 0, std::nullopt, std::nullopt).pack();
    raw[8] = 0x07;
    ASSERT_THROWS(MetadataPdu::unpack(raw), UnrecognizedCodeError);
    PASS();
}

// =============================================================================
// NAK
// =============================================================================

TEST(Nak_RoundTripWithSegments) {
    NakPdu nak(makeConfig(), 0, 1000, {{0, 100}, {200, 300}});
    ASSERT_EQ(nak.header().direction(), Direction::TowardsSender);
    auto raw = nak.pack();
    ASSERT_EQ(raw.size(), 32u);
    ASSERT_EQ(nak.packetLen(), 32u);

    NakPdu parsed = NakPdu::unpack(raw);
    ASSERT_TRUE(parsed == nak);
    ASSERT_EQ(parsed.segmentRequests().size(), 2u);
    ASSERT_EQ(parsed.segmentRequests()[1].second, 300u);
    PASS();
}

TEST(Nak_LargeFileValues) {
    NakPdu normal(makeConfig(), 0, (1ULL << 32) + 1);
    ASSERT_THROWS(normal.pack(), RangeError);

    PduConfig config = makeConfig();
    config.fileFlag = LargeFileFlag::Large;
    NakPdu large(config, 0, (1ULL << 32) + 1, {{1ULL << 33, (1ULL << 33) + 10}});
    auto raw = large.pack();
    ASSERT_EQ(raw.size(), 7u + 1u + 32u);
    ASSERT_TRUE(NakPdu::unpack(raw) == large);
    PASS();
}

TEST(Nak_PartialSegmentRequest) {
    auto raw = NakPdu(makeConfig(), 0, 10, {{0, 5}}).pack();
    std::vector<uint8_t> half{0x00, 0x00, 0x00, 0x07};
    raw.insert(raw.end(), half.begin(), half.end());
    bumpDataFieldLen(raw, 4);
    ASSERT_THROWS(NakPdu::unpack(raw), ValueError);
    PASS();
}

TEST(Nak_RangesMustNotRunBackwards) {
    ASSERT_THROWS(NakPdu(makeConfig(), 100, 10), ValueError);
    ASSERT_THROWS(NakPdu(makeConfig(), 0, 100, {{0, 10}, {50, 40}}), ValueError);

    NakPdu nak(makeConfig(), 0, 100, {{20, 20}});
    ASSERT_THROWS(nak.setScope(60, 50), ValueError);
    ASSERT_EQ(nak.startOfScope(), 0u);
    ASSERT_EQ(nak.endOfScope(), 100u);
    ASSERT_THROWS(nak.setSegmentRequests({{5, 4}}), ValueError);
    ASSERT_EQ(nak.segmentRequests().size(), 1u);

    nak.setScope(10, 90);
    ASSERT_EQ(nak.startOfScope(), 10u);

    // Scope start 0x20, end 0x10 on the wire
    auto raw = NakPdu(makeConfig(), 0x10, 0x20).pack();
    std::swap(raw[11], raw[15]);
    ASSERT_THROWS(NakPdu::unpack(raw), ValueError);
    PASS();
}

TEST(Nak_MaxSegmentRequests) {
    NakPdu nak(makeConfig(), 0, 0);
    ASSERT_EQ(nak.maxSegmentRequestsForPacketSize(32), 2u);
    ASSERT_EQ(nak.maxSegmentRequestsForPacketSize(39), 2u);
    ASSERT_EQ(nak.maxSegmentRequestsForPacketSize(16), 0u);
    ASSERT_EQ(nak.maxSegmentRequestsForPacketSize(10), 0u);
    PASS();
}

// =============================================================================
// Keep Alive / Prompt
// =============================================================================

TEST(KeepAlive_PackAndRange) {
    KeepAlivePdu keepAlive(makeConfig(), 0);
    ASSERT_EQ(keepAlive.pack().size(), 12u);
    ASSERT_EQ(keepAlive.packetLen(), 12u);

    keepAlive.setProgress((1ULL << 32) + 1);
    ASSERT_THROWS(keepAlive.pack(), RangeError);

    keepAlive.header().setLargeFileFlag(LargeFileFlag::Large);
    auto raw = keepAlive.pack();
    ASSERT_EQ(raw.size(), 16u);
    ASSERT_EQ(KeepAlivePdu::unpack(raw).progress(), (1ULL << 32) + 1);
    PASS();
}

TEST(Prompt_RoundTrip) {
    PromptPdu prompt(makeConfig(), ResponseRequired::KeepAlive);
    auto raw = prompt.pack();
    ASSERT_EQ(raw.size(), 9u);
    ASSERT_EQ(raw[7], 0x09);
    ASSERT_EQ(raw[8], 0x80);
    ASSERT_EQ(PromptPdu::unpack(raw).responseRequired(), ResponseRequired::KeepAlive);
    PASS();
}

TEST(Pdu_LengthInvariant) {
    PduConfig config = makeConfig(4, 2);
    config.crcFlag = CrcFlag::WithCrc;
    std::vector<std::vector<uint8_t>> packets{
        EofPdu(config, 1, 2).pack(),
        FinishedPdu(config, DeliveryCode::DataComplete, FileStatus::Retained).pack(),
        NakPdu(config, 0, 10, {{1, 2}}).pack(),
        MetadataPdu(config, false, ChecksumType::Modular, 5, std::string("a"), std::string("b")).pack(),
        KeepAlivePdu(config, 7).pack(),
    };
    size_t headerLen = PduHeader(PduType::FileDirective, config).headerLen();
    for (const auto& raw : packets) {
        size_t declared = static_cast<size_t>(raw[1] << 8 | raw[2]);
        ASSERT_EQ(declared, raw.size() - headerLen - 2);
    }
    PASS();
}
