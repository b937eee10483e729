#include "cfdp/ack_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

PduConfig ackConfig(PduConfig config, DirectiveCode acked) {
    if (acked != DirectiveCode::Eof && acked != DirectiveCode::Finished) {
        throw ValueError(fmt::format("only EOF and Finished PDUs can be acknowledged, got {}",
                                     toString(acked)));
    }
    config.direction = acked == DirectiveCode::Finished ? Direction::TowardsReceiver
                                                        : Direction::TowardsSender;
    return config;
}

} // namespace

AckPdu::AckPdu(const PduConfig& config, DirectiveCode ackedDirective, ConditionCode conditionCode,
               TransactionStatus transactionStatus)
    : m_base(DirectiveCode::Ack, ackConfig(config, ackedDirective))
    , m_ackedDirective(ackedDirective)
    , m_conditionCode(conditionCode)
    , m_transactionStatus(transactionStatus)
{}

std::vector<uint8_t> AckPdu::pack() const {
    std::vector<uint8_t> params{
        static_cast<uint8_t>((static_cast<uint8_t>(m_ackedDirective) << 4) | directiveSubtypeCode()),
        static_cast<uint8_t>((static_cast<uint8_t>(m_conditionCode) << 4) |
                             static_cast<uint8_t>(m_transactionStatus)),
    };
    auto raw = m_base.packWithParams(params);
    LOG_TRACE("Packed ACK PDU, {} bytes", raw.size());
    return raw;
}

AckPdu AckPdu::unpack(const uint8_t* data, size_t size) {
    FileDirectivePduBase base = FileDirectivePduBase::unpack(data, size, DirectiveCode::Ack);
    utils::BufferReader reader = base.paramReader(data);

    uint8_t first = reader.readU8();
    uint8_t second = reader.readU8();
    if (reader.hasMore()) {
        throw ValueError(fmt::format("{} unexpected bytes after the ACK parameters", reader.remaining()));
    }

    // The constructor validates the acknowledged directive; the header is kept as received
    AckPdu pdu(base.header().pduConfig(), static_cast<DirectiveCode>(first >> 4),
               conditionCodeFromRaw(second >> 4),
               static_cast<TransactionStatus>(second & 0b11));
    uint8_t subtype = first & 0x0F;
    if (subtype != pdu.directiveSubtypeCode()) {
        LOG_DEBUG("Rejecting ACK PDU with directive subtype {}", subtype);
        throw ValueError(fmt::format("directive subtype {:#06b} does not match the acknowledged {} PDU",
                                     subtype, cfdp::toString(pdu.ackedDirective())));
    }
    pdu.m_base = base;
    LOG_TRACE("Unpacked ACK PDU, {} bytes", size);
    return pdu;
}

std::string AckPdu::toString() const {
    return fmt::format("AckPdu(acked={}, cc={}, status={}, {})",
                       cfdp::toString(m_ackedDirective), cfdp::toString(m_conditionCode),
                       static_cast<int>(m_transactionStatus), header().toString());
}

} // namespace cfdp
