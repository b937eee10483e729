#pragma once

#include "cfdp/file_directive.hpp"

#include <string>
#include <vector>

namespace cfdp {

/**
 * ACK PDU (CCSDS 727.0-B-5 5.2.4)
 *
 * Acknowledges an EOF or a Finished PDU. The direction follows from the
 * acknowledged directive: a Finished ACK goes to the receiver, an EOF ACK
 * to the sender.
 */
class AckPdu {
public:
    // Throws ValueError unless ackedDirective is EOF or Finished
    AckPdu(const PduConfig& config, DirectiveCode ackedDirective, ConditionCode conditionCode,
           TransactionStatus transactionStatus);

    std::vector<uint8_t> pack() const;
    static AckPdu unpack(const uint8_t* data, size_t size);
    static AckPdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const { return m_base.packetLen(2); }

    PduHeader& header() { return m_base.header(); }
    const PduHeader& header() const { return m_base.header(); }
    const PduConfig& pduConfig() const { return m_base.header().pduConfig(); }

    DirectiveCode ackedDirective() const { return m_ackedDirective; }
    uint8_t directiveSubtypeCode() const { return m_ackedDirective == DirectiveCode::Finished ? 0b0001 : 0b0000; }

    ConditionCode conditionCode() const { return m_conditionCode; }
    void setConditionCode(ConditionCode code) { m_conditionCode = code; }

    TransactionStatus transactionStatus() const { return m_transactionStatus; }
    void setTransactionStatus(TransactionStatus status) { m_transactionStatus = status; }

    std::string toString() const;

    bool operator==(const AckPdu& other) const {
        return pduConfig() == other.pduConfig() &&
               m_ackedDirective == other.m_ackedDirective &&
               m_conditionCode == other.m_conditionCode &&
               m_transactionStatus == other.m_transactionStatus;
    }
    bool operator!=(const AckPdu& other) const { return !(*this == other); }

private:
    FileDirectivePduBase m_base;
    DirectiveCode m_ackedDirective;
    ConditionCode m_conditionCode;
    TransactionStatus m_transactionStatus;
};

} // namespace cfdp
