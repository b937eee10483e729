#pragma once

#include "cfdp/file_directive.hpp"

#include <string>
#include <vector>

namespace cfdp {

/**
 * Prompt PDU (CCSDS 727.0-B-5 5.2.7)
 */
class PromptPdu {
public:
    PromptPdu(const PduConfig& config, ResponseRequired responseRequired);

    std::vector<uint8_t> pack() const;
    static PromptPdu unpack(const uint8_t* data, size_t size);
    static PromptPdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const { return m_base.packetLen(1); }

    PduHeader& header() { return m_base.header(); }
    const PduHeader& header() const { return m_base.header(); }
    const PduConfig& pduConfig() const { return m_base.header().pduConfig(); }

    ResponseRequired responseRequired() const { return m_responseRequired; }
    void setResponseRequired(ResponseRequired value) { m_responseRequired = value; }

    std::string toString() const;

    bool operator==(const PromptPdu& other) const {
        return pduConfig() == other.pduConfig() && m_responseRequired == other.m_responseRequired;
    }
    bool operator!=(const PromptPdu& other) const { return !(*this == other); }

private:
    FileDirectivePduBase m_base;
    ResponseRequired m_responseRequired;
};

} // namespace cfdp
