#include "cfdp/prompt_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

PromptPdu::PromptPdu(const PduConfig& config, ResponseRequired responseRequired)
    : m_base(DirectiveCode::Prompt, config)
    , m_responseRequired(responseRequired)
{}

std::vector<uint8_t> PromptPdu::pack() const {
    auto raw = m_base.packWithParams({static_cast<uint8_t>(static_cast<uint8_t>(m_responseRequired) << 7)});
    LOG_TRACE("Packed Prompt PDU, {} bytes", raw.size());
    return raw;
}

PromptPdu PromptPdu::unpack(const uint8_t* data, size_t size) {
    FileDirectivePduBase base = FileDirectivePduBase::unpack(data, size, DirectiveCode::Prompt);
    utils::BufferReader reader = base.paramReader(data);

    auto responseRequired = static_cast<ResponseRequired>(reader.readU8() >> 7);
    if (reader.hasMore()) {
        throw ValueError(fmt::format("{} unexpected bytes after the Prompt parameters", reader.remaining()));
    }

    PromptPdu pdu(base.header().pduConfig(), responseRequired);
    pdu.m_base = base;
    return pdu;
}

std::string PromptPdu::toString() const {
    return fmt::format("PromptPdu(response={}, {})",
                       m_responseRequired == ResponseRequired::Nak ? "NAK" : "KeepAlive",
                       header().toString());
}

} // namespace cfdp
