#include "cfdp/pdu_factory.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string pduKindName(const GenericPdu& pdu) {
    return std::visit(overloaded{
        [](const EofPdu&) { return std::string("EOF PDU"); },
        [](const FinishedPdu&) { return std::string("Finished PDU"); },
        [](const AckPdu&) { return std::string("ACK PDU"); },
        [](const MetadataPdu&) { return std::string("Metadata PDU"); },
        [](const NakPdu&) { return std::string("NAK PDU"); },
        [](const PromptPdu&) { return std::string("Prompt PDU"); },
        [](const KeepAlivePdu&) { return std::string("KeepAlive PDU"); },
        [](const FileDataPdu&) { return std::string("File Data PDU"); },
    }, pdu);
}

// =============================================================================
// PduHolder
// =============================================================================

std::string PduHolder::kindName() const {
    return m_pdu ? pduKindName(*m_pdu) : "none";
}

const PduHeader& PduHolder::header() const {
    if (!m_pdu) {
        throw TypeMismatchError("a PDU", "none");
    }
    return std::visit([](const auto& pdu) -> const PduHeader& { return pdu.header(); }, *m_pdu);
}

PduType PduHolder::pduType() const {
    return header().pduType();
}

std::optional<DirectiveCode> PduHolder::directiveType() const {
    if (!m_pdu) {
        throw TypeMismatchError("a PDU", "none");
    }
    return std::visit(overloaded{
        [](const EofPdu&) -> std::optional<DirectiveCode> { return DirectiveCode::Eof; },
        [](const FinishedPdu&) -> std::optional<DirectiveCode> { return DirectiveCode::Finished; },
        [](const AckPdu&) -> std::optional<DirectiveCode> { return DirectiveCode::Ack; },
        [](const MetadataPdu&) -> std::optional<DirectiveCode> { return DirectiveCode::Metadata; },
        [](const NakPdu&) -> std::optional<DirectiveCode> { return DirectiveCode::Nak; },
        [](const PromptPdu&) -> std::optional<DirectiveCode> { return DirectiveCode::Prompt; },
        [](const KeepAlivePdu&) -> std::optional<DirectiveCode> { return DirectiveCode::KeepAlive; },
        [](const FileDataPdu&) -> std::optional<DirectiveCode> { return std::nullopt; },
    }, *m_pdu);
}

std::vector<uint8_t> PduHolder::pack() const {
    if (!m_pdu) {
        throw TypeMismatchError("a PDU", "none");
    }
    return std::visit([](const auto& pdu) { return pdu.pack(); }, *m_pdu);
}

size_t PduHolder::packetLen() const {
    if (!m_pdu) {
        throw TypeMismatchError("a PDU", "none");
    }
    return std::visit([](const auto& pdu) { return pdu.packetLen(); }, *m_pdu);
}

std::string PduHolder::toString() const {
    if (!m_pdu) {
        return "PduHolder(none)";
    }
    return std::visit([](const auto& pdu) { return pdu.toString(); }, *m_pdu);
}

// =============================================================================
// PduFactory
// =============================================================================

PduType PduFactory::pduType(const uint8_t* data, size_t size) {
    if (size == 0) {
        throw LengthError("can not determine the PDU type of an empty buffer");
    }
    return static_cast<PduType>((data[0] >> 4) & 1);
}

std::optional<DirectiveCode> PduFactory::pduDirectiveType(const uint8_t* data, size_t size) {
    if (pduType(data, size) == PduType::FileData) {
        return std::nullopt;
    }
    PduHeader header = PduHeader::unpack(data, size);
    if (size <= header.headerLen()) {
        throw LengthError(fmt::format("directive code at offset {} is beyond the {} byte buffer",
                                      header.headerLen(), size));
    }
    uint8_t rawCode = data[header.headerLen()];
    if (!isValidDirectiveCode(rawCode)) {
        LOG_DEBUG("Rejecting PDU with directive code {:#04x}", rawCode);
        throw UnrecognizedCodeError(fmt::format("unrecognized directive code {:#04x}", rawCode));
    }
    return static_cast<DirectiveCode>(rawCode);
}

PduHolder PduFactory::fromRaw(const uint8_t* data, size_t size) {
    std::optional<DirectiveCode> directive = pduDirectiveType(data, size);
    if (!directive) {
        return PduHolder(FileDataPdu::unpack(data, size));
    }
    switch (*directive) {
        case DirectiveCode::Eof:       return PduHolder(EofPdu::unpack(data, size));
        case DirectiveCode::Finished:  return PduHolder(FinishedPdu::unpack(data, size));
        case DirectiveCode::Ack:       return PduHolder(AckPdu::unpack(data, size));
        case DirectiveCode::Metadata:  return PduHolder(MetadataPdu::unpack(data, size));
        case DirectiveCode::Nak:       return PduHolder(NakPdu::unpack(data, size));
        case DirectiveCode::Prompt:    return PduHolder(PromptPdu::unpack(data, size));
        case DirectiveCode::KeepAlive: return PduHolder(KeepAlivePdu::unpack(data, size));
    }
    return PduHolder();
}

} // namespace cfdp
