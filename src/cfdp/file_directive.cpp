#include "cfdp/file_directive.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

FileDirectivePduBase::FileDirectivePduBase(DirectiveCode code, const PduConfig& config)
    : m_header(PduType::FileDirective, config)
    , m_code(code)
{}

FileDirectivePduBase FileDirectivePduBase::unpack(const uint8_t* data, size_t size) {
    PduHeader header = PduHeader::unpack(data, size);
    if (header.pduType() != PduType::FileDirective) {
        throw ValueError("PDU type bit marks a file data PDU, expected a file directive");
    }
    if (header.pduDataFieldLen() < DIRECTIVE_CODE_LEN) {
        throw LengthError("file directive PDU has an empty data field");
    }
    header.verifyPacket(data, size);

    uint8_t rawCode = data[header.headerLen()];
    if (!isValidDirectiveCode(rawCode)) {
        LOG_DEBUG("Rejecting PDU with directive code {:#04x}", rawCode);
        throw UnrecognizedCodeError(fmt::format("unrecognized directive code {:#04x}", rawCode));
    }

    FileDirectivePduBase base(static_cast<DirectiveCode>(rawCode), header.pduConfig());
    base.m_header = header;
    return base;
}

FileDirectivePduBase FileDirectivePduBase::unpack(const uint8_t* data, size_t size, DirectiveCode expected) {
    FileDirectivePduBase base = unpack(data, size);
    if (base.m_code != expected) {
        throw TypeMismatchError(toString(expected) + " PDU", toString(base.m_code) + " PDU");
    }
    return base;
}

std::vector<uint8_t> FileDirectivePduBase::packWithParams(const std::vector<uint8_t>& params) const {
    std::vector<uint8_t> dataField;
    dataField.reserve(DIRECTIVE_CODE_LEN + params.size());
    dataField.push_back(static_cast<uint8_t>(m_code));
    dataField.insert(dataField.end(), params.begin(), params.end());
    return m_header.packPdu(dataField);
}

utils::BufferReader FileDirectivePduBase::paramReader(const uint8_t* data) const {
    return utils::BufferReader(data + headerLen(), directiveParamFieldLen());
}

size_t FileDirectivePduBase::directiveParamFieldLen() const {
    return m_header.pduDataFieldLen() - DIRECTIVE_CODE_LEN;
}

} // namespace cfdp
