#pragma once

#include "cfdp/defs.hpp"
#include "cfdp/pdu_header.hpp"
#include "utils/buffer.hpp"

#include <cstdint>
#include <vector>

namespace cfdp {

/**
 * File Directive PDU base
 *
 * PDU header followed by the one-byte directive code. Every directive PDU
 * owns one of these and appends its parameter field behind it.
 */
class FileDirectivePduBase {
public:
    static constexpr size_t DIRECTIVE_CODE_LEN = 1;

    FileDirectivePduBase(DirectiveCode code, const PduConfig& config);

    /**
     * Parse header and directive code, and check the buffer length and CRC
     * against the declared data field length. If expected is given, the
     * directive code must match it.
     */
    static FileDirectivePduBase unpack(const uint8_t* data, size_t size);
    static FileDirectivePduBase unpack(const uint8_t* data, size_t size, DirectiveCode expected);

    // Full PDU for the given directive parameter field
    std::vector<uint8_t> packWithParams(const std::vector<uint8_t>& params) const;

    // Reader bounded to the parameter field of a buffer this base was parsed from
    utils::BufferReader paramReader(const uint8_t* data) const;

    PduHeader& header() { return m_header; }
    const PduHeader& header() const { return m_header; }
    DirectiveCode directiveCode() const { return m_code; }

    // Header plus directive code
    size_t headerLen() const { return m_header.headerLen() + DIRECTIVE_CODE_LEN; }
    size_t packetLen(size_t directiveParamFieldLen) const {
        return m_header.packetLen(DIRECTIVE_CODE_LEN + directiveParamFieldLen);
    }
    // As parsed from the wire
    size_t directiveParamFieldLen() const;

    size_t fssLen() const { return m_header.fssLen(); }
    uint64_t parseFssField(utils::BufferReader& reader) const { return m_header.parseFssField(reader); }
    void writeFssField(utils::BufferWriter& writer, uint64_t value, const char* what) const {
        m_header.writeFssField(writer, value, what);
    }

private:
    PduHeader m_header;
    DirectiveCode m_code;
};

} // namespace cfdp
