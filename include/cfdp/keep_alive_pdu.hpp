#pragma once

#include "cfdp/file_directive.hpp"

#include <string>
#include <vector>

namespace cfdp {

/**
 * Keep Alive PDU (CCSDS 727.0-B-5 5.2.8)
 *
 * Progress is a file size sensitive field; packing a value above 2^32-1
 * without the large file flag throws RangeError.
 */
class KeepAlivePdu {
public:
    KeepAlivePdu(const PduConfig& config, uint64_t progress);

    std::vector<uint8_t> pack() const;
    static KeepAlivePdu unpack(const uint8_t* data, size_t size);
    static KeepAlivePdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const { return m_base.packetLen(m_base.fssLen()); }

    PduHeader& header() { return m_base.header(); }
    const PduHeader& header() const { return m_base.header(); }
    const PduConfig& pduConfig() const { return m_base.header().pduConfig(); }

    uint64_t progress() const { return m_progress; }
    void setProgress(uint64_t progress) { m_progress = progress; }

    std::string toString() const;

    bool operator==(const KeepAlivePdu& other) const {
        return pduConfig() == other.pduConfig() && m_progress == other.m_progress;
    }
    bool operator!=(const KeepAlivePdu& other) const { return !(*this == other); }

private:
    FileDirectivePduBase m_base;
    uint64_t m_progress;
};

} // namespace cfdp
