#pragma once

#include "cfdp/file_directive.hpp"
#include "cfdp/tlv.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cfdp {

/**
 * EOF PDU (CCSDS 727.0-B-5 5.2.2)
 *
 * Always travels towards the receiver.
 */
class EofPdu {
public:
    EofPdu(const PduConfig& config, uint32_t fileChecksum, uint64_t fileSize,
           ConditionCode conditionCode = ConditionCode::NoError,
           std::optional<EntityIdTlv> faultLocation = std::nullopt);

    std::vector<uint8_t> pack() const;
    static EofPdu unpack(const uint8_t* data, size_t size);
    static EofPdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const;

    PduHeader& header() { return m_base.header(); }
    const PduHeader& header() const { return m_base.header(); }
    const PduConfig& pduConfig() const { return m_base.header().pduConfig(); }

    ConditionCode conditionCode() const { return m_conditionCode; }
    void setConditionCode(ConditionCode code) { m_conditionCode = code; }

    uint32_t fileChecksum() const { return m_fileChecksum; }
    void setFileChecksum(uint32_t checksum) { m_fileChecksum = checksum; }

    uint64_t fileSize() const { return m_fileSize; }
    void setFileSize(uint64_t size) { m_fileSize = size; }

    const std::optional<EntityIdTlv>& faultLocation() const { return m_faultLocation; }
    void setFaultLocation(std::optional<EntityIdTlv> location) { m_faultLocation = std::move(location); }

    std::string toString() const;

    bool operator==(const EofPdu& other) const;
    bool operator!=(const EofPdu& other) const { return !(*this == other); }

private:
    FileDirectivePduBase m_base;
    ConditionCode m_conditionCode;
    uint32_t m_fileChecksum;
    uint64_t m_fileSize;
    std::optional<EntityIdTlv> m_faultLocation;
};

} // namespace cfdp
