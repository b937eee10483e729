#pragma once

#include "cfdp/file_directive.hpp"
#include "cfdp/tlv.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cfdp {

/**
 * Finished PDU (CCSDS 727.0-B-5 5.2.3)
 *
 * Parameter field: condition code, delivery code and file status in one
 * byte, then filestore responses, then the fault location. The fault
 * location is only legal when the condition code reports an error other
 * than an unsupported checksum type. Always travels towards the sender.
 */
class FinishedPdu {
public:
    // Throws ValueError for a fault location with a non-fault condition code
    FinishedPdu(const PduConfig& config, DeliveryCode deliveryCode, FileStatus fileStatus,
                ConditionCode conditionCode = ConditionCode::NoError,
                std::vector<FilestoreResponseTlv> filestoreResponses = {},
                std::optional<EntityIdTlv> faultLocation = std::nullopt);

    std::vector<uint8_t> pack() const;
    static FinishedPdu unpack(const uint8_t* data, size_t size);
    static FinishedPdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const { return m_base.packetLen(packParams().size()); }

    PduHeader& header() { return m_base.header(); }
    const PduHeader& header() const { return m_base.header(); }
    const PduConfig& pduConfig() const { return m_base.header().pduConfig(); }

    ConditionCode conditionCode() const { return m_conditionCode; }
    // Throws ValueError if a fault location is set and code does not allow one
    void setConditionCode(ConditionCode code);

    DeliveryCode deliveryCode() const { return m_deliveryCode; }
    void setDeliveryCode(DeliveryCode code) { m_deliveryCode = code; }

    FileStatus fileStatus() const { return m_fileStatus; }
    void setFileStatus(FileStatus status) { m_fileStatus = status; }

    const std::vector<FilestoreResponseTlv>& filestoreResponses() const { return m_filestoreResponses; }
    void setFilestoreResponses(std::vector<FilestoreResponseTlv> responses) {
        m_filestoreResponses = std::move(responses);
    }

    const std::optional<EntityIdTlv>& faultLocation() const { return m_faultLocation; }
    void setFaultLocation(std::optional<EntityIdTlv> location);

    static bool faultLocationAllowed(ConditionCode code) {
        return code != ConditionCode::NoError && code != ConditionCode::UnsupportedChecksumType;
    }

    std::string toString() const;

    bool operator==(const FinishedPdu& other) const;
    bool operator!=(const FinishedPdu& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> packParams() const;

    FileDirectivePduBase m_base;
    ConditionCode m_conditionCode;
    DeliveryCode m_deliveryCode;
    FileStatus m_fileStatus;
    std::vector<FilestoreResponseTlv> m_filestoreResponses;
    std::optional<EntityIdTlv> m_faultLocation;
};

} // namespace cfdp
