#include "cfdp/finished_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

PduConfig towardsSender(PduConfig config) {
    config.direction = Direction::TowardsSender;
    return config;
}

void checkFaultLocation(ConditionCode code, const std::optional<EntityIdTlv>& location) {
    if (location && !FinishedPdu::faultLocationAllowed(code)) {
        throw ValueError(fmt::format("Finished PDU with condition code {} can not carry a fault location",
                                     toString(code)));
    }
}

} // namespace

FinishedPdu::FinishedPdu(const PduConfig& config, DeliveryCode deliveryCode, FileStatus fileStatus,
                         ConditionCode conditionCode,
                         std::vector<FilestoreResponseTlv> filestoreResponses,
                         std::optional<EntityIdTlv> faultLocation)
    : m_base(DirectiveCode::Finished, towardsSender(config))
    , m_conditionCode(conditionCode)
    , m_deliveryCode(deliveryCode)
    , m_fileStatus(fileStatus)
    , m_filestoreResponses(std::move(filestoreResponses))
    , m_faultLocation(std::move(faultLocation))
{
    checkFaultLocation(m_conditionCode, m_faultLocation);
}

void FinishedPdu::setConditionCode(ConditionCode code) {
    checkFaultLocation(code, m_faultLocation);
    m_conditionCode = code;
}

void FinishedPdu::setFaultLocation(std::optional<EntityIdTlv> location) {
    checkFaultLocation(m_conditionCode, location);
    m_faultLocation = std::move(location);
}

std::vector<uint8_t> FinishedPdu::packParams() const {
    std::vector<uint8_t> params;
    params.push_back(static_cast<uint8_t>(
        (static_cast<uint8_t>(m_conditionCode) << 4) |
        (static_cast<uint8_t>(m_deliveryCode) << 2) |
        static_cast<uint8_t>(m_fileStatus)));
    for (const auto& response : m_filestoreResponses) {
        response.toTlv().packInto(params);
    }
    if (m_faultLocation) {
        m_faultLocation->toTlv().packInto(params);
    }
    return params;
}

std::vector<uint8_t> FinishedPdu::pack() const {
    auto raw = m_base.packWithParams(packParams());
    LOG_TRACE("Packed Finished PDU, {} bytes", raw.size());
    return raw;
}

FinishedPdu FinishedPdu::unpack(const uint8_t* data, size_t size) {
    FileDirectivePduBase base = FileDirectivePduBase::unpack(data, size, DirectiveCode::Finished);
    utils::BufferReader reader = base.paramReader(data);

    uint8_t codes = reader.readU8();
    auto conditionCode = conditionCodeFromRaw(codes >> 4);
    auto deliveryCode = static_cast<DeliveryCode>((codes >> 2) & 1);
    auto fileStatus = static_cast<FileStatus>(codes & 0b11);

    std::vector<FilestoreResponseTlv> responses;
    std::optional<EntityIdTlv> faultLocation;
    while (reader.hasMore()) {
        Tlv tlv = Tlv::unpack(reader.current(), reader.remaining());
        reader.skip(tlv.packetLen());
        switch (tlv.type()) {
            case TlvType::FilestoreResponse:
                responses.push_back(tlv.asFilestoreResponse());
                break;
            case TlvType::EntityId:
                if (faultLocation) {
                    throw ValueError("Finished PDU carries more than one fault location");
                }
                faultLocation = tlv.asEntityId();
                break;
            default:
                LOG_DEBUG("Rejecting Finished PDU with a {} TLV", cfdp::toString(tlv.type()));
                throw ValueError(fmt::format("unexpected {} TLV in Finished PDU", cfdp::toString(tlv.type())));
        }
    }

    FinishedPdu pdu(base.header().pduConfig(), deliveryCode, fileStatus, conditionCode,
                    std::move(responses), std::move(faultLocation));
    pdu.m_base = base;
    LOG_TRACE("Unpacked Finished PDU, {} bytes", size);
    return pdu;
}

std::string FinishedPdu::toString() const {
    return fmt::format("FinishedPdu(cc={}, delivery={}, file_status={}, fs_responses={}, fault_location={}, {})",
                       cfdp::toString(m_conditionCode),
                       m_deliveryCode == DeliveryCode::DataComplete ? "complete" : "incomplete",
                       static_cast<int>(m_fileStatus), m_filestoreResponses.size(),
                       m_faultLocation ? m_faultLocation->entityId().hexStr() : "none",
                       header().toString());
}

bool FinishedPdu::operator==(const FinishedPdu& other) const {
    return pduConfig() == other.pduConfig() &&
           m_conditionCode == other.m_conditionCode &&
           m_deliveryCode == other.m_deliveryCode &&
           m_fileStatus == other.m_fileStatus &&
           m_filestoreResponses == other.m_filestoreResponses &&
           m_faultLocation == other.m_faultLocation;
}

} // namespace cfdp
