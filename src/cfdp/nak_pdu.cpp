#include "cfdp/nak_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

PduConfig towardsSender(PduConfig config) {
    config.direction = Direction::TowardsSender;
    return config;
}

void checkRange(uint64_t start, uint64_t end, const char* what) {
    if (start > end) {
        throw ValueError(fmt::format("NAK {} starts at {} but ends at {}", what, start, end));
    }
}

void checkSegmentRequests(const std::vector<SegmentRequest>& requests) {
    for (const auto& [start, end] : requests) {
        checkRange(start, end, "segment request");
    }
}

} // namespace

NakPdu::NakPdu(const PduConfig& config, uint64_t startOfScope, uint64_t endOfScope,
               std::vector<SegmentRequest> segmentRequests)
    : m_base(DirectiveCode::Nak, towardsSender(config))
    , m_startOfScope(startOfScope)
    , m_endOfScope(endOfScope)
    , m_segmentRequests(std::move(segmentRequests))
{
    checkRange(m_startOfScope, m_endOfScope, "scope");
    checkSegmentRequests(m_segmentRequests);
}

void NakPdu::setScope(uint64_t startOfScope, uint64_t endOfScope) {
    checkRange(startOfScope, endOfScope, "scope");
    m_startOfScope = startOfScope;
    m_endOfScope = endOfScope;
}

void NakPdu::setSegmentRequests(std::vector<SegmentRequest> requests) {
    checkSegmentRequests(requests);
    m_segmentRequests = std::move(requests);
}

size_t NakPdu::packetLen() const {
    return m_base.packetLen(m_base.fssLen() * (2 + 2 * m_segmentRequests.size()));
}

size_t NakPdu::maxSegmentRequestsForPacketSize(size_t maxPacketSize) const {
    size_t fixedLen = m_base.packetLen(2 * m_base.fssLen());
    if (maxPacketSize < fixedLen) {
        return 0;
    }
    return (maxPacketSize - fixedLen) / (2 * m_base.fssLen());
}

std::vector<uint8_t> NakPdu::pack() const {
    utils::BufferWriter params;
    m_base.writeFssField(params, m_startOfScope, "start of scope");
    m_base.writeFssField(params, m_endOfScope, "end of scope");
    for (const auto& [start, end] : m_segmentRequests) {
        m_base.writeFssField(params, start, "segment request start");
        m_base.writeFssField(params, end, "segment request end");
    }
    auto raw = m_base.packWithParams(params.data());
    LOG_TRACE("Packed NAK PDU with {} segment requests, {} bytes", m_segmentRequests.size(), raw.size());
    return raw;
}

NakPdu NakPdu::unpack(const uint8_t* data, size_t size) {
    FileDirectivePduBase base = FileDirectivePduBase::unpack(data, size, DirectiveCode::Nak);
    utils::BufferReader reader = base.paramReader(data);

    uint64_t startOfScope = base.parseFssField(reader);
    uint64_t endOfScope = base.parseFssField(reader);
    size_t pairLen = 2 * base.fssLen();
    if (reader.remaining() % pairLen != 0) {
        throw ValueError(fmt::format("NAK segment request field of {} bytes is not a multiple of {}",
                                     reader.remaining(), pairLen));
    }
    std::vector<SegmentRequest> requests;
    requests.reserve(reader.remaining() / pairLen);
    while (reader.hasMore()) {
        uint64_t start = base.parseFssField(reader);
        uint64_t end = base.parseFssField(reader);
        requests.emplace_back(start, end);
    }

    NakPdu pdu(base.header().pduConfig(), startOfScope, endOfScope, std::move(requests));
    pdu.m_base = base;
    LOG_TRACE("Unpacked NAK PDU, {} bytes", size);
    return pdu;
}

std::string NakPdu::toString() const {
    return fmt::format("NakPdu(scope={}..{}, segment_requests={}, {})",
                       m_startOfScope, m_endOfScope, m_segmentRequests.size(), header().toString());
}

} // namespace cfdp
