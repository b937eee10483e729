#pragma once

#include "cfdp/file_directive.hpp"

#include <string>
#include <utility>
#include <vector>

namespace cfdp {

// Start and end offset of a missing file segment
using SegmentRequest = std::pair<uint64_t, uint64_t>;

/**
 * NAK PDU (CCSDS 727.0-B-5 5.2.6)
 *
 * Scope and segment requests are file size sensitive fields. Always travels
 * towards the sender.
 */
class NakPdu {
public:
    // Throws ValueError if the scope or a segment request ends before it starts
    NakPdu(const PduConfig& config, uint64_t startOfScope, uint64_t endOfScope,
           std::vector<SegmentRequest> segmentRequests = {});

    std::vector<uint8_t> pack() const;
    static NakPdu unpack(const uint8_t* data, size_t size);
    static NakPdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const;

    /**
     * Number of segment requests which fit into a PDU of at most
     * maxPacketSize bytes with the current header settings. Returns 0 if
     * not even the scope fields fit.
     */
    size_t maxSegmentRequestsForPacketSize(size_t maxPacketSize) const;

    PduHeader& header() { return m_base.header(); }
    const PduHeader& header() const { return m_base.header(); }
    const PduConfig& pduConfig() const { return m_base.header().pduConfig(); }

    uint64_t startOfScope() const { return m_startOfScope; }
    uint64_t endOfScope() const { return m_endOfScope; }
    void setScope(uint64_t startOfScope, uint64_t endOfScope);

    const std::vector<SegmentRequest>& segmentRequests() const { return m_segmentRequests; }
    void setSegmentRequests(std::vector<SegmentRequest> requests);

    std::string toString() const;

    bool operator==(const NakPdu& other) const {
        return pduConfig() == other.pduConfig() &&
               m_startOfScope == other.m_startOfScope &&
               m_endOfScope == other.m_endOfScope &&
               m_segmentRequests == other.m_segmentRequests;
    }
    bool operator!=(const NakPdu& other) const { return !(*this == other); }

private:
    FileDirectivePduBase m_base;
    uint64_t m_startOfScope;
    uint64_t m_endOfScope;
    std::vector<SegmentRequest> m_segmentRequests;
};

} // namespace cfdp
