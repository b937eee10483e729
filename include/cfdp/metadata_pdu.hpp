#pragma once

#include "cfdp/file_directive.hpp"
#include "cfdp/tlv.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cfdp {

/**
 * Metadata PDU (CCSDS 727.0-B-5 5.2.5)
 *
 * File names travel as LVs; an empty LV means no file name, which is how
 * metadata-only transactions (e.g. pure user messages) are sent. Options
 * are kept as generic TLVs in wire order.
 */
class MetadataPdu {
public:
    MetadataPdu(const PduConfig& config, bool closureRequested, ChecksumType checksumType,
                uint64_t fileSize, std::optional<std::string> sourceFileName,
                std::optional<std::string> destFileName, std::vector<Tlv> options = {});

    std::vector<uint8_t> pack() const;
    static MetadataPdu unpack(const uint8_t* data, size_t size);
    static MetadataPdu unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    size_t packetLen() const;

    PduHeader& header() { return m_base.header(); }
    const PduHeader& header() const { return m_base.header(); }
    const PduConfig& pduConfig() const { return m_base.header().pduConfig(); }

    bool closureRequested() const { return m_closureRequested; }
    void setClosureRequested(bool requested) { m_closureRequested = requested; }

    ChecksumType checksumType() const { return m_checksumType; }
    void setChecksumType(ChecksumType type) { m_checksumType = type; }

    uint64_t fileSize() const { return m_fileSize; }
    void setFileSize(uint64_t size) { m_fileSize = size; }

    const std::optional<std::string>& sourceFileName() const { return m_sourceFileName; }
    void setSourceFileName(std::optional<std::string> name) { m_sourceFileName = std::move(name); }

    const std::optional<std::string>& destFileName() const { return m_destFileName; }
    void setDestFileName(std::optional<std::string> name) { m_destFileName = std::move(name); }

    const std::vector<Tlv>& options() const { return m_options; }
    void setOptions(std::vector<Tlv> options) { m_options = std::move(options); }

    // Options of one type, converted to their typed view
    std::vector<FilestoreRequestTlv> filestoreRequests() const;
    std::vector<MessageToUserTlv> messagesToUser() const;
    std::vector<FaultHandlerOverrideTlv> faultHandlerOverrides() const;
    std::optional<FlowLabelTlv> flowLabel() const;

    std::string toString() const;

    bool operator==(const MetadataPdu& other) const;
    bool operator!=(const MetadataPdu& other) const { return !(*this == other); }

private:
    FileDirectivePduBase m_base;
    bool m_closureRequested;
    ChecksumType m_checksumType;
    uint64_t m_fileSize;
    std::optional<std::string> m_sourceFileName;
    std::optional<std::string> m_destFileName;
    std::vector<Tlv> m_options;
};

} // namespace cfdp
