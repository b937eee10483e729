#include "cfdp/metadata_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace cfdp {

namespace {

Lv fileNameLv(const std::optional<std::string>& name) {
    return name ? Lv::fromString(*name) : Lv();
}

std::optional<std::string> fileNameFromLv(const Lv& lv) {
    if (lv.empty()) {
        return std::nullopt;
    }
    return lv.valueAsString();
}

Lv readLv(utils::BufferReader& reader) {
    Lv lv = Lv::unpack(reader.current(), reader.remaining());
    reader.skip(lv.packetLen());
    return lv;
}

} // namespace

MetadataPdu::MetadataPdu(const PduConfig& config, bool closureRequested, ChecksumType checksumType,
                         uint64_t fileSize, std::optional<std::string> sourceFileName,
                         std::optional<std::string> destFileName, std::vector<Tlv> options)
    : m_base(DirectiveCode::Metadata, config)
    , m_closureRequested(closureRequested)
    , m_checksumType(checksumType)
    , m_fileSize(fileSize)
    , m_sourceFileName(std::move(sourceFileName))
    , m_destFileName(std::move(destFileName))
    , m_options(std::move(options))
{}

size_t MetadataPdu::packetLen() const {
    size_t params = 1 + m_base.fssLen() + fileNameLv(m_sourceFileName).packetLen() +
                    fileNameLv(m_destFileName).packetLen();
    for (const auto& option : m_options) {
        params += option.packetLen();
    }
    return m_base.packetLen(params);
}

std::vector<uint8_t> MetadataPdu::pack() const {
    utils::BufferWriter params;
    params.writeU8(static_cast<uint8_t>((static_cast<uint8_t>(m_closureRequested) << 6) |
                                        static_cast<uint8_t>(m_checksumType)));
    m_base.writeFssField(params, m_fileSize, "file size");
    params.writeBytes(fileNameLv(m_sourceFileName).pack());
    params.writeBytes(fileNameLv(m_destFileName).pack());
    for (const auto& option : m_options) {
        params.writeBytes(option.pack());
    }
    auto raw = m_base.packWithParams(params.data());
    LOG_TRACE("Packed Metadata PDU, {} bytes", raw.size());
    return raw;
}

MetadataPdu MetadataPdu::unpack(const uint8_t* data, size_t size) {
    FileDirectivePduBase base = FileDirectivePduBase::unpack(data, size, DirectiveCode::Metadata);
    size_t minParams = 1 + base.fssLen() + 2;
    if (base.directiveParamFieldLen() < minParams) {
        throw LengthError(fmt::format("Metadata parameter field needs at least {} bytes, got {}",
                                      minParams, base.directiveParamFieldLen()));
    }
    utils::BufferReader reader = base.paramReader(data);

    uint8_t first = reader.readU8();
    bool closureRequested = (first >> 6) & 1;
    auto checksumType = checksumTypeFromRaw(first & 0x0F);
    uint64_t fileSize = base.parseFssField(reader);
    auto sourceFileName = fileNameFromLv(readLv(reader));
    auto destFileName = fileNameFromLv(readLv(reader));

    std::vector<Tlv> options;
    while (reader.hasMore()) {
        Tlv tlv = Tlv::unpack(reader.current(), reader.remaining());
        reader.skip(tlv.packetLen());
        options.push_back(std::move(tlv));
    }

    MetadataPdu pdu(base.header().pduConfig(), closureRequested, checksumType, fileSize,
                    std::move(sourceFileName), std::move(destFileName), std::move(options));
    pdu.m_base = base;
    LOG_TRACE("Unpacked Metadata PDU, {} bytes", size);
    return pdu;
}

std::vector<FilestoreRequestTlv> MetadataPdu::filestoreRequests() const {
    std::vector<FilestoreRequestTlv> result;
    for (const auto& option : m_options) {
        if (option.type() == TlvType::FilestoreRequest) {
            result.push_back(option.asFilestoreRequest());
        }
    }
    return result;
}

std::vector<MessageToUserTlv> MetadataPdu::messagesToUser() const {
    std::vector<MessageToUserTlv> result;
    for (const auto& option : m_options) {
        if (option.type() == TlvType::MessageToUser) {
            result.push_back(option.asMessageToUser());
        }
    }
    return result;
}

std::vector<FaultHandlerOverrideTlv> MetadataPdu::faultHandlerOverrides() const {
    std::vector<FaultHandlerOverrideTlv> result;
    for (const auto& option : m_options) {
        if (option.type() == TlvType::FaultHandler) {
            result.push_back(option.asFaultHandlerOverride());
        }
    }
    return result;
}

std::optional<FlowLabelTlv> MetadataPdu::flowLabel() const {
    for (const auto& option : m_options) {
        if (option.type() == TlvType::FlowLabel) {
            return option.asFlowLabel();
        }
    }
    return std::nullopt;
}

std::string MetadataPdu::toString() const {
    return fmt::format("MetadataPdu(closure={}, checksum={}, size={}, src={}, dest={}, options={}, {})",
                       m_closureRequested, static_cast<int>(m_checksumType), m_fileSize,
                       m_sourceFileName.value_or("<none>"), m_destFileName.value_or("<none>"),
                       m_options.size(), header().toString());
}

bool MetadataPdu::operator==(const MetadataPdu& other) const {
    return pduConfig() == other.pduConfig() &&
           m_closureRequested == other.m_closureRequested &&
           m_checksumType == other.m_checksumType &&
           m_fileSize == other.m_fileSize &&
           m_sourceFileName == other.m_sourceFileName &&
           m_destFileName == other.m_destFileName &&
           m_options == other.m_options;
}

} // namespace cfdp
