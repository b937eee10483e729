#pragma once

#include "cfdp/ack_pdu.hpp"
#include "cfdp/eof_pdu.hpp"
#include "cfdp/exceptions.hpp"
#include "cfdp/file_data_pdu.hpp"
#include "cfdp/finished_pdu.hpp"
#include "cfdp/keep_alive_pdu.hpp"
#include "cfdp/metadata_pdu.hpp"
#include "cfdp/nak_pdu.hpp"
#include "cfdp/prompt_pdu.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cfdp {

// Closed set of concrete PDUs
using GenericPdu = std::variant<EofPdu, FinishedPdu, AckPdu, MetadataPdu, NakPdu,
                                PromptPdu, KeepAlivePdu, FileDataPdu>;

std::string pduKindName(const GenericPdu& pdu);

/**
 * PDU Holder
 *
 * Owns one concrete PDU (or nothing) and hands it out through typed
 * accessors. A mismatching accessor throws TypeMismatchError naming the
 * requested and the held kind.
 */
class PduHolder {
public:
    PduHolder() = default;
    explicit PduHolder(GenericPdu pdu) : m_pdu(std::move(pdu)) {}

    bool empty() const { return !m_pdu.has_value(); }
    const std::optional<GenericPdu>& pdu() const { return m_pdu; }

    // Throws TypeMismatchError when empty
    PduType pduType() const;
    std::optional<DirectiveCode> directiveType() const;
    const PduHeader& header() const;
    std::vector<uint8_t> pack() const;
    size_t packetLen() const;

    // "EOF PDU", "File Data PDU", ... or "none"
    std::string kindName() const;
    std::string toString() const;

    const EofPdu& toEofPdu() const { return as<EofPdu>("EOF PDU"); }
    const FinishedPdu& toFinishedPdu() const { return as<FinishedPdu>("Finished PDU"); }
    const AckPdu& toAckPdu() const { return as<AckPdu>("ACK PDU"); }
    const MetadataPdu& toMetadataPdu() const { return as<MetadataPdu>("Metadata PDU"); }
    const NakPdu& toNakPdu() const { return as<NakPdu>("NAK PDU"); }
    const PromptPdu& toPromptPdu() const { return as<PromptPdu>("Prompt PDU"); }
    const KeepAlivePdu& toKeepAlivePdu() const { return as<KeepAlivePdu>("KeepAlive PDU"); }
    const FileDataPdu& toFileDataPdu() const { return as<FileDataPdu>("File Data PDU"); }

private:
    template<typename T>
    const T& as(const char* expected) const {
        const T* pdu = m_pdu ? std::get_if<T>(&*m_pdu) : nullptr;
        if (!pdu) {
            throw TypeMismatchError(expected, kindName());
        }
        return *pdu;
    }

    std::optional<GenericPdu> m_pdu;
};

/**
 * PDU Factory
 *
 * Classifies raw PDUs and dispatches to the matching unpack routine.
 */
class PduFactory {
public:
    // Throws LengthError on an empty buffer
    static PduType pduType(const uint8_t* data, size_t size);
    static bool isFileDirective(const uint8_t* data, size_t size) {
        return pduType(data, size) == PduType::FileDirective;
    }

    /**
     * Directive code of a raw PDU, or nullopt for file data. Throws
     * UnrecognizedCodeError for a directive code outside the standard set.
     */
    static std::optional<DirectiveCode> pduDirectiveType(const uint8_t* data, size_t size);

    static PduHolder fromRaw(const uint8_t* data, size_t size);
    static PduHolder fromRaw(const std::vector<uint8_t>& data) { return fromRaw(data.data(), data.size()); }

    static PduType pduType(const std::vector<uint8_t>& data) { return pduType(data.data(), data.size()); }
    static bool isFileDirective(const std::vector<uint8_t>& data) { return isFileDirective(data.data(), data.size()); }
    static std::optional<DirectiveCode> pduDirectiveType(const std::vector<uint8_t>& data) {
        return pduDirectiveType(data.data(), data.size());
    }
};

} // namespace cfdp
