#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <functional>

namespace cfdp {

/**
 * Unsigned Byte Field
 *
 * Fixed-width (0, 1, 2, 4 or 8 byte) unsigned integer with a big-endian
 * wire form. Used for entity IDs and transaction sequence numbers. A width
 * of 0 is the "no identifier" sentinel and packs to nothing.
 *
 * Two fields compare equal only if both value and width match.
 */
class UnsignedByteField {
public:
    UnsignedByteField() = default;

    // Throws RangeError if the width is illegal or the value does not fit
    UnsignedByteField(uint64_t value, size_t byteLen);

    // Takes the first byteLen bytes of data; throws LengthError if shorter
    static UnsignedByteField fromBytes(const uint8_t* data, size_t size, size_t byteLen);
    static UnsignedByteField fromBytes(const std::vector<uint8_t>& data, size_t byteLen);
    // Width taken from the buffer length
    static UnsignedByteField fromBytes(const std::vector<uint8_t>& data);

    static bool isValidWidth(size_t byteLen);
    static uint64_t maxValue(size_t byteLen);

    uint64_t value() const { return m_value; }
    size_t byteLen() const { return m_byteLen; }

    std::vector<uint8_t> toBytes() const;

    // e.g. "0x0002" for a 2-byte field
    std::string hexStr() const;
    std::string toString() const;

    bool operator==(const UnsignedByteField& other) const {
        return m_value == other.m_value && m_byteLen == other.m_byteLen;
    }
    bool operator!=(const UnsignedByteField& other) const { return !(*this == other); }
    bool operator<(const UnsignedByteField& other) const {
        return m_byteLen != other.m_byteLen ? m_byteLen < other.m_byteLen
                                            : m_value < other.m_value;
    }

private:
    uint64_t m_value = 0;
    size_t m_byteLen = 0;
};

/**
 * Transaction ID: source entity ID plus transaction sequence number
 */
struct TransactionId {
    UnsignedByteField sourceId;
    UnsignedByteField seqNum;

    bool operator==(const TransactionId& other) const {
        return sourceId == other.sourceId && seqNum == other.seqNum;
    }
    bool operator!=(const TransactionId& other) const { return !(*this == other); }
    bool operator<(const TransactionId& other) const {
        if (sourceId != other.sourceId) {
            return sourceId < other.sourceId;
        }
        return seqNum < other.seqNum;
    }
};

} // namespace cfdp

namespace std {

template<>
struct hash<cfdp::UnsignedByteField> {
    size_t operator()(const cfdp::UnsignedByteField& field) const noexcept {
        size_t h = std::hash<uint64_t>{}(field.value());
        return h ^ (std::hash<size_t>{}(field.byteLen()) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

template<>
struct hash<cfdp::TransactionId> {
    size_t operator()(const cfdp::TransactionId& id) const noexcept {
        size_t h = std::hash<cfdp::UnsignedByteField>{}(id.sourceId);
        return h ^ (std::hash<cfdp::UnsignedByteField>{}(id.seqNum) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

} // namespace std
