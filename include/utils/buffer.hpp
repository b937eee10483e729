#pragma once

#include "cfdp/exceptions.hpp"

#include <cstdint>
#include <vector>
#include <string>
#include <cstdio>

namespace cfdp::utils {

/**
 * Buffer reader for parsing binary data
 *
 * All multi-byte reads are big-endian (network order). Reads past the end
 * throw cfdp::LengthError and leave the cursor untouched.
 */
class BufferReader {
public:
    explicit BufferReader(const std::vector<uint8_t>& data)
        : m_data(data.data())
        , m_size(data.size())
        , m_pos(0)
    {}

    BufferReader(const uint8_t* data, size_t size)
        : m_data(data)
        , m_size(size)
        , m_pos(0)
    {}

    uint8_t readU8() {
        checkBounds(1);
        return m_data[m_pos++];
    }

    uint16_t readU16() {
        return static_cast<uint16_t>(readUnsigned(2));
    }

    uint32_t readU32() {
        return static_cast<uint32_t>(readUnsigned(4));
    }

    // Read an unsigned integer of 0..8 bytes
    uint64_t readUnsigned(size_t width) {
        checkBounds(width);
        uint64_t value = 0;
        for (size_t i = 0; i < width; i++) {
            value = (value << 8) | m_data[m_pos + i];
        }
        m_pos += width;
        return value;
    }

    // Read raw bytes
    std::vector<uint8_t> readBytes(size_t count) {
        checkBounds(count);
        std::vector<uint8_t> result(m_data + m_pos, m_data + m_pos + count);
        m_pos += count;
        return result;
    }

    void skip(size_t count) {
        checkBounds(count);
        m_pos += count;
    }

    size_t remaining() const { return m_size - m_pos; }
    bool hasMore() const { return m_pos < m_size; }
    const uint8_t* current() const { return m_data + m_pos; }

private:
    void checkBounds(size_t count) const {
        if (count > m_size - m_pos) {
            throw LengthError("buffer read out of bounds: need " + std::to_string(count) +
                              " bytes at offset " + std::to_string(m_pos) +
                              ", have " + std::to_string(m_size - m_pos));
        }
    }

    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

/**
 * Buffer writer for building binary data (big-endian)
 */
class BufferWriter {
public:
    BufferWriter() {
        m_data.reserve(64);
    }

    explicit BufferWriter(size_t reserveSize) {
        m_data.reserve(reserveSize);
    }

    void writeU8(uint8_t value) {
        m_data.push_back(value);
    }

    void writeU16(uint16_t value) {
        writeUnsigned(value, 2);
    }

    void writeU32(uint32_t value) {
        writeUnsigned(value, 4);
    }

    // Write the low `width` bytes of value, most significant first
    void writeUnsigned(uint64_t value, size_t width) {
        for (size_t i = width; i > 0; i--) {
            m_data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
        }
    }

    void writeBytes(const std::vector<uint8_t>& data) {
        m_data.insert(m_data.end(), data.begin(), data.end());
    }

    // Get result
    const std::vector<uint8_t>& data() const { return m_data; }
    std::vector<uint8_t>&& take() { return std::move(m_data); }
    size_t size() const { return m_data.size(); }

private:
    std::vector<uint8_t> m_data;
};

// Space separated two-digit hex, for diagnostics
inline std::string toHex(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size * 3);
    char buf[4];
    for (size_t i = 0; i < size; i++) {
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : " %02x", data[i]);
        out += buf;
    }
    return out;
}

inline std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

} // namespace cfdp::utils
