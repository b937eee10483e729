#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace cfdp {

/**
 * Length-Value field
 *
 * One length byte followed by up to 255 value bytes. Carries file names in
 * the Metadata PDU and inside filestore TLVs. An empty LV means "absent".
 */
class Lv {
public:
    static constexpr size_t MAX_VALUE_LEN = 255;

    Lv() = default;
    explicit Lv(std::vector<uint8_t> value) : m_value(std::move(value)) {}
    static Lv fromString(const std::string& str);

    // Throws LengthError if the value exceeds 255 bytes
    std::vector<uint8_t> pack() const;
    void packInto(std::vector<uint8_t>& out) const;

    // Throws LengthError if the buffer cannot hold the declared length
    static Lv unpack(const uint8_t* data, size_t size);
    static Lv unpack(const std::vector<uint8_t>& data) { return unpack(data.data(), data.size()); }

    const std::vector<uint8_t>& value() const { return m_value; }
    std::string valueAsString() const { return std::string(m_value.begin(), m_value.end()); }
    size_t valueLen() const { return m_value.size(); }
    size_t packetLen() const { return 1 + m_value.size(); }
    bool empty() const { return m_value.empty(); }

    bool operator==(const Lv& other) const { return m_value == other.m_value; }
    bool operator!=(const Lv& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> m_value;
};

} // namespace cfdp
