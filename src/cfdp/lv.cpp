#include "cfdp/lv.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/buffer.hpp"

#include <fmt/format.h>

namespace cfdp {

Lv Lv::fromString(const std::string& str) {
    return Lv(std::vector<uint8_t>(str.begin(), str.end()));
}

void Lv::packInto(std::vector<uint8_t>& out) const {
    if (m_value.size() > MAX_VALUE_LEN) {
        throw LengthError(fmt::format("LV value of {} bytes exceeds {} bytes", m_value.size(), MAX_VALUE_LEN));
    }
    out.push_back(static_cast<uint8_t>(m_value.size()));
    out.insert(out.end(), m_value.begin(), m_value.end());
}

std::vector<uint8_t> Lv::pack() const {
    std::vector<uint8_t> out;
    out.reserve(packetLen());
    packInto(out);
    return out;
}

Lv Lv::unpack(const uint8_t* data, size_t size) {
    utils::BufferReader reader(data, size);
    uint8_t len = reader.readU8();
    if (reader.remaining() < len) {
        throw LengthError(fmt::format("LV declares {} value bytes, only {} available", len, reader.remaining()));
    }
    return Lv(reader.readBytes(len));
}

} // namespace cfdp
