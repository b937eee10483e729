#include "cfdp/unsigned_byte_field.hpp"
#include "cfdp/exceptions.hpp"
#include "utils/buffer.hpp"

#include <fmt/format.h>

namespace cfdp {

bool UnsignedByteField::isValidWidth(size_t byteLen) {
    return byteLen == 0 || byteLen == 1 || byteLen == 2 || byteLen == 4 || byteLen == 8;
}

uint64_t UnsignedByteField::maxValue(size_t byteLen) {
    if (byteLen >= 8) {
        return UINT64_MAX;
    }
    return (uint64_t{1} << (byteLen * 8)) - 1;
}

UnsignedByteField::UnsignedByteField(uint64_t value, size_t byteLen)
    : m_value(value)
    , m_byteLen(byteLen)
{
    if (!isValidWidth(byteLen)) {
        throw RangeError(fmt::format("invalid byte field width {}, must be 0, 1, 2, 4 or 8", byteLen));
    }
    if (value > maxValue(byteLen)) {
        throw RangeError(fmt::format("value {} does not fit into {} byte(s)", value, byteLen));
    }
}

UnsignedByteField UnsignedByteField::fromBytes(const uint8_t* data, size_t size, size_t byteLen) {
    if (!isValidWidth(byteLen)) {
        throw RangeError(fmt::format("invalid byte field width {}, must be 0, 1, 2, 4 or 8", byteLen));
    }
    utils::BufferReader reader(data, size);
    return UnsignedByteField(reader.readUnsigned(byteLen), byteLen);
}

UnsignedByteField UnsignedByteField::fromBytes(const std::vector<uint8_t>& data, size_t byteLen) {
    return fromBytes(data.data(), data.size(), byteLen);
}

UnsignedByteField UnsignedByteField::fromBytes(const std::vector<uint8_t>& data) {
    return fromBytes(data.data(), data.size(), data.size());
}

std::vector<uint8_t> UnsignedByteField::toBytes() const {
    utils::BufferWriter writer(m_byteLen);
    writer.writeUnsigned(m_value, m_byteLen);
    return writer.take();
}

std::string UnsignedByteField::hexStr() const {
    if (m_byteLen == 0) {
        return "0x";
    }
    return fmt::format("{:#0{}x}", m_value, m_byteLen * 2 + 2);
}

std::string UnsignedByteField::toString() const {
    return fmt::format("{} ({} byte(s))", hexStr(), m_byteLen);
}

} // namespace cfdp
