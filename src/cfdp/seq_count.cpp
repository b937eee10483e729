#include "cfdp/seq_count.hpp"
#include "cfdp/exceptions.hpp"

#include <fmt/format.h>

namespace cfdp {

SimpleSeqCountProvider::SimpleSeqCountProvider(size_t bitWidth)
    : m_bitWidth(bitWidth)
{
    if (bitWidth == 0 || bitWidth > 64) {
        throw RangeError(fmt::format("sequence counter width {} out of range 1..64", bitWidth));
    }
}

uint64_t SimpleSeqCountProvider::getAndIncrement() {
    uint64_t max = m_bitWidth == 64 ? UINT64_MAX : (uint64_t{1} << m_bitWidth) - 1;
    uint64_t current = m_count;
    m_count = current >= max ? 0 : current + 1;
    return current;
}

} // namespace cfdp
