#pragma once

#include <cstdint>
#include <cstddef>

namespace cfdp {

/**
 * Sequence count provider interface
 *
 * Supplies transaction sequence numbers. The first call to
 * getAndIncrement() yields 0; the count wraps to 0 after 2^width - 1.
 * Callers wrap the result into an UnsignedByteField of the header width.
 */
class SeqCountProvider {
public:
    virtual ~SeqCountProvider() = default;

    virtual size_t maxBitWidth() const = 0;
    virtual uint64_t getAndIncrement() = 0;
};

/**
 * In-memory sequence counter
 */
class SimpleSeqCountProvider : public SeqCountProvider {
public:
    // Throws RangeError unless 1 <= bitWidth <= 64
    explicit SimpleSeqCountProvider(size_t bitWidth);

    size_t maxBitWidth() const override { return m_bitWidth; }
    uint64_t getAndIncrement() override;
    uint64_t current() const { return m_count; }

private:
    size_t m_bitWidth;
    uint64_t m_count = 0;
};

} // namespace cfdp
