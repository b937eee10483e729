#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace cfdp {

// =============================================================================
// Codec error taxonomy
// =============================================================================

/** Value does not fit its declared width, or the width itself is illegal. */
class RangeError : public std::out_of_range {
public:
    explicit RangeError(const std::string& what) : std::out_of_range(what) {}
};

/** Buffer too short for a field, or a payload above its length ceiling. */
class LengthError : public std::length_error {
public:
    explicit LengthError(const std::string& what) : std::length_error(what) {}
};

/** Generic semantic violation of the wire format. */
class ValueError : public std::invalid_argument {
public:
    explicit ValueError(const std::string& what) : std::invalid_argument(what) {}
};

/** Directive code, TLV type or action/status pair outside the enumerated set. */
class UnrecognizedCodeError : public std::invalid_argument {
public:
    explicit UnrecognizedCodeError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * A typed view was requested from a container holding something else.
 *
 * Used for typed TLV wrappers and for PduHolder downcasts.
 */
class TypeMismatchError : public std::invalid_argument {
public:
    TypeMismatchError(const std::string& expected, const std::string& found)
        : std::invalid_argument("expected " + expected + ", found " + found)
        , m_expected(expected)
        , m_found(found)
    {}

    const std::string& expected() const { return m_expected; }
    const std::string& found() const { return m_found; }

private:
    std::string m_expected;
    std::string m_found;
};

/** CRC-16 trailer verification failed. */
class ChecksumError : public std::runtime_error {
public:
    explicit ChecksumError(uint16_t residue);

    uint16_t residue() const { return m_residue; }

private:
    uint16_t m_residue;
};

} // namespace cfdp
