/**
 * @file uuid_error.hpp
 * @brief Structured error for UUID construction and parsing
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace uuidkit {

/**
 * @brief Why a UUID could not be built
 *
 * - OutOfRange: field(), lowerBound(), upperBound(), actualValue()
 * - InvalidLength: expectedLength(), actualLength(), input() for text
 * - InvalidFormat: input(), position(), actualChar(), expectedChar() when
 *   a specific character was required
 */
class UuidError {
public:
    static UuidError outOfRange(std::string field, int64_t lower, int64_t upper, int64_t actual);
    static UuidError wrongWordCount(std::size_t actual);
    static UuidError wrongTextLength(std::string_view input, std::size_t actual);
    static UuidError unexpectedChar(std::string_view input, std::size_t position, char expected);
    static UuidError invalidHexDigit(std::string_view input, std::size_t position);

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }
    const char* what() const { return m_message.c_str(); }

    const std::string& field() const { return m_field; }
    int64_t lowerBound() const { return m_lower; }
    int64_t upperBound() const { return m_upper; }
    int64_t actualValue() const { return m_actual; }

    std::size_t expectedLength() const { return m_expectedLength; }
    std::size_t actualLength() const { return m_actualLength; }

    const std::string& input() const { return m_input; }
    std::optional<std::size_t> position() const { return m_position; }
    std::optional<char> expectedChar() const { return m_expectedChar; }
    std::optional<char> actualChar() const { return m_actualChar; }

private:
    explicit UuidError(ErrorCode code) : m_code(code) {}

    ErrorCode m_code;
    std::string m_message;

    std::string m_field;
    int64_t m_lower = 0;
    int64_t m_upper = 0;
    int64_t m_actual = 0;

    std::size_t m_expectedLength = 0;
    std::size_t m_actualLength = 0;

    std::string m_input;
    std::optional<std::size_t> m_position;
    std::optional<char> m_expectedChar;
    std::optional<char> m_actualChar;
};

} // namespace uuidkit
