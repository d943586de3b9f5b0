/**
 * @file uuid_error.cpp
 * @brief UuidError construction and messages
 */

#include <uuidkit/core/uuid_error.hpp>
#include <sstream>

namespace uuidkit {

namespace {

constexpr std::size_t kCanonicalLength = 36;

void appendInput(std::ostringstream& ss, std::string_view input, std::size_t position) {
    ss << " at position " << position << " in \"" << input << "\"";
}

} // anonymous namespace

UuidError UuidError::outOfRange(std::string field, int64_t lower, int64_t upper, int64_t actual) {
    UuidError err(ErrorCode::OutOfRange);
    err.m_field = std::move(field);
    err.m_lower = lower;
    err.m_upper = upper;
    err.m_actual = actual;

    std::ostringstream ss;
    ss << "Field '" << err.m_field << "' must be in [" << lower << ", " << upper
       << "], got " << actual;
    err.m_message = ss.str();
    return err;
}

UuidError UuidError::wrongWordCount(std::size_t actual) {
    UuidError err(ErrorCode::InvalidLength);
    err.m_expectedLength = 4;
    err.m_actualLength = actual;
    err.m_message = "Expected a 4-length list, got " + std::to_string(actual) + "-length";
    return err;
}

UuidError UuidError::wrongTextLength(std::string_view input, std::size_t actual) {
    UuidError err(ErrorCode::InvalidLength);
    err.m_expectedLength = kCanonicalLength;
    err.m_actualLength = actual;
    err.m_input = std::string(input);
    err.m_message = "Expected a 36-length string, got " + std::to_string(actual) + "-length";
    return err;
}

UuidError UuidError::unexpectedChar(std::string_view input, std::size_t position, char expected) {
    UuidError err(ErrorCode::InvalidFormat);
    err.m_input = std::string(input);
    err.m_position = position;
    err.m_expectedChar = expected;
    err.m_actualChar = input[position];

    std::ostringstream ss;
    ss << "Expected '" << expected << "' got '" << input[position] << "'";
    appendInput(ss, input, position);
    err.m_message = ss.str();
    return err;
}

UuidError UuidError::invalidHexDigit(std::string_view input, std::size_t position) {
    UuidError err(ErrorCode::InvalidFormat);
    err.m_input = std::string(input);
    err.m_position = position;
    err.m_actualChar = input[position];

    std::ostringstream ss;
    ss << "Expected a hex digit got '" << input[position] << "'";
    appendInput(ss, input, position);
    err.m_message = ss.str();
    return err;
}

} // namespace uuidkit
