/**
 * @file result.hpp
 * @brief Error handling with Result<T, E> type
 *
 * Fallible operations return a Result holding either the value or the
 * error that prevented it. Nothing in the library throws for bad input;
 * callers that want exceptions unwrap with value().
 */

#pragma once

#include <variant>
#include <string>
#include <utility>
#include <stdexcept>

#include "types.hpp"

namespace uuidkit {

// ============================================================================
// Error Type
// ============================================================================

/// Error holding an error code and optional message
class Error {
public:
    Error() : m_code(ErrorCode::Unknown) {}

    explicit Error(ErrorCode code) : m_code(code) {}

    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }

    const char* what() const {
        if (!m_message.empty()) {
            return m_message.c_str();
        }
        return errorCodeToString(m_code);
    }

private:
    ErrorCode m_code;
    std::string m_message;
};

// ============================================================================
// Result<T, E> Template
// ============================================================================

/**
 * @brief Result type for functions that can fail
 *
 * Holds either a success value (T) or an error (E). E must provide
 * what() returning a C string.
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Construct success result from value
    Result(T value) : m_data(std::move(value)) {}

    /// Construct error result from error
    Result(E error) : m_data(std::move(error)) {}

    [[nodiscard]] bool ok() const {
        return std::holds_alternative<T>(m_data);
    }

    [[nodiscard]] bool isError() const {
        return std::holds_alternative<E>(m_data);
    }

    explicit operator bool() const { return ok(); }

    // ========== Value Access ==========

    /// Get value (throws std::runtime_error carrying the error message)
    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(m_data);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(std::move(m_data));
    }

    // ========== Error Access ==========

    /// Get error (throws if success)
    const E& error() const& {
        if (ok()) {
            throw std::logic_error("Result::error() called on success value");
        }
        return std::get<E>(m_data);
    }

private:
    std::variant<T, E> m_data;
};

// ============================================================================
// Helper Factory Functions
// ============================================================================

/// Create error result from code and message
template<typename T>
inline Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error(code, std::move(message)));
}

} // namespace uuidkit
