/**
 * @file ExpressionResult.hpp
 * @brief Success-or-error values returned by the expression parser and evaluator.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

namespace logicchat::domain::expression {

/**
 * @enum ExpressionErrorKind
 * @brief Distinguishes syntax rejections from evaluation failures.
 */
enum class ExpressionErrorKind {
    ParseError,             ///< Malformed syntax or a disallowed construct.
    DivisionByZero,         ///< `/`, `//`, `%` by zero, or zero to a negative power.
    UnsupportedExpression,  ///< A node outside the closed set met during the walk.
    NonFiniteResult         ///< Overflow, or a result that is not a real number.
};

inline std::string ErrorKindToString(ExpressionErrorKind kind) {
    switch (kind) {
        case ExpressionErrorKind::ParseError: return "ParseError";
        case ExpressionErrorKind::DivisionByZero: return "DivisionByZero";
        case ExpressionErrorKind::UnsupportedExpression: return "UnsupportedExpression";
        case ExpressionErrorKind::NonFiniteResult: return "NonFiniteResult";
    }
    return "Unknown";
}

struct ExpressionError {
    ExpressionErrorKind kind;
    std::string message;
    std::size_t position = 0; ///< Offset into the source text (parse errors only).
};

/**
 * @class ExpressionResult
 * @brief Holds either a value or an ExpressionError. Callers must check ok()
 * before reading value().
 */
template <typename T>
class ExpressionResult {
public:
    ExpressionResult(T value) : m_data(std::move(value)) {}
    ExpressionResult(ExpressionError error) : m_data(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    const ExpressionError& error() const { return std::get<ExpressionError>(m_data); }

private:
    std::variant<T, ExpressionError> m_data;
};

} // namespace logicchat::domain::expression
