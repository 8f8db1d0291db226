/**
 * @file ExpressionParser.hpp
 * @brief Recursive-descent parser for the restricted arithmetic grammar.
 */

#pragma once

#include <cstddef>
#include <string>
#include "domain/expression/ExpressionAst.hpp"
#include "domain/expression/ExpressionResult.hpp"

namespace logicchat::domain::expression {

/**
 * @brief Bounds that keep adversarial input from exhausting the stack.
 */
struct ParserLimits {
    std::size_t maxLength = 512;  ///< Maximum source length in bytes.
    int maxDepth = 64;            ///< Maximum recursion depth of nested factors.
};

/**
 * @class ExpressionParser
 * @brief Turns text into an AST made only of NumberLiteral, UnaryOp and BinaryOp.
 *
 * Grammar:
 *   expression := term (('+' | '-') term)*
 *   term       := factor (('*' | '/' | '//' | '%') factor)*
 *   factor     := ('+' | '-') factor | power
 *   power      := primary ('**' factor)?
 *   primary    := NUMBER | '(' expression ')'
 *
 * Names, calls, subscripts, comparisons, strings and every other construct
 * are rejected with ExpressionErrorKind::ParseError.
 * This class is stateless and safe to share between threads.
 */
class ExpressionParser {
public:
    explicit ExpressionParser(ParserLimits limits = {});

    /**
     * @brief Parses an expression.
     * @param text Source text.
     * @return The AST root, or a ParseError describing the first problem found.
     */
    ExpressionResult<NodePtr> parse(const std::string& text) const;

    const ParserLimits& limits() const { return m_limits; }

private:
    ParserLimits m_limits;
};

} // namespace logicchat::domain::expression
