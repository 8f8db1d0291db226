/**
 * @file ExpressionEvaluator.hpp
 * @brief Safe evaluator for restricted arithmetic expressions.
 */

#pragma once

#include <string>
#include "domain/expression/ExpressionAst.hpp"
#include "domain/expression/ExpressionParser.hpp"
#include "domain/expression/ExpressionResult.hpp"

namespace logicchat::domain::expression {

/**
 * @class ExpressionEvaluator
 * @brief Parses and evaluates arithmetic over the closed node set.
 *
 * The evaluator can only add, subtract, multiply, divide, take floor
 * quotients and remainders, raise to powers and apply signs. There is no path
 * from the input text to anything else. Failures come back as values:
 * ParseError, DivisionByZero, UnsupportedExpression or NonFiniteResult.
 */
class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(ParserLimits limits = {});

    /** @brief Parses with the configured limits. */
    ExpressionResult<NodePtr> parse(const std::string& text) const;

    /** @brief Parses then evaluates. */
    ExpressionResult<double> evaluate(const std::string& text) const;

    /**
     * @brief Walks an already-built tree.
     * @param root The AST root.
     * @return The numeric value; the bare double, without any display rounding.
     */
    static ExpressionResult<double> evaluate(const Node& root);

private:
    ExpressionParser m_parser;
};

/** @brief Floor division with the sign of the mathematical floor (-7 // 2 == -4). */
double FloorDivide(double a, double b);

/** @brief Remainder whose sign follows the divisor, so a == FloorDivide(a, b) * b + FloorModulo(a, b). */
double FloorModulo(double a, double b);

} // namespace logicchat::domain::expression
