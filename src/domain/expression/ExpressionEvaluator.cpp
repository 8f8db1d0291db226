#include "domain/expression/ExpressionEvaluator.hpp"
#include <cmath>
#include <type_traits>

namespace logicchat::domain::expression {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

ExpressionError Failure(ExpressionErrorKind kind, const std::string& message) {
    return ExpressionError{kind, message, 0};
}

ExpressionResult<double> ApplyUnary(UnaryOperator op, double operand) {
    switch (op) {
        case UnaryOperator::Pos: return +operand;
        case UnaryOperator::Neg: return -operand;
    }
    return Failure(ExpressionErrorKind::UnsupportedExpression, "Unsupported unary operator");
}

ExpressionResult<double> ApplyBinary(BinaryOperator op, double left, double right) {
    switch (op) {
        case BinaryOperator::Add: return left + right;
        case BinaryOperator::Sub: return left - right;
        case BinaryOperator::Mul: return left * right;
        case BinaryOperator::Div:
            if (right == 0.0) return Failure(ExpressionErrorKind::DivisionByZero, "division by zero");
            return left / right;
        case BinaryOperator::FloorDiv:
            if (right == 0.0) return Failure(ExpressionErrorKind::DivisionByZero, "integer division or modulo by zero");
            return FloorDivide(left, right);
        case BinaryOperator::Mod:
            if (right == 0.0) return Failure(ExpressionErrorKind::DivisionByZero, "modulo by zero");
            return FloorModulo(left, right);
        case BinaryOperator::Pow: {
            if (left == 0.0 && right < 0.0) {
                return Failure(ExpressionErrorKind::DivisionByZero, "zero cannot be raised to a negative power");
            }
            double value = std::pow(left, right);
            if (std::isnan(value)) {
                return Failure(ExpressionErrorKind::NonFiniteResult, "result is not a real number");
            }
            return value;
        }
    }
    return Failure(ExpressionErrorKind::UnsupportedExpression, "Unsupported binary operator");
}

ExpressionResult<double> Walk(const Node* node) {
    if (node == nullptr) {
        return Failure(ExpressionErrorKind::UnsupportedExpression, "Missing operand");
    }
    if (node->value.valueless_by_exception()) {
        return Failure(ExpressionErrorKind::UnsupportedExpression, "Invalid expression");
    }

    return std::visit([](const auto& n) -> ExpressionResult<double> {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, NumberLiteral>) {
            return n.value;
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            auto operand = Walk(n.operand.get());
            if (!operand) return operand;
            return ApplyUnary(n.op, operand.value());
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            auto left = Walk(n.left.get());
            if (!left) return left;
            auto right = Walk(n.right.get());
            if (!right) return right;
            return ApplyBinary(n.op, left.value(), right.value());
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled expression node kind");
        }
    }, node->value);
}

} // namespace

double FloorDivide(double a, double b) {
    double mod = std::fmod(a, b);
    double div = (a - mod) / b;
    if (mod != 0.0 && ((b < 0.0) != (mod < 0.0))) {
        div -= 1.0;
    }
    if (div == 0.0) {
        return std::copysign(0.0, a / b);
    }
    double floored = std::floor(div);
    if (div - floored > 0.5) {
        floored += 1.0;
    }
    return floored;
}

double FloorModulo(double a, double b) {
    double mod = std::fmod(a, b);
    if (mod != 0.0) {
        if ((b < 0.0) != (mod < 0.0)) {
            mod += b;
        }
    } else {
        mod = std::copysign(0.0, b);
    }
    return mod;
}

ExpressionEvaluator::ExpressionEvaluator(ParserLimits limits) : m_parser(limits) {}

ExpressionResult<NodePtr> ExpressionEvaluator::parse(const std::string& text) const {
    return m_parser.parse(text);
}

ExpressionResult<double> ExpressionEvaluator::evaluate(const std::string& text) const {
    auto tree = m_parser.parse(text);
    if (!tree) return tree.error();
    return evaluate(*tree.value());
}

ExpressionResult<double> ExpressionEvaluator::evaluate(const Node& root) {
    auto result = Walk(&root);
    if (result && !std::isfinite(result.value())) {
        return Failure(ExpressionErrorKind::NonFiniteResult, "result is out of range");
    }
    return result;
}

} // namespace logicchat::domain::expression
