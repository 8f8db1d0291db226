/**
 * @file ExpressionAst.hpp
 * @brief Closed tagged-union AST for restricted arithmetic expressions.
 */

#pragma once

#include <memory>
#include <variant>

namespace logicchat::domain::expression {

struct Node;
using NodePtr = std::unique_ptr<Node>;

enum class UnaryOperator { Pos, Neg };

enum class BinaryOperator { Add, Sub, Mul, Div, FloorDiv, Mod, Pow };

struct NumberLiteral {
    double value = 0.0;
};

struct UnaryOp {
    UnaryOperator op = UnaryOperator::Pos;
    NodePtr operand;
};

struct BinaryOp {
    BinaryOperator op = BinaryOperator::Add;
    NodePtr left;
    NodePtr right;
};

/**
 * @struct Node
 * @brief One AST node. The variant is the complete set of constructs the
 * evaluator knows about; nothing else can be represented.
 */
struct Node {
    std::variant<NumberLiteral, UnaryOp, BinaryOp> value;
};

inline NodePtr MakeNumber(double value) {
    return std::make_unique<Node>(Node{NumberLiteral{value}});
}

inline NodePtr MakeUnary(UnaryOperator op, NodePtr operand) {
    return std::make_unique<Node>(Node{UnaryOp{op, std::move(operand)}});
}

inline NodePtr MakeBinary(BinaryOperator op, NodePtr left, NodePtr right) {
    return std::make_unique<Node>(Node{BinaryOp{op, std::move(left), std::move(right)}});
}

} // namespace logicchat::domain::expression
