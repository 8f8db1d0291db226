#include "domain/expression/ExpressionParser.hpp"
#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>
#include <utility>
#include <vector>

namespace logicchat::domain::expression {

namespace {

enum class TokenType {
    Number,
    Plus,
    Minus,
    Star,
    DoubleStar,
    Slash,
    DoubleSlash,
    Percent,
    LParen,
    RParen,
    End
};

struct Token {
    TokenType type;
    double number = 0.0;
    std::size_t position = 0;
};

ExpressionError SyntaxError(const std::string& message, std::size_t position) {
    return ExpressionError{ExpressionErrorKind::ParseError, message, position};
}

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsNameChar(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool IsBlank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// The literal is already validated, so a stream failure here means it does
// not fit in a double.
ExpressionResult<double> ToDouble(const std::string& literal, std::size_t position) {
    std::istringstream in(literal);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    if (in.fail() || !std::isfinite(value)) {
        return ExpressionError{ExpressionErrorKind::NonFiniteResult, "Number literal is out of range", position};
    }
    return value;
}

// Scans one numeric literal starting at `pos`: digits, optional fraction,
// optional exponent. Advances `pos` past it.
ExpressionResult<double> ScanNumber(const std::string& text, std::size_t& pos) {
    const std::size_t start = pos;
    std::size_t intDigits = 0;
    std::size_t fracDigits = 0;
    bool hasDot = false;
    bool hasExponent = false;

    while (pos < text.size() && IsDigit(text[pos])) { ++pos; ++intDigits; }
    if (pos < text.size() && text[pos] == '.') {
        hasDot = true;
        ++pos;
        while (pos < text.size() && IsDigit(text[pos])) { ++pos; ++fracDigits; }
    }
    if (intDigits == 0 && fracDigits == 0) {
        return SyntaxError("Invalid number", start);
    }
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        std::size_t expPos = pos + 1;
        if (expPos < text.size() && (text[expPos] == '+' || text[expPos] == '-')) ++expPos;
        std::size_t expDigits = 0;
        while (expPos < text.size() && IsDigit(text[expPos])) { ++expPos; ++expDigits; }
        if (expDigits == 0) {
            return SyntaxError("Invalid exponent in number", pos);
        }
        hasExponent = true;
        pos = expPos;
    }
    if (pos < text.size() && (IsNameChar(text[pos]) || text[pos] == '.')) {
        return SyntaxError("Invalid number", start);
    }

    std::string literal = text.substr(start, pos - start);
    if (!hasDot && !hasExponent && literal.size() > 1 && literal[0] == '0' &&
        literal.find_first_not_of('0') != std::string::npos) {
        return SyntaxError("Leading zeros are not allowed in integers", start);
    }
    return ToDouble(literal, start);
}

ExpressionResult<std::vector<Token>> Tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::size_t pos = 0;

    while (pos < text.size()) {
        const char c = text[pos];
        if (IsBlank(c)) { ++pos; continue; }

        if (IsDigit(c) || (c == '.' && pos + 1 < text.size() && IsDigit(text[pos + 1]))) {
            const std::size_t start = pos;
            auto number = ScanNumber(text, pos);
            if (!number) return number.error();
            tokens.push_back(Token{TokenType::Number, number.value(), start});
            continue;
        }

        const bool doubled = pos + 1 < text.size() && text[pos + 1] == c;
        switch (c) {
            case '+': tokens.push_back(Token{TokenType::Plus, 0.0, pos}); ++pos; break;
            case '-': tokens.push_back(Token{TokenType::Minus, 0.0, pos}); ++pos; break;
            case '%': tokens.push_back(Token{TokenType::Percent, 0.0, pos}); ++pos; break;
            case '(': tokens.push_back(Token{TokenType::LParen, 0.0, pos}); ++pos; break;
            case ')': tokens.push_back(Token{TokenType::RParen, 0.0, pos}); ++pos; break;
            case '*':
                tokens.push_back(Token{doubled ? TokenType::DoubleStar : TokenType::Star, 0.0, pos});
                pos += doubled ? 2 : 1;
                break;
            case '/':
                tokens.push_back(Token{doubled ? TokenType::DoubleSlash : TokenType::Slash, 0.0, pos});
                pos += doubled ? 2 : 1;
                break;
            default:
                if (IsNameChar(c)) {
                    return SyntaxError("Names are not allowed in expressions", pos);
                }
                return SyntaxError(std::string("Unexpected character '") + c + "'", pos);
        }
    }

    tokens.push_back(Token{TokenType::End, 0.0, text.size()});
    return tokens;
}

class Parser {
public:
    Parser(const std::vector<Token>& tokens, int maxDepth)
        : m_tokens(tokens), m_maxDepth(maxDepth) {}

    ExpressionResult<NodePtr> parseAll() {
        auto root = parseExpression();
        if (!root) return root;
        if (peek().type != TokenType::End) {
            return SyntaxError("Unexpected token after expression", peek().position);
        }
        return root;
    }

private:
    const Token& peek() const { return m_tokens[m_index]; }
    const Token& advance() { return m_tokens[m_index++]; }

    ExpressionResult<NodePtr> parseExpression() {
        auto left = parseTerm();
        if (!left) return left;
        NodePtr node = std::move(left.value());

        while (peek().type == TokenType::Plus || peek().type == TokenType::Minus) {
            BinaryOperator op = advance().type == TokenType::Plus ? BinaryOperator::Add : BinaryOperator::Sub;
            auto right = parseTerm();
            if (!right) return right;
            node = MakeBinary(op, std::move(node), std::move(right.value()));
        }
        return std::move(node);
    }

    ExpressionResult<NodePtr> parseTerm() {
        auto left = parseFactor();
        if (!left) return left;
        NodePtr node = std::move(left.value());

        while (true) {
            BinaryOperator op;
            switch (peek().type) {
                case TokenType::Star: op = BinaryOperator::Mul; break;
                case TokenType::Slash: op = BinaryOperator::Div; break;
                case TokenType::DoubleSlash: op = BinaryOperator::FloorDiv; break;
                case TokenType::Percent: op = BinaryOperator::Mod; break;
                default: return std::move(node);
            }
            advance();
            auto right = parseFactor();
            if (!right) return right;
            node = MakeBinary(op, std::move(node), std::move(right.value()));
        }
    }

    // Every recursive path (signs, powers, parentheses) passes through here,
    // so this is the single place the depth bound is enforced.
    ExpressionResult<NodePtr> parseFactor() {
        if (++m_depth > m_maxDepth) {
            return SyntaxError("Expression is nested too deeply", peek().position);
        }
        auto result = parseSignedOrPower();
        --m_depth;
        return result;
    }

    ExpressionResult<NodePtr> parseSignedOrPower() {
        if (peek().type == TokenType::Plus || peek().type == TokenType::Minus) {
            UnaryOperator op = advance().type == TokenType::Plus ? UnaryOperator::Pos : UnaryOperator::Neg;
            auto operand = parseFactor();
            if (!operand) return operand;
            return MakeUnary(op, std::move(operand.value()));
        }
        return parsePower();
    }

    ExpressionResult<NodePtr> parsePower() {
        auto base = parsePrimary();
        if (!base) return base;
        if (peek().type != TokenType::DoubleStar) return base;

        advance();
        auto exponent = parseFactor();
        if (!exponent) return exponent;
        return MakeBinary(BinaryOperator::Pow, std::move(base.value()), std::move(exponent.value()));
    }

    ExpressionResult<NodePtr> parsePrimary() {
        const Token& token = peek();
        switch (token.type) {
            case TokenType::Number:
                advance();
                return MakeNumber(token.number);
            case TokenType::LParen: {
                advance();
                auto inner = parseExpression();
                if (!inner) return inner;
                if (peek().type != TokenType::RParen) {
                    return SyntaxError("Missing closing parenthesis", peek().position);
                }
                advance();
                return inner;
            }
            case TokenType::End:
                return SyntaxError("Unexpected end of expression", token.position);
            default:
                return SyntaxError("Expected a number or '('", token.position);
        }
    }

    const std::vector<Token>& m_tokens;
    std::size_t m_index = 0;
    int m_depth = 0;
    int m_maxDepth;
};

} // namespace

ExpressionParser::ExpressionParser(ParserLimits limits) : m_limits(limits) {}

ExpressionResult<NodePtr> ExpressionParser::parse(const std::string& text) const {
    if (text.size() > m_limits.maxLength) {
        return SyntaxError("Expression is too long", m_limits.maxLength);
    }

    auto tokens = Tokenize(text);
    if (!tokens) return tokens.error();
    if (tokens.value().size() == 1) {
        return SyntaxError("Empty expression", 0);
    }

    Parser parser(tokens.value(), m_limits.maxDepth);
    return parser.parseAll();
}

} // namespace logicchat::domain::expression
