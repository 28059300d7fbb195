#include "linecalc/parser.hpp"
#include <cstdlib>
#include <string>
#include <utility>

namespace linecalc {

// Binding strength used while parsing. '+'/'-' and '*'/'/' share a level so
// that mixed chains such as 10-2+3 associate left to right.
static int binding(const Token& t) {
    switch (t.kind) {
        case TokKind::Minus: return precedence(TokKind::Plus);
        case TokKind::Star:  return precedence(TokKind::Slash);
        default:             return t.precedence;
    }
}

static BinaryOperator binary_op(const Token& t) {
    switch (t.kind) {
        case TokKind::Plus:  return BinaryOperator::Add;
        case TokKind::Minus: return BinaryOperator::Sub;
        case TokKind::Star:  return BinaryOperator::Mul;
        case TokKind::Slash: return BinaryOperator::Div;
        case TokKind::Caret: return BinaryOperator::Pow;
        case TokKind::Sci:   return BinaryOperator::Sci;
        default: break;
    }
    throw SyntaxError("Expected an operator, got '" + t.text + "'");
}

namespace {

// Counts the tree levels a parse has open and rejects input nested past
// kMaxExprDepth. Levels entered through one guard are released when it dies.
class DepthGuard {
public:
    explicit DepthGuard(int& depth) : depth_(depth) {}
    ~DepthGuard() { depth_ -= entered_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

    void enter() {
        ++depth_;
        ++entered_;
        if (depth_ > kMaxExprDepth) throw SyntaxError("Expression too deeply nested");
    }

private:
    int& depth_;
    int entered_{0};
};

class Parser {
public:
    explicit Parser(const std::vector<Token>& tokens) : t_(tokens) {}

    // Start of an expression: an operand followed by any operators.
    ParseResult expression(std::size_t i) {
        DepthGuard guard(depth_);
        guard.enter();
        if (at_end(i)) throw SyntaxError("Expected an expression");
        const Token& tok = t_[i];
        if (!starts_operand(tok)) throw SyntaxError("Expression cannot start with " + tok.text);
        ParseResult left = operand(i);
        return continue_parsing(std::move(left.expr), left.next, 0);
    }

private:
    bool at_end(std::size_t i) const { return i >= t_.size(); }

    static bool starts_operand(const Token& t) {
        switch (t.kind) {
            case TokKind::Number:
            case TokKind::Ident:
            case TokKind::Call:
            case TokKind::LParen:
            case TokKind::Plus:
            case TokKind::Minus:
                return true;
            default:
                return false;
        }
    }

    // Does the token at i bind tighter than `level`?
    bool binds_tighter(std::size_t i, int level) const {
        if (at_end(i)) return false;
        const Token& t = t_[i];
        if (t.kind == TokKind::Bang) return true;
        return t.is_binary_operator() && binding(t) > level;
    }

    // Fold operators binding at least as tight as `min` into `left`. Stops at
    // the end of input, a closing bracket or a weaker operator.
    ParseResult continue_parsing(ExprPtr left, std::size_t i, int min) {
        DepthGuard guard(depth_);
        for (;;) {
            if (at_end(i)) {
                // Top level always ends on an operator node.
                if (min == 0) left = make_binary(BinaryOperator::Add, std::move(left), make_constant(0));
                return {std::move(left), i};
            }

            const Token& tok = t_[i];
            if (tok.kind == TokKind::RParen) return {std::move(left), i};

            if (tok.kind == TokKind::Bang) {
                guard.enter();
                left = make_unary(UnaryOperator::Factorial, std::move(left));
                ++i;
                continue;
            }

            if (!tok.is_binary_operator()) throw SyntaxError("Expected an operator before " + tok.text);

            const int level = binding(tok);
            if (level < min) return {std::move(left), i};
            guard.enter();

            // Bind the single next operand, unless what follows it binds
            // tighter than this operator.
            ParseResult rhs = operand(i + 1);
            if (binds_tighter(rhs.next, level)) rhs = continue_parsing(std::move(rhs.expr), rhs.next, level + 1);

            left = make_binary(binary_op(tok), std::move(left), std::move(rhs.expr));
            i = rhs.next;
        }
    }

    ParseResult operand(std::size_t i) {
        if (at_end(i)) throw SyntaxError("Binary operator requires two operands");

        const Token& tok = t_[i];
        switch (tok.kind) {
            case TokKind::Number:
                return {make_constant(std::strtod(tok.text.c_str(), nullptr)), i + 1};
            case TokKind::Ident:
                return {make_variable(tok.text), i + 1};
            case TokKind::LParen:
                return brackets(i);
            case TokKind::Call:
                return function_call(i);
            case TokKind::Plus:
            case TokKind::Minus: {
                // The sign takes the single next operand; any suffix applies
                // to the whole 0 op operand node.
                DepthGuard guard(depth_);
                guard.enter();
                ParseResult rhs = operand(i + 1);
                return {make_binary(binary_op(tok), make_constant(0), std::move(rhs.expr)), rhs.next};
            }
            default:
                break;
        }
        throw SyntaxError("Unexpected operand " + tok.text);
    }

    ParseResult brackets(std::size_t i) {
        ParseResult inner = expression(i + 1);
        if (at_end(inner.next) || t_[inner.next].kind != TokKind::RParen) {
            throw SyntaxError("Unmatched brackets");
        }
        return {std::move(inner.expr), inner.next + 1};
    }

    // name ( argument )
    ParseResult function_call(std::size_t i) {
        if (i + 3 >= t_.size() || t_[i + 1].kind != TokKind::LParen) {
            throw SyntaxError("Invalid function call to " + t_[i].text);
        }
        ParseResult arg = brackets(i + 1);
        return {make_call(t_[i].text, std::move(arg.expr)), arg.next};
    }

    const std::vector<Token>& t_;
    int depth_{0};
};

} // namespace

ParseResult parse(const std::vector<Token>& tokens, std::size_t start) {
    return Parser(tokens).expression(start);
}

ExprPtr parse_all(const std::vector<Token>& tokens) {
    if (tokens.empty()) throw SyntaxError("Empty expression");
    ParseResult r = parse(tokens);
    if (r.next != tokens.size()) throw SyntaxError("Unmatched brackets");
    return std::move(r.expr);
}

} // namespace linecalc
