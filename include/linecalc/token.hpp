#pragma once
#include <string>
#include <utility>

namespace linecalc {

enum class TokKind {
    Number, // unsigned
    Ident,

    LParen, RParen,

    Plus, Minus, Star, Slash,
    Caret, // power
    Bang,  // postfix factorial
    Sci,   // E exponent notation
    Call,  // identifier naming a known function
};

enum class Arity { Unary, Binary };

// Higher binds tighter. Non-operators are 0.
constexpr int precedence(TokKind k) {
    switch (k) {
        case TokKind::Call:  return 110;
        case TokKind::Bang:  return 100;
        case TokKind::Caret:
        case TokKind::Sci:   return 90;
        case TokKind::Slash: return 80;
        case TokKind::Star:  return 70;
        case TokKind::Plus:  return 60;
        case TokKind::Minus: return 50;
        default:             return 0;
    }
}

constexpr bool is_operator(TokKind k) { return precedence(k) > 0; }

constexpr Arity arity(TokKind k) {
    return (k == TokKind::Call || k == TokKind::Bang) ? Arity::Unary : Arity::Binary;
}

struct Token {
    TokKind kind{TokKind::Number};
    std::string text{};
    int precedence{0};
    Arity arity{Arity::Unary};

    bool is_operator() const { return linecalc::is_operator(kind); }
    bool is_binary_operator() const { return is_operator() && arity == Arity::Binary; }
    bool is_sign() const { return kind == TokKind::Plus || kind == TokKind::Minus; }
};

inline Token make_token(TokKind kind, std::string text) {
    Token t{kind, std::move(text)};
    if (linecalc::is_operator(kind)) {
        t.precedence = precedence(kind);
        t.arity = arity(kind);
    }
    return t;
}

} // namespace linecalc
