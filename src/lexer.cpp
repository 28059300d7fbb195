#include "linecalc/lexer.hpp"
#include <cctype>

namespace linecalc {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_lower(char c) {
    return c >= 'a' && c <= 'z';
}

// [0-9]+(\.[0-9]+)?
static std::size_t match_number(std::string_view s) {
    std::size_t n = 0;
    while (n < s.size() && is_digit(s[n])) ++n;
    if (n == 0) return 0;
    if (n + 1 < s.size() && s[n] == '.' && is_digit(s[n + 1])) {
        n += 1;
        while (n < s.size() && is_digit(s[n])) ++n;
    }
    return n;
}

// [a-z]+
static std::size_t match_ident(std::string_view s) {
    std::size_t n = 0;
    while (n < s.size() && is_lower(s[n])) ++n;
    return n;
}

template <char C>
static std::size_t match_char(std::string_view s) {
    return (!s.empty() && s.front() == C) ? 1 : 0;
}

struct Rule {
    std::size_t (*match)(std::string_view);
    TokKind kind;
};

// Order matters: the first rule that matches wins.
static const Rule kRules[] = {
    {match_number,    TokKind::Number},
    {match_ident,     TokKind::Ident},
    {match_char<'('>, TokKind::LParen},
    {match_char<')'>, TokKind::RParen},
    {match_char<'+'>, TokKind::Plus},
    {match_char<'-'>, TokKind::Minus},
    {match_char<'*'>, TokKind::Star},
    {match_char<'/'>, TokKind::Slash},
    {match_char<'!'>, TokKind::Bang},
    {match_char<'^'>, TokKind::Caret},
    {match_char<'E'>, TokKind::Sci},
};

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

std::optional<Token> Lexer::next() {
    skip_ws();
    if (is_end()) return std::nullopt;

    std::string_view rest = s_.substr(i_);
    for (const auto& rule : kRules) {
        std::size_t n = rule.match(rest);
        if (n == 0) continue;

        i_ += n;
        std::string text(rest.substr(0, n));
        TokKind kind = rule.kind;
        if (kind == TokKind::Ident && functions_.count(text) != 0) kind = TokKind::Call;
        return make_token(kind, std::move(text));
    }

    throw TokeniseError("Unknown token at '" + std::string(rest) + "'");
}

std::vector<Token> tokenise(std::string_view input, const FunctionNames& functions) {
    Lexer lex(input, functions);
    std::vector<Token> out;
    while (auto t = lex.next()) out.push_back(std::move(*t));
    return out;
}

} // namespace linecalc
