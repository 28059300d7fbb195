#include <linecalc/engine.hpp>
#include <linecalc/lexer.hpp>
#include <linecalc/parser.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace linecalc {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// [a-z]+
static bool is_name(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= 'a' && c <= 'z'; });
}

// [a-z]+\(x\)
static bool is_function_head(std::string_view s) {
    static const std::string_view suffix = "(x)";
    if (s.size() <= suffix.size() || s.substr(s.size() - suffix.size()) != suffix) return false;
    return is_name(s.substr(0, s.size() - suffix.size()));
}

ExprPtr Engine::compile(std::string_view text) const {
    return parse_all(tokenise(text, symbols_.callable_names()));
}

double Engine::run(std::string_view text) {
    text = trim(text);

    auto eq = text.find('=');
    if (eq != std::string_view::npos) {
        return assign(trim(text.substr(0, eq)), trim(text.substr(eq + 1)));
    }

    ExprPtr e = compile(text);
    double result = evaluate(*e, symbols_);

    double previous = symbols_.get_variable("ans").value();
    symbols_.set_symbol("preans", previous);
    symbols_.set_symbol("ans", result);
    return result;
}

double Engine::assign(std::string_view left, std::string_view right) {
    if (is_function_head(left)) {
        std::string name(left.substr(0, left.find('(')));
        Body body = compile(right);
        symbols_.set_symbol(name, std::move(body));
    } else if (is_name(left)) {
        double value = evaluate(*compile(right), symbols_);
        symbols_.set_symbol(std::string(left), value);
    } else {
        throw SyntaxError("Unknown assignment");
    }
    return 0.0;
}

} // namespace linecalc
