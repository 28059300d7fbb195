#pragma once
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "linecalc/token.hpp"

namespace linecalc {

struct TokeniseError : std::runtime_error { using std::runtime_error::runtime_error; };

using FunctionNames = std::set<std::string, std::less<>>;

class Lexer {
public:
    Lexer(std::string_view s, const FunctionNames& functions) : s_(s), functions_(functions) {}

    // Empty once the input is exhausted.
    std::optional<Token> next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    const FunctionNames& functions_;
    std::size_t i_{0};
};

/// Split a line into tokens. Identifiers found in `functions` come back as
/// TokKind::Call. Throws TokeniseError on text no rule recognises.
std::vector<Token> tokenise(std::string_view input, const FunctionNames& functions);

} // namespace linecalc
