#pragma once
#include <cstddef>
#include <stdexcept>
#include <vector>
#include "linecalc/expr.hpp"
#include "linecalc/token.hpp"

namespace linecalc {

struct SyntaxError : std::runtime_error { using std::runtime_error::runtime_error; };

// Deepest expression tree a single parse may build. Deeper input (long
// operator chains, bracket nests) is a SyntaxError.
inline constexpr int kMaxExprDepth = 256;

struct ParseResult {
    ExprPtr expr;
    std::size_t next{0}; // first token not consumed
};

// Parse one expression starting at tokens[start]. Stops at the end of input
// or at a closing bracket it does not own.
ParseResult parse(const std::vector<Token>& tokens, std::size_t start = 0);

// Parse a whole line; leftover tokens or empty input are a SyntaxError.
ExprPtr parse_all(const std::vector<Token>& tokens);

} // namespace linecalc
