#pragma once

#include <string_view>
#include <utility>

#include <linecalc/symbols.hpp>

namespace linecalc {

/// Runs calculator input lines against a persistent symbol table.
///
/// A line is either a query ("2+3*4"), whose result becomes `ans` with the
/// previous `ans` moved to `preans`, or an assignment: "name = expr" stores a
/// number, "name(x) = expr" stores a function of x. Assignments return 0.
///
/// Errors are thrown as TokeniseError, SyntaxError, SymbolLookupError,
/// SymbolMutationError, ArithmeticError or RecursionLimitError. A failing
/// line leaves the symbol table untouched.
class Engine {
public:
    Engine() = default;
    explicit Engine(SymbolTable symbols) : symbols_(std::move(symbols)) {}

    double run(std::string_view text);

    const SymbolTable& symbols() const { return symbols_; }

private:
    double assign(std::string_view left, std::string_view right);
    ExprPtr compile(std::string_view text) const;

    SymbolTable symbols_;
};

} // namespace linecalc
