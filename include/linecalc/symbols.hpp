#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "linecalc/expr.hpp"
#include "linecalc/lexer.hpp"

namespace linecalc {

struct SymbolLookupError   : std::runtime_error { using std::runtime_error::runtime_error; };
struct SymbolMutationError : std::runtime_error { using std::runtime_error::runtime_error; };

/// A named, optionally write-protected binding.
template <class T>
class Symbol {
public:
    Symbol(std::string name, T value, bool is_final)
        : name_(std::move(name)), value_(std::move(value)), final_(is_final) {}

    const std::string& name() const { return name_; }
    const T& value() const { return value_; }
    bool is_final() const { return final_; }

    void set_to(T v) {
        if (final_) throw SymbolMutationError("Cannot modify " + name_);
        value_ = std::move(v);
    }

private:
    std::string name_;
    T value_;
    bool final_;
};

using Body     = std::shared_ptr<const Expr>;
using Variable = Symbol<double>;
using Callable = Symbol<Body>;

class SymbolTable {
public:
    /// Seeds ans, preans, pi, e and the built-in functions.
    SymbolTable();

    static SymbolTable empty();

    const Variable& get_variable(std::string_view name) const;
    const Callable& get_callable(std::string_view name) const;

    // Update in place (subject to the entry's guard) or append a non-final entry.
    void set_symbol(const std::string& name, double value);
    void set_symbol(const std::string& name, Body body);

    void define_constant(const std::string& name, double value);
    void define_builtin(const std::string& name, double (*fn)(double));

    FunctionNames callable_names() const;

    // Insertion order, for display.
    const std::vector<Variable>& variables() const { return variables_; }
    const std::vector<Callable>& callables() const { return callables_; }

private:
    struct NoDefaults {};
    explicit SymbolTable(NoDefaults) {}

    std::vector<Variable> variables_;
    std::vector<Callable> callables_;
};

} // namespace linecalc
