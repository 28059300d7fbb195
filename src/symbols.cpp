#include "linecalc/symbols.hpp"

#include <algorithm>
#include <cmath>

namespace linecalc {

static const double kPi = std::acos(-1.0);

static double to_radians(double deg) { return deg * kPi / 180.0; }
static double to_degrees(double rad) { return rad * 180.0 / kPi; }

static double fn_sin(double v)   { return std::sin(v); }
static double fn_asin(double v)  { return std::asin(v); }
static double fn_asinh(double v) { return std::asinh(v); }
static double fn_cos(double v)   { return std::cos(v); }
static double fn_acos(double v)  { return std::acos(v); }
static double fn_acosh(double v) { return std::acosh(v); }
static double fn_tan(double v)   { return std::tan(v); }
static double fn_atan(double v)  { return std::atan(v); }
static double fn_atanh(double v) { return std::atanh(v); }

template <class T>
static auto find_named(std::vector<Symbol<T>>& v, std::string_view name) {
    return std::find_if(v.begin(), v.end(), [&](const Symbol<T>& s) { return s.name() == name; });
}

template <class T>
static auto find_named(const std::vector<Symbol<T>>& v, std::string_view name) {
    return std::find_if(v.begin(), v.end(), [&](const Symbol<T>& s) { return s.name() == name; });
}

// Insert `sym`, replacing a non-final entry of the same name.
template <class T>
static void define(std::vector<Symbol<T>>& v, Symbol<T> sym) {
    auto it = find_named(v, sym.name());
    if (it == v.end()) {
        v.push_back(std::move(sym));
        return;
    }
    if (it->is_final()) throw SymbolMutationError("Cannot modify " + it->name());
    *it = std::move(sym);
}

SymbolTable::SymbolTable() {
    variables_.emplace_back("ans", 0.0, false);
    variables_.emplace_back("preans", 0.0, false);
    define_constant("pi", kPi);
    define_constant("e", std::exp(1.0));

    define_builtin("sin", fn_sin);
    define_builtin("asin", fn_asin);
    define_builtin("asinh", fn_asinh);
    define_builtin("cos", fn_cos);
    define_builtin("acos", fn_acos);
    define_builtin("acosh", fn_acosh);
    define_builtin("tan", fn_tan);
    define_builtin("atan", fn_atan);
    define_builtin("atanh", fn_atanh);
    define_builtin("rad", to_radians);
    define_builtin("deg", to_degrees);
}

SymbolTable SymbolTable::empty() {
    SymbolTable t{NoDefaults{}};
    t.variables_.emplace_back("ans", 0.0, false);
    t.variables_.emplace_back("preans", 0.0, false);
    return t;
}

const Variable& SymbolTable::get_variable(std::string_view name) const {
    auto it = find_named(variables_, name);
    if (it == variables_.end()) throw SymbolLookupError(std::string(name) + " is not a stored variable");
    return *it;
}

const Callable& SymbolTable::get_callable(std::string_view name) const {
    auto it = find_named(callables_, name);
    if (it == callables_.end()) throw SymbolLookupError(std::string(name) + " is not a stored function");
    return *it;
}

void SymbolTable::set_symbol(const std::string& name, double value) {
    auto it = find_named(variables_, name);
    if (it != variables_.end()) {
        it->set_to(value);
        return;
    }
    variables_.emplace_back(name, value, false);
}

void SymbolTable::set_symbol(const std::string& name, Body body) {
    auto it = find_named(callables_, name);
    if (it != callables_.end()) {
        it->set_to(std::move(body));
        return;
    }
    callables_.emplace_back(name, std::move(body), false);
}

void SymbolTable::define_constant(const std::string& name, double value) {
    define(variables_, Variable{name, value, true});
}

void SymbolTable::define_builtin(const std::string& name, double (*fn)(double)) {
    define(callables_, Callable{name, Body(make_intrinsic(name, fn)), true});
}

FunctionNames SymbolTable::callable_names() const {
    FunctionNames out;
    for (const auto& c : callables_) out.insert(c.name());
    return out;
}

} // namespace linecalc
