#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

namespace linecalc {

struct ArithmeticError     : std::runtime_error { using std::runtime_error::runtime_error; };
struct RecursionLimitError : std::runtime_error { using std::runtime_error::runtime_error; };

class SymbolTable;

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

enum class BinaryOperator { Add, Sub, Mul, Div, Pow, Sci };
enum class UnaryOperator { Factorial };

char symbol(BinaryOperator op);

struct Constant {
    double value{};
};

struct VariableRef {
    std::string name;
};

struct BinaryOp {
    BinaryOperator op{};
    ExprPtr lhs;
    ExprPtr rhs;
};

struct UnaryOp {
    UnaryOperator op{};
    ExprPtr operand;
};

struct FunctionCall {
    std::string name;
    ExprPtr argument;
};

// Body of a built-in function: applies `fn` to the current call argument.
struct Intrinsic {
    std::string name;
    double (*fn)(double){nullptr};
};

struct Expr {
    std::variant<Constant, VariableRef, BinaryOp, UnaryOp, FunctionCall, Intrinsic> node;
};

ExprPtr make_constant(double value);
ExprPtr make_variable(std::string name);
ExprPtr make_binary(BinaryOperator op, ExprPtr lhs, ExprPtr rhs);
ExprPtr make_unary(UnaryOperator op, ExprPtr operand);
ExprPtr make_call(std::string name, ExprPtr argument);
ExprPtr make_intrinsic(std::string name, double (*fn)(double));

/// Evaluation context of one function call. Frames chain back to the caller,
/// so a nested call never overwrites the argument of the call around it.
struct Frame {
    double argument{};
    const Frame* caller{nullptr};
    int depth{0};
};

/// Name under which a function body sees its argument.
inline constexpr const char* kArgumentName = "x";

/// Nested calls deeper than this throw RecursionLimitError.
inline constexpr int kMaxCallDepth = 64;

/// Evaluate `e` against `symbols`. `frame` is the enclosing call, if any.
/// Throws ArithmeticError, SymbolLookupError or RecursionLimitError.
double evaluate(const Expr& e, const SymbolTable& symbols, const Frame* frame = nullptr);

/// Fully parenthesised rendering, e.g. "((x^2)+0)".
std::string debug(const Expr& e);

/// Factorial of a whole number. Negative input yields -1, which callers
/// must treat as "undefined". Throws ArithmeticError for fractions.
double factorial(double n);

std::string format_number(double v);

} // namespace linecalc
