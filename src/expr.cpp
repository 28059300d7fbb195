#include <linecalc/expr.hpp>
#include <linecalc/symbols.hpp>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace linecalc {

// Divisors smaller than this in magnitude are treated as zero.
static constexpr double kDivisionEpsilon = 1e-8;

char symbol(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add: return '+';
        case BinaryOperator::Sub: return '-';
        case BinaryOperator::Mul: return '*';
        case BinaryOperator::Div: return '/';
        case BinaryOperator::Pow: return '^';
        case BinaryOperator::Sci: return 'E';
    }
    return '?';
}

// -----------------------------
// construction
// -----------------------------
static ExprPtr wrap(decltype(Expr::node) node) {
    auto e = std::make_unique<Expr>();
    e->node = std::move(node);
    return e;
}

ExprPtr make_constant(double value) {
    return wrap(Constant{value});
}

ExprPtr make_variable(std::string name) {
    return wrap(VariableRef{std::move(name)});
}

ExprPtr make_binary(BinaryOperator op, ExprPtr lhs, ExprPtr rhs) {
    return wrap(BinaryOp{op, std::move(lhs), std::move(rhs)});
}

ExprPtr make_unary(UnaryOperator op, ExprPtr operand) {
    return wrap(UnaryOp{op, std::move(operand)});
}

ExprPtr make_call(std::string name, ExprPtr argument) {
    return wrap(FunctionCall{std::move(name), std::move(argument)});
}

ExprPtr make_intrinsic(std::string name, double (*fn)(double)) {
    return wrap(Intrinsic{std::move(name), fn});
}

// -----------------------------
// evaluation
// -----------------------------
double factorial(double n) {
    if (n < 0) return -1;
    if (n != std::floor(n)) throw ArithmeticError("Factorial requires a whole number");

    // Stops once the product overflows, so huge inputs cannot spin.
    double acc = 1.0;
    for (double k = 2.0; k <= n && std::isfinite(acc); k += 1.0) acc *= k;
    return acc;
}

static double apply_binary(BinaryOperator op, double x, double y) {
    switch (op) {
        case BinaryOperator::Add: return x + y;
        case BinaryOperator::Sub: return x - y;
        case BinaryOperator::Mul: return x * y;
        case BinaryOperator::Div:
            if (std::fabs(y) < kDivisionEpsilon) throw ArithmeticError("Cannot divide by zero");
            return x / y;
        case BinaryOperator::Pow: return std::pow(x, y);
        case BinaryOperator::Sci: return x * std::pow(10.0, y);
    }
    throw ArithmeticError("Unsupported operator");
}

namespace {

struct Evaluator {
    const SymbolTable& symbols;
    const Frame* frame;

    double operator()(const Constant& n) const { return n.value; }

    double operator()(const VariableRef& n) const {
        if (frame && n.name == kArgumentName) return frame->argument;
        return symbols.get_variable(n.name).value();
    }

    double operator()(const BinaryOp& n) const {
        double x = evaluate(*n.lhs, symbols, frame);
        double y = evaluate(*n.rhs, symbols, frame);
        return apply_binary(n.op, x, y);
    }

    double operator()(const UnaryOp& n) const {
        double v = evaluate(*n.operand, symbols, frame);
        switch (n.op) {
            case UnaryOperator::Factorial: return factorial(v);
        }
        throw ArithmeticError("Unsupported operator");
    }

    double operator()(const FunctionCall& n) const {
        double arg = evaluate(*n.argument, symbols, frame);
        int depth = frame ? frame->depth + 1 : 1;
        if (depth > kMaxCallDepth) throw RecursionLimitError("Too many nested calls to " + n.name);

        // Hold the body so a redefinition cannot free it mid-call.
        Body body = symbols.get_callable(n.name).value();
        Frame callee{arg, frame, depth};
        return evaluate(*body, symbols, &callee);
    }

    double operator()(const Intrinsic& n) const {
        if (!frame) throw SymbolLookupError(std::string(kArgumentName) + " is not bound outside a call to " + n.name);
        return n.fn(frame->argument);
    }
};

struct Printer {
    std::string operator()(const Constant& n) const { return format_number(n.value); }
    std::string operator()(const VariableRef& n) const { return n.name; }

    std::string operator()(const BinaryOp& n) const {
        return "(" + debug(*n.lhs) + symbol(n.op) + debug(*n.rhs) + ")";
    }

    std::string operator()(const UnaryOp& n) const {
        return "(" + debug(*n.operand) + "!)";
    }

    std::string operator()(const FunctionCall& n) const {
        return n.name + "(" + debug(*n.argument) + ")";
    }

    std::string operator()(const Intrinsic& n) const {
        return n.name + "(" + kArgumentName + ")";
    }
};

} // namespace

double evaluate(const Expr& e, const SymbolTable& symbols, const Frame* frame) {
    return std::visit(Evaluator{symbols, frame}, e.node);
}

std::string debug(const Expr& e) {
    return std::visit(Printer{}, e.node);
}

std::string format_number(double v) {
    std::ostringstream os;
    os << std::setprecision(15) << v;
    return os.str();
}

} // namespace linecalc
