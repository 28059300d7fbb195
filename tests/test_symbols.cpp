#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <linecalc/symbols.hpp>

#include <cmath>

namespace {

using namespace linecalc;
using namespace ::testing;

TEST(Symbols, DefaultsAreSeeded) {
    SymbolTable st;
    EXPECT_DOUBLE_EQ(st.get_variable("ans").value(), 0.0);
    EXPECT_DOUBLE_EQ(st.get_variable("preans").value(), 0.0);
    EXPECT_FALSE(st.get_variable("ans").is_final());
    EXPECT_FALSE(st.get_variable("preans").is_final());
    EXPECT_DOUBLE_EQ(st.get_variable("pi").value(), std::acos(-1.0));
    EXPECT_DOUBLE_EQ(st.get_variable("e").value(), std::exp(1.0));
    EXPECT_TRUE(st.get_variable("pi").is_final());

    EXPECT_THAT(st.callable_names(), UnorderedElementsAre(
        "sin", "asin", "asinh", "cos", "acos", "acosh", "tan", "atan", "atanh", "rad", "deg"));
    for (const auto& c : st.callables()) EXPECT_TRUE(c.is_final()) << c.name();
}

TEST(Symbols, EmptyTableHasOnlyHistory) {
    SymbolTable st = SymbolTable::empty();
    EXPECT_EQ(st.variables().size(), 2u);
    EXPECT_TRUE(st.callables().empty());
    EXPECT_THROW(st.get_variable("pi"), SymbolLookupError);
}

TEST(Symbols, LookupFailures) {
    SymbolTable st;
    try {
        st.get_variable("zz");
        FAIL() << "expected SymbolLookupError";
    } catch (const SymbolLookupError& e) {
        EXPECT_STREQ(e.what(), "zz is not a stored variable");
    }
    try {
        st.get_callable("zz");
        FAIL() << "expected SymbolLookupError";
    } catch (const SymbolLookupError& e) {
        EXPECT_STREQ(e.what(), "zz is not a stored function");
    }
}

TEST(Symbols, SetInsertsThenUpdatesInPlace) {
    SymbolTable st;
    std::size_t before = st.variables().size();
    st.set_symbol("r", 1.0);
    st.set_symbol("r", 2.0);
    EXPECT_EQ(st.variables().size(), before + 1);
    EXPECT_DOUBLE_EQ(st.get_variable("r").value(), 2.0);
    EXPECT_FALSE(st.get_variable("r").is_final());
    EXPECT_EQ(st.variables().back().name(), "r");
}

TEST(Symbols, ExpressionsGoToCallables) {
    SymbolTable st;
    st.set_symbol("g", Body(make_variable("x")));
    EXPECT_EQ(debug(*st.get_callable("g").value()), "x");
    EXPECT_THROW(st.get_variable("g"), SymbolLookupError);
    EXPECT_EQ(st.callable_names().count("g"), 1u);

    st.set_symbol("g", Body(make_constant(1)));
    EXPECT_EQ(debug(*st.get_callable("g").value()), "1");
}

TEST(Symbols, FinalEntriesRejectMutation) {
    SymbolTable st;
    try {
        st.set_symbol("pi", 3.0);
        FAIL() << "expected SymbolMutationError";
    } catch (const SymbolMutationError& e) {
        EXPECT_STREQ(e.what(), "Cannot modify pi");
    }
    EXPECT_DOUBLE_EQ(st.get_variable("pi").value(), std::acos(-1.0));
    EXPECT_THROW(st.set_symbol("sin", Body(make_constant(0))), SymbolMutationError);
    EXPECT_THROW(st.define_constant("e", 3.0), SymbolMutationError);
}

TEST(Symbols, DefineConstantAndBuiltin) {
    SymbolTable st = SymbolTable::empty();
    st.set_symbol("g", 9.81);
    st.define_constant("g", 9.8);
    EXPECT_TRUE(st.get_variable("g").is_final());
    EXPECT_THROW(st.set_symbol("g", 1.0), SymbolMutationError);

    st.define_builtin("sqrt", [](double v) { return std::sqrt(v); });
    EXPECT_DOUBLE_EQ(evaluate(*make_call("sqrt", make_constant(16)), st), 4.0);
}

} // namespace
