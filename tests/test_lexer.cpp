#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <linecalc/lexer.hpp>

#include <vector>

namespace {

using linecalc::TokKind;
using namespace ::testing;

static std::vector<TokKind> kinds(const std::vector<linecalc::Token>& toks) {
    std::vector<TokKind> out;
    for (const auto& t : toks) out.push_back(t.kind);
    return out;
}

TEST(Lexer, EmptyInputYieldsNoTokens) {
    EXPECT_TRUE(linecalc::tokenise("", {}).empty());
    EXPECT_TRUE(linecalc::tokenise("   \t", {}).empty());
}

TEST(Lexer, OperatorsAndBrackets) {
    auto toks = linecalc::tokenise("(1+2)-3*4/5!^6E7", {});
    EXPECT_THAT(kinds(toks), ElementsAre(
        TokKind::LParen, TokKind::Number, TokKind::Plus, TokKind::Number, TokKind::RParen,
        TokKind::Minus, TokKind::Number, TokKind::Star, TokKind::Number, TokKind::Slash,
        TokKind::Number, TokKind::Bang, TokKind::Caret, TokKind::Number, TokKind::Sci,
        TokKind::Number));
}

TEST(Lexer, NumbersAreUnsignedDecimals) {
    auto toks = linecalc::tokenise("12.5 - 3", {});
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].text, "12.5");
    EXPECT_EQ(toks[1].kind, TokKind::Minus);
    EXPECT_EQ(toks[2].text, "3");
}

TEST(Lexer, WhitespaceBetweenTokensIsIgnored) {
    auto toks = linecalc::tokenise("  ans   *  2 ", {});
    EXPECT_THAT(kinds(toks), ElementsAre(TokKind::Ident, TokKind::Star, TokKind::Number));
}

TEST(Lexer, KnownFunctionNamesBecomeCalls) {
    auto toks = linecalc::tokenise("sin(x) + sine", {"sin"});
    EXPECT_THAT(kinds(toks), ElementsAre(
        TokKind::Call, TokKind::LParen, TokKind::Ident, TokKind::RParen, TokKind::Plus, TokKind::Ident));
    EXPECT_EQ(toks[0].text, "sin");
    EXPECT_EQ(toks[5].text, "sine");
}

TEST(Lexer, OperatorTokensCarryPrecedenceAndArity) {
    auto toks = linecalc::tokenise("f(2)!^3E1/4*5+6-7", {"f"});
    ASSERT_EQ(toks.size(), 17u);
    EXPECT_EQ(toks[0].precedence, 110);  // call
    EXPECT_EQ(toks[0].arity, linecalc::Arity::Unary);
    EXPECT_EQ(toks[1].precedence, 0);    // (
    EXPECT_EQ(toks[2].precedence, 0);    // number
    EXPECT_EQ(toks[4].precedence, 100);  // !
    EXPECT_EQ(toks[4].arity, linecalc::Arity::Unary);
    EXPECT_EQ(toks[5].precedence, 90);   // ^
    EXPECT_EQ(toks[7].precedence, 90);   // E
    EXPECT_EQ(toks[9].precedence, 80);   // /
    EXPECT_EQ(toks[11].precedence, 70);  // *
    EXPECT_EQ(toks[13].precedence, 60);  // +
    EXPECT_EQ(toks[15].precedence, 50);  // -
    EXPECT_EQ(toks[15].arity, linecalc::Arity::Binary);
}

TEST(Lexer, LowercaseRunsAreSingleIdentifiers) {
    auto toks = linecalc::tokenise("2e", {});
    EXPECT_THAT(kinds(toks), ElementsAre(TokKind::Number, TokKind::Ident));
}

TEST(Lexer, UnknownCharacterThrows) {
    EXPECT_THROW(linecalc::tokenise("2 % 3", {}), linecalc::TokeniseError);
    EXPECT_THROW(linecalc::tokenise("X+1", {}), linecalc::TokeniseError);
    EXPECT_THROW(linecalc::tokenise("a=1", {}), linecalc::TokeniseError);
}

TEST(Lexer, TrailingDotIsNotPartOfANumber) {
    EXPECT_THROW(linecalc::tokenise("1.", {}), linecalc::TokeniseError);
}

} // namespace
