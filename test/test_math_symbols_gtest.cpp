#include <gtest/gtest.h>
#include "../docx2tex/math/math_symbols.hpp"
#include "../lib/log.h"
#include <cstring>

using namespace docx2tex;

class MathSymbolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(nullptr);
    }
};

TEST_F(MathSymbolsTest, GreekLetters) {
    const MathSymbolDef* alpha = math_symbol_lookup(0x03B1);
    ASSERT_NE(alpha, nullptr);
    EXPECT_STREQ(alpha->latex, "\\alpha");
    EXPECT_EQ(alpha->cls, MathSymbolClass::Ordinary);

    const MathSymbolDef* omega = math_symbol_lookup(0x03A9);
    ASSERT_NE(omega, nullptr);
    EXPECT_STREQ(omega->latex, "\\Omega");

    // capitals shared with Latin have no command of their own
    const MathSymbolDef* alpha_cap = math_symbol_lookup(0x0391);
    ASSERT_NE(alpha_cap, nullptr);
    EXPECT_STREQ(alpha_cap->latex, "A");
}

TEST_F(MathSymbolsTest, Classes) {
    const MathSymbolDef* leq = math_symbol_lookup(0x2264);
    ASSERT_NE(leq, nullptr);
    EXPECT_STREQ(leq->latex, "\\leq");
    EXPECT_EQ(leq->cls, MathSymbolClass::Relation);

    const MathSymbolDef* plus = math_symbol_lookup('+');
    ASSERT_NE(plus, nullptr);
    EXPECT_EQ(plus->cls, MathSymbolClass::Operator);

    const MathSymbolDef* paren = math_symbol_lookup('(');
    ASSERT_NE(paren, nullptr);
    EXPECT_EQ(paren->cls, MathSymbolClass::Delimiter);

    EXPECT_STREQ(math_symbol_class_name(MathSymbolClass::Relation), "relation");
    EXPECT_STREQ(math_symbol_class_name(MathSymbolClass::FunctionName), "function-name");
}

TEST_F(MathSymbolsTest, ReservedCharactersAreEscaped) {
    const MathSymbolDef* lbrace = math_symbol_lookup('{');
    ASSERT_NE(lbrace, nullptr);
    EXPECT_STREQ(lbrace->latex, "\\{");

    const MathSymbolDef* degree = math_symbol_lookup(0x00B0);
    ASSERT_NE(degree, nullptr);
    EXPECT_STREQ(degree->latex, "^{\\circ}");
}

TEST_F(MathSymbolsTest, UnmappedCodepoints) {
    EXPECT_EQ(math_symbol_lookup(0x20AC), nullptr);   // euro sign
    EXPECT_EQ(math_symbol_lookup(0x6F22), nullptr);   // CJK ideograph
    EXPECT_EQ(math_symbol_lookup('x'), nullptr);
    EXPECT_EQ(math_symbol_lookup('7'), nullptr);
}

TEST_F(MathSymbolsTest, LookupByName) {
    const MathSymbolDef* infty = math_symbol_lookup_name("infty", 5);
    ASSERT_NE(infty, nullptr);
    EXPECT_EQ(infty->codepoint, 0x221Eu);
    EXPECT_STREQ(infty->latex, "\\infty");

    // a leading backslash is accepted
    const MathSymbolDef* nabla = math_symbol_lookup_name("\\nabla", 6);
    ASSERT_NE(nabla, nullptr);
    EXPECT_EQ(nabla->codepoint, 0x2207u);

    EXPECT_EQ(math_symbol_lookup_name("notasymbol", 10), nullptr);
    EXPECT_EQ(math_symbol_lookup_name("", 0), nullptr);
    EXPECT_EQ(math_symbol_lookup_name(nullptr, 3), nullptr);
}

TEST_F(MathSymbolsTest, FunctionNames) {
    EXPECT_TRUE(math_is_function_name("sin", 3));
    EXPECT_TRUE(math_is_function_name("lim", 3));
    EXPECT_TRUE(math_is_function_name("SIN", 3));
    EXPECT_FALSE(math_is_function_name("sinx", 4));
    EXPECT_FALSE(math_is_function_name("x", 1));

    EXPECT_STREQ(math_function_latex("cos", 3), "\\cos");
    EXPECT_STREQ(math_function_latex("sech", 4), "\\operatorname{sech}");
    EXPECT_STREQ(math_function_latex("mod", 3), "\\operatorname{mod}");
    EXPECT_EQ(math_function_latex("foo", 3), nullptr);

    // only the leading bytes given by len are considered
    EXPECT_TRUE(math_is_function_name("logarithm", 3));
}

TEST_F(MathSymbolsTest, NaryOperators) {
    EXPECT_STREQ(math_nary_latex(0x2211), "\\sum");
    EXPECT_STREQ(math_nary_latex(0x222B), "\\int");
    EXPECT_STREQ(math_nary_latex(0x222C), "\\iint");
    EXPECT_EQ(math_nary_latex('x'), nullptr);

    EXPECT_TRUE(math_nary_is_integral(0x222B));
    EXPECT_TRUE(math_nary_is_integral(0x222E));
    EXPECT_FALSE(math_nary_is_integral(0x2211));
    EXPECT_FALSE(math_nary_is_integral(0x220F));
}

TEST_F(MathSymbolsTest, InvisibleCharacters) {
    EXPECT_TRUE(math_is_invisible_char(0x2061));    // function application
    EXPECT_TRUE(math_is_invisible_char(0x2062));    // invisible times
    EXPECT_TRUE(math_is_invisible_char(0x200B));
    EXPECT_TRUE(math_is_invisible_char(0xFEFF));
    EXPECT_FALSE(math_is_invisible_char(' '));
    EXPECT_FALSE(math_is_invisible_char('x'));
}

TEST_F(MathSymbolsTest, TableIsStable) {
    size_t count = math_symbol_count();
    EXPECT_GT(count, 150u);
    // the index is built once; repeated lookups return the same entry
    EXPECT_EQ(math_symbol_lookup(0x03B1), math_symbol_lookup(0x03B1));
    EXPECT_EQ(math_symbol_count(), count);
}
