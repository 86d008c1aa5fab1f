#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "parse_error.hpp"
#include "shunting_yard.hpp"
#include "tokenize.hpp"

using namespace redfa;
using namespace redfa::token;

namespace {

std::string postfix(std::string_view regex) {
    return to_string(shunting_yard(tokenize(regex)));
}

template <class E>
std::size_t error_position(std::string_view regex) {
    try {
        shunting_yard(tokenize(regex));
    } catch (const E& e) {
        return e.position();
    }
    ADD_FAILURE() << "no error raised for '" << regex << "'";
    return std::string_view::npos;
}

}  // namespace

TEST(ShuntingYard, Basic) {
    EXPECT_EQ(postfix("a"), "a");
    EXPECT_EQ(postfix("ab"), "ab.");
    EXPECT_EQ(postfix("abc"), "ab.c.");
    EXPECT_EQ(postfix("a|b"), "ab|");
    EXPECT_EQ(postfix("a|b|c"), "ab|c|");
    EXPECT_EQ(postfix("a*"), "a*");
    EXPECT_EQ(postfix("a**"), "a**");
}

TEST(ShuntingYard, Precedence) {
    EXPECT_EQ(postfix("a|bc"), "abc.|");
    EXPECT_EQ(postfix("ab|c"), "ab.c|");
    EXPECT_EQ(postfix("ab*"), "ab*.");
    EXPECT_EQ(postfix("a*b"), "a*b.");
    EXPECT_EQ(postfix("a|b*"), "ab*|");
}

TEST(ShuntingYard, Groups) {
    EXPECT_EQ(postfix("(a)"), "a");
    EXPECT_EQ(postfix("(a)(b)"), "ab.");
    EXPECT_EQ(postfix("(ab)*"), "ab.*");
    EXPECT_EQ(postfix("(a|b)c"), "ab|c.");
    EXPECT_EQ(postfix("(a|b)*abb"), "ab|*a.b.b.");
    EXPECT_EQ(postfix("(a|b)*(c)"), "ab|*c.");
    EXPECT_EQ(postfix("a(b|c)*d"), "abc|*.d.");
    EXPECT_EQ(postfix("((a))"), "a");
}

TEST(ShuntingYard, ExplicitConcatenationAfterStar) {
    auto out = shunting_yard(tokenize("a*(b)"));
    ASSERT_EQ(out.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<Concatenation>(out[3]));
    // The inserted operator points at the token that triggered it.
    EXPECT_EQ(position(out[3]), 2u);
}

TEST(ShuntingYard, Unbalanced) {
    EXPECT_EQ(error_position<UnbalancedParentheses>("(a|b"), 0u);
    EXPECT_EQ(error_position<UnbalancedParentheses>("a(b"), 1u);
    EXPECT_EQ(error_position<UnbalancedParentheses>("a)"), 1u);
    EXPECT_EQ(error_position<UnbalancedParentheses>(")"), 0u);
    EXPECT_EQ(error_position<UnbalancedParentheses>("(a))"), 3u);
    EXPECT_EQ(error_position<UnbalancedParentheses>("((a)"), 0u);
}

TEST(ShuntingYard, Dangling) {
    EXPECT_EQ(error_position<DanglingOperator>("a|"), 1u);
    EXPECT_EQ(error_position<DanglingOperator>("|a"), 0u);
    EXPECT_EQ(error_position<DanglingOperator>("*a"), 0u);
    EXPECT_EQ(error_position<DanglingOperator>("a||b"), 2u);
    EXPECT_EQ(error_position<DanglingOperator>("(|a)"), 1u);
    EXPECT_EQ(error_position<DanglingOperator>("(a|)"), 2u);
    EXPECT_EQ(error_position<DanglingOperator>("(*)"), 1u);
    EXPECT_EQ(error_position<DanglingOperator>("a|*"), 2u);
}

TEST(ShuntingYard, Empty) {
    EXPECT_THROW(postfix(""), ParseError);
    EXPECT_THROW(postfix("()"), ParseError);
    EXPECT_THROW(postfix("a()"), ParseError);
}

TEST(ShuntingYard, ErrorMessage) {
    try {
        postfix("ab|");
        FAIL() << "expected DanglingOperator";
    } catch (const DanglingOperator& e) {
        EXPECT_STREQ(e.what(), "Missing right operand for '|' at position 2");
    }
    try {
        postfix("(ab");
        FAIL() << "expected UnbalancedParentheses";
    } catch (const UnbalancedParentheses& e) {
        EXPECT_STREQ(e.what(), "Unclosed '(' at position 0");
    }
}
