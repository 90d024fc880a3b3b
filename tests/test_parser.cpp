#include <gtest/gtest.h>
#include <mathexpr/lexer.hpp>
#include <mathexpr/parser.hpp>

#include <string>

namespace {

using namespace mathexpr;

::testing::AssertionResult same_tree(const NodePtr& got, const NodePtr& want) {
    if (equal(*got, *want)) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << "trees differ";
}

ParseError parse_failure(const std::string& input) {
    try {
        parse_expression(input);
    } catch (const ParseError& e) {
        return e;
    }
    ADD_FAILURE() << "expected ParseError for: " << input;
    return ParseError("", "", 0);
}

TEST(Parser, MultiplicationBindsTighterThanAddition) {
    auto want = binary(BinOp::Add, number(2), binary(BinOp::Multiply, number(3), number(4)));
    EXPECT_TRUE(same_tree(parse_expression("2+3*4"), want));
}

TEST(Parser, AdditiveAndMultiplicativeAreLeftAssociative) {
    auto sub = binary(BinOp::Subtract, binary(BinOp::Subtract, number(8), number(3)), number(2));
    EXPECT_TRUE(same_tree(parse_expression("8-3-2"), sub));

    auto div = binary(BinOp::Divide, binary(BinOp::Divide, number(8), number(4)), number(2));
    EXPECT_TRUE(same_tree(parse_expression("8/4/2"), div));
}

TEST(Parser, PowerIsRightAssociative) {
    auto want = binary(BinOp::Exponent, number(2), binary(BinOp::Exponent, number(3), number(2)));
    EXPECT_TRUE(same_tree(parse_expression("2^3^2"), want));
}

TEST(Parser, UnaryMinusBindsBeforePower) {
    auto want = binary(BinOp::Exponent, negate(number(2)), number(2));
    EXPECT_TRUE(same_tree(parse_expression("-2^2"), want));
}

TEST(Parser, UnaryInsideExponent) {
    auto want = binary(BinOp::Exponent, number(2), negate(number(1)));
    EXPECT_TRUE(same_tree(parse_expression("2^-1"), want));
}

TEST(Parser, UnaryPlusIsDropped) {
    EXPECT_TRUE(same_tree(parse_expression("+x"), variable("x")));
    EXPECT_TRUE(same_tree(parse_expression("-+-x"), negate(negate(variable("x")))));
}

TEST(Parser, ParenthesesOverridePrecedence) {
    auto want = binary(BinOp::Multiply, binary(BinOp::Add, number(2), number(3)), number(4));
    EXPECT_TRUE(same_tree(parse_expression("(2+3)*4"), want));
}

TEST(Parser, FunctionCallKeepsArgumentOrder) {
    auto want = call("max", {variable("a"), binary(BinOp::Add, number(1), number(2)), number(3)});
    EXPECT_TRUE(same_tree(parse_expression("max(a, 1+2, 3)"), want));
}

TEST(Parser, EmptyArgumentList) {
    auto node = parse_expression("f()");
    ASSERT_TRUE(node->is<FunctionCall>());
    EXPECT_EQ(node->as<FunctionCall>().name, "f");
    EXPECT_TRUE(node->as<FunctionCall>().args.empty());
}

TEST(Parser, SingleExpressionIsNotWrappedInBatch) {
    EXPECT_FALSE(parse_expression("x=1")->is<Batch>());
}

TEST(Parser, SemicolonsProduceBatchInSourceOrder) {
    auto node = parse_expression("x=5;x+1");
    ASSERT_TRUE(node->is<Batch>());
    const auto& exprs = node->as<Batch>().expressions;
    ASSERT_EQ(exprs.size(), 2u);
    EXPECT_TRUE(same_tree(exprs[0], make_node(Assignment{"x", number(5)})));
    EXPECT_TRUE(same_tree(exprs[1], binary(BinOp::Add, variable("x"), number(1))));
}

TEST(Parser, AssignmentChainsToTheRight) {
    auto want = make_node(Assignment{"a", make_node(Assignment{"b", number(3)})});
    EXPECT_TRUE(same_tree(parse_expression("a = b = 3"), want));
}

TEST(Parser, FunctionDefinitionBindsParameters) {
    auto node = parse_expression("f(x, y) = x*y + 1");
    ASSERT_TRUE(node->is<FunctionDef>());
    const auto& def = node->as<FunctionDef>();
    EXPECT_EQ(def.name, "f");
    EXPECT_EQ(def.params, (std::vector<std::string>{"x", "y"}));
    auto body = binary(BinOp::Add, binary(BinOp::Multiply, variable("x"), variable("y")), number(1));
    EXPECT_TRUE(same_tree(def.body, body));
}

TEST(Parser, RejectsInvalidAssignmentTarget) {
    ParseError e = parse_failure("2 = 3");
    EXPECT_EQ(e.position(), 2u);

    ParseError sum = parse_failure("x + 1 = 3");
    EXPECT_EQ(sum.position(), 6u);
}

TEST(Parser, RejectsNonNameParameters) {
    ParseError e = parse_failure("f(x, 2) = x");
    EXPECT_EQ(e.position(), 8u);
}

TEST(Parser, RejectsDuplicateParameters) {
    parse_failure("f(x, x) = x");
    parse_failure("f(x, X) = x");
}

TEST(Parser, EmptyInputIsAnError) {
    ParseError e = parse_failure("   ");
    EXPECT_EQ(e.position(), 0u);
}

TEST(Parser, UnexpectedEndReportsPositionPastLastToken) {
    ParseError e = parse_failure("2 +");
    EXPECT_EQ(e.position(), 3u);
    EXPECT_EQ(e.expected(), "number, variable, or '('");
}

TEST(Parser, MissingCloseParen) {
    ParseError e = parse_failure("(1 + 2");
    EXPECT_EQ(e.position(), 6u);
    EXPECT_EQ(e.expected(), "')'");

    ParseError call_end = parse_failure("sin(1");
    EXPECT_EQ(call_end.position(), 5u);
}

TEST(Parser, UnexpectedTokenReportsItsPosition) {
    ParseError e = parse_failure("2 * )");
    EXPECT_EQ(e.position(), 4u);
}

TEST(Parser, TrailingTokensAreRejected) {
    ParseError e = parse_failure("1 2");
    EXPECT_EQ(e.position(), 2u);
    EXPECT_EQ(e.expected(), "end of input");
}

TEST(Parser, UnsupportedOperatorsFailToParse) {
    ParseError e = parse_failure("3 % 2");
    EXPECT_EQ(e.position(), 2u);
    parse_failure("1 < 2");
    parse_failure("4!");
}

TEST(Parser, AssignmentNotAllowedInsideParentheses) {
    parse_failure("(x = 1) + 2");
}

TEST(Parser, LexErrorsPropagate) {
    EXPECT_THROW(parse_expression("1 + #"), LexError);
}

} // namespace
