#include <gtest/gtest.h>
#include <mathexpr/expr.hpp>
#include <mathexpr/steps.hpp>
#include <mathexpr/variables.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace {

using namespace mathexpr;

TEST(Expr, CalculateKeepsBindingsInScope) {
    Scope scope;
    Value v = calculate("r = 2; area = pi * r^2; area / pi", scope);
    ASSERT_TRUE(std::holds_alternative<double>(v));
    EXPECT_DOUBLE_EQ(std::get<double>(v), 4.0);
    EXPECT_EQ(scope.count("r"), 1u);
    EXPECT_EQ(scope.count("area"), 1u);

    EXPECT_DOUBLE_EQ(std::get<double>(calculate("r + 1", scope)), 3.0);
}

TEST(Expr, SimplifyText) {
    EXPECT_EQ(simplify_text("x + 0"), "x");
    EXPECT_EQ(simplify_text("2*3+4"), "10");
    EXPECT_EQ(simplify_text("(y*1 + 2*2) * z"), "(y + 4) * z");
}

TEST(Expr, ErrorsSurfaceFromEachStage) {
    Scope scope;
    EXPECT_THROW(calculate("3.5.6", scope), LexError);
    EXPECT_THROW(calculate("3 +", scope), ParseError);
    EXPECT_THROW(calculate("3 + q", scope), EvalError);
}

TEST(Format, Numbers) {
    EXPECT_EQ(format_number(3), "3");
    EXPECT_EQ(format_number(-0.5), "-0.5");
    EXPECT_EQ(format_number(0.1 + 0.2), "0.3");
    EXPECT_EQ(format_number(-0.0), "0");
    EXPECT_EQ(format_number(1e21), "1000000000000000000000");
    EXPECT_EQ(format_number(1e-7), "0.0000001");
    EXPECT_EQ(format_number(-1.5e-5), "-0.000015");
    EXPECT_EQ(format_number(123456789012345.0), "123456789012345");
}

TEST(Format, NonFiniteNumbersPrintAsDivisions) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(format_number(inf), "1 / 0");
    EXPECT_EQ(format_number(-inf), "-1 / 0");
    EXPECT_EQ(format_number(std::nan("")), "0 / 0");

    EXPECT_EQ(to_string(*binary(BinOp::Exponent, variable("x"), number(inf))), "x ^ (1 / 0)");
    EXPECT_EQ(to_string(*negate(number(-inf))), "-(-1 / 0)");
    EXPECT_EQ(to_string(*binary(BinOp::Add, variable("x"), number(inf))), "x + 1 / 0");
}

TEST(Format, MinimalParentheses) {
    EXPECT_EQ(to_string(*parse_expression("1+2*3")), "1 + 2 * 3");
    EXPECT_EQ(to_string(*parse_expression("(1+2)*3")), "(1 + 2) * 3");
    EXPECT_EQ(to_string(*parse_expression("a-(b-c)")), "a - (b - c)");
    EXPECT_EQ(to_string(*parse_expression("(a-b)-c")), "a - b - c");
    EXPECT_EQ(to_string(*parse_expression("a^b^c")), "a ^ b ^ c");
    EXPECT_EQ(to_string(*parse_expression("(a^b)^c")), "(a ^ b) ^ c");
    EXPECT_EQ(to_string(*parse_expression("-2^2")), "-2 ^ 2");
    EXPECT_EQ(to_string(*parse_expression("-(2^2)")), "-(2 ^ 2)");
    EXPECT_EQ(to_string(*parse_expression("--x")), "--x");
}

TEST(Format, CallsAndBindingForms) {
    EXPECT_EQ(to_string(*parse_expression("max(a, b+1)")), "max(a, b + 1)");
    EXPECT_EQ(to_string(*parse_expression("f(x,y)=x*y")), "f(x, y) = x * y");
    EXPECT_EQ(to_string(*parse_expression("x=1;x+1")), "x = 1; x + 1");
    EXPECT_EQ(to_string(*make_node(ComplexLit{2, -1})), "2-1i");
}

TEST(Format, OutputReparsesToSameValue) {
    const std::vector<std::string> inputs = {
        "-2^2", "2^-1", "a-(b-c)*d", "(a/b)/(c/d)", "-(a+b)^2", "a^(b^c)", "-a*-b",
    };
    for (const auto& in : inputs) {
        Scope s1{{"a", 2.0}, {"b", 3.0}, {"c", 0.5}, {"d", 4.0}};
        Scope s2 = s1;
        NodePtr tree = parse_expression(in);
        NodePtr again = parse_expression(to_string(*tree));
        EXPECT_DOUBLE_EQ(std::get<double>(evaluate_ast(*tree, s1)), std::get<double>(evaluate_ast(*again, s2))) << in;
    }
}

TEST(Format, SimplifiedOutputReparsesToSameValue) {
    const std::vector<std::string> inputs = {
        "x * 0.0000001", "x * 10^21", "x + 1/0", "x - 1/0", "x ^ (1/0)", "-(1/0) * x", "x / 10^-9",
    };
    for (const auto& in : inputs) {
        Scope s1{{"x", 1.5}};
        Scope s2 = s1;
        const std::string text = simplify_text(in);
        Value want = evaluate_ast(*parse_expression(in), s1);
        Value got = evaluate_ast(*parse_expression(text), s2);
        EXPECT_DOUBLE_EQ(std::get<double>(want), std::get<double>(got)) << in << " -> " << text;
    }

    Scope scope{{"x", 1.5}};
    const std::string nan_text = simplify_text("x * (0/0)");
    EXPECT_EQ(nan_text, "x * (0 / 0)");
    EXPECT_TRUE(std::isnan(std::get<double>(calculate(nan_text, scope))));
}

TEST(Steps, RecordsEachStage) {
    Scope scope{{"x", 3.0}};
    StepTracker tracker;
    Solution sol = evaluate_with_steps(parse_expression("x*1 + 0"), scope, tracker);

    ASSERT_TRUE(std::holds_alternative<double>(sol.result));
    EXPECT_DOUBLE_EQ(std::get<double>(sol.result), 3.0);

    ASSERT_EQ(sol.steps.size(), 4u);
    EXPECT_EQ(sol.steps[0].kind, StepKind::Evaluation);
    EXPECT_EQ(sol.steps[0].expression, "x * 1 + 0");
    EXPECT_EQ(sol.steps[1].kind, StepKind::Simplification);
    EXPECT_EQ(sol.steps[1].expression, "x");
    EXPECT_EQ(sol.steps[2].kind, StepKind::Substitution);
    EXPECT_EQ(sol.steps[2].description, "Substitute values: x = 3");
    EXPECT_FALSE(sol.steps[2].result.has_value());
    EXPECT_EQ(sol.steps[3].description, "Final result");
    ASSERT_TRUE(sol.steps[3].result.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(*sol.steps[3].result), 3.0);

    for (std::size_t i = 0; i < sol.steps.size(); ++i) EXPECT_EQ(sol.steps[i].id, i);
}

TEST(Steps, SkipsStagesWithNothingToShow) {
    Scope scope;
    StepTracker tracker;
    Solution sol = evaluate_with_steps(parse_expression("1 + sqrt(4)"), scope, tracker);
    ASSERT_EQ(sol.steps.size(), 2u);
    EXPECT_EQ(sol.steps[0].description, "Original expression");
    EXPECT_EQ(sol.steps[1].description, "Final result");

    tracker.clear();
    EXPECT_TRUE(tracker.steps().empty());
}

TEST(Steps, ReusedTrackerReturnsOnlyTheLatestRun) {
    Scope scope{{"x", 3.0}};
    StepTracker tracker;
    Solution first = evaluate_with_steps(parse_expression("x + 1"), scope, tracker);
    ASSERT_EQ(first.steps.size(), 3u);

    Scope empty;
    Solution second = evaluate_with_steps(parse_expression("2 * 3"), empty, tracker);
    ASSERT_EQ(second.steps.size(), 3u);
    EXPECT_EQ(second.steps[0].description, "Original expression");
    EXPECT_EQ(second.steps[0].expression, "2 * 3");
    EXPECT_EQ(second.steps[0].id, 3u);
    EXPECT_DOUBLE_EQ(std::get<double>(second.result), 6.0);

    EXPECT_EQ(tracker.steps().size(), 6u);
}

TEST(Variables, DetectsFreeNamesInOrder) {
    auto vars = detect_variables(*parse_expression("b*x + a*x + pi + sin(c)"));
    EXPECT_EQ(vars, (std::vector<std::string>{"b", "x", "a", "c"}));
}

TEST(Variables, SkipsBoundNames) {
    auto vars = detect_variables(*parse_expression("k = 2; f(t) = k*t + u; f(w)"));
    EXPECT_EQ(vars, (std::vector<std::string>{"u", "w"}));

    EXPECT_TRUE(detect_variables(*parse_expression("e^2 + 1")).empty());
}

TEST(Variables, NamesAreCaseInsensitive) {
    auto vars = detect_variables(*parse_expression("X + x + PI; K = 1; k * y"));
    EXPECT_EQ(vars, (std::vector<std::string>{"X", "y"}));
}

} // namespace
