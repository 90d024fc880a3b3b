#include <mathexpr/expr.hpp>

namespace mathexpr {

Value calculate(std::string_view input, Scope& scope) {
    NodePtr ast = parse_expression(input);
    return evaluate_ast(*ast, scope);
}

std::string simplify_text(std::string_view input) {
    return to_string(*simplify_ast(parse_expression(input)));
}

} // namespace mathexpr
