#pragma once
#include <string>
#include "mathexpr/ast.hpp"

namespace mathexpr {

/// Shortest readable rendering of a double, up to 15 significant digits.
std::string format_number(double x);

/// Render a tree back to source text. Parentheses are added only where
/// precedence or associativity requires them, so the output re-parses to
/// a tree with the same value.
std::string to_string(const Node& node);

} // namespace mathexpr
