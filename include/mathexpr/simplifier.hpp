#pragma once
#include "mathexpr/ast.hpp"

namespace mathexpr {

/// Bottom-up algebraic cleanup: folds operators whose operands are both
/// literals and drops identity operands (x+0, x*1, x/1, x^1, ...).
/// Never descends through function calls to fold them.
/// Returns a new tree; unchanged subtrees are shared with the input.
/// simplify_ast(simplify_ast(t)) is equal to simplify_ast(t).
NodePtr simplify_ast(const NodePtr& node);

} // namespace mathexpr
