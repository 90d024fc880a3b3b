#pragma once
#include <string>
#include <vector>
#include "mathexpr/ast.hpp"

namespace mathexpr {

/// Names a caller has to bind before evaluating `node`, in order of first use.
/// Skips built-in constants, parameters of an enclosing definition, and names
/// assigned earlier in the same batch.
std::vector<std::string> detect_variables(const Node& node);

} // namespace mathexpr
