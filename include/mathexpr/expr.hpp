#pragma once

#include <string>
#include <string_view>

#include <mathexpr/ast.hpp>
#include <mathexpr/evaluator.hpp>
#include <mathexpr/format.hpp>
#include <mathexpr/lexer.hpp>
#include <mathexpr/parser.hpp>
#include <mathexpr/simplifier.hpp>

namespace mathexpr {

/// Parse + evaluate in one call. Bindings made by the input stay in `scope`.
/// Throws LexError, ParseError or EvalError.
Value calculate(std::string_view input, Scope& scope);

/// Parse + simplify, rendered back to text.
std::string simplify_text(std::string_view input);

} // namespace mathexpr
