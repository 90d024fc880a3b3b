#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "mathexpr/ast.hpp"

namespace mathexpr {

struct EvalError : std::runtime_error {
    EvalError(std::string reason, std::string name)
        : std::runtime_error(reason + ": " + name), reason_(std::move(reason)), name_(std::move(name)) {}
    EvalError(std::string reason, std::string name, const std::string& detail)
        : std::runtime_error(reason + ": " + name + " (" + detail + ")"),
          reason_(std::move(reason)), name_(std::move(name)) {}

    // "undefined variable", "unknown function", "invalid arity", ...
    const std::string& reason() const noexcept { return reason_; }
    const std::string& name() const noexcept { return name_; }

private:
    std::string reason_;
    std::string name_;
};

/// A user-defined function: f(x, y) = body.
struct Closure {
    std::vector<std::string> params;
    NodePtr body;
};

using Binding = std::variant<double, Closure>;
using Scope   = std::map<std::string, Binding>;

/// Numeric result, or a symbolic string when a value cannot be reduced
/// to a number (complex literals, definitions, and anything built on them).
using Value = std::variant<double, std::string>;

/// Evaluate a tree against a caller-owned scope.
/// Assignment and FunctionDef nodes write into `scope`; a Batch threads the
/// same scope through every expression and yields the last result.
/// Throws EvalError on undefined names, unknown functions, or bad arity.
Value evaluate_ast(const Node& node, Scope& scope);

/// IEEE-754 arithmetic for one operator; division by zero is not an error.
double apply_binary(BinOp op, double a, double b);

std::string to_string(const Value& v);

} // namespace mathexpr
