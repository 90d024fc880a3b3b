#include "mathexpr/evaluator.hpp"
#include "mathexpr/builtins.hpp"
#include "mathexpr/format.hpp"

#include <cmath>

namespace mathexpr {

double apply_binary(BinOp op, double a, double b) {
    switch (op) {
        case BinOp::Add:      return a + b;
        case BinOp::Subtract: return a - b;
        case BinOp::Multiply: return a * b;
        case BinOp::Divide:   return a / b;
        case BinOp::Exponent: return std::pow(a, b);
    }
    return std::nan("");
}

std::string to_string(const Value& v) {
    if (std::holds_alternative<double>(v)) return format_number(std::get<double>(v));
    return std::get<std::string>(v);
}

namespace {

// Scope keys written by the evaluator are lowercased; a caller may still
// seed the scope under the spelling it uses in the expression.
Scope::iterator find_binding(Scope& scope, const std::string& name) {
    auto it = scope.find(fold_case(name));
    return it != scope.end() ? it : scope.find(name);
}

std::string join_values(const std::vector<Value>& vs) {
    std::string out;
    for (std::size_t i = 0; i < vs.size(); ++i) {
        if (i) out += ", ";
        out += to_string(vs[i]);
    }
    return out;
}

bool all_numeric(const std::vector<Value>& vs) {
    for (const auto& v : vs)
        if (!std::holds_alternative<double>(v)) return false;
    return true;
}

class Evaluator {
public:
    explicit Evaluator(Scope& scope) : scope_(scope) {}

    Value eval(const Node& n) { return std::visit(*this, n.v); }

    Value operator()(const NumberLit& n) { return n.value; }

    Value operator()(const ComplexLit& n) {
        return format_number(n.re) + (n.im >= 0 ? "+" : "") + format_number(n.im) + "i";
    }

    Value operator()(const Variable& n) {
        auto it = find_binding(scope_, n.name);
        if (it != scope_.end()) {
            if (!std::holds_alternative<double>(it->second)) throw EvalError("not a variable", n.name);
            return std::get<double>(it->second);
        }
        if (auto c = find_constant(n.name)) return *c;
        throw EvalError("undefined variable", n.name);
    }

    Value operator()(const Assignment& n) {
        Value v = eval(*n.value);
        if (!std::holds_alternative<double>(v)) throw EvalError("non-numeric assignment", n.name);
        scope_[fold_case(n.name)] = std::get<double>(v);
        return v;
    }

    Value operator()(const FunctionDef& n) {
        std::vector<std::string> params;
        params.reserve(n.params.size());
        for (const auto& p : n.params) params.push_back(fold_case(p));
        scope_[fold_case(n.name)] = Closure{std::move(params), n.body};
        std::string sig;
        for (std::size_t i = 0; i < n.params.size(); ++i) {
            if (i) sig += ", ";
            sig += n.params[i];
        }
        return n.name + "(" + sig + ") defined";
    }

    Value operator()(const Batch& n) {
        Value last = 0.0;
        for (const auto& e : n.expressions) last = eval(*e);
        return last;
    }

    Value operator()(const BinaryOp& n) {
        Value a = eval(*n.left);
        Value b = eval(*n.right);
        if (std::holds_alternative<double>(a) && std::holds_alternative<double>(b))
            return apply_binary(n.op, std::get<double>(a), std::get<double>(b));
        return "(" + to_string(a) + " " + op_symbol(n.op) + " " + to_string(b) + ")";
    }

    Value operator()(const UnaryMinus& n) {
        Value v = eval(*n.operand);
        if (std::holds_alternative<double>(v)) return -std::get<double>(v);
        return "-(" + std::get<std::string>(v) + ")";
    }

    Value operator()(const FunctionCall& n) {
        auto it = find_binding(scope_, n.name);
        if (it != scope_.end()) {
            if (!std::holds_alternative<Closure>(it->second)) throw EvalError("not a function", n.name);
            // Copy: the body may redefine the name while it runs.
            Closure fn = std::get<Closure>(it->second);
            return call_closure(n, fn);
        }

        const Builtin* b = find_function(n.name);
        if (!b) throw EvalError("unknown function", n.name);
        if (!b->accepts(n.args.size())) throw EvalError("invalid arity", n.name);

        std::vector<Value> args;
        args.reserve(n.args.size());
        for (const auto& a : n.args) args.push_back(eval(*a));

        if (!all_numeric(args)) return n.name + "(" + join_values(args) + ")";

        std::vector<double> xs;
        xs.reserve(args.size());
        for (const auto& a : args) xs.push_back(std::get<double>(a));

        try {
            return b->fn(xs);
        } catch (const std::domain_error& e) {
            throw EvalError("domain error", n.name, e.what());
        }
    }

private:
    Value call_closure(const FunctionCall& n, const Closure& fn) {
        if (fn.params.size() != n.args.size()) throw EvalError("invalid arity", n.name);

        // Arguments are evaluated in the caller's scope, left to right.
        std::vector<Value> args;
        args.reserve(n.args.size());
        for (const auto& a : n.args) args.push_back(eval(*a));
        if (!all_numeric(args)) return n.name + "(" + join_values(args) + ")";

        Scope local = scope_;
        for (std::size_t i = 0; i < fn.params.size(); ++i) local[fn.params[i]] = std::get<double>(args[i]);
        return Evaluator(local).eval(*fn.body);
    }

    Scope& scope_;
};

} // namespace

Value evaluate_ast(const Node& node, Scope& scope) {
    return Evaluator(scope).eval(node);
}

} // namespace mathexpr
