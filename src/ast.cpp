#include "mathexpr/ast.hpp"
#include <cmath>

namespace mathexpr {

NodePtr number(double value) { return make_node(NumberLit{value}); }
NodePtr variable(std::string name) { return make_node(Variable{std::move(name)}); }
NodePtr binary(BinOp op, NodePtr left, NodePtr right) {
    return make_node(BinaryOp{op, std::move(left), std::move(right)});
}
NodePtr negate(NodePtr operand) { return make_node(UnaryMinus{std::move(operand)}); }
NodePtr call(std::string name, std::vector<NodePtr> args) {
    return make_node(FunctionCall{std::move(name), std::move(args)});
}

const char* op_symbol(BinOp op) {
    switch (op) {
        case BinOp::Add:      return "+";
        case BinOp::Subtract: return "-";
        case BinOp::Multiply: return "*";
        case BinOp::Divide:   return "/";
        case BinOp::Exponent: return "^";
    }
    return "?";
}

static bool same_number(double a, double b) {
    return a == b || (std::isnan(a) && std::isnan(b));
}

static bool equal_ptr(const NodePtr& a, const NodePtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return equal(*a, *b);
}

static bool equal_list(const std::vector<NodePtr>& a, const std::vector<NodePtr>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (!equal_ptr(a[i], b[i])) return false;
    return true;
}

namespace {

struct EqualVisitor {
    const Node::Variant& other;

    bool operator()(const NumberLit& n) const {
        return same_number(n.value, std::get<NumberLit>(other).value);
    }
    bool operator()(const ComplexLit& n) const {
        const auto& o = std::get<ComplexLit>(other);
        return same_number(n.re, o.re) && same_number(n.im, o.im);
    }
    bool operator()(const Variable& n) const {
        return n.name == std::get<Variable>(other).name;
    }
    bool operator()(const Assignment& n) const {
        const auto& o = std::get<Assignment>(other);
        return n.name == o.name && equal_ptr(n.value, o.value);
    }
    bool operator()(const FunctionDef& n) const {
        const auto& o = std::get<FunctionDef>(other);
        return n.name == o.name && n.params == o.params && equal_ptr(n.body, o.body);
    }
    bool operator()(const Batch& n) const {
        return equal_list(n.expressions, std::get<Batch>(other).expressions);
    }
    bool operator()(const BinaryOp& n) const {
        const auto& o = std::get<BinaryOp>(other);
        return n.op == o.op && equal_ptr(n.left, o.left) && equal_ptr(n.right, o.right);
    }
    bool operator()(const FunctionCall& n) const {
        const auto& o = std::get<FunctionCall>(other);
        return n.name == o.name && equal_list(n.args, o.args);
    }
    bool operator()(const UnaryMinus& n) const {
        return equal_ptr(n.operand, std::get<UnaryMinus>(other).operand);
    }
};

} // namespace

bool equal(const Node& a, const Node& b) {
    if (a.v.index() != b.v.index()) return false;
    return std::visit(EqualVisitor{b.v}, a.v);
}

} // namespace mathexpr
