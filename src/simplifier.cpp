#include "mathexpr/simplifier.hpp"
#include "mathexpr/evaluator.hpp"

namespace mathexpr {

namespace {

bool is_number(const NodePtr& n, double v) {
    return n->is<NumberLit>() && n->as<NumberLit>().value == v;
}

bool is_nonzero_number(const NodePtr& n) {
    return n->is<NumberLit>() && n->as<NumberLit>().value != 0;
}

NodePtr simplify_binary(BinOp op, const NodePtr& left, const NodePtr& right) {
    switch (op) {
        case BinOp::Add:
            if (is_number(left, 0)) return right;
            if (is_number(right, 0)) return left;
            break;
        case BinOp::Subtract:
            if (is_number(right, 0)) return left;
            break;
        case BinOp::Multiply:
            if (is_number(left, 1)) return right;
            if (is_number(right, 1)) return left;
            if (is_number(left, 0) || is_number(right, 0)) return number(0);
            break;
        case BinOp::Divide:
            if (is_number(right, 1)) return left;
            if (is_number(left, 0) && is_nonzero_number(right)) return number(0);
            break;
        case BinOp::Exponent:
            if (is_number(right, 1)) return left;
            if (is_number(left, 1)) return number(1);
            if (is_number(right, 0)) return number(1);
            break;
    }
    return nullptr;
}

bool same_list(const std::vector<NodePtr>& a, const std::vector<NodePtr>& b) {
    for (std::size_t i = 0; i < a.size(); ++i)
        if (a[i] != b[i]) return false;
    return true;
}

std::vector<NodePtr> simplify_list(const std::vector<NodePtr>& xs) {
    std::vector<NodePtr> out;
    out.reserve(xs.size());
    for (const auto& x : xs) out.push_back(simplify_ast(x));
    return out;
}

// Each handler gets the original node so it can be returned untouched when
// none of its children changed.
struct Simplifier {
    const NodePtr& self;

    NodePtr operator()(const NumberLit&) const { return self; }
    NodePtr operator()(const ComplexLit&) const { return self; }
    NodePtr operator()(const Variable&) const { return self; }

    NodePtr operator()(const UnaryMinus& n) const {
        NodePtr inner = simplify_ast(n.operand);
        if (inner->is<NumberLit>()) return number(-inner->as<NumberLit>().value);
        if (inner->is<UnaryMinus>()) return inner->as<UnaryMinus>().operand;
        if (inner == n.operand) return self;
        return negate(std::move(inner));
    }

    NodePtr operator()(const BinaryOp& n) const {
        NodePtr l = simplify_ast(n.left);
        NodePtr r = simplify_ast(n.right);

        if (l->is<NumberLit>() && r->is<NumberLit>())
            return number(apply_binary(n.op, l->as<NumberLit>().value, r->as<NumberLit>().value));

        if (NodePtr reduced = simplify_binary(n.op, l, r)) return reduced;

        if (l == n.left && r == n.right) return self;
        return binary(n.op, std::move(l), std::move(r));
    }

    NodePtr operator()(const FunctionCall& n) const {
        std::vector<NodePtr> args = simplify_list(n.args);
        if (same_list(args, n.args)) return self;
        return call(n.name, std::move(args));
    }

    NodePtr operator()(const Assignment& n) const {
        NodePtr v = simplify_ast(n.value);
        if (v == n.value) return self;
        return make_node(Assignment{n.name, std::move(v)});
    }

    NodePtr operator()(const FunctionDef& n) const {
        NodePtr body = simplify_ast(n.body);
        if (body == n.body) return self;
        return make_node(FunctionDef{n.name, n.params, std::move(body)});
    }

    NodePtr operator()(const Batch& n) const {
        std::vector<NodePtr> exprs = simplify_list(n.expressions);
        if (same_list(exprs, n.expressions)) return self;
        return make_node(Batch{std::move(exprs)});
    }
};

} // namespace

NodePtr simplify_ast(const NodePtr& node) {
    return std::visit(Simplifier{node}, node->v);
}

} // namespace mathexpr
