#pragma once
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mathexpr {

struct Node;

// Trees are immutable once built; rewrites share unchanged subtrees.
using NodePtr = std::shared_ptr<const Node>;

enum class BinOp { Add, Subtract, Multiply, Divide, Exponent };

struct NumberLit {
    double value{0.0};
};

// Not produced by the parser yet.
struct ComplexLit {
    double re{0.0};
    double im{0.0};
};

struct Variable {
    std::string name;
};

struct Assignment {
    std::string name;
    NodePtr value;
};

struct FunctionDef {
    std::string name;
    std::vector<std::string> params;
    NodePtr body;
};

struct Batch {
    std::vector<NodePtr> expressions;
};

struct BinaryOp {
    BinOp op{BinOp::Add};
    NodePtr left;
    NodePtr right;
};

struct FunctionCall {
    std::string name;
    std::vector<NodePtr> args; // call-site order
};

struct UnaryMinus {
    NodePtr operand;
};

struct Node {
    using Variant = std::variant<NumberLit, ComplexLit, Variable, Assignment, FunctionDef,
                                 Batch, BinaryOp, FunctionCall, UnaryMinus>;
    Variant v;

    template <class T>
    bool is() const { return std::holds_alternative<T>(v); }

    template <class T>
    const T& as() const { return std::get<T>(v); }
};

template <class T>
NodePtr make_node(T alt) {
    return std::make_shared<const Node>(Node{Node::Variant{std::move(alt)}});
}

NodePtr number(double value);
NodePtr variable(std::string name);
NodePtr binary(BinOp op, NodePtr left, NodePtr right);
NodePtr negate(NodePtr operand);
NodePtr call(std::string name, std::vector<NodePtr> args);

/// Deep structural equality. Two NaN literals compare equal.
bool equal(const Node& a, const Node& b);

const char* op_symbol(BinOp op);

} // namespace mathexpr
