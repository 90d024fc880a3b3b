#include "mathexpr/variables.hpp"
#include "mathexpr/builtins.hpp"

#include <set>

namespace mathexpr {

namespace {

class Collector {
public:
    std::vector<std::string> found;

    void walk(const Node& n) { std::visit(*this, n.v); }

    void operator()(const NumberLit&) {}
    void operator()(const ComplexLit&) {}

    void operator()(const Variable& n) {
        const std::string key = fold_case(n.name);
        if (bound_.count(key) || find_constant(key)) return;
        if (seen_.insert(key).second) found.push_back(n.name);
    }

    void operator()(const Assignment& n) {
        walk(*n.value);
        bound_.insert(fold_case(n.name));
    }

    void operator()(const FunctionDef& n) {
        const std::set<std::string> saved = bound_;
        for (const auto& p : n.params) bound_.insert(fold_case(p));
        walk(*n.body);
        bound_ = saved;
    }

    void operator()(const Batch& n) {
        for (const auto& e : n.expressions) walk(*e);
    }

    void operator()(const BinaryOp& n) {
        walk(*n.left);
        walk(*n.right);
    }

    void operator()(const FunctionCall& n) {
        for (const auto& a : n.args) walk(*a);
    }

    void operator()(const UnaryMinus& n) { walk(*n.operand); }

private:
    std::set<std::string> bound_;
    std::set<std::string> seen_;
};

} // namespace

std::vector<std::string> detect_variables(const Node& node) {
    Collector c;
    c.walk(node);
    return std::move(c.found);
}

} // namespace mathexpr
