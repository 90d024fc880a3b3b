#include "mathexpr/format.hpp"
#include <cmath>
#include <cstdio>
#include <vector>

namespace mathexpr {

// The lexer has no exponent syntax, so values outside the %g plain range are
// written out in full with %f and trailing zeros trimmed.
static std::string format_fixed(double x, int decimals) {
    const int len = std::snprintf(nullptr, 0, "%.*f", decimals, x);
    std::vector<char> buf(static_cast<std::size_t>(len) + 1);
    std::snprintf(buf.data(), buf.size(), "%.*f", decimals, x);

    std::string s(buf.data(), static_cast<std::size_t>(len));
    if (s.find('.') != std::string::npos) {
        s.erase(s.find_last_not_of('0') + 1);
        if (s.back() == '.') s.pop_back();
    }
    return s;
}

std::string format_number(double x) {
    // Non-finite values print as expressions that evaluate back to them.
    if (std::isnan(x)) return "0 / 0";
    if (std::isinf(x)) return x < 0 ? "-1 / 0" : "1 / 0";
    if (x == 0) return "0"; // also folds -0

    const double mag = std::abs(x);
    if (mag >= 1e15) return format_fixed(x, 0);
    if (mag < 1e-4) {
        // 15 significant digits after the leading zeros
        const int lead = -static_cast<int>(std::floor(std::log10(mag)));
        return format_fixed(x, lead + 14);
    }

    char buf[32];
    std::snprintf(buf, sizeof buf, "%.15g", x);
    std::string s = buf;
    // rounding up to 15 digits can still tip %g into exponent form near 1e15
    if (s.find('e') != std::string::npos) return format_fixed(x, 0);
    return s;
}

namespace {

// Binding strength of a node when it appears as an operand.
// Unary minus binds tighter than '^' in this grammar.
enum Prec : int { kStatement = 0, kAdditive = 1, kTerm = 2, kPower = 3, kUnary = 4, kAtom = 5 };

int op_prec(BinOp op) {
    switch (op) {
        case BinOp::Add:
        case BinOp::Subtract: return kAdditive;
        case BinOp::Multiply:
        case BinOp::Divide:   return kTerm;
        case BinOp::Exponent: return kPower;
    }
    return kAtom;
}

int prec(const Node& n) {
    if (n.is<BinaryOp>()) return op_prec(n.as<BinaryOp>().op);
    if (n.is<UnaryMinus>()) return kUnary;
    if (n.is<Assignment>() || n.is<FunctionDef>() || n.is<Batch>()) return kStatement;
    if (n.is<NumberLit>()) {
        const double x = n.as<NumberLit>().value;
        if (!std::isfinite(x)) return kTerm; // printed as a division
        if (std::signbit(x) && x != 0) return kUnary;
    }
    return kAtom;
}

std::string wrap(const Node& n, bool parens) {
    std::string s = to_string(n);
    return parens ? "(" + s + ")" : s;
}

std::string join(const std::vector<NodePtr>& xs, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < xs.size(); ++i) {
        if (i) out += sep;
        out += to_string(*xs[i]);
    }
    return out;
}

struct Printer {
    std::string operator()(const NumberLit& n) const { return format_number(n.value); }

    std::string operator()(const ComplexLit& n) const {
        return format_number(n.re) + (n.im >= 0 ? "+" : "") + format_number(n.im) + "i";
    }

    std::string operator()(const Variable& n) const { return n.name; }

    std::string operator()(const Assignment& n) const { return n.name + " = " + to_string(*n.value); }

    std::string operator()(const FunctionDef& n) const {
        std::string params;
        for (std::size_t i = 0; i < n.params.size(); ++i) {
            if (i) params += ", ";
            params += n.params[i];
        }
        return n.name + "(" + params + ") = " + to_string(*n.body);
    }

    std::string operator()(const Batch& n) const { return join(n.expressions, "; "); }

    std::string operator()(const BinaryOp& n) const {
        const int p = op_prec(n.op);
        const bool right_assoc = n.op == BinOp::Exponent;
        const int lp = prec(*n.left);
        const int rp = prec(*n.right);

        // A negative literal re-parses as unary minus, which binds before '^'.
        const bool left_parens = lp < p || (lp == p && right_assoc);
        const bool right_parens = rp < p || (rp == p && !right_assoc);

        return wrap(*n.left, left_parens) + " " + op_symbol(n.op) + " " + wrap(*n.right, right_parens);
    }

    std::string operator()(const FunctionCall& n) const { return n.name + "(" + join(n.args, ", ") + ")"; }

    std::string operator()(const UnaryMinus& n) const {
        return "-" + wrap(*n.operand, prec(*n.operand) < kUnary);
    }
};

} // namespace

std::string to_string(const Node& node) {
    return std::visit(Printer{}, node.v);
}

} // namespace mathexpr
