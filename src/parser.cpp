#include "mathexpr/parser.hpp"
#include "mathexpr/builtins.hpp"
#include "mathexpr/lexer.hpp"
#include "mathexpr/token.hpp"
#include <algorithm>
#include <vector>

namespace mathexpr {

namespace {

const char* kind_name(TokKind k) {
    switch (k) {
        case TokKind::Number:     return "number";
        case TokKind::Identifier: return "identifier";
        case TokKind::Operator:   return "operator";
        case TokKind::ParenOpen:  return "'('";
        case TokKind::ParenClose: return "')'";
        case TokKind::Comma:      return "','";
    }
    return "token";
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : toks_(std::move(tokens)) {}

    NodePtr parse() {
        if (toks_.empty()) throw ParseError("Cannot parse an empty expression", "expression", 0);
        NodePtr node = parse_batch();
        if (!at_end()) {
            const Token& t = toks_[pos_];
            throw ParseError("Unexpected token '" + t.text + "' at position " + std::to_string(t.position) +
                                 " after parsing completed",
                             "end of input", t.position);
        }
        return node;
    }

private:
    bool at_end() const { return pos_ >= toks_.size(); }
    const Token* peek() const { return at_end() ? nullptr : &toks_[pos_]; }

    bool match(TokKind k) const { return !at_end() && toks_[pos_].kind == k; }
    bool match_op(char c) const { return !at_end() && toks_[pos_].is_op(c); }

    // Offset just past the last consumed token.
    std::size_t end_position() const {
        if (pos_ == 0) return 0;
        const Token& t = toks_[pos_ - 1];
        return t.position + t.text.size();
    }

    [[noreturn]] void fail(const std::string& expected) const {
        if (at_end()) {
            std::size_t p = end_position();
            throw ParseError("Unexpected end of input at position " + std::to_string(p) + ", expected " + expected,
                             expected, p);
        }
        const Token& t = toks_[pos_];
        throw ParseError("Unexpected " + std::string(kind_name(t.kind)) + " '" + t.text + "' at position " +
                             std::to_string(t.position) + ", expected " + expected,
                         expected, t.position);
    }

    const Token& consume(TokKind k, const char* expected) {
        if (!match(k)) fail(expected);
        return toks_[pos_++];
    }

    NodePtr parse_batch() {
        std::vector<NodePtr> exprs;
        exprs.push_back(parse_assignment());
        while (match_op(';')) {
            ++pos_;
            exprs.push_back(parse_assignment());
        }
        if (exprs.size() == 1) return std::move(exprs.front());
        return make_node(Batch{std::move(exprs)});
    }

    NodePtr parse_assignment() {
        NodePtr lhs = parse_additive();
        if (!match_op('=')) return lhs;

        const std::size_t eq_pos = toks_[pos_].position;

        if (lhs->is<Variable>()) {
            ++pos_;
            NodePtr value = parse_assignment();
            return make_node(Assignment{lhs->as<Variable>().name, std::move(value)});
        }

        if (lhs->is<FunctionCall>()) {
            const auto& sig = lhs->as<FunctionCall>();
            std::vector<std::string> params;
            params.reserve(sig.args.size());
            for (const auto& a : sig.args) {
                if (!a->is<Variable>()) {
                    throw ParseError("Parameters of '" + sig.name + "' must be plain names (at position " +
                                         std::to_string(eq_pos) + ")",
                                     "parameter name", eq_pos);
                }
                const std::string& p = a->as<Variable>().name;
                const bool repeated = std::any_of(params.begin(), params.end(),
                                                  [&](const std::string& q) { return fold_case(q) == fold_case(p); });
                if (repeated) {
                    throw ParseError("Duplicate parameter '" + p + "' in definition of '" + sig.name + "'",
                                     "distinct parameter names", eq_pos);
                }
                params.push_back(p);
            }
            ++pos_;
            NodePtr body = parse_assignment();
            return make_node(FunctionDef{sig.name, std::move(params), std::move(body)});
        }

        throw ParseError("Invalid assignment target before '=' at position " + std::to_string(eq_pos),
                         "variable or function signature", eq_pos);
    }

    NodePtr parse_additive() {
        NodePtr node = parse_term();
        while (match_op('+') || match_op('-')) {
            BinOp op = toks_[pos_++].text[0] == '+' ? BinOp::Add : BinOp::Subtract;
            NodePtr right = parse_term();
            node = binary(op, std::move(node), std::move(right));
        }
        return node;
    }

    NodePtr parse_term() {
        NodePtr node = parse_power();
        while (match_op('*') || match_op('/')) {
            BinOp op = toks_[pos_++].text[0] == '*' ? BinOp::Multiply : BinOp::Divide;
            NodePtr right = parse_power();
            node = binary(op, std::move(node), std::move(right));
        }
        return node;
    }

    NodePtr parse_power() {
        NodePtr base = parse_unary();
        if (!match_op('^')) return base;
        ++pos_;
        NodePtr exponent = parse_power(); // right-associative
        return binary(BinOp::Exponent, std::move(base), std::move(exponent));
    }

    NodePtr parse_unary() {
        if (match_op('-')) {
            ++pos_;
            return negate(parse_unary());
        }
        if (match_op('+')) {
            ++pos_;
            return parse_unary();
        }
        return parse_primary();
    }

    NodePtr parse_primary() {
        const Token* t = peek();
        if (!t) fail("number, variable, or '('");

        if (t->kind == TokKind::Number) {
            ++pos_;
            return number(t->number);
        }

        if (t->kind == TokKind::Identifier) {
            std::string name = t->text;
            ++pos_;
            if (!match(TokKind::ParenOpen)) return variable(std::move(name));

            ++pos_; // '('
            std::vector<NodePtr> args;
            if (!match(TokKind::ParenClose)) {
                args.push_back(parse_additive());
                while (match(TokKind::Comma)) {
                    ++pos_;
                    args.push_back(parse_additive());
                }
            }
            consume(TokKind::ParenClose, "')' or ','");
            return call(std::move(name), std::move(args));
        }

        if (t->kind == TokKind::ParenOpen) {
            ++pos_;
            NodePtr inner = parse_additive();
            consume(TokKind::ParenClose, "')'");
            return inner;
        }

        fail("number, variable, or '('");
    }

    std::vector<Token> toks_;
    std::size_t pos_{0};
};

} // namespace

NodePtr parse_expression(std::string_view input) {
    Parser p(tokenize(input));
    return p.parse();
}

} // namespace mathexpr
