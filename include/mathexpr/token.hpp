#pragma once
#include <cstddef>
#include <string>

namespace mathexpr {

enum class TokKind {
    Number,
    Identifier,
    Operator,   // one of + - * / ^ = < > ! % ;
    ParenOpen,
    ParenClose,
    Comma,
};

struct Token {
    TokKind kind{TokKind::Number};
    std::string text{};      // source text of the token
    std::size_t position{0}; // offset of the first character in the input
    double number{0.0};      // Number only

    bool is_op(char c) const { return kind == TokKind::Operator && text.size() == 1 && text[0] == c; }
};

} // namespace mathexpr
