#include "mathexpr/lexer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mathexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_operator_char(char c) {
    switch (c) {
        case '+': case '-': case '*': case '/': case '^':
        case '=': case '<': case '>': case '!': case '%': case ';':
            return true;
        default:
            return false;
    }
}

void Lexer::skip_ws() {
    while (!is_end() && (s_[i_] == ' ' || s_[i_] == '\t' || s_[i_] == '\n')) ++i_;
}

Token Lexer::lex_number() {
    std::size_t start = i_;
    while (!is_end() && (is_digit(s_[i_]) || s_[i_] == '.')) ++i_;

    std::string text(s_.substr(start, i_ - start));
    if (std::count(text.begin(), text.end(), '.') > 1 || text == ".") {
        throw LexError("Invalid number format '" + text + "' at position " + std::to_string(start),
                       text, start);
    }

    Token t{TokKind::Number, text, start};
    t.number = std::strtod(t.text.c_str(), nullptr);
    return t;
}

Token Lexer::lex_identifier() {
    std::size_t start = i_++;
    while (!is_end() && is_ident_char(s_[i_])) ++i_;
    // 'i' is reserved for imaginary literals but lexes as a plain identifier for now
    return Token{TokKind::Identifier, std::string(s_.substr(start, i_ - start)), start};
}

std::optional<Token> Lexer::next() {
    skip_ws();
    if (is_end()) return std::nullopt;

    char c = s_[i_];
    std::size_t pos = i_;

    if (is_digit(c) || (c == '.' && i_ + 1 < s_.size() && is_digit(s_[i_ + 1]))) {
        return lex_number();
    }

    if (is_ident_start(c)) return lex_identifier();

    if (is_operator_char(c)) {
        ++i_;
        return Token{TokKind::Operator, std::string(1, c), pos};
    }

    switch (c) {
        case '(': ++i_; return Token{TokKind::ParenOpen, "(", pos};
        case ')': ++i_; return Token{TokKind::ParenClose, ")", pos};
        case ',': ++i_; return Token{TokKind::Comma, ",", pos};
        default: break;
    }

    throw LexError(std::string("Unknown character '") + c + "' at position " + std::to_string(pos),
                   std::string(1, c), pos);
}

std::vector<Token> tokenize(std::string_view input) {
    Lexer lex(input);
    std::vector<Token> tokens;
    while (auto t = lex.next()) tokens.push_back(std::move(*t));
    return tokens;
}

} // namespace mathexpr
