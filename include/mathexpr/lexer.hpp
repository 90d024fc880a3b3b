#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "mathexpr/token.hpp"

namespace mathexpr {

struct LexError : std::runtime_error {
    LexError(const std::string& message, std::string text, std::size_t position)
        : std::runtime_error(message), text_(std::move(text)), position_(position) {}

    const std::string& text() const noexcept { return text_; }
    std::size_t position() const noexcept { return position_; }

private:
    std::string text_;
    std::size_t position_;
};

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    // Returns an empty optional once the input is exhausted.
    std::optional<Token> next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    Token lex_number();
    Token lex_identifier();

    std::string_view s_;
    std::size_t i_{0};
};

/// Split an expression into tokens, left to right.
/// Throws LexError on an unknown character or a malformed number.
std::vector<Token> tokenize(std::string_view input);

} // namespace mathexpr
