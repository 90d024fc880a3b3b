#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "mathexpr/ast.hpp"

namespace mathexpr {

struct ParseError : std::runtime_error {
    ParseError(const std::string& message, std::string expected, std::size_t position)
        : std::runtime_error(message), expected_(std::move(expected)), position_(position) {}

    // What the parser was looking for, e.g. "')'" or "number, variable, or '('".
    const std::string& expected() const noexcept { return expected_; }
    std::size_t position() const noexcept { return position_; }

private:
    std::string expected_;
    std::size_t position_;
};

// Grammar, loosest to tightest:
//   batch      := assignment (';' assignment)*
//   assignment := additive ('=' assignment)?
//   additive   := term (('+' | '-') term)*
//   term       := power (('*' | '/') power)*
//   power      := unary ('^' power)?
//   unary      := ('-' | '+') unary | primary
//   primary    := NUMBER | IDENT | IDENT '(' args? ')' | '(' additive ')'
//
// Unary binds before '^', so "-2^2" is (-2)^2.

/// Parse a whole input into one tree. A single expression is returned as-is;
/// two or more ';'-separated expressions come back wrapped in a Batch.
/// Throws LexError or ParseError; never returns a partial tree.
NodePtr parse_expression(std::string_view input);

} // namespace mathexpr
