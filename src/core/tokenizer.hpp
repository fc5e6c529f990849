#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace lxterm {

enum class TokenKind {
    Word,
    Pipe,
    RedirectTruncate,
    RedirectAppend,
};

struct Token {
    TokenKind kind;
    std::string text;
    std::size_t column;
};

struct ParseError {
    std::string message;
    std::size_t column;
};

class Tokenizer {
  public:
    [[nodiscard]] std::expected<std::vector<Token>, ParseError> tokenize(std::string_view input) const;
};

} // namespace lxterm
