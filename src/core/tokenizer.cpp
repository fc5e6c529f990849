#include "core/tokenizer.hpp"

#include <cctype>
#include <optional>
#include <utility>

namespace lxterm {

std::expected<std::vector<Token>, ParseError> Tokenizer::tokenize(std::string_view input) const {
    std::vector<Token> tokens;
    std::string word;

    // A word exists once any character or quote pair has been seen, so `""` yields an empty word.
    bool in_word = false;
    std::size_t word_column = 0;

    std::optional<char> open_quote;
    std::size_t quote_column = 0;

    auto flush_word = [&]() {
        if (in_word) {
            tokens.push_back(Token{.kind = TokenKind::Word, .text = std::move(word), .column = word_column});
            word.clear();
            in_word = false;
        }
    };

    auto start_word = [&](std::size_t column) {
        if (!in_word) {
            in_word = true;
            word_column = column;
        }
    };

    for (std::size_t i = 0; i < input.size(); ++i) {
        const char current = input[i];

        if (open_quote.has_value()) {
            if (current == *open_quote) {
                open_quote.reset();
            } else {
                word.push_back(current);
            }
            continue;
        }

        if (current == '\'' || current == '"') {
            start_word(i);
            open_quote = current;
            quote_column = i;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(current))) {
            flush_word();
            continue;
        }

        if (current == '|') {
            flush_word();
            tokens.push_back(Token{.kind = TokenKind::Pipe, .text = "|", .column = i});
            continue;
        }

        if (current == '>') {
            flush_word();
            if (i + 1 < input.size() && input[i + 1] == '>') {
                tokens.push_back(Token{.kind = TokenKind::RedirectAppend, .text = ">>", .column = i});
                ++i;
            } else {
                tokens.push_back(Token{.kind = TokenKind::RedirectTruncate, .text = ">", .column = i});
            }
            continue;
        }

        start_word(i);
        word.push_back(current);
    }

    if (open_quote.has_value()) {
        return std::unexpected(ParseError{
            .message = std::string("unterminated quote `") + *open_quote + "'",
            .column = quote_column,
        });
    }

    flush_word();
    return tokens;
}

} // namespace lxterm
