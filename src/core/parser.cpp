#include "core/parser.hpp"

#include <string>
#include <utility>
#include <vector>

namespace lxterm {

namespace {

[[nodiscard]] bool is_redirection(TokenKind kind) {
    return kind == TokenKind::RedirectTruncate || kind == TokenKind::RedirectAppend;
}

[[nodiscard]] ParseError error_at(const Token &token, std::string message) {
    return ParseError{.message = std::move(message), .column = token.column};
}

} // namespace

std::expected<Pipeline, ParseError> Parser::parse(std::string_view line) const {
    auto tokens = tokenizer_.tokenize(line);
    if (!tokens.has_value()) {
        return std::unexpected(std::move(tokens.error()));
    }

    return parse(std::span<const Token>(tokens.value()));
}

std::expected<Pipeline, ParseError> Parser::parse(std::span<const Token> tokens) const {
    Pipeline pipeline;
    if (tokens.empty()) {
        return pipeline;
    }

    Stage current;
    bool has_command = false;
    bool redirected = false;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto &token = tokens[i];

        if (token.kind == TokenKind::Pipe) {
            if (!has_command) {
                return std::unexpected(error_at(token, "syntax error near unexpected token `|'"));
            }

            if (redirected) {
                return std::unexpected(error_at(token, "only the last command of a pipeline may redirect output"));
            }

            pipeline.stages.push_back(std::move(current));
            current = Stage{};
            has_command = false;
            continue;
        }

        if (is_redirection(token.kind)) {
            if (!has_command) {
                return std::unexpected(error_at(token, "redirection requires a command"));
            }

            if (redirected) {
                return std::unexpected(error_at(token, "output is already redirected"));
            }

            if (i + 1 >= tokens.size() || tokens[i + 1].kind != TokenKind::Word) {
                return std::unexpected(error_at(token, "redirection missing target file"));
            }

            current.redirection = OutputRedirection{
                .mode = token.kind == TokenKind::RedirectAppend ? RedirectionMode::Append : RedirectionMode::Truncate,
                .target = tokens[i + 1].text,
            };
            redirected = true;
            ++i;
            continue;
        }

        if (redirected) {
            return std::unexpected(error_at(token, "unexpected word after redirection target"));
        }

        if (!has_command) {
            current.name = token.text;
            has_command = true;
        } else {
            current.args.push_back(token.text);
        }
    }

    if (!has_command) {
        return std::unexpected(error_at(tokens.back(), "syntax error near unexpected token `|'"));
    }

    pipeline.stages.push_back(std::move(current));
    return pipeline;
}

} // namespace lxterm
