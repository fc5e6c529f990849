#include <cassert>
#include <string>
#include <vector>

#include "core/parser.hpp"
#include "core/tokenizer.hpp"

using lxterm::Parser;
using lxterm::RedirectionMode;
using lxterm::TokenKind;
using lxterm::Tokenizer;

namespace {

std::vector<std::string> token_texts(const std::vector<lxterm::Token> &tokens) {
    std::vector<std::string> texts;
    for (const auto &token : tokens) {
        texts.push_back(token.text);
    }
    return texts;
}

void test_tokenizer_quotes_and_operators() {
    Tokenizer tokenizer;
    const auto tokens = tokenizer.tokenize(R"(list "my docs" | filter 'a b'>>log.txt)");

    assert(tokens.has_value());
    const std::vector<std::string> expected{"list", "my docs", "|", "filter", "a b", ">>", "log.txt"};
    assert(token_texts(*tokens) == expected);

    assert((*tokens)[0].kind == TokenKind::Word);
    assert((*tokens)[2].kind == TokenKind::Pipe);
    assert((*tokens)[5].kind == TokenKind::RedirectAppend);
    assert((*tokens)[2].column == 15);
}

void test_tokenizer_quoted_operators_are_words() {
    Tokenizer tokenizer;
    const auto tokens = tokenizer.tokenize(R"(echo "|" '>' ">>")");

    assert(tokens.has_value());
    assert(tokens->size() == 4);
    for (const auto &token : *tokens) {
        assert(token.kind == TokenKind::Word);
    }
    assert((*tokens)[1].text == "|");
    assert((*tokens)[2].text == ">");
    assert((*tokens)[3].text == ">>");
}

void test_tokenizer_joins_adjacent_spans_and_keeps_empty_quotes() {
    Tokenizer tokenizer;

    const auto joined = tokenizer.tokenize(R"(a"b c"d)");
    assert(joined.has_value());
    assert(joined->size() == 1);
    assert(joined->front().text == "ab cd");

    const auto empty = tokenizer.tokenize(R"(echo "" x)");
    assert(empty.has_value());
    assert(token_texts(*empty) == std::vector<std::string>({"echo", "", "x"}));
}

void test_tokenizer_keeps_backslashes_literal() {
    Tokenizer tokenizer;
    const auto tokens = tokenizer.tokenize(R"(concat C:\Users\me\notes.txt)");

    assert(tokens.has_value());
    assert((*tokens)[1].text == R"(C:\Users\me\notes.txt)");
}

void test_tokenizer_reports_unterminated_quote_position() {
    Tokenizer tokenizer;

    const auto single = tokenizer.tokenize("echo 'oops");
    assert(!single.has_value());
    assert(single.error().column == 5);

    const auto dbl = tokenizer.tokenize(R"(echo ok "x 'y' z)");
    assert(!dbl.has_value());
    assert(dbl.error().column == 8);
    assert(dbl.error().message.find("unterminated") != std::string::npos);
}

void test_parser_builds_two_stage_pipeline_with_truncate() {
    Parser parser;
    const auto parsed = parser.parse("list /home | filter txt > results.txt");

    assert(parsed.has_value());
    assert(parsed->stages.size() == 2);

    const auto &first = parsed->stages[0];
    assert(first.name == "list");
    assert(first.args == std::vector<std::string>({"/home"}));
    assert(first.redirection.mode == RedirectionMode::Terminal);

    const auto &second = parsed->stages[1];
    assert(second.name == "filter");
    assert(second.args == std::vector<std::string>({"txt"}));
    assert(second.redirection.mode == RedirectionMode::Truncate);
    assert(second.redirection.target == "results.txt");
    assert(parsed->output().is_file());
}

void test_parser_append_redirection() {
    Parser parser;
    const auto parsed = parser.parse("echo hi >> out.txt");

    assert(parsed.has_value());
    assert(parsed->stages.size() == 1);
    assert(parsed->output().mode == RedirectionMode::Append);
    assert(parsed->output().target == "out.txt");
}

void test_parser_empty_line_is_empty_pipeline() {
    Parser parser;

    const auto blank = parser.parse("   \t ");
    assert(blank.has_value());
    assert(blank->empty());
}

void test_parser_rejects_empty_stages() {
    Parser parser;

    const auto leading = parser.parse("| echo hi");
    assert(!leading.has_value());
    assert(leading.error().column == 0);

    const auto trailing = parser.parse("echo hi |");
    assert(!trailing.has_value());
    assert(trailing.error().column == 8);

    const auto doubled = parser.parse("echo hi || count");
    assert(!doubled.has_value());
    assert(doubled.error().column == 9);

    const auto bare_redirect = parser.parse("> out.txt");
    assert(!bare_redirect.has_value());
}

void test_parser_rejects_misplaced_redirections() {
    Parser parser;

    const auto missing_target = parser.parse("echo hi >");
    assert(!missing_target.has_value());
    assert(missing_target.error().message.find("missing target") != std::string::npos);

    const auto operator_target = parser.parse("echo hi > | count");
    assert(!operator_target.has_value());

    const auto before_pipe = parser.parse("echo hi > out.txt | count");
    assert(!before_pipe.has_value());
    assert(before_pipe.error().column == 18);

    const auto twice = parser.parse("echo hi > a.txt >> b.txt");
    assert(!twice.has_value());
    assert(twice.error().message.find("already redirected") != std::string::npos);

    const auto trailing_word = parser.parse("echo hi > a.txt extra");
    assert(!trailing_word.has_value());
}

void test_parser_forwards_tokenizer_errors() {
    Parser parser;
    const auto parsed = parser.parse("echo \"unterminated | count");

    assert(!parsed.has_value());
    assert(parsed.error().column == 5);
}

} // namespace

int main() {
    test_tokenizer_quotes_and_operators();
    test_tokenizer_quoted_operators_are_words();
    test_tokenizer_joins_adjacent_spans_and_keeps_empty_quotes();
    test_tokenizer_keeps_backslashes_literal();
    test_tokenizer_reports_unterminated_quote_position();
    test_parser_builds_two_stage_pipeline_with_truncate();
    test_parser_append_redirection();
    test_parser_empty_line_is_empty_pipeline();
    test_parser_rejects_empty_stages();
    test_parser_rejects_misplaced_redirections();
    test_parser_forwards_tokenizer_errors();

    return 0;
}
