#pragma once

#include <expected>
#include <span>
#include <string_view>

#include "core/pipeline.hpp"
#include "core/tokenizer.hpp"

namespace lxterm {

class Parser {
  public:
    [[nodiscard]] std::expected<Pipeline, ParseError> parse(std::string_view line) const;
    [[nodiscard]] std::expected<Pipeline, ParseError> parse(std::span<const Token> tokens) const;

  private:
    Tokenizer tokenizer_;
};

} // namespace lxterm
