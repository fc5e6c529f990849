#pragma once

#include <expected>
#include <string>

#include "core/parser.hpp"
#include "execution/dispatcher.hpp"

namespace lxterm {

class CommandRegistry;
class PipelineExecutor;
struct ShellContext;

// One input line through parse, alias resolution, dispatch, execution and history.
class Interpreter {
  public:
    Interpreter(ShellContext &context, const CommandRegistry &registry, PipelineExecutor &executor);

    int execute(const std::string &line);

    [[nodiscard]] std::expected<PreparedPipeline, std::string> prepare(const std::string &line) const;

  private:
    ShellContext &context_;
    PipelineExecutor &executor_;
    Parser parser_;
    Dispatcher dispatcher_;
};

} // namespace lxterm
