#pragma once

#include <iosfwd>
#include <string>

#include "app/interpreter.hpp"
#include "builtins/command_registry.hpp"
#include "builtins/shell_builtins.hpp"
#include "core/executable_search.hpp"
#include "core/shell_config.hpp"
#include "core/shell_context.hpp"
#include "execution/host_shell.hpp"
#include "execution/pipeline_executor.hpp"
#include "line_editing/completion.hpp"
#include "line_editing/history_navigator.hpp"
#include "line_editing/prompt_interrupt.hpp"

namespace lxterm {

class ShellApp {
  public:
    explicit ShellApp(ShellConfig config);

    int run_interactive();
    int run_batch(std::istream &input);
    int run_command(const std::string &line);

    [[nodiscard]] std::string prompt() const;

  private:
    ShellContext context_;
    ExecutableSearch search_;
    CommandRegistry registry_;
    ShellBuiltins shell_builtins_;
    HostShell host_shell_;
    PipelineExecutor executor_;
    Interpreter interpreter_;
    CompletionEngine completion_engine_;
    HistoryNavigator history_navigator_;
    PromptInterrupt prompt_interrupt_;
};

} // namespace lxterm
