#pragma once

#include <string>
#include <vector>

#include "builtins/command_registry.hpp"

namespace lxterm {

class ExecutableSearch;
struct ShellContext;

// Commands that read or change interpreter state: chdir, cwd, alias, unalias,
// history, which, help and exit.
class ShellBuiltins {
  public:
    ShellBuiltins(ShellContext &context, const CommandRegistry &registry, const ExecutableSearch &search);

    void install(CommandRegistry &registry);

  private:
    ShellContext &context_;
    const CommandRegistry &registry_;
    const ExecutableSearch &search_;

    int builtin_chdir(const std::vector<std::string> &args, CommandIo &io);
    int builtin_cwd(const std::vector<std::string> &args, CommandIo &io);
    int builtin_alias(const std::vector<std::string> &args, CommandIo &io);
    int builtin_unalias(const std::vector<std::string> &args, CommandIo &io);
    int builtin_history(const std::vector<std::string> &args, CommandIo &io);
    int builtin_which(const std::vector<std::string> &args, CommandIo &io);
    int builtin_help(const std::vector<std::string> &args, CommandIo &io);
    int builtin_exit(const std::vector<std::string> &args, CommandIo &io);
};

} // namespace lxterm
