#pragma once

#include <string>

#include "core/alias_resolver.hpp"
#include "core/exit_codes.hpp"
#include "core/path_translator.hpp"
#include "core/shell_config.hpp"
#include "history/history_manager.hpp"

namespace lxterm {

// Interpreter-wide state, handed to each component at construction.
struct ShellContext {
    explicit ShellContext(ShellConfig shell_config);

    ShellConfig config;
    AliasResolver aliases;
    HistoryManager history;
    PathTranslator paths;

    int last_exit_code{exit_code::success};
    bool exit_requested{false};
    std::string previous_directory;
};

} // namespace lxterm
