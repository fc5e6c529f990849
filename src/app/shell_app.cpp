#include "app/shell_app.hpp"

#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <system_error>
#include <utility>

#include <readline/readline.h>
#include <unistd.h>

#include "builtins/file_builtins.hpp"

namespace lxterm {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] std::string env_or(std::initializer_list<const char *> names, const char *fallback) {
    for (const char *name : names) {
        if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
            return value;
        }
    }

    return fallback;
}

[[nodiscard]] std::string host_name() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return buffer;
    }

    return env_or({"COMPUTERNAME"}, "localhost");
}

} // namespace

ShellApp::ShellApp(ShellConfig config)
    : context_(std::move(config)),
      search_(),
      registry_(),
      shell_builtins_(context_, registry_, search_),
      host_shell_(context_.config.host_shell),
      executor_(host_shell_),
      interpreter_(context_, registry_, executor_),
      completion_engine_(registry_, context_.aliases, search_),
      history_navigator_(context_.history) {
    register_file_builtins(registry_);
    shell_builtins_.install(registry_);
}

std::string ShellApp::prompt() const {
    const std::string user = env_or({"USER", "USERNAME"}, "user");

    std::error_code ec;
    const fs::path current = fs::current_path(ec);
    std::string location = ec ? std::string("?") : context_.paths.to_emulated_form(current.string());

    if (!context_.config.home_directory.empty()) {
        const std::string home = context_.paths.to_emulated_form(context_.config.home_directory);
        if (location == home) {
            location = "~";
        } else if (location.starts_with(home + "/")) {
            location = "~" + location.substr(home.size());
        }
    }

    return user + "@" + host_name() + ":" + location + "$ ";
}

int ShellApp::run_interactive() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    prompt_interrupt_.install();
    completion_engine_.install();
    history_navigator_.install();

    while (!context_.exit_requested) {
        const std::string prompt_text = prompt();

        PromptInterrupt::discard_pending();
        char *line = readline(prompt_text.c_str());

        if (line == nullptr) {
            std::cout << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        context_.history.reset_cursor();
        interpreter_.execute(input);
    }

    return context_.last_exit_code;
}

int ShellApp::run_batch(std::istream &input) {
    std::string line;

    while (!context_.exit_requested && std::getline(input, line)) {
        interpreter_.execute(line);
    }

    return context_.last_exit_code;
}

int ShellApp::run_command(const std::string &line) { return interpreter_.execute(line); }

} // namespace lxterm
