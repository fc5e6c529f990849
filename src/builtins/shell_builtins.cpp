#include "builtins/shell_builtins.hpp"

#include <charconv>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string_view>
#include <system_error>
#include <utility>

#include "core/executable_search.hpp"
#include "core/shell_context.hpp"
#include "core/tokenizer.hpp"

namespace lxterm {

namespace fs = std::filesystem;

namespace {

template <typename Integer>
[[nodiscard]] std::optional<Integer> parse_number(std::string_view token) {
    Integer value{};
    const char *first = token.data();
    const char *last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }

    return value;
}

void print_alias(std::ostream &out, const std::string &trigger, const AliasExpansion &expansion) {
    out << "alias " << trigger << "='" << format_expansion(expansion) << "'\n";
}

} // namespace

ShellBuiltins::ShellBuiltins(ShellContext &context, const CommandRegistry &registry, const ExecutableSearch &search)
    : context_(context), registry_(registry), search_(search) {}

void ShellBuiltins::install(CommandRegistry &registry) {
    auto bind = [this](int (ShellBuiltins::*member)(const std::vector<std::string> &, CommandIo &)) {
        return [this, member](const std::vector<std::string> &args, CommandIo &io) { return (this->*member)(args, io); };
    };

    registry.register_command("chdir", {.handler = bind(&ShellBuiltins::builtin_chdir),
                                        .summary = "chdir [DIR|-|~] - change the working directory",
                                        .path_arguments = {.positional = true, .first_positional = 0, .flags = {}},
                                        .runs_in_interpreter = true});
    registry.register_command("cwd", {.handler = bind(&ShellBuiltins::builtin_cwd),
                                      .summary = "cwd - print the working directory",
                                      .path_arguments = {},
                                      .runs_in_interpreter = false});
    registry.register_command("alias", {.handler = bind(&ShellBuiltins::builtin_alias),
                                        .summary = "alias [NAME[=VALUE]...] - define or show aliases",
                                        .path_arguments = {},
                                        .runs_in_interpreter = true});
    registry.register_command("unalias", {.handler = bind(&ShellBuiltins::builtin_unalias),
                                          .summary = "unalias NAME... - remove user aliases",
                                          .path_arguments = {},
                                          .runs_in_interpreter = true});
    registry.register_command("history", {.handler = bind(&ShellBuiltins::builtin_history),
                                          .summary = "history [N] - show the last N commands",
                                          .path_arguments = {},
                                          .runs_in_interpreter = false});
    registry.register_command("which", {.handler = bind(&ShellBuiltins::builtin_which),
                                        .summary = "which NAME... - show how a command name resolves",
                                        .path_arguments = {},
                                        .runs_in_interpreter = false});
    registry.register_command("help", {.handler = bind(&ShellBuiltins::builtin_help),
                                       .summary = "help [COMMAND] - describe the available commands",
                                       .path_arguments = {},
                                       .runs_in_interpreter = false});
    registry.register_command("exit", {.handler = bind(&ShellBuiltins::builtin_exit),
                                       .summary = "exit [N] - leave the terminal",
                                       .path_arguments = {},
                                       .runs_in_interpreter = true});
}

int ShellBuiltins::builtin_chdir(const std::vector<std::string> &args, CommandIo &io) {
    fs::path target;
    bool announce = false;

    if (args.empty() || args.front() == "~") {
        if (context_.config.home_directory.empty()) {
            io.err << "chdir: HOME not set" << std::endl;
            return 1;
        }
        target = context_.config.home_directory;
    } else if (args.front() == "-") {
        if (context_.previous_directory.empty()) {
            io.err << "chdir: OLDPWD not set" << std::endl;
            return 1;
        }
        target = context_.previous_directory;
        announce = true;
    } else if (args.front().starts_with("~/") && !context_.config.home_directory.empty()) {
        target = fs::path(context_.config.home_directory) / args.front().substr(2);
    } else {
        target = args.front();
    }

    std::error_code ec;
    const fs::path current = fs::current_path(ec);

    fs::current_path(target, ec);
    if (ec) {
        io.err << "chdir: " << target.string() << ": No such file or directory" << std::endl;
        return 1;
    }

    context_.previous_directory = current.string();
    if (announce) {
        io.out << context_.paths.to_emulated_form(fs::current_path().string()) << std::endl;
    }

    return 0;
}

int ShellBuiltins::builtin_cwd(const std::vector<std::string> & /*args*/, CommandIo &io) {
    std::error_code ec;
    const fs::path current = fs::current_path(ec);
    if (ec) {
        io.err << "cwd: " << ec.message() << std::endl;
        return 1;
    }

    io.out << context_.paths.to_emulated_form(current.string()) << std::endl;
    return 0;
}

int ShellBuiltins::builtin_alias(const std::vector<std::string> &args, CommandIo &io) {
    if (args.empty()) {
        for (const auto &[trigger, expansion] : context_.aliases.entries()) {
            print_alias(io.out, trigger, expansion);
        }
        io.out.flush();
        return 0;
    }

    int status = 0;
    const Tokenizer tokenizer;

    for (const auto &arg : args) {
        const auto equals = arg.find('=');

        if (equals == std::string::npos) {
            if (const AliasExpansion *expansion = context_.aliases.lookup(arg); expansion != nullptr) {
                print_alias(io.out, arg, *expansion);
            } else {
                io.err << "alias: " << arg << ": not found" << std::endl;
                status = 1;
            }
            continue;
        }

        const std::string trigger = arg.substr(0, equals);
        if (trigger.empty()) {
            io.err << "alias: `" << arg << "': invalid alias name" << std::endl;
            status = 1;
            continue;
        }

        auto tokens = tokenizer.tokenize(std::string_view(arg).substr(equals + 1));
        if (!tokens.has_value()) {
            io.err << "alias: " << trigger << ": " << tokens.error().message << std::endl;
            status = 1;
            continue;
        }

        AliasExpansion expansion;
        bool valid = !tokens->empty();
        for (const auto &token : *tokens) {
            if (token.kind != TokenKind::Word) {
                valid = false;
                break;
            }

            if (expansion.name.empty()) {
                expansion.name = token.text;
            } else {
                expansion.args.push_back(token.text);
            }
        }

        if (!valid) {
            io.err << "alias: " << trigger << ": expansion must be a single command" << std::endl;
            status = 1;
            continue;
        }

        if (auto defined = context_.aliases.define(trigger, std::move(expansion)); !defined.has_value()) {
            io.err << "alias: " << defined.error().message << std::endl;
            status = 1;
        }
    }

    io.out.flush();
    return status;
}

int ShellBuiltins::builtin_unalias(const std::vector<std::string> &args, CommandIo &io) {
    if (args.empty()) {
        io.err << "unalias: usage: unalias NAME..." << std::endl;
        return 2;
    }

    int status = 0;
    for (const auto &name : args) {
        if (context_.aliases.remove(name)) {
            continue;
        }

        if (context_.aliases.lookup(name) != nullptr) {
            io.err << "unalias: " << name << ": built-in alias cannot be removed" << std::endl;
        } else {
            io.err << "unalias: " << name << ": not found" << std::endl;
        }
        status = 1;
    }

    return status;
}

int ShellBuiltins::builtin_history(const std::vector<std::string> &args, CommandIo &io) {
    std::size_t limit = context_.history.size();

    if (!args.empty()) {
        const auto parsed = parse_number<std::size_t>(args.front());
        if (!parsed.has_value()) {
            io.err << "history: " << args.front() << ": numeric argument required" << std::endl;
            return 1;
        }
        limit = *parsed;
    }

    context_.history.print(io.out, limit);
    io.out.flush();
    return 0;
}

int ShellBuiltins::builtin_which(const std::vector<std::string> &args, CommandIo &io) {
    if (args.empty()) {
        io.err << "which: missing argument" << std::endl;
        return 1;
    }

    int status = 0;
    for (const auto &name : args) {
        if (const AliasExpansion *expansion = context_.aliases.lookup(name); expansion != nullptr) {
            io.out << name << ": aliased to " << format_expansion(*expansion) << '\n';
        } else if (registry_.contains(name)) {
            io.out << name << ": shell builtin" << '\n';
        } else if (auto path = search_.find(name); path.has_value()) {
            io.out << context_.paths.to_emulated_form(*path) << '\n';
        } else {
            io.err << "which: no " << name << " in PATH" << std::endl;
            status = 1;
        }
    }

    io.out.flush();
    return status;
}

int ShellBuiltins::builtin_help(const std::vector<std::string> &args, CommandIo &io) {
    if (!args.empty()) {
        const auto resolved = context_.aliases.resolve(args.front());
        const std::string &name = resolved.has_value() ? resolved->name : args.front();

        const CommandEntry *entry = registry_.find(name);
        if (entry == nullptr) {
            io.err << "help: no help available for '" << args.front() << "'" << std::endl;
            return 1;
        }

        io.out << entry->summary << std::endl;
        return 0;
    }

    io.out << "Builtin commands (anything else runs in the host shell):\n";
    for (const auto &name : registry_.names()) {
        io.out << "  " << registry_.find(name)->summary << '\n';
    }

    io.out.flush();
    return 0;
}

int ShellBuiltins::builtin_exit(const std::vector<std::string> &args, CommandIo &io) {
    context_.exit_requested = true;

    if (args.empty()) {
        return context_.last_exit_code;
    }

    const auto code = parse_number<int>(args.front());
    if (!code.has_value()) {
        io.err << "exit: " << args.front() << ": numeric argument required" << std::endl;
        return 2;
    }

    return *code & 0xff;
}

} // namespace lxterm
