#include "execution/host_shell.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <utility>

#include <unistd.h>

#include "core/executable_search.hpp"
#include "core/exit_codes.hpp"

namespace lxterm {

namespace {

[[nodiscard]] HostShellFlavor detect_flavor(const std::string &path) {
    const auto separator = path.find_last_of("/\\");
    std::string name = separator == std::string::npos ? path : path.substr(separator + 1);
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return name == "cmd" || name == "cmd.exe" ? HostShellFlavor::Cmd : HostShellFlavor::Posix;
}

[[nodiscard]] std::optional<std::string> resolve_shell(const std::string &path) {
    if (path.find('/') != std::string::npos) {
        return path;
    }

    return ExecutableSearch{}.find(path);
}

[[nodiscard]] bool is_plain_word(std::string_view arg, std::string_view extra_safe) {
    return !arg.empty() && std::ranges::all_of(arg, [&](unsigned char c) {
        return std::isalnum(c) || extra_safe.find(static_cast<char>(c)) != std::string_view::npos;
    });
}

} // namespace

std::string quote_posix_argument(std::string_view arg) {
    if (is_plain_word(arg, "-_./:=@%+,")) {
        return std::string(arg);
    }

    std::string quoted = "'";
    for (const char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string quote_cmd_argument(std::string_view arg) {
    if (is_plain_word(arg, "-_./:\\=@%+,")) {
        return std::string(arg);
    }

    std::string quoted = "\"";
    for (const char c : arg) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('"');
    return quoted;
}

HostShell::HostShell(std::string path)
    : path_(std::move(path)), resolved_path_(resolve_shell(path_)), flavor_(detect_flavor(path_)) {}

bool HostShell::available() const { return resolved_path_.has_value() && ::access(resolved_path_->c_str(), X_OK) == 0; }

std::string HostShell::command_line(const std::string &name, const std::vector<std::string> &args) const {
    const auto quote = flavor_ == HostShellFlavor::Cmd ? &quote_cmd_argument : &quote_posix_argument;

    std::string line = quote(name);
    for (const auto &arg : args) {
        line.push_back(' ');
        line += quote(arg);
    }

    return line;
}

std::vector<std::string> HostShell::argv(const std::string &name, const std::vector<std::string> &args) const {
    if (flavor_ == HostShellFlavor::Cmd) {
        return {path_, "/d", "/s", "/c", command_line(name, args)};
    }

    return {path_, "-c", command_line(name, args)};
}

void HostShell::exec(const std::string &name, const std::vector<std::string> &args) const noexcept {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGPIPE, SIG_DFL);

    if (resolved_path_.has_value()) {
        const auto arguments = argv(name, args);

        std::vector<char *> raw;
        raw.reserve(arguments.size() + 1);
        for (const auto &argument : arguments) {
            raw.push_back(const_cast<char *>(argument.c_str()));
        }
        raw.push_back(nullptr);

        ::execv(resolved_path_->c_str(), raw.data());
    } else {
        errno = ENOENT;
    }

    const int error = errno;
    std::perror(path_.c_str());
    _exit(error == ENOENT ? exit_code::not_found : exit_code::cannot_start);
}

} // namespace lxterm
