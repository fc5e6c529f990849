#include "core/shell_config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <initializer_list>

namespace lxterm {

namespace {

[[nodiscard]] std::optional<std::string> env_value(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }

    return std::string(value);
}

[[nodiscard]] std::optional<std::string> first_env_value(std::initializer_list<const char *> names) {
    for (const char *name : names) {
        if (auto value = env_value(name); value.has_value()) {
            return value;
        }
    }

    return std::nullopt;
}

} // namespace

std::optional<char> parse_system_drive(const std::string &value) {
    if (value.empty() || !std::isalpha(static_cast<unsigned char>(value[0]))) {
        return std::nullopt;
    }

    if (value.size() > 1 && value[1] != ':') {
        return std::nullopt;
    }

    return static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
}

ShellConfig ShellConfig::from_environment() {
    ShellConfig config;

    if (auto shell = first_env_value({"LXTERM_HOST_SHELL", "COMSPEC"}); shell.has_value()) {
        config.host_shell = *shell;
    }

    if (auto drive = first_env_value({"LXTERM_SYSTEM_DRIVE", "SystemDrive"}); drive.has_value()) {
        config.system_drive = parse_system_drive(*drive);
    }

    if (auto home = first_env_value({"HOME", "USERPROFILE"}); home.has_value()) {
        config.home_directory = *home;
    }

    if (auto size = env_value("LXTERM_HISTSIZE"); size.has_value()) {
        std::size_t capacity = 0;
        const char *first = size->data();
        const char *last = size->data() + size->size();
        auto [ptr, ec] = std::from_chars(first, last, capacity);
        if (ec == std::errc{} && ptr == last && capacity > 0) {
            config.history_capacity = capacity;
        }
    }

    return config;
}

} // namespace lxterm
