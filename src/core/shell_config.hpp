#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/alias_resolver.hpp"
#include "core/path_translator.hpp"

namespace lxterm {

struct ShellConfig {
    static constexpr std::size_t default_history_capacity = 1000;

    std::string host_shell{"/bin/sh"};
    // Drive letter of the Windows system root; empty on hosts without one.
    std::optional<char> system_drive;
    std::string home_directory;
    std::size_t history_capacity{default_history_capacity};

    std::map<std::string, AliasExpansion> aliases;
    std::vector<PathMappingRule> path_rules;

    // Read once at startup; nothing here is consulted again per command.
    [[nodiscard]] static ShellConfig from_environment();
};

[[nodiscard]] std::optional<char> parse_system_drive(const std::string &value);

} // namespace lxterm
