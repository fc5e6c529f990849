#include "core/shell_context.hpp"

#include <iostream>
#include <utility>

namespace lxterm {

namespace {

[[nodiscard]] PathTranslator make_translator(const ShellConfig &config) {
    if (!config.system_drive.has_value()) {
        return PathTranslator{};
    }

    return PathTranslator(*config.system_drive, config.home_directory, config.path_rules);
}

} // namespace

ShellContext::ShellContext(ShellConfig shell_config)
    : config(std::move(shell_config)), history(config.history_capacity), paths(make_translator(config)) {
    for (const auto &[trigger, expansion] : config.aliases) {
        if (auto defined = aliases.define(trigger, expansion); !defined.has_value()) {
            std::cerr << "lxterm: ignoring alias: " << defined.error().message << std::endl;
        }
    }
}

} // namespace lxterm
