#include "line_editing/completion.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include <readline/readline.h>

#include "builtins/command_registry.hpp"
#include "core/alias_resolver.hpp"
#include "core/executable_search.hpp"

namespace lxterm {

CompletionEngine *CompletionEngine::instance_ = nullptr;

namespace {

constexpr std::string_view blanks = " \t";

} // namespace

CompletionEngine::CompletionEngine(
    const CommandRegistry &registry, const AliasResolver &aliases, const ExecutableSearch &search)
    : registry_(registry), aliases_(aliases), search_(search) {}

void CompletionEngine::install() {
    instance_ = this;
    rl_attempted_completion_function = &CompletionEngine::completion_callback;
}

char **CompletionEngine::completion_callback(const char *text, int start, int /*end*/) {
    if (instance_ == nullptr) {
        return nullptr;
    }

    const std::string_view line = rl_line_buffer != nullptr ? std::string_view(rl_line_buffer) : std::string_view();
    instance_->kind_ = instance_->classify(line, static_cast<std::size_t>(std::max(start, 0)));

    // Plain arguments fall back to readline's filename completion.
    if (instance_->kind_ == WordKind::Argument) {
        return nullptr;
    }

    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, &CompletionEngine::generator_callback);
}

char *CompletionEngine::generator_callback(const char *text, int state) {
    static std::set<std::string> matches;
    static std::set<std::string>::iterator iterator;

    if (instance_ == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        matches = instance_->collect_matches(text, instance_->kind_);
        iterator = matches.begin();
    }

    if (iterator == matches.end()) {
        return nullptr;
    }

    return ::strdup((iterator++)->c_str());
}

WordKind CompletionEngine::classify(std::string_view line, std::size_t start) const {
    std::string_view before = line.substr(0, std::min(start, line.size()));

    // Only the current pipeline stage matters.
    if (const auto bar = before.find_last_of('|'); bar != std::string_view::npos) {
        before.remove_prefix(bar + 1);
    }

    const auto first = before.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return WordKind::Command;
    }
    before.remove_prefix(first);

    const auto word_end = before.find_first_of(blanks);
    if (word_end == std::string_view::npos) {
        // The cursor word is glued to the command word, as in "echo>o".
        return WordKind::Argument;
    }

    std::string command(before.substr(0, word_end));
    if (auto resolved = aliases_.resolve(command); resolved.has_value()) {
        command = resolved->name;
    }

    if (command == "which" || command == "help") {
        return WordKind::CommandName;
    }
    if (command == "unalias") {
        return WordKind::AliasName;
    }
    return WordKind::Argument;
}

std::set<std::string> CompletionEngine::collect_matches(const std::string &prefix, WordKind kind) const {
    std::set<std::string> matches;

    if (kind == WordKind::AliasName) {
        // Only user aliases can be removed.
        for (const auto &[trigger, _] : aliases_.entries()) {
            if (trigger.starts_with(prefix) && aliases_.is_user_defined(trigger)) {
                matches.insert(trigger);
            }
        }
        return matches;
    }

    if (kind == WordKind::Argument) {
        return matches;
    }

    matches = search_.candidates(prefix);

    for (const auto &name : registry_.names()) {
        if (name.starts_with(prefix)) {
            matches.insert(name);
        }
    }

    for (const auto &[trigger, _] : aliases_.entries()) {
        if (trigger.starts_with(prefix)) {
            matches.insert(trigger);
        }
    }

    return matches;
}

} // namespace lxterm
