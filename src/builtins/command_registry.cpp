#include "builtins/command_registry.hpp"

#include <ostream>
#include <utility>

#include "core/exit_codes.hpp"

namespace lxterm {

void CommandRegistry::register_command(std::string name, CommandEntry entry) {
    entries_.insert_or_assign(std::move(name), std::move(entry));
}

const CommandEntry *CommandRegistry::find(std::string_view name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

bool CommandRegistry::contains(std::string_view name) const { return find(name) != nullptr; }

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());

    for (const auto &[name, _] : entries_) {
        result.push_back(name);
    }

    return result;
}

int CommandRegistry::execute(std::string_view name, const std::vector<std::string> &args, CommandIo &io) const {
    const CommandEntry *entry = find(name);
    if (entry == nullptr || !entry->handler) {
        io.err << name << ": command not found" << std::endl;
        return exit_code::not_found;
    }

    return entry->handler(args, io);
}

std::vector<bool> path_argument_mask(const PathArguments &declaration, const std::vector<std::string> &args) {
    std::vector<bool> mask(args.size(), false);
    bool options_ended = false;
    std::size_t positional_index = 0;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto &arg = args[i];

        if (!options_ended && arg == "--") {
            options_ended = true;
            continue;
        }

        if (!options_ended && arg.size() > 1 && arg.front() == '-') {
            for (const auto &flag : declaration.flags) {
                if (arg == flag && i + 1 < args.size()) {
                    mask[++i] = true;
                    break;
                }
            }
            continue;
        }

        if (declaration.positional && positional_index >= declaration.first_positional) {
            mask[i] = true;
        }
        ++positional_index;
    }

    return mask;
}

} // namespace lxterm
