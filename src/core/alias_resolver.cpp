#include "core/alias_resolver.hpp"

#include <set>

namespace lxterm {

AliasResolver::AliasResolver() { seed_defaults(); }

void AliasResolver::seed(std::string trigger, AliasExpansion expansion) {
    builtin_.insert_or_assign(std::move(trigger), std::move(expansion));
}

void AliasResolver::seed_defaults() {
    seed("ls", {.name = "list", .args = {}});
    seed("rm", {.name = "remove", .args = {}});
    seed("cat", {.name = "concat", .args = {}});
    seed("type", {.name = "concat", .args = {}});
    seed("grep", {.name = "filter", .args = {}});
    seed("wc", {.name = "count", .args = {}});
    seed("mkdir", {.name = "makedir", .args = {}});
    seed("md", {.name = "makedir", .args = {}});
    seed("del", {.name = "remove", .args = {}});
    seed("pwd", {.name = "cwd", .args = {}});
    seed("cd", {.name = "chdir", .args = {}});
    seed("quit", {.name = "exit", .args = {}});
    seed("man", {.name = "help", .args = {}});
    seed("ll", {.name = "list", .args = {"-la"}});
    seed("la", {.name = "list", .args = {"-a"}});
    seed("dir", {.name = "list", .args = {"-la"}});
    seed("..", {.name = "chdir", .args = {".."}});
    seed("...", {.name = "chdir", .args = {"../.."}});
}

std::expected<void, AliasCycleError> AliasResolver::define(std::string trigger, AliasExpansion expansion) {
    auto previous = user_.find(trigger);
    const bool had_previous = previous != user_.end();
    AliasExpansion saved = had_previous ? previous->second : AliasExpansion{};

    user_.insert_or_assign(trigger, std::move(expansion));

    if (auto resolved = resolve(trigger); !resolved.has_value()) {
        if (had_previous) {
            user_.insert_or_assign(trigger, std::move(saved));
        } else {
            user_.erase(trigger);
        }
        return std::unexpected(std::move(resolved.error()));
    }

    return {};
}

bool AliasResolver::remove(std::string_view trigger) {
    auto it = user_.find(trigger);
    if (it == user_.end()) {
        return false;
    }

    user_.erase(it);
    return true;
}

const AliasExpansion *AliasResolver::lookup(std::string_view trigger) const {
    if (auto it = user_.find(trigger); it != user_.end()) {
        return &it->second;
    }

    if (auto it = builtin_.find(trigger); it != builtin_.end()) {
        return &it->second;
    }

    return nullptr;
}

bool AliasResolver::is_user_defined(std::string_view trigger) const { return user_.find(trigger) != user_.end(); }

std::vector<std::pair<std::string, AliasExpansion>> AliasResolver::entries() const {
    std::map<std::string, AliasExpansion, std::less<>> merged = builtin_;
    for (const auto &[trigger, expansion] : user_) {
        merged.insert_or_assign(trigger, expansion);
    }

    return {merged.begin(), merged.end()};
}

std::expected<ResolvedCommand, AliasCycleError> AliasResolver::resolve(std::string_view name) const {
    ResolvedCommand resolved{.name = std::string(name), .prefix_args = {}};
    std::set<std::string, std::less<>> visited;

    for (std::size_t depth = 0;; ++depth) {
        const AliasExpansion *expansion = lookup(resolved.name);
        if (expansion == nullptr) {
            return resolved;
        }

        if (!visited.insert(resolved.name).second) {
            return std::unexpected(AliasCycleError{
                .alias = resolved.name,
                .message = "alias `" + resolved.name + "' expands to itself",
            });
        }

        if (depth >= max_depth) {
            return std::unexpected(AliasCycleError{
                .alias = resolved.name,
                .message = "alias `" + resolved.name + "' exceeds the maximum expansion depth",
            });
        }

        // "a x" with a -> "b y" becomes "b y x": the expansion's arguments lead.
        resolved.prefix_args.insert(resolved.prefix_args.begin(), expansion->args.begin(), expansion->args.end());
        resolved.name = expansion->name;
    }
}

std::string format_expansion(const AliasExpansion &expansion) {
    std::string text = expansion.name;
    for (const auto &arg : expansion.args) {
        text.push_back(' ');
        text += arg;
    }
    return text;
}

} // namespace lxterm
