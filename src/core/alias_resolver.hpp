#pragma once

#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lxterm {

struct AliasExpansion {
    std::string name;
    std::vector<std::string> args;

    bool operator==(const AliasExpansion &) const = default;
};

struct ResolvedCommand {
    std::string name;
    std::vector<std::string> prefix_args;
};

struct AliasCycleError {
    std::string alias;
    std::string message;
};

class AliasResolver {
  public:
    static constexpr std::size_t max_depth = 16;

    AliasResolver();

    // Built-in aliases; a user alias with the same trigger shadows them.
    void seed(std::string trigger, AliasExpansion expansion);
    void seed_defaults();

    // Rejects a definition that would make resolution cycle; the table is left unchanged then.
    [[nodiscard]] std::expected<void, AliasCycleError> define(std::string trigger, AliasExpansion expansion);
    bool remove(std::string_view trigger);

    [[nodiscard]] const AliasExpansion *lookup(std::string_view trigger) const;
    [[nodiscard]] bool is_user_defined(std::string_view trigger) const;
    [[nodiscard]] std::vector<std::pair<std::string, AliasExpansion>> entries() const;

    [[nodiscard]] std::expected<ResolvedCommand, AliasCycleError> resolve(std::string_view name) const;

  private:
    std::map<std::string, AliasExpansion, std::less<>> builtin_;
    std::map<std::string, AliasExpansion, std::less<>> user_;
};

[[nodiscard]] std::string format_expansion(const AliasExpansion &expansion);

} // namespace lxterm
