#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lxterm {

// Both prefixes are whole path segments: "/home" matches "/home/x" but not "/homes".
struct PathMappingRule {
    std::string linux_prefix;
    std::string windows_prefix;
};

class PathTranslator {
  public:
    // Pass-through translator, used when the host has no system drive.
    PathTranslator() = default;
    PathTranslator(char system_drive, std::string home_directory, std::vector<PathMappingRule> rules = {});

    [[nodiscard]] bool enabled() const noexcept { return system_drive_.has_value(); }

    [[nodiscard]] std::string to_host_form(std::string_view path) const;
    [[nodiscard]] std::string to_emulated_form(std::string_view path) const;

  private:
    std::optional<char> system_drive_;
    std::string home_directory_;
    std::vector<PathMappingRule> rules_;

    [[nodiscard]] std::optional<std::string> apply_rule_to_host(std::string_view path) const;
    [[nodiscard]] std::optional<std::string> apply_rule_to_emulated(std::string_view path) const;
};

} // namespace lxterm
