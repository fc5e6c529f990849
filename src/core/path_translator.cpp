#include "core/path_translator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace lxterm {

namespace {

[[nodiscard]] std::string with_backslashes(std::string_view path) {
    std::string result(path);
    std::ranges::replace(result, '/', '\\');
    return result;
}

[[nodiscard]] std::string with_forward_slashes(std::string_view path) {
    std::string result(path);
    std::ranges::replace(result, '\\', '/');
    return result;
}

[[nodiscard]] bool is_separator(char c) { return c == '/' || c == '\\'; }

[[nodiscard]] char upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

[[nodiscard]] char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

// A lone letter segment at `offset`, as in "/c" or "/c/Users".
[[nodiscard]] std::optional<char> drive_segment(std::string_view path, std::size_t offset) {
    if (offset >= path.size() || !std::isalpha(static_cast<unsigned char>(path[offset]))) {
        return std::nullopt;
    }

    if (offset + 1 < path.size() && path[offset + 1] != '/') {
        return std::nullopt;
    }

    return path[offset];
}

struct DriveSplit {
    char drive;
    std::string_view rest;
};

[[nodiscard]] std::optional<DriveSplit> split_linux_drive(std::string_view path) {
    constexpr std::string_view mount_root = "/mnt/";

    if (path.starts_with(mount_root)) {
        if (auto drive = drive_segment(path, mount_root.size()); drive.has_value()) {
            return DriveSplit{.drive = *drive, .rest = path.substr(mount_root.size() + 1)};
        }
    }

    if (path.starts_with('/')) {
        if (auto drive = drive_segment(path, 1); drive.has_value()) {
            return DriveSplit{.drive = *drive, .rest = path.substr(2)};
        }
    }

    return std::nullopt;
}

[[nodiscard]] bool is_unc_linux(std::string_view path) {
    return path.size() > 2 && path.starts_with("//") && path[2] != '/';
}

[[nodiscard]] bool is_unc_windows(std::string_view path) {
    return path.size() > 2 && path.starts_with("\\\\") && !is_separator(path[2]);
}

[[nodiscard]] bool is_absolute_windows_drive(std::string_view path) {
    return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':' &&
           is_separator(path[2]);
}

[[nodiscard]] bool segment_prefix(std::string_view path, std::string_view prefix) {
    if (prefix.empty() || !path.starts_with(prefix)) {
        return false;
    }

    return path.size() == prefix.size() || prefix.ends_with('/') || path[prefix.size()] == '/';
}

[[nodiscard]] bool segment_prefix_ignore_case(std::string_view path, std::string_view prefix) {
    if (prefix.empty() || path.size() < prefix.size()) {
        return false;
    }

    for (std::size_t i = 0; i < prefix.size(); ++i) {
        const char a = path[i];
        const char b = prefix[i];
        if (is_separator(a) && is_separator(b)) {
            continue;
        }

        if (lower(a) != lower(b)) {
            return false;
        }
    }

    return path.size() == prefix.size() || is_separator(prefix.back()) || is_separator(path[prefix.size()]);
}

} // namespace

PathTranslator::PathTranslator(char system_drive, std::string home_directory, std::vector<PathMappingRule> rules)
    : system_drive_(upper(system_drive)), home_directory_(std::move(home_directory)), rules_(std::move(rules)) {}

std::optional<std::string> PathTranslator::apply_rule_to_host(std::string_view path) const {
    for (const auto &rule : rules_) {
        if (segment_prefix(path, rule.linux_prefix)) {
            return rule.windows_prefix + with_backslashes(path.substr(rule.linux_prefix.size()));
        }
    }

    return std::nullopt;
}

std::optional<std::string> PathTranslator::apply_rule_to_emulated(std::string_view path) const {
    for (const auto &rule : rules_) {
        if (segment_prefix_ignore_case(path, rule.windows_prefix)) {
            return rule.linux_prefix + with_forward_slashes(path.substr(rule.windows_prefix.size()));
        }
    }

    return std::nullopt;
}

std::string PathTranslator::to_host_form(std::string_view path) const {
    if (!enabled() || path.empty()) {
        return std::string(path);
    }

    if (auto mapped = apply_rule_to_host(path); mapped.has_value()) {
        return *mapped;
    }

    if (!home_directory_.empty() && (path == "~" || path.starts_with("~/"))) {
        return home_directory_ + with_backslashes(path.substr(1));
    }

    if (is_unc_linux(path)) {
        return with_backslashes(path);
    }

    if (!path.starts_with('/')) {
        return std::string(path);
    }

    if (auto split = split_linux_drive(path); split.has_value()) {
        std::string result{upper(split->drive), ':'};
        result += split->rest.empty() ? std::string("\\") : with_backslashes(split->rest);
        return result;
    }

    std::string result{*system_drive_, ':'};
    result += with_backslashes(path);
    return result;
}

std::string PathTranslator::to_emulated_form(std::string_view path) const {
    if (!enabled() || path.empty()) {
        return std::string(path);
    }

    if (auto mapped = apply_rule_to_emulated(path); mapped.has_value()) {
        return *mapped;
    }

    if (is_absolute_windows_drive(path)) {
        // Every drive keeps its segment, the system drive included; a bare "/" is
        // accepted as host-form input only.
        const char drive = lower(path[0]);
        const std::string rest = with_forward_slashes(path.substr(2));

        std::string result{'/', drive};
        if (rest != "/") {
            result += rest;
        }
        return result;
    }

    if (is_unc_windows(path)) {
        return with_forward_slashes(path);
    }

    return std::string(path);
}

} // namespace lxterm
