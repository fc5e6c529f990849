#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lxterm {

enum class HostShellFlavor {
    Posix,
    Cmd,
};

// The host's native command interpreter, used for every command no builtin handles.
class HostShell {
  public:
    explicit HostShell(std::string path);

    [[nodiscard]] const std::string &path() const noexcept { return path_; }
    [[nodiscard]] HostShellFlavor flavor() const noexcept { return flavor_; }
    [[nodiscard]] bool available() const;

    [[nodiscard]] std::string command_line(const std::string &name, const std::vector<std::string> &args) const;
    [[nodiscard]] std::vector<std::string> argv(const std::string &name, const std::vector<std::string> &args) const;

    // Only called in a forked child; replaces the process image or exits with 126/127.
    [[noreturn]] void exec(const std::string &name, const std::vector<std::string> &args) const noexcept;

  private:
    std::string path_;
    std::optional<std::string> resolved_path_;
    HostShellFlavor flavor_;
};

[[nodiscard]] std::string quote_posix_argument(std::string_view arg);
[[nodiscard]] std::string quote_cmd_argument(std::string_view arg);

} // namespace lxterm
