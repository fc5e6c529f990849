#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace lxterm {

// Looks up executables on PATH, for `which` and command-name completion.
class ExecutableSearch {
  public:
    [[nodiscard]] std::optional<std::string> find(std::string_view command) const;
    [[nodiscard]] std::set<std::string> candidates(std::string_view prefix) const;

  private:
    using Visitor = std::function<bool(const std::string &filename, const std::string &full_path)>;

    void for_each_executable(std::string_view prefix, const Visitor &visit) const;
};

} // namespace lxterm
