#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace lxterm {

struct CommandIo {
    std::istream &in;
    std::ostream &out;
    std::ostream &err;
};

// Handlers report failure through a non-zero return and a diagnostic on io.err;
// they never terminate the process.
using CommandHandler = std::function<int(const std::vector<std::string> &args, CommandIo &io)>;

// Which arguments of a command hold paths and therefore get host-form translation.
struct PathArguments {
    bool positional{false};
    std::size_t first_positional{0};
    std::vector<std::string> flags;
};

struct CommandEntry {
    CommandHandler handler;
    std::string summary;
    PathArguments path_arguments;
    // Set for commands that mutate interpreter state (cwd, aliases, exit); they run in-process.
    bool runs_in_interpreter{false};
};

class CommandRegistry {
  public:
    void register_command(std::string name, CommandEntry entry);

    [[nodiscard]] const CommandEntry *find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    int execute(std::string_view name, const std::vector<std::string> &args, CommandIo &io) const;

  private:
    std::map<std::string, CommandEntry, std::less<>> entries_;
};

[[nodiscard]] std::vector<bool> path_argument_mask(const PathArguments &declaration,
                                                   const std::vector<std::string> &args);

} // namespace lxterm
