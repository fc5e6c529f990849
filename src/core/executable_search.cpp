#include "core/executable_search.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace lxterm {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] bool is_executable(const fs::directory_entry &entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) {
        return false;
    }

    const auto perms = entry.status(ec).permissions();
    if (ec) {
        return false;
    }

    constexpr auto exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (perms & exec_bits) != fs::perms::none;
}

} // namespace

void ExecutableSearch::for_each_executable(std::string_view prefix, const Visitor &visit) const {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return;
    }

    std::string_view remaining(path_env);
    while (!remaining.empty()) {
        const auto colon = remaining.find(':');
        const std::string dir(remaining.substr(0, colon));
        remaining = colon == std::string_view::npos ? std::string_view{} : remaining.substr(colon + 1);

        if (dir.empty()) {
            continue;
        }

        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string filename = it->path().filename().string();
            if (!filename.starts_with(prefix) || !is_executable(*it)) {
                continue;
            }

            if (visit(filename, it->path().string())) {
                return;
            }
        }
    }
}

std::optional<std::string> ExecutableSearch::find(std::string_view command) const {
    std::optional<std::string> found;

    for_each_executable(command, [&](const std::string &filename, const std::string &full_path) {
        if (filename != command) {
            return false;
        }

        found = full_path;
        return true;
    });

    return found;
}

std::set<std::string> ExecutableSearch::candidates(std::string_view prefix) const {
    std::set<std::string> result;

    for_each_executable(prefix, [&](const std::string &filename, const std::string & /*full_path*/) {
        result.insert(filename);
        return false;
    });

    return result;
}

} // namespace lxterm
