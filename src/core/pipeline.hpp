#pragma once

#include <string>
#include <vector>

namespace lxterm {

enum class RedirectionMode {
    Terminal,
    Truncate,
    Append,
};

struct OutputRedirection {
    RedirectionMode mode{RedirectionMode::Terminal};
    std::string target;

    [[nodiscard]] bool is_file() const noexcept { return mode != RedirectionMode::Terminal; }
};

struct Stage {
    std::string name;
    std::vector<std::string> args;
    OutputRedirection redirection;
};

// Only the last stage may carry a file redirection; earlier stages pipe into the next one.
struct Pipeline {
    std::vector<Stage> stages;

    [[nodiscard]] bool empty() const noexcept { return stages.empty(); }
    [[nodiscard]] const OutputRedirection &output() const { return stages.back().redirection; }
};

} // namespace lxterm
