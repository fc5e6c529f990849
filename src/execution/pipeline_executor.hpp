#pragma once

#include <optional>
#include <span>
#include <sys/types.h>

#include "execution/dispatcher.hpp"

namespace lxterm {

class HostShell;
class RedirectionTarget;

class PipelineExecutor {
  public:
    explicit PipelineExecutor(const HostShell &host_shell);

    // Runs every stage concurrently with live pipes between them and returns the
    // exit code of the last stage. Throws std::runtime_error when a pipe or a
    // process cannot be created or reaped; stages already started are terminated first.
    int run(const PreparedPipeline &pipeline);

  private:
    const HostShell &host_shell_;

    [[nodiscard]] int run_in_interpreter(const Invocation &invocation, const RedirectionTarget *target) const;
    [[noreturn]] void run_stage_in_child(
        const Invocation &invocation, int input_fd, int output_fd, std::span<const int> inherited_fds) const noexcept;

    static void terminate_started(std::span<const pid_t> pids) noexcept;
    // Waits for every pid in order. If one cannot be reaped, the later ones are
    // killed and reaped before the error propagates.
    [[nodiscard]] static int wait_all(std::span<const pid_t> pids);
    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace lxterm
