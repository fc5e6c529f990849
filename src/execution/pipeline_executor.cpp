#include "execution/pipeline_executor.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <stdio_ext.h>
#include <sys/wait.h>
#include <unistd.h>

#include "builtins/command_registry.hpp"
#include "core/exit_codes.hpp"
#include "execution/file_descriptor.hpp"
#include "execution/host_shell.hpp"
#include "execution/interrupt.hpp"
#include "execution/redirection.hpp"

namespace lxterm {

namespace {

struct PipeEnds {
    FileDescriptor read;
    FileDescriptor write;
};

[[nodiscard]] PipeEnds make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        throw std::runtime_error("pipe failed");
    }

    return PipeEnds{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

[[nodiscard]] bool needs_interpreter(const PreparedPipeline &pipeline) {
    if (pipeline.stages.size() != 1) {
        return false;
    }

    const auto &stage = pipeline.stages.front();
    return stage.kind == InvocationKind::Builtin && stage.entry != nullptr && stage.entry->runs_in_interpreter;
}

} // namespace

PipelineExecutor::PipelineExecutor(const HostShell &host_shell) : host_shell_(host_shell) {}

int PipelineExecutor::run(const PreparedPipeline &pipeline) {
    if (pipeline.stages.empty()) {
        return exit_code::success;
    }

    for (const auto &stage : pipeline.stages) {
        if (stage.kind == InvocationKind::HostShell && !host_shell_.available()) {
            std::cerr << "lxterm: " << stage.name << ": host shell '" << host_shell_.path() << "' is not available"
                      << std::endl;
            return exit_code::not_found;
        }
    }

    std::optional<RedirectionTarget> target;
    if (pipeline.output.is_file()) {
        auto opened = RedirectionTarget::open(pipeline.output);
        if (!opened.has_value()) {
            std::cerr << "lxterm: " << opened.error().message << std::endl;
            return exit_code::failure;
        }
        target.emplace(std::move(opened.value()));
    }

    if (needs_interpreter(pipeline)) {
        return run_in_interpreter(pipeline.stages.front(), target.has_value() ? &*target : nullptr);
    }

    const std::size_t stage_count = pipeline.stages.size();

    std::vector<PipeEnds> pipes;
    pipes.reserve(stage_count - 1);
    for (std::size_t i = 0; i + 1 < stage_count; ++i) {
        pipes.push_back(make_pipe());
    }

    std::vector<int> inherited_fds;
    for (const auto &ends : pipes) {
        inherited_fds.push_back(ends.read.get());
        inherited_fds.push_back(ends.write.get());
    }
    if (target.has_value()) {
        inherited_fds.push_back(target->fd());
    }

    const int final_output = target.has_value() ? target->fd() : STDOUT_FILENO;

    std::cout.flush();
    std::cerr.flush();

    std::vector<pid_t> pids;
    pids.reserve(stage_count);
    InterruptForwarder forwarder;

    for (std::size_t i = 0; i < stage_count; ++i) {
        const pid_t pid = ::fork();
        if (pid == -1) {
            terminate_started(pids);
            throw std::runtime_error("fork failed");
        }

        if (pid == 0) {
            const int input_fd = i > 0 ? pipes[i - 1].read.get() : STDIN_FILENO;
            const int output_fd = i + 1 < stage_count ? pipes[i].write.get() : final_output;
            run_stage_in_child(pipeline.stages[i], input_fd, output_fd, inherited_fds);
        }

        pids.push_back(pid);
        forwarder.track(pids.data(), pids.size());
    }

    // The children hold their own copies; closing ours lets readers see EOF.
    pipes.clear();
    target.reset();

    return wait_all(pids);
}

int PipelineExecutor::run_in_interpreter(const Invocation &invocation, const RedirectionTarget *target) const {
    std::optional<StdoutRedirectGuard> guard;
    if (target != nullptr) {
        guard.emplace(target->fd());
        if (!guard->is_valid()) {
            std::cerr << "lxterm: " << guard->error() << std::endl;
            return exit_code::failure;
        }
    }

    CommandIo io{.in = std::cin, .out = std::cout, .err = std::cerr};
    int status = exit_code::failure;

    try {
        status = invocation.entry->handler(invocation.args, io);
    } catch (const std::exception &error) {
        std::cerr << invocation.name << ": " << error.what() << std::endl;
    }

    std::cout.flush();
    return status;
}

void PipelineExecutor::run_stage_in_child(
    const Invocation &invocation, int input_fd, int output_fd, std::span<const int> inherited_fds) const noexcept {
    std::signal(SIGINT, SIG_DFL);

    if (input_fd != STDIN_FILENO) {
        if (::dup2(input_fd, STDIN_FILENO) == -1) {
            std::perror("dup2 failed");
            _exit(exit_code::cannot_start);
        }
    }

    // Input the interpreter had already buffered from its own stdin belongs to the
    // interpreter, whether or not this stage reads a pipe.
    ::__fpurge(stdin);

    if (output_fd != STDOUT_FILENO && ::dup2(output_fd, STDOUT_FILENO) == -1) {
        std::perror("dup2 failed");
        _exit(exit_code::cannot_start);
    }

    for (const int fd : inherited_fds) {
        ::close(fd);
    }

    if (invocation.kind == InvocationKind::HostShell) {
        host_shell_.exec(invocation.name, invocation.args);
    }

    // A reader that exits early turns our writes into stream errors instead of killing us.
    std::signal(SIGPIPE, SIG_IGN);

    int status = exit_code::failure;
    try {
        CommandIo io{.in = std::cin, .out = std::cout, .err = std::cerr};
        status = invocation.entry->handler(invocation.args, io);
        std::cout.flush();
    } catch (const std::exception &error) {
        std::cerr << invocation.name << ": " << error.what() << std::endl;
    }

    std::cerr.flush();
    _exit(status);
}

void PipelineExecutor::terminate_started(std::span<const pid_t> pids) noexcept {
    for (const pid_t pid : pids) {
        ::kill(pid, SIGKILL);
    }

    for (const pid_t pid : pids) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
    }
}

int PipelineExecutor::wait_all(std::span<const pid_t> pids) {
    int last_status = exit_code::success;

    for (std::size_t i = 0; i < pids.size(); ++i) {
        try {
            last_status = wait_for_process(pids[i]);
        } catch (const std::runtime_error &) {
            terminate_started(pids.subspan(i + 1));
            throw;
        }
    }

    return last_status;
}

int PipelineExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (::waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error("waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

int PipelineExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return exit_code::signal_base + WTERMSIG(status);
    }

    return exit_code::failure;
}

} // namespace lxterm
