#pragma once

#include <expected>
#include <string>
#include <utility>

#include "core/pipeline.hpp"
#include "execution/file_descriptor.hpp"

namespace lxterm {

struct RedirectionSyscalls {
    int (*open_fn)(const char *path, int flags, unsigned int mode);
    int (*flock_fn)(int fd, int operation);
    int (*ftruncate_fn)(int fd, long length);
    int (*dup_fn)(int fd);
    int (*dup2_fn)(int old_fd, int new_fd);
    int (*close_fn)(int fd);
};

struct RedirectionError {
    std::string message;
};

// The opened, exclusively locked file a pipeline's last stage writes to.
// Opened before any stage starts and closed on every exit path.
class RedirectionTarget {
  public:
    [[nodiscard]] static std::expected<RedirectionTarget, RedirectionError> open(
        const OutputRedirection &redirection, const RedirectionSyscalls *syscalls = nullptr);

    [[nodiscard]] int fd() const noexcept { return fd_.get(); }

  private:
    explicit RedirectionTarget(FileDescriptor fd) : fd_(std::move(fd)) {}

    FileDescriptor fd_;
};

// Points STDOUT at `fd` for the lifetime of the guard, for builtins that run in the interpreter.
class StdoutRedirectGuard {
  public:
    explicit StdoutRedirectGuard(int fd, const RedirectionSyscalls *syscalls = nullptr);
    ~StdoutRedirectGuard();

    StdoutRedirectGuard(const StdoutRedirectGuard &) = delete;
    StdoutRedirectGuard &operator=(const StdoutRedirectGuard &) = delete;

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] const std::string &error() const noexcept;

  private:
    const RedirectionSyscalls *syscalls_;
    int backup_fd_{-1};
    std::string error_;

    void restore() noexcept;
};

} // namespace lxterm
