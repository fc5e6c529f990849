#include "execution/redirection.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace lxterm {

namespace {

int posix_open(const char *path, int flags, unsigned int mode) { return ::open(path, flags, mode); }

int posix_flock(int fd, int operation) { return ::flock(fd, operation); }

int posix_ftruncate(int fd, long length) { return ::ftruncate(fd, static_cast<off_t>(length)); }

int posix_dup(int fd) { return ::dup(fd); }

int posix_dup2(int old_fd, int new_fd) { return ::dup2(old_fd, new_fd); }

int posix_close(int fd) { return ::close(fd); }

const RedirectionSyscalls default_syscalls{
    .open_fn = &posix_open,
    .flock_fn = &posix_flock,
    .ftruncate_fn = &posix_ftruncate,
    .dup_fn = &posix_dup,
    .dup2_fn = &posix_dup2,
    .close_fn = &posix_close,
};

[[nodiscard]] std::string describe_errno(const std::string &what, const std::string &path) {
    return what + " '" + path + "': " + std::strerror(errno);
}

} // namespace

std::expected<RedirectionTarget, RedirectionError> RedirectionTarget::open(const OutputRedirection &redirection,
                                                                           const RedirectionSyscalls *syscalls) {
    const RedirectionSyscalls &sys = syscalls != nullptr ? *syscalls : default_syscalls;

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (redirection.mode == RedirectionMode::Append) {
        flags |= O_APPEND;
    }

    const int raw_fd = sys.open_fn(redirection.target.c_str(), flags, 0644);
    if (raw_fd == -1) {
        return std::unexpected(RedirectionError{describe_errno("cannot open", redirection.target)});
    }

    FileDescriptor fd(raw_fd);

    if (sys.flock_fn(fd.get(), LOCK_EX | LOCK_NB) == -1) {
        return std::unexpected(RedirectionError{describe_errno("cannot lock", redirection.target)});
    }

    // Truncate only once the lock is held, so a competing writer's output is never discarded.
    if (redirection.mode == RedirectionMode::Truncate && sys.ftruncate_fn(fd.get(), 0) == -1) {
        return std::unexpected(RedirectionError{describe_errno("cannot truncate", redirection.target)});
    }

    return RedirectionTarget(std::move(fd));
}

StdoutRedirectGuard::StdoutRedirectGuard(int fd, const RedirectionSyscalls *syscalls)
    : syscalls_(syscalls != nullptr ? syscalls : &default_syscalls) {
    std::cout.flush();

    backup_fd_ = syscalls_->dup_fn(STDOUT_FILENO);
    if (backup_fd_ == -1) {
        error_ = std::string("failed to save standard output: ") + std::strerror(errno);
        return;
    }

    if (syscalls_->dup2_fn(fd, STDOUT_FILENO) == -1) {
        error_ = std::string("failed to redirect standard output: ") + std::strerror(errno);
        syscalls_->close_fn(backup_fd_);
        backup_fd_ = -1;
    }
}

StdoutRedirectGuard::~StdoutRedirectGuard() { restore(); }

bool StdoutRedirectGuard::is_valid() const noexcept { return error_.empty(); }

const std::string &StdoutRedirectGuard::error() const noexcept { return error_; }

void StdoutRedirectGuard::restore() noexcept {
    if (backup_fd_ == -1) {
        return;
    }

    std::cout.flush();
    syscalls_->dup2_fn(backup_fd_, STDOUT_FILENO);
    syscalls_->close_fn(backup_fd_);
    backup_fd_ = -1;
}

} // namespace lxterm
