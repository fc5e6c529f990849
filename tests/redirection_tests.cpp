#include <cassert>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "execution/redirection.hpp"

using lxterm::OutputRedirection;
using lxterm::RedirectionMode;
using lxterm::RedirectionTarget;
using lxterm::StdoutRedirectGuard;

namespace {

std::string temp_path(const std::string &suffix) {
    return "/tmp/lxterm_redirection_test_" + std::to_string(getpid()) + "_" + suffix;
}

std::string slurp(const std::string &path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_through(const RedirectionTarget &target, const std::string &text) {
    const auto written = ::write(target.fd(), text.data(), text.size());
    assert(written == static_cast<ssize_t>(text.size()));
}

void test_truncate_replaces_contents() {
    const std::string path = temp_path("truncate.txt");

    for (const char *text : {"first run\n", "second\n"}) {
        auto target = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Truncate, .target = path});
        assert(target.has_value());
        write_through(*target, text);
    }

    assert(slurp(path) == "second\n");
    std::remove(path.c_str());
}

void test_append_keeps_contents() {
    const std::string path = temp_path("append.txt");

    {
        auto target = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Truncate, .target = path});
        assert(target.has_value());
        write_through(*target, "one\n");
    }
    {
        auto target = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Append, .target = path});
        assert(target.has_value());
        write_through(*target, "two\n");
    }

    assert(slurp(path) == "one\ntwo\n");
    std::remove(path.c_str());
}

void test_target_is_closed_on_exec() {
    const std::string path = temp_path("cloexec.txt");

    auto target = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Truncate, .target = path});
    assert(target.has_value());
    assert((::fcntl(target->fd(), F_GETFD) & FD_CLOEXEC) != 0);

    std::remove(path.c_str());
}

void test_missing_directory_reports_error() {
    const auto target = RedirectionTarget::open(
        OutputRedirection{.mode = RedirectionMode::Truncate, .target = "/no/such/directory/lxterm.txt"});

    assert(!target.has_value());
    assert(target.error().message.starts_with("cannot open '/no/such/directory/lxterm.txt'"));
}

void test_locked_target_is_rejected_and_left_intact() {
    const std::string path = temp_path("locked.txt");
    {
        std::ofstream seed(path);
        seed << "keep me\n";
    }

    const int holder = ::open(path.c_str(), O_WRONLY);
    assert(holder != -1);
    assert(::flock(holder, LOCK_EX) == 0);

    const auto target = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Truncate, .target = path});
    assert(!target.has_value());
    assert(target.error().message.starts_with("cannot lock"));
    assert(slurp(path) == "keep me\n");

    ::close(holder);

    auto after = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Append, .target = path});
    assert(after.has_value());

    std::remove(path.c_str());
}

void test_truncate_failure_reports_error() {
    const std::string path = temp_path("ftruncate.txt");

    static const lxterm::RedirectionSyscalls failing_truncate{
        .open_fn = +[](const char *target, int flags, unsigned int mode) { return ::open(target, flags, mode); },
        .flock_fn = +[](int fd, int operation) { return ::flock(fd, operation); },
        .ftruncate_fn = +[](int /*fd*/, long /*length*/) {
            errno = EIO;
            return -1;
        },
        .dup_fn = +[](int fd) { return ::dup(fd); },
        .dup2_fn = +[](int old_fd, int new_fd) { return ::dup2(old_fd, new_fd); },
        .close_fn = +[](int fd) { return ::close(fd); },
    };

    const auto target = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Truncate, .target = path},
                                                &failing_truncate);
    assert(!target.has_value());
    assert(target.error().message.starts_with("cannot truncate"));

    // Append never truncates.
    const auto appended = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Append, .target = path},
                                                  &failing_truncate);
    assert(appended.has_value());

    std::remove(path.c_str());
}

void test_stdout_guard_round_trip() {
    const std::string path = temp_path("guard.txt");

    {
        auto target = RedirectionTarget::open(OutputRedirection{.mode = RedirectionMode::Truncate, .target = path});
        assert(target.has_value());

        StdoutRedirectGuard guard(target->fd());
        assert(guard.is_valid());
        std::cout << "inside guard" << std::endl;
    }

    assert(slurp(path) == "inside guard\n");
    std::remove(path.c_str());
}

void test_stdout_guard_dup2_failure() {
    static const lxterm::RedirectionSyscalls failing_dup2{
        .open_fn = +[](const char *target, int flags, unsigned int mode) { return ::open(target, flags, mode); },
        .flock_fn = +[](int fd, int operation) { return ::flock(fd, operation); },
        .ftruncate_fn = +[](int fd, long length) { return ::ftruncate(fd, length); },
        .dup_fn = +[](int fd) { return ::dup(fd); },
        .dup2_fn = +[](int /*old_fd*/, int /*new_fd*/) {
            errno = EBADF;
            return -1;
        },
        .close_fn = +[](int fd) { return ::close(fd); },
    };

    StdoutRedirectGuard guard(STDOUT_FILENO, &failing_dup2);
    assert(!guard.is_valid());
    assert(guard.error().starts_with("failed to redirect standard output"));
}

} // namespace

int main() {
    test_truncate_replaces_contents();
    test_append_keeps_contents();
    test_target_is_closed_on_exec();
    test_missing_directory_reports_error();
    test_locked_target_is_rejected_and_left_intact();
    test_truncate_failure_reports_error();
    test_stdout_guard_round_trip();
    test_stdout_guard_dup2_failure();

    return 0;
}
