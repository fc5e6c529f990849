#pragma once

#include <cstddef>
#include <signal.h>

#include <sys/types.h>

namespace lxterm {

// While alive, SIGINT delivered to the interpreter is forwarded to the tracked
// stage processes instead of reaching the previous handler. Only one forwarder
// may be alive at a time.
class InterruptForwarder {
  public:
    InterruptForwarder();
    ~InterruptForwarder();

    InterruptForwarder(const InterruptForwarder &) = delete;
    InterruptForwarder &operator=(const InterruptForwarder &) = delete;

    // `pids` must stay valid (no reallocation) until the forwarder is destroyed.
    void track(const pid_t *pids, std::size_t count) noexcept;

  private:
    struct sigaction previous_ {};
    bool installed_{false};
};

} // namespace lxterm
