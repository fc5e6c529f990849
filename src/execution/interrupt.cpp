#include "execution/interrupt.hpp"

#include <atomic>

#include <signal.h>

namespace lxterm {

namespace {

std::atomic<const pid_t *> tracked_pids{nullptr};
std::atomic<std::size_t> tracked_count{0};

void forward_interrupt(int signal_number) {
    const pid_t *pids = tracked_pids.load();
    const std::size_t count = tracked_count.load();

    for (std::size_t i = 0; pids != nullptr && i < count; ++i) {
        ::kill(pids[i], signal_number);
    }
}

} // namespace

InterruptForwarder::InterruptForwarder() {
    struct sigaction action {};
    action.sa_handler = &forward_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    installed_ = ::sigaction(SIGINT, &action, &previous_) == 0;
}

InterruptForwarder::~InterruptForwarder() {
    tracked_count.store(0);
    tracked_pids.store(nullptr);

    if (installed_) {
        ::sigaction(SIGINT, &previous_, nullptr);
    }
}

void InterruptForwarder::track(const pid_t *pids, std::size_t count) noexcept {
    // Publish the count last so the handler never reads past the live entries.
    tracked_count.store(0);
    tracked_pids.store(pids);
    tracked_count.store(count);
}

} // namespace lxterm
