#include "line_editing/prompt_interrupt.hpp"

#include <cstdio>

#include <readline/readline.h>
#include <signal.h>

namespace lxterm {

volatile std::sig_atomic_t PromptInterrupt::pending_ = 0;

void PromptInterrupt::install() {
    rl_catch_signals = 0;
    rl_signal_event_hook = &PromptInterrupt::on_signal_event;

    // No SA_RESTART: the terminal read has to fail with EINTR for the hook to run.
    struct sigaction action {};
    action.sa_handler = &PromptInterrupt::on_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (::sigaction(SIGINT, &action, nullptr) == -1) {
        std::perror("sigaction failed");
    }
}

void PromptInterrupt::discard_pending() noexcept { pending_ = 0; }

void PromptInterrupt::on_signal(int /*signal_number*/) { pending_ = 1; }

int PromptInterrupt::on_signal_event() {
    if (pending_ == 0) {
        return 0;
    }
    pending_ = 0;

    rl_crlf();
    rl_on_new_line();
    rl_replace_line("", 0);
    rl_redisplay();
    return 0;
}

} // namespace lxterm
