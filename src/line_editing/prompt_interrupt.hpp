#pragma once

#include <csignal>

namespace lxterm {

// Ctrl-C at the prompt abandons the line being edited; the loop itself keeps
// running. The handler only raises a flag. readline's signal event hook does the
// line editing once the interrupted read returns.
class PromptInterrupt {
  public:
    void install();

    // Forgets an interrupt that arrived while no prompt was showing.
    static void discard_pending() noexcept;

  private:
    static volatile std::sig_atomic_t pending_;

    static void on_signal(int signal_number);
    static int on_signal_event();
};

} // namespace lxterm
