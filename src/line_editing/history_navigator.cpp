#include "line_editing/history_navigator.hpp"

#include <cstdio>

#include <readline/readline.h>

#include "history/history_manager.hpp"

namespace lxterm {

HistoryNavigator *HistoryNavigator::instance_ = nullptr;

namespace {

void replace_line(const char *text) {
    rl_replace_line(text, 0);
    rl_point = rl_end;
}

} // namespace

HistoryNavigator::HistoryNavigator(HistoryManager &history) : history_(history) {}

void HistoryNavigator::install() {
    instance_ = this;

    // Normal and application cursor-key modes.
    rl_bind_keyseq("\\e[A", &HistoryNavigator::previous_callback);
    rl_bind_keyseq("\\eOA", &HistoryNavigator::previous_callback);
    rl_bind_keyseq("\\e[B", &HistoryNavigator::next_callback);
    rl_bind_keyseq("\\eOB", &HistoryNavigator::next_callback);
}

int HistoryNavigator::previous_callback(int /*count*/, int /*key*/) {
    if (instance_ == nullptr) {
        return 0;
    }

    if (const auto line = instance_->history_.previous(); line.has_value()) {
        replace_line(line->c_str());
    } else {
        rl_ding();
    }

    return 0;
}

int HistoryNavigator::next_callback(int /*count*/, int /*key*/) {
    if (instance_ == nullptr) {
        return 0;
    }

    const auto line = instance_->history_.next();
    replace_line(line.has_value() ? line->c_str() : "");
    return 0;
}

} // namespace lxterm
