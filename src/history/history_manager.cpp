#include "history/history_manager.hpp"

#include <algorithm>
#include <ostream>

#include <readline/history.h>

namespace lxterm {

HistoryManager::HistoryManager(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
    using_history();
    clear_history();
    history_base = 1;
    stifle_history(static_cast<int>(capacity_));
}

void HistoryManager::record(const std::string &line) {
    if (!std::ranges::all_of(line, [](unsigned char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; })) {
        add_history(line.c_str());
    }

    reset_cursor();
}

std::optional<std::string> HistoryManager::previous() {
    if (history_length == 0) {
        return std::nullopt;
    }

    const int position = where_history();
    if (position > 0) {
        history_set_pos(position - 1);
    }

    const HIST_ENTRY *entry = current_history();
    if (entry == nullptr) {
        return std::nullopt;
    }
    return std::string(entry->line);
}

std::optional<std::string> HistoryManager::next() {
    const int position = where_history();
    if (position >= history_length) {
        return std::nullopt;
    }

    // Stepping onto history_length leaves nothing selected.
    history_set_pos(position + 1);
    const HIST_ENTRY *entry = current_history();
    if (entry == nullptr) {
        return std::nullopt;
    }
    return std::string(entry->line);
}

void HistoryManager::reset_cursor() noexcept { history_set_pos(history_length); }

std::vector<HistoryEntry> HistoryManager::entries() const {
    std::vector<HistoryEntry> result;
    result.reserve(static_cast<std::size_t>(history_length));

    for (int i = history_base; i < history_base + history_length; ++i) {
        if (const HIST_ENTRY *entry = history_get(i)) {
            result.push_back(HistoryEntry{.index = static_cast<std::size_t>(i), .line = entry->line});
        }
    }
    return result;
}

std::size_t HistoryManager::size() const noexcept { return static_cast<std::size_t>(history_length); }

std::size_t HistoryManager::capacity() const noexcept { return capacity_; }

void HistoryManager::print(std::ostream &out, std::size_t limit) const {
    const int count = static_cast<int>(std::min(limit, size()));
    const int end = history_base + history_length;

    for (int i = end - count; i < end; ++i) {
        const HIST_ENTRY *entry = history_get(i);
        if (entry != nullptr) {
            out << "    " << i << "  " << entry->line << '\n';
        }
    }
}

} // namespace lxterm
