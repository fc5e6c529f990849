#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace lxterm {

struct HistoryEntry {
    std::size_t index;
    std::string line;
};

// Front end over GNU readline's history list. The list is process-wide, so a
// new manager clears it and stifles it to its own capacity.
class HistoryManager {
  public:
    explicit HistoryManager(std::size_t capacity);

    void record(const std::string &line);

    // Cursor navigation. previous() saturates at the oldest entry; next() returns
    // nullopt once it moves past the newest one and clears the selection.
    [[nodiscard]] std::optional<std::string> previous();
    [[nodiscard]] std::optional<std::string> next();
    void reset_cursor() noexcept;

    [[nodiscard]] std::vector<HistoryEntry> entries() const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;

    void print(std::ostream &out, std::size_t limit) const;

  private:
    std::size_t capacity_;
};

} // namespace lxterm
