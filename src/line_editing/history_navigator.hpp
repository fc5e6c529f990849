#pragma once

namespace lxterm {

class HistoryManager;

// Binds the Up/Down arrow keys to HistoryManager::previous()/next().
class HistoryNavigator {
  public:
    explicit HistoryNavigator(HistoryManager &history);

    void install();

  private:
    HistoryManager &history_;

    static HistoryNavigator *instance_;

    static int previous_callback(int count, int key);
    static int next_callback(int count, int key);
};

} // namespace lxterm
