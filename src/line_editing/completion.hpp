#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace lxterm {

class AliasResolver;
class CommandRegistry;
class ExecutableSearch;

// What the word under the cursor names, judged from the text before it.
enum class WordKind {
    Command,     // first word of the line or of a pipeline stage
    CommandName, // argument of which/help
    AliasName,   // argument of unalias
    Argument,    // anything else; readline completes file names
};

// Completes command words from builtin names, alias triggers and PATH executables.
class CompletionEngine {
  public:
    CompletionEngine(const CommandRegistry &registry, const AliasResolver &aliases, const ExecutableSearch &search);

    void install();

  private:
    const CommandRegistry &registry_;
    const AliasResolver &aliases_;
    const ExecutableSearch &search_;
    WordKind kind_{WordKind::Command};

    static CompletionEngine *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);

    [[nodiscard]] WordKind classify(std::string_view line, std::size_t start) const;
    [[nodiscard]] std::set<std::string> collect_matches(const std::string &prefix, WordKind kind) const;
};

} // namespace lxterm
