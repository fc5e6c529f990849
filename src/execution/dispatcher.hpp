#pragma once

#include <string>
#include <vector>

#include "core/pipeline.hpp"

namespace lxterm {

class CommandRegistry;
class PathTranslator;
struct CommandEntry;

enum class InvocationKind {
    Builtin,
    HostShell,
};

struct Invocation {
    InvocationKind kind;
    std::string name;
    std::vector<std::string> args;
    const CommandEntry *entry{nullptr};
};

struct PreparedPipeline {
    std::vector<Invocation> stages;
    OutputRedirection output;
};

class Dispatcher {
  public:
    Dispatcher(const CommandRegistry &registry, const PathTranslator &paths);

    // `stage` is already alias-resolved. A registered builtin gets its declared path
    // arguments translated to host form; anything else goes to the host shell untouched.
    [[nodiscard]] Invocation dispatch(const Stage &stage) const;
    [[nodiscard]] PreparedPipeline prepare(const Pipeline &pipeline) const;

  private:
    const CommandRegistry &registry_;
    const PathTranslator &paths_;
};

} // namespace lxterm
