#include "execution/dispatcher.hpp"

#include "builtins/command_registry.hpp"
#include "core/path_translator.hpp"

namespace lxterm {

Dispatcher::Dispatcher(const CommandRegistry &registry, const PathTranslator &paths)
    : registry_(registry), paths_(paths) {}

Invocation Dispatcher::dispatch(const Stage &stage) const {
    const CommandEntry *entry = registry_.find(stage.name);
    if (entry == nullptr) {
        return Invocation{.kind = InvocationKind::HostShell, .name = stage.name, .args = stage.args, .entry = nullptr};
    }

    Invocation invocation{.kind = InvocationKind::Builtin, .name = stage.name, .args = stage.args, .entry = entry};

    const auto mask = path_argument_mask(entry->path_arguments, invocation.args);
    for (std::size_t i = 0; i < invocation.args.size(); ++i) {
        if (mask[i]) {
            invocation.args[i] = paths_.to_host_form(invocation.args[i]);
        }
    }

    return invocation;
}

PreparedPipeline Dispatcher::prepare(const Pipeline &pipeline) const {
    PreparedPipeline prepared;
    prepared.stages.reserve(pipeline.stages.size());

    for (const auto &stage : pipeline.stages) {
        prepared.stages.push_back(dispatch(stage));
    }

    if (!pipeline.empty() && pipeline.output().is_file()) {
        prepared.output = OutputRedirection{
            .mode = pipeline.output().mode,
            .target = paths_.to_host_form(pipeline.output().target),
        };
    }

    return prepared;
}

} // namespace lxterm
