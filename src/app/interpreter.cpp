#include "app/interpreter.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "core/exit_codes.hpp"
#include "core/shell_context.hpp"
#include "execution/pipeline_executor.hpp"

namespace lxterm {

namespace {

[[nodiscard]] std::string_view trim(std::string_view text) {
    constexpr std::string_view blanks = " \t\r\n";

    const auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

} // namespace

Interpreter::Interpreter(ShellContext &context, const CommandRegistry &registry, PipelineExecutor &executor)
    : context_(context), executor_(executor), parser_(), dispatcher_(registry, context.paths) {}

std::expected<PreparedPipeline, std::string> Interpreter::prepare(const std::string &line) const {
    auto parsed = parser_.parse(line);
    if (!parsed.has_value()) {
        return std::unexpected("syntax error at column " + std::to_string(parsed.error().column + 1) + ": " +
                               parsed.error().message);
    }

    Pipeline pipeline = std::move(parsed.value());

    for (auto &stage : pipeline.stages) {
        auto resolved = context_.aliases.resolve(stage.name);
        if (!resolved.has_value()) {
            return std::unexpected(std::move(resolved.error().message));
        }

        stage.name = std::move(resolved->name);
        stage.args.insert(stage.args.begin(), resolved->prefix_args.begin(), resolved->prefix_args.end());
    }

    return dispatcher_.prepare(pipeline);
}

int Interpreter::execute(const std::string &line) {
    const std::string_view text = trim(line);
    if (text.empty() || text.starts_with('#')) {
        return context_.last_exit_code;
    }

    context_.history.record(std::string(text));

    auto prepared = prepare(std::string(text));
    if (!prepared.has_value()) {
        std::cerr << "lxterm: " << prepared.error() << std::endl;
        context_.last_exit_code = exit_code::not_executed;
        return context_.last_exit_code;
    }

    int status = exit_code::success;
    try {
        status = executor_.run(prepared.value());
    } catch (const std::runtime_error &error) {
        std::cerr << "lxterm: " << error.what() << std::endl;
        status = exit_code::cannot_start;
    }

    context_.last_exit_code = status;
    return status;
}

} // namespace lxterm
