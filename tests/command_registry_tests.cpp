#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "builtins/command_registry.hpp"
#include "builtins/file_builtins.hpp"
#include "core/parser.hpp"
#include "core/path_translator.hpp"
#include "execution/dispatcher.hpp"

using lxterm::CommandEntry;
using lxterm::CommandIo;
using lxterm::CommandRegistry;
using lxterm::Dispatcher;
using lxterm::InvocationKind;
using lxterm::PathArguments;
using lxterm::PathTranslator;

namespace {

CommandEntry make_entry(int status, std::string output) {
    return CommandEntry{
        .handler = [status, output](const std::vector<std::string> &, CommandIo &io) {
            io.out << output;
            return status;
        },
        .summary = "test command",
        .path_arguments = {},
        .runs_in_interpreter = false,
    };
}

void test_register_find_and_execute() {
    CommandRegistry registry;
    registry.register_command("greet", make_entry(3, "hello"));

    assert(registry.contains("greet"));
    assert(registry.find("greet")->summary == "test command");
    assert(!registry.contains("missing"));

    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    CommandIo io{.in = in, .out = out, .err = err};

    assert(registry.execute("greet", {}, io) == 3);
    assert(out.str() == "hello");
}

void test_execute_unknown_reports_not_found() {
    CommandRegistry registry;

    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    CommandIo io{.in = in, .out = out, .err = err};

    assert(registry.execute("nope", {}, io) == 127);
    assert(err.str() == "nope: command not found\n");
}

void test_names_are_sorted_and_reregistration_replaces() {
    CommandRegistry registry;
    registry.register_command("zeta", make_entry(0, ""));
    registry.register_command("alpha", make_entry(0, "first"));
    registry.register_command("alpha", make_entry(0, "second"));

    assert(registry.names() == std::vector<std::string>({"alpha", "zeta"}));

    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    CommandIo io{.in = in, .out = out, .err = err};
    assert(registry.execute("alpha", {}, io) == 0);
    assert(out.str() == "second");
}

void test_path_mask_for_positionals() {
    const PathArguments all{.positional = true, .first_positional = 0, .flags = {}};
    assert(lxterm::path_argument_mask(all, {"-la", "/home", "x"}) == std::vector<bool>({false, true, true}));

    const PathArguments after_pattern{.positional = true, .first_positional = 1, .flags = {}};
    assert(lxterm::path_argument_mask(after_pattern, {"-i", "/pattern", "/file"}) ==
           std::vector<bool>({false, false, true}));

    const PathArguments none{};
    assert(lxterm::path_argument_mask(none, {"/a", "/b"}) == std::vector<bool>({false, false}));
}

void test_path_mask_flags_and_double_dash() {
    const PathArguments with_flag{.positional = false, .first_positional = 0, .flags = {"-o"}};
    assert(lxterm::path_argument_mask(with_flag, {"-o", "/out", "/plain"}) == std::vector<bool>({false, true, false}));
    assert(lxterm::path_argument_mask(with_flag, {"-o"}) == std::vector<bool>({false}));

    const PathArguments all{.positional = true, .first_positional = 0, .flags = {}};
    assert(lxterm::path_argument_mask(all, {"--", "-dash-file"}) == std::vector<bool>({false, true}));
}

void test_dispatch_example_pipeline_to_builtins() {
    CommandRegistry registry;
    lxterm::register_file_builtins(registry);
    const PathTranslator paths('C', R"(C:\Users\ana)");
    const Dispatcher dispatcher(registry, paths);

    lxterm::Parser parser;
    const auto pipeline = parser.parse("list /home | filter txt > results.txt");
    assert(pipeline.has_value());

    const auto prepared = dispatcher.prepare(*pipeline);
    assert(prepared.stages.size() == 2);

    assert(prepared.stages[0].kind == InvocationKind::Builtin);
    assert(prepared.stages[0].entry == registry.find("list"));
    assert(prepared.stages[0].args == std::vector<std::string>({R"(C:\home)"}));

    assert(prepared.stages[1].kind == InvocationKind::Builtin);
    assert(prepared.stages[1].args == std::vector<std::string>({"txt"}));

    assert(prepared.output.mode == lxterm::RedirectionMode::Truncate);
    assert(prepared.output.target == "results.txt");
}

void test_dispatch_unknown_to_host_shell_untranslated() {
    CommandRegistry registry;
    lxterm::register_file_builtins(registry);
    const PathTranslator paths('C', "");
    const Dispatcher dispatcher(registry, paths);

    const auto invocation = dispatcher.dispatch(lxterm::Stage{
        .name = "gcc",
        .args = {"-o", "/tmp/a.out", "/home/main.c"},
        .redirection = {},
    });

    assert(invocation.kind == InvocationKind::HostShell);
    assert(invocation.entry == nullptr);
    assert(invocation.name == "gcc");
    assert(invocation.args == std::vector<std::string>({"-o", "/tmp/a.out", "/home/main.c"}));
}

void test_dispatch_translates_redirection_target() {
    CommandRegistry registry;
    lxterm::register_file_builtins(registry);
    const PathTranslator paths('C', "");
    const Dispatcher dispatcher(registry, paths);

    lxterm::Parser parser;
    const auto pipeline = parser.parse("echo /not/a/path >> /d/logs/out.txt");
    assert(pipeline.has_value());

    const auto prepared = dispatcher.prepare(*pipeline);
    // echo declares no path arguments.
    assert(prepared.stages[0].args == std::vector<std::string>({"/not/a/path"}));
    assert(prepared.output.mode == lxterm::RedirectionMode::Append);
    assert(prepared.output.target == R"(D:\logs\out.txt)");
}

} // namespace

int main() {
    test_register_find_and_execute();
    test_execute_unknown_reports_not_found();
    test_names_are_sorted_and_reregistration_replaces();
    test_path_mask_for_positionals();
    test_path_mask_flags_and_double_dash();
    test_dispatch_example_pipeline_to_builtins();
    test_dispatch_unknown_to_host_shell_untranslated();
    test_dispatch_translates_redirection_target();

    return 0;
}
