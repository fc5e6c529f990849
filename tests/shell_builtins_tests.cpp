#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "builtins/command_registry.hpp"
#include "builtins/file_builtins.hpp"
#include "builtins/shell_builtins.hpp"
#include "core/executable_search.hpp"
#include "core/shell_context.hpp"

using lxterm::CommandIo;
using lxterm::CommandRegistry;
using lxterm::ShellConfig;
using lxterm::ShellContext;

namespace {

namespace fs = std::filesystem;

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

class CwdGuard {
  public:
    CwdGuard() : saved_(fs::current_path()) {}
    ~CwdGuard() { fs::current_path(saved_); }

  private:
    fs::path saved_;
};

std::string make_temp_dir() {
    std::string pattern = "/tmp/lxterm_shell_builtins_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *dir = mkdtemp(buffer.data());
    assert(dir != nullptr);
    return fs::canonical(dir).string();
}

struct Result {
    int status;
    std::string out;
    std::string err;
};

struct Fixture {
    explicit Fixture(ShellConfig config = {}) : context(std::move(config)), builtins(context, registry, search) {
        lxterm::register_file_builtins(registry);
        builtins.install(registry);
    }

    Result run(const std::string &name, const std::vector<std::string> &args) {
        std::istringstream in;
        std::ostringstream out;
        std::ostringstream err;
        CommandIo io{.in = in, .out = out, .err = err};

        const int status = registry.execute(name, args, io);
        return Result{.status = status, .out = out.str(), .err = err.str()};
    }

    ShellContext context;
    CommandRegistry registry;
    lxterm::ExecutableSearch search;
    lxterm::ShellBuiltins builtins;
};

void test_state_changing_builtins_run_in_interpreter() {
    Fixture fixture;

    for (const char *name : {"chdir", "alias", "unalias", "exit"}) {
        assert(fixture.registry.find(name)->runs_in_interpreter);
    }
    for (const char *name : {"cwd", "history", "which", "help", "list"}) {
        assert(!fixture.registry.find(name)->runs_in_interpreter);
    }
}

void test_chdir_cwd_and_previous_directory() {
    CwdGuard cwd_guard;
    const std::string first = make_temp_dir();
    const std::string second = make_temp_dir();

    ShellConfig config;
    config.home_directory = first;
    Fixture fixture(config);

    assert(fixture.run("chdir", {}).status == 0);
    assert(fixture.run("cwd", {}).out == first + "\n");

    assert(fixture.run("chdir", {second}).status == 0);
    assert(fixture.context.previous_directory == first);

    const auto back = fixture.run("chdir", {"-"});
    assert(back.status == 0);
    assert(back.out == first + "\n");
    assert(fs::current_path() == first);

    fs::create_directory(fs::path(first) / "inner");
    assert(fixture.run("chdir", {"~/inner"}).status == 0);
    assert(fs::current_path() == fs::path(first) / "inner");

    const auto missing = fixture.run("chdir", {"/no/such/dir"});
    assert(missing.status == 1);
    assert(missing.err == "chdir: /no/such/dir: No such file or directory\n");

    fs::current_path("/");
    fs::remove_all(first);
    fs::remove_all(second);
}

void test_chdir_without_home_or_previous() {
    Fixture fixture;

    const auto no_home = fixture.run("chdir", {});
    assert(no_home.status == 1);
    assert(no_home.err == "chdir: HOME not set\n");

    const auto no_previous = fixture.run("chdir", {"-"});
    assert(no_previous.status == 1);
    assert(no_previous.err == "chdir: OLDPWD not set\n");
}

void test_alias_define_show_and_list() {
    Fixture fixture;

    assert(fixture.run("alias", {"lt=list -l 'my dir'"}).status == 0);
    const auto *defined = fixture.context.aliases.lookup("lt");
    assert(defined != nullptr);
    assert(defined->name == "list");
    assert(defined->args == std::vector<std::string>({"-l", "my dir"}));

    assert(fixture.run("alias", {"lt"}).out == "alias lt='list -l my dir'\n");
    assert(fixture.run("alias", {"ll"}).out == "alias ll='list -la'\n");

    const auto listing = fixture.run("alias", {});
    assert(listing.status == 0);
    assert(listing.out.find("alias lt='list -l my dir'\n") != std::string::npos);
    assert(listing.out.find("alias cd='chdir'\n") != std::string::npos);

    const auto unknown = fixture.run("alias", {"nothing"});
    assert(unknown.status == 1);
}

void test_alias_rejects_cycles_and_pipelines() {
    Fixture fixture;

    assert(fixture.run("alias", {"a=b"}).status == 0);
    const auto cycle = fixture.run("alias", {"b=a"});
    assert(cycle.status == 1);
    assert(cycle.err.find("expands to itself") != std::string::npos);
    assert(fixture.context.aliases.lookup("b") == nullptr);

    const auto piped = fixture.run("alias", {"p=list | count"});
    assert(piped.status == 1);
    assert(fixture.context.aliases.lookup("p") == nullptr);

    assert(fixture.run("alias", {"empty="}).status == 1);
    assert(fixture.run("alias", {"=x"}).status == 1);
}

void test_unalias() {
    Fixture fixture;
    assert(fixture.run("alias", {"hi=echo hi"}).status == 0);

    assert(fixture.run("unalias", {"hi"}).status == 0);
    assert(fixture.context.aliases.lookup("hi") == nullptr);

    const auto builtin = fixture.run("unalias", {"ls"});
    assert(builtin.status == 1);
    assert(builtin.err.find("built-in alias") != std::string::npos);
    assert(fixture.context.aliases.lookup("ls") != nullptr);

    assert(fixture.run("unalias", {"ghost"}).status == 1);
    assert(fixture.run("unalias", {}).status == 2);
}

void test_history_builtin() {
    Fixture fixture;
    fixture.context.history.record("list");
    fixture.context.history.record("cwd");

    assert(fixture.run("history", {}).out == "    1  list\n    2  cwd\n");
    assert(fixture.run("history", {"1"}).out == "    2  cwd\n");
    assert(fixture.run("history", {"x"}).status == 1);
}

void test_which_and_help() {
    EnvVarGuard path_guard("PATH");
    setenv("PATH", "/bin:/usr/bin", 1);
    Fixture fixture;

    assert(fixture.run("which", {"ls"}).out == "ls: aliased to list\n");
    assert(fixture.run("which", {"filter"}).out == "filter: shell builtin\n");

    const auto sh = fixture.run("which", {"sh"});
    assert(sh.status == 0);
    assert(sh.out.ends_with("/sh\n"));

    const auto missing = fixture.run("which", {"lxterm-no-such-command"});
    assert(missing.status == 1);

    assert(fixture.run("help", {"grep"}).out.starts_with("filter [-ivn]"));
    assert(fixture.run("help", {"nothing-here"}).status == 1);

    const auto overview = fixture.run("help", {});
    assert(overview.status == 0);
    assert(overview.out.find("  makedir [-p]") != std::string::npos);
    assert(overview.out.find("  exit [N]") != std::string::npos);
}

void test_exit_codes() {
    Fixture fixture;
    fixture.context.last_exit_code = 5;

    assert(fixture.run("exit", {}).status == 5);
    assert(fixture.context.exit_requested);

    assert(fixture.run("exit", {"3"}).status == 3);
    assert(fixture.run("exit", {"256"}).status == 0);

    const auto bad = fixture.run("exit", {"abc"});
    assert(bad.status == 2);
    assert(bad.err == "exit: abc: numeric argument required\n");
}

} // namespace

int main() {
    test_state_changing_builtins_run_in_interpreter();
    test_chdir_cwd_and_previous_directory();
    test_chdir_without_home_or_previous();
    test_alias_define_show_and_list();
    test_alias_rejects_cycles_and_pipelines();
    test_unalias();
    test_history_builtin();
    test_which_and_help();
    test_exit_codes();

    return 0;
}
