#include <csignal>
#include <iostream>
#include <string>
#include <string_view>

#include <unistd.h>

#include "app/shell_app.hpp"
#include "core/exit_codes.hpp"
#include "core/shell_config.hpp"

namespace {

void print_usage(std::ostream &out) {
    out << "usage: lxterm [-c COMMAND]\n"
           "  -c COMMAND  run one command line and exit with its status\n"
           "  -h, --help  show this help\n"
           "Without -c, commands are read interactively, or line by line when stdin is not a terminal.\n";
}

} // namespace

int main(int argc, char **argv) {
    std::signal(SIGPIPE, SIG_IGN);

    lxterm::ShellApp app(lxterm::ShellConfig::from_environment());

    if (argc > 1) {
        const std::string_view option = argv[1];

        if (option == "-h" || option == "--help") {
            print_usage(std::cout);
            return lxterm::exit_code::success;
        }

        if (option == "-c" && argc == 3) {
            return app.run_command(argv[2]);
        }

        print_usage(std::cerr);
        return lxterm::exit_code::not_executed;
    }

    if (::isatty(STDIN_FILENO) == 0) {
        return app.run_batch(std::cin);
    }

    return app.run_interactive();
}
