#include "builtins/file_builtins.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "builtins/command_registry.hpp"

namespace lxterm {

namespace fs = std::filesystem;

namespace {

struct Options {
    std::set<char> flags;
    std::vector<std::string> operands;
    std::optional<char> unknown;

    [[nodiscard]] bool has(char flag) const { return flags.contains(flag); }
};

[[nodiscard]] Options parse_options(const std::vector<std::string> &args, std::string_view allowed) {
    Options options;
    bool options_ended = false;

    for (const auto &arg : args) {
        if (!options_ended && arg == "--") {
            options_ended = true;
            continue;
        }

        if (options_ended || arg.size() < 2 || arg.front() != '-') {
            options.operands.push_back(arg);
            continue;
        }

        for (const char flag : std::string_view(arg).substr(1)) {
            if (allowed.find(flag) == std::string_view::npos) {
                options.unknown = flag;
            } else {
                options.flags.insert(flag);
            }
        }
    }

    return options;
}

[[nodiscard]] bool reject_unknown(const Options &options, std::string_view command, std::ostream &err) {
    if (!options.unknown.has_value()) {
        return false;
    }

    err << command << ": invalid option -- '" << *options.unknown << "'" << std::endl;
    return true;
}

// Chunked copy; stops once the destination goes bad (e.g. the reader closed the pipe).
void copy_stream(std::istream &in, std::ostream &out) {
    char buffer[8192];

    while (out) {
        in.read(buffer, sizeof(buffer));
        if (in.gcount() <= 0) {
            break;
        }
        out.write(buffer, in.gcount());
    }
}

[[nodiscard]] std::string to_lower(std::string_view text) {
    std::string result(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void print_list_entry(const fs::directory_entry &entry, const std::string &name, bool long_format, std::ostream &out) {
    if (!long_format) {
        out << name << '\n';
        return;
    }

    std::error_code ec;
    const bool is_dir = entry.is_directory(ec);
    const auto size = is_dir ? std::uintmax_t{0} : entry.file_size(ec);

    out << (is_dir ? 'd' : '-') << ' ' << std::setw(10) << (ec ? std::uintmax_t{0} : size) << ' ' << name << '\n';
}

int builtin_list(const std::vector<std::string> &args, CommandIo &io) {
    auto options = parse_options(args, "al");
    if (reject_unknown(options, "list", io.err)) {
        return 2;
    }

    if (options.operands.empty()) {
        options.operands.emplace_back(".");
    }

    const bool show_hidden = options.has('a');
    const bool long_format = options.has('l');
    const bool print_headers = options.operands.size() > 1;
    int status = 0;

    for (std::size_t i = 0; i < options.operands.size(); ++i) {
        const auto &operand = options.operands[i];
        std::error_code ec;
        const fs::directory_entry target(operand, ec);

        if (ec || !target.exists(ec)) {
            io.err << "list: cannot access '" << operand << "': No such file or directory" << std::endl;
            status = 1;
            continue;
        }

        if (!target.is_directory(ec)) {
            print_list_entry(target, operand, long_format, io.out);
            continue;
        }

        std::vector<fs::directory_entry> entries;
        for (fs::directory_iterator it(operand, ec), end; !ec && it != end; it.increment(ec)) {
            const auto name = it->path().filename().string();
            if (show_hidden || !name.starts_with('.')) {
                entries.push_back(*it);
            }
        }

        if (ec) {
            io.err << "list: cannot open directory '" << operand << "': " << ec.message() << std::endl;
            status = 1;
            continue;
        }

        std::ranges::sort(entries, {}, [](const fs::directory_entry &entry) { return entry.path().filename().string(); });

        if (print_headers) {
            io.out << (i > 0 ? "\n" : "") << operand << ":\n";
        }

        for (const auto &entry : entries) {
            print_list_entry(entry, entry.path().filename().string(), long_format, io.out);
        }
    }

    io.out.flush();
    return status;
}

int builtin_concat(const std::vector<std::string> &args, CommandIo &io) {
    auto options = parse_options(args, "n");
    if (reject_unknown(options, "concat", io.err)) {
        return 2;
    }

    if (options.operands.empty()) {
        options.operands.emplace_back("-");
    }

    const bool number_lines = options.has('n');
    std::size_t line_number = 0;
    int status = 0;

    auto emit = [&](std::istream &in) {
        if (!number_lines) {
            copy_stream(in, io.out);
            return;
        }

        std::string line;
        while (io.out && std::getline(in, line)) {
            io.out << std::setw(6) << ++line_number << '\t' << line << '\n';
        }
    };

    for (const auto &operand : options.operands) {
        if (operand == "-") {
            emit(io.in);
            continue;
        }

        std::ifstream file(operand, std::ios::binary);
        if (!file.is_open()) {
            io.err << "concat: " << operand << ": No such file or directory" << std::endl;
            status = 1;
            continue;
        }

        emit(file);
    }

    io.out.flush();
    return status;
}

int builtin_filter(const std::vector<std::string> &args, CommandIo &io) {
    auto options = parse_options(args, "ivn");
    if (reject_unknown(options, "filter", io.err)) {
        return 2;
    }

    if (options.operands.empty()) {
        io.err << "filter: usage: filter [-ivn] PATTERN [FILE...]" << std::endl;
        return 2;
    }

    const bool ignore_case = options.has('i');
    const bool invert = options.has('v');
    const bool number_lines = options.has('n');
    const std::string pattern = ignore_case ? to_lower(options.operands.front()) : options.operands.front();

    std::vector<std::string> sources(options.operands.begin() + 1, options.operands.end());
    if (sources.empty()) {
        sources.emplace_back("-");
    }

    const bool print_names = sources.size() > 1;
    bool matched = false;
    bool failed = false;

    auto scan = [&](std::istream &in, const std::string &name) {
        std::string line;
        std::size_t line_number = 0;

        while (io.out && std::getline(in, line)) {
            ++line_number;
            const bool found = (ignore_case ? to_lower(line) : line).find(pattern) != std::string::npos;
            if (found == invert) {
                continue;
            }

            matched = true;
            if (print_names) {
                io.out << name << ':';
            }
            if (number_lines) {
                io.out << line_number << ':';
            }
            io.out << line << '\n';
        }
    };

    for (const auto &source : sources) {
        if (source == "-") {
            scan(io.in, "(standard input)");
            continue;
        }

        std::ifstream file(source);
        if (!file.is_open()) {
            io.err << "filter: " << source << ": No such file or directory" << std::endl;
            failed = true;
            continue;
        }

        scan(file, source);
    }

    io.out.flush();
    if (failed) {
        return 2;
    }

    return matched ? 0 : 1;
}

struct Counts {
    std::uintmax_t lines{0};
    std::uintmax_t words{0};
    std::uintmax_t bytes{0};
};

[[nodiscard]] Counts count_stream(std::istream &in) {
    Counts counts;
    char buffer[8192];
    bool in_word = false;

    while (true) {
        in.read(buffer, sizeof(buffer));
        if (in.gcount() <= 0) {
            break;
        }

        const auto read = static_cast<std::size_t>(in.gcount());
        counts.bytes += read;

        for (std::size_t i = 0; i < read; ++i) {
            const auto c = static_cast<unsigned char>(buffer[i]);
            if (c == '\n') {
                ++counts.lines;
            }

            if (std::isspace(c)) {
                in_word = false;
            } else if (!in_word) {
                in_word = true;
                ++counts.words;
            }
        }
    }

    return counts;
}

int builtin_count(const std::vector<std::string> &args, CommandIo &io) {
    auto options = parse_options(args, "lwc");
    if (reject_unknown(options, "count", io.err)) {
        return 2;
    }

    const bool all = options.flags.empty();
    const bool show_lines = all || options.has('l');
    const bool show_words = all || options.has('w');
    const bool show_bytes = all || options.has('c');

    auto report = [&](const Counts &counts, const std::string &name) {
        bool first = true;
        auto field = [&](std::uintmax_t value) {
            if (!first) {
                io.out << ' ';
            }
            io.out << std::setw(7) << value;
            first = false;
        };

        if (show_lines) {
            field(counts.lines);
        }
        if (show_words) {
            field(counts.words);
        }
        if (show_bytes) {
            field(counts.bytes);
        }
        if (!name.empty()) {
            io.out << ' ' << name;
        }
        io.out << '\n';
    };

    if (options.operands.empty()) {
        report(count_stream(io.in), "");
        io.out.flush();
        return 0;
    }

    Counts total;
    int status = 0;

    for (const auto &operand : options.operands) {
        std::ifstream file(operand, std::ios::binary);
        if (!file.is_open()) {
            io.err << "count: " << operand << ": No such file or directory" << std::endl;
            status = 1;
            continue;
        }

        const Counts counts = count_stream(file);
        total.lines += counts.lines;
        total.words += counts.words;
        total.bytes += counts.bytes;
        report(counts, operand);
    }

    if (options.operands.size() > 1) {
        report(total, "total");
    }

    io.out.flush();
    return status;
}

int builtin_remove(const std::vector<std::string> &args, CommandIo &io) {
    const auto options = parse_options(args, "rRf");
    if (reject_unknown(options, "remove", io.err)) {
        return 2;
    }

    const bool recursive = options.has('r') || options.has('R');
    const bool force = options.has('f');

    if (options.operands.empty()) {
        if (force) {
            return 0;
        }
        io.err << "remove: missing operand" << std::endl;
        return 1;
    }

    int status = 0;
    for (const auto &operand : options.operands) {
        std::error_code ec;
        const auto file_status = fs::symlink_status(operand, ec);

        if (!fs::exists(file_status)) {
            if (!force) {
                io.err << "remove: cannot remove '" << operand << "': No such file or directory" << std::endl;
                status = 1;
            }
            continue;
        }

        if (fs::is_directory(file_status) && !recursive) {
            io.err << "remove: cannot remove '" << operand << "': Is a directory" << std::endl;
            status = 1;
            continue;
        }

        if (recursive) {
            fs::remove_all(operand, ec);
        } else {
            fs::remove(operand, ec);
        }

        if (ec) {
            io.err << "remove: cannot remove '" << operand << "': " << ec.message() << std::endl;
            status = 1;
        }
    }

    return status;
}

int builtin_makedir(const std::vector<std::string> &args, CommandIo &io) {
    const auto options = parse_options(args, "p");
    if (reject_unknown(options, "makedir", io.err)) {
        return 2;
    }

    if (options.operands.empty()) {
        io.err << "makedir: missing operand" << std::endl;
        return 1;
    }

    const bool parents = options.has('p');
    int status = 0;

    for (const auto &operand : options.operands) {
        std::error_code ec;

        if (parents) {
            fs::create_directories(operand, ec);
        } else if (fs::exists(operand, ec)) {
            io.err << "makedir: cannot create directory '" << operand << "': File exists" << std::endl;
            status = 1;
            continue;
        } else {
            fs::create_directory(operand, ec);
        }

        if (ec) {
            io.err << "makedir: cannot create directory '" << operand << "': " << ec.message() << std::endl;
            status = 1;
        }
    }

    return status;
}

[[nodiscard]] std::string expand_escapes(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            result.push_back(text[i]);
            continue;
        }

        switch (text[++i]) {
        case 'n':
            result.push_back('\n');
            break;
        case 't':
            result.push_back('\t');
            break;
        case '\\':
            result.push_back('\\');
            break;
        default:
            result.push_back('\\');
            result.push_back(text[i]);
            break;
        }
    }

    return result;
}

int builtin_echo(const std::vector<std::string> &args, CommandIo &io) {
    bool newline = true;
    bool escapes = false;
    std::size_t first = 0;

    for (; first < args.size(); ++first) {
        if (args[first] == "-n") {
            newline = false;
        } else if (args[first] == "-e") {
            escapes = true;
        } else {
            break;
        }
    }

    for (std::size_t i = first; i < args.size(); ++i) {
        if (i > first) {
            io.out << ' ';
        }

        io.out << (escapes ? expand_escapes(args[i]) : args[i]);
    }

    if (newline) {
        io.out << '\n';
    }

    io.out.flush();
    return 0;
}

} // namespace

void register_file_builtins(CommandRegistry &registry) {
    const PathArguments all_operands{.positional = true, .first_positional = 0, .flags = {}};

    registry.register_command("list", {.handler = builtin_list,
                                       .summary = "list [-al] [PATH...] - list directory contents",
                                       .path_arguments = all_operands,
                                       .runs_in_interpreter = false});
    registry.register_command("concat", {.handler = builtin_concat,
                                         .summary = "concat [-n] [FILE...] - print files or standard input",
                                         .path_arguments = all_operands,
                                         .runs_in_interpreter = false});
    registry.register_command("filter",
                              {.handler = builtin_filter,
                               .summary = "filter [-ivn] PATTERN [FILE...] - print lines containing PATTERN",
                               .path_arguments = {.positional = true, .first_positional = 1, .flags = {}},
                               .runs_in_interpreter = false});
    registry.register_command("count", {.handler = builtin_count,
                                        .summary = "count [-lwc] [FILE...] - count lines, words and bytes",
                                        .path_arguments = all_operands,
                                        .runs_in_interpreter = false});
    registry.register_command("remove", {.handler = builtin_remove,
                                         .summary = "remove [-rf] PATH... - remove files or directories",
                                         .path_arguments = all_operands,
                                         .runs_in_interpreter = false});
    registry.register_command("makedir", {.handler = builtin_makedir,
                                          .summary = "makedir [-p] DIR... - create directories",
                                          .path_arguments = all_operands,
                                          .runs_in_interpreter = false});
    registry.register_command("echo", {.handler = builtin_echo,
                                       .summary = "echo [-ne] [TEXT...] - print arguments",
                                       .path_arguments = {},
                                       .runs_in_interpreter = false});
}

} // namespace lxterm
