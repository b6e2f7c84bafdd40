// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: сообщения об ошибках в стиле clap,
// exit code 2 для любых ошибок аргументов.
//
// ==============================================================================

#include <sdiff/cli.hpp>
#include <sdiff/git.hpp>
#include <sdiff/platform.hpp>

#include <charconv>
#include <cstring>

namespace sdiff::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE = "Usage: sdiff [OPTIONS] <FILE1> <FILE2>";

bool starts_with(const std::string& str, const char* prefix) {
    return str.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    // error + "\n\n" + Usage + "\n\n" + hint
    return "error: " + error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& error_msg) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg);
    return result;
}

std::string invalid_value(const std::string& value, const char* option, const char* allowed) {
    return "invalid value '" + value + "' for '" + option + "'\n  [possible values: " + allowed +
           "]";
}

/// Разбор значения опции: "--name value" или "--name=value"
class OptionReader {
public:
    explicit OptionReader(const std::vector<std::string>& args) : args_(args) {}

    bool done() const { return pos_ >= args_.size(); }

    const std::string& current() const { return args_[pos_]; }

    void advance() { ++pos_; }

    /// Проверить имя опции; при совпадении "--name=value" запоминает value
    bool is(const char* short_name, const char* long_name) {
        const std::string& arg = current();
        inline_value_.reset();
        if ((short_name != nullptr && arg == short_name) || arg == long_name) {
            return true;
        }
        std::string prefix = std::string(long_name) + "=";
        if (starts_with(arg, prefix.c_str())) {
            inline_value_ = arg.substr(prefix.size());
            return true;
        }
        return false;
    }

    /// Значение опции: inline или следующий аргумент
    std::optional<std::string> value() {
        if (inline_value_) {
            return inline_value_;
        }
        if (pos_ + 1 < args_.size()) {
            ++pos_;
            return args_[pos_];
        }
        return std::nullopt;
    }

private:
    const std::vector<std::string>& args_;
    std::size_t pos_ = 0;
    std::optional<std::string> inline_value_;
};

std::optional<bool> parse_bool(const std::string& s) {
    if (s == "true") {
        return true;
    }
    if (s == "false") {
        return false;
    }
    return std::nullopt;
}

std::optional<std::size_t> parse_size(const std::string& s) {
    std::size_t n = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), n);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return n;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("sdiff ") + VERSION + "\n";
}

std::string render_help() {
    return "Semantic diff tool for structured data\n"
           "\n"
           "Usage: sdiff [OPTIONS] <FILE1> <FILE2>\n"
           "\n"
           "Arguments:\n"
           "  <FILE1>  First file to compare ('-' for stdin)\n"
           "  <FILE2>  Second file to compare ('-' for stdin)\n"
           "\n"
           "Options:\n"
           "  -f, --format <FORMAT>        Output format [default: terminal]\n"
           "                               [possible values: terminal, plain, json]\n"
           "  -c, --compact <COMPACT>      Show only changes [default: true]\n"
           "      --show-values            Show full values instead of previews\n"
           "      --max-value-length <N>   Maximum length for displayed values [default: 80]\n"
           "      --null-as-missing        Treat null values as missing keys\n"
           "      --ignore-whitespace      Ignore whitespace differences in strings\n"
           "      --array-diff <STRATEGY>  Array comparison [default: positional]\n"
           "                               [possible values: positional, lcs]\n"
           "      --ignore <PATTERN>       Ignore changes under PATTERN (repeatable)\n"
           "      --only <PATTERN>         Only show changes under PATTERN (repeatable)\n"
           "      --config <FILE>          Settings file [default: .sdiff.yaml if present]\n"
           "      --color <WHEN>           Colorize output [default: auto]\n"
           "                               [possible values: auto, always, never]\n"
           "  -o, --output <FILE>          Write the diff to a file\n"
           "  -v, --verbose...             Verbose output\n"
           "  -q, --quiet                  Only show changes, suppress summary\n"
           "      --git-install            Install sdiff as git difftool and diff driver\n"
           "      --git-uninstall          Remove sdiff from git configuration\n"
           "      --git-status             Show git configuration for sdiff\n"
           "  -h, --help                   Print help\n"
           "  -V, --version                Print version\n"
           "\n"
           "Patterns are dot-separated paths: '*' matches one segment, '**' any number.\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Compare two configs, ignoring metadata:\n"
           "        sdiff old.yaml new.yaml --ignore 'metadata.**'\n"
           "\n"
           "    Align reordered lists and print JSON:\n"
           "        sdiff --array-diff lcs -f json a.json b.json\n"
           "\n"
           "Exit status: 0 no changes, 1 changes found, 2 error.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

ParseResult parse_args(const std::vector<std::string>& args) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (args.empty()) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    // git diff driver: path old-file old-hex old-mode new-file new-hex new-mode
    if (auto files = vcs::detect_git_diff_driver_args(args)) {
        DiffCommand diff_cmd;
        diff_cmd.file1 = files->first;
        diff_cmd.file2 = files->second;
        diff_cmd.git_driver = true;
        result.ok = true;
        result.command = std::move(diff_cmd);
        return result;
    }

    DiffCommand diff_cmd;
    std::vector<std::string> positional;
    bool git_install = false;
    bool git_uninstall = false;
    bool git_status = false;
    bool only_positional = false;

    OptionReader r(args);
    for (; !r.done(); r.advance()) {
        const std::string& arg = r.current();

        if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }

        if (r.is("-h", "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (r.is("-V", "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }

        if (arg == "-v" || arg == "--verbose") {
            result.global.verbose++;
        } else if (arg.size() > 2 && arg[0] == '-' && arg[1] == 'v' &&
                   arg.find_first_not_of('v', 1) == std::string::npos) {
            // -vv, -vvv
            result.global.verbose += static_cast<int>(arg.size() - 1);
        } else if (arg == "-q" || arg == "--quiet") {
            result.global.quiet = true;
        } else if (arg == "--show-values") {
            diff_cmd.show_values = true;
        } else if (arg == "--null-as-missing") {
            diff_cmd.null_as_missing = true;
        } else if (arg == "--ignore-whitespace") {
            diff_cmd.ignore_whitespace = true;
        } else if (arg == "--git-install") {
            git_install = true;
        } else if (arg == "--git-uninstall") {
            git_uninstall = true;
        } else if (arg == "--git-status") {
            git_status = true;
        } else if (r.is("-f", "--format")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--format <FORMAT>' but none was "
                                   "supplied");
            }
            diff_cmd.format = render::render_format_from_string(*v);
            if (!diff_cmd.format) {
                return usage_error(std::move(result),
                                   invalid_value(*v, "--format <FORMAT>", "terminal, plain, json"));
            }
        } else if (r.is("-c", "--compact")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--compact <COMPACT>' but none was "
                                   "supplied");
            }
            diff_cmd.compact = parse_bool(*v);
            if (!diff_cmd.compact) {
                return usage_error(std::move(result),
                                   invalid_value(*v, "--compact <COMPACT>", "true, false"));
            }
        } else if (r.is(nullptr, "--max-value-length")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--max-value-length <N>' but none "
                                   "was supplied");
            }
            diff_cmd.max_value_length = parse_size(*v);
            if (!diff_cmd.max_value_length) {
                return usage_error(std::move(result),
                                   "invalid value '" + *v +
                                       "' for '--max-value-length <N>': invalid digit found in "
                                       "string");
            }
        } else if (r.is(nullptr, "--array-diff")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--array-diff <STRATEGY>' but none "
                                   "was supplied");
            }
            diff_cmd.array_diff = array_diff_strategy_from_string(*v);
            if (!diff_cmd.array_diff) {
                return usage_error(std::move(result),
                                   invalid_value(*v, "--array-diff <STRATEGY>", "positional, lcs"));
            }
        } else if (r.is(nullptr, "--ignore")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--ignore <PATTERN>' but none was "
                                   "supplied");
            }
            diff_cmd.ignore.push_back(*v);
        } else if (r.is(nullptr, "--only")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--only <PATTERN>' but none was "
                                   "supplied");
            }
            diff_cmd.only.push_back(*v);
        } else if (r.is(nullptr, "--config")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--config <FILE>' but none was "
                                   "supplied");
            }
            result.global.config = platform::path_from_utf8(*v);
        } else if (r.is(nullptr, "--color")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--color <WHEN>' but none was "
                                   "supplied");
            }
            auto mode = output::color_mode_from_string(*v);
            if (!mode) {
                return usage_error(std::move(result),
                                   invalid_value(*v, "--color <WHEN>", "auto, always, never"));
            }
            result.global.color = *mode;
        } else if (r.is("-o", "--output")) {
            auto v = r.value();
            if (!v) {
                return usage_error(std::move(result),
                                   "a value is required for '--output <FILE>' but none was "
                                   "supplied");
            }
            result.global.output = platform::path_from_utf8(*v);
        } else {
            return usage_error(std::move(result), "unexpected argument '" + arg + "' found");
        }
    }

    // Команды git не требуют файлов
    const int git_commands = int(git_install) + int(git_uninstall) + int(git_status);
    if (git_commands > 1) {
        return usage_error(std::move(result),
                           "the git options '--git-install', '--git-uninstall' and "
                           "'--git-status' cannot be used together");
    }
    if (git_commands == 1) {
        if (!positional.empty()) {
            return usage_error(std::move(result),
                               "unexpected argument '" + positional.front() + "' found");
        }
        result.ok = true;
        if (git_install) {
            result.command = GitInstallCommand{};
        } else if (git_uninstall) {
            result.command = GitUninstallCommand{};
        } else {
            result.command = GitStatusCommand{};
        }
        return result;
    }

    if (positional.size() < 2) {
        std::string missing = positional.empty() ? "  <FILE1>\n  <FILE2>" : "  <FILE2>";
        return usage_error(std::move(result),
                           "the following required arguments were not provided:\n" + missing);
    }
    if (positional.size() > 2) {
        return usage_error(std::move(result), "unexpected argument '" + positional[2] + "' found");
    }
    if (positional[0] == "-" && positional[1] == "-") {
        return usage_error(std::move(result), "only one of <FILE1> and <FILE2> can be '-'");
    }

    diff_cmd.file1 = positional[0];
    diff_cmd.file2 = positional[1];
    result.ok = true;
    result.command = std::move(diff_cmd);
    return result;
}

}  // namespace sdiff::cli
