// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Сборка конфигурации: значения по умолчанию -> .sdiff.yaml -> флаги
// 4. Загрузка документов, сравнение, фильтрация, вывод
// 5. Exit code: 0 - нет изменений, 1 - есть изменения, 2 - ошибка
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include <sdiff/cli.hpp>
#include <sdiff/diff.hpp>
#include <sdiff/filter.hpp>
#include <sdiff/git.hpp>
#include <sdiff/output.hpp>
#include <sdiff/parser.hpp>
#include <sdiff/platform.hpp>
#include <sdiff/render.hpp>
#include <sdiff/settings.hpp>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace {

constexpr int EXIT_NO_CHANGES = 0;
constexpr int EXIT_CHANGES = 1;
constexpr int EXIT_ERROR = 2;

// ----------------------------------------------------------------------------
// Конфигурация сравнения
// ----------------------------------------------------------------------------

struct RunConfig {
    sdiff::DiffConfig diff;
    sdiff::FilterConfig filter;
    sdiff::render::RenderOptions render;
    sdiff::render::RenderFormat format = sdiff::render::RenderFormat::Terminal;
};

/// Файл настроек: --config или .sdiff.yaml в текущем каталоге.
/// false - ошибка уже выведена.
bool load_settings_layer(const sdiff::cli::GlobalOptions& global, RunConfig& cfg,
                         sdiff::output::Writer& writer) {
    using namespace sdiff;

    std::filesystem::path settings_path;
    if (global.config.has_value()) {
        settings_path = *global.config;
    } else {
        std::error_code ec;
        std::filesystem::path default_path(io::DEFAULT_SETTINGS_FILE);
        if (!std::filesystem::is_regular_file(default_path, ec)) {
            return true;
        }
        settings_path = default_path;
    }

    writer.debug("Loading settings from " + platform::path_to_utf8(settings_path));
    auto result = io::load_settings(settings_path);
    if (!result.ok) {
        writer.error(result.error);
        return false;
    }
    io::apply_settings(result.settings, cfg.diff, cfg.filter, cfg.render, cfg.format);
    return true;
}

/// Флаги командной строки поверх настроек
void apply_cli_layer(const sdiff::cli::DiffCommand& cmd, RunConfig& cfg) {
    if (cmd.format) {
        cfg.format = *cmd.format;
    }
    if (cmd.compact) {
        cfg.render.compact = *cmd.compact;
    }
    if (cmd.max_value_length) {
        cfg.render.max_value_length = *cmd.max_value_length;
    }
    if (cmd.array_diff) {
        cfg.diff.array_diff_strategy = *cmd.array_diff;
    }
    if (cmd.show_values) {
        cfg.render.show_values = true;
    }
    if (cmd.null_as_missing) {
        cfg.diff.treat_null_as_missing = true;
    }
    if (cmd.ignore_whitespace) {
        cfg.diff.ignore_whitespace = true;
    }
    for (const auto& p : cmd.ignore) {
        cfg.filter.ignore(p);
    }
    for (const auto& p : cmd.only) {
        cfg.filter.only(p);
    }
}

// ----------------------------------------------------------------------------
// Загрузка документа
// ----------------------------------------------------------------------------

sdiff::io::ParseResult load_document(const std::string& name) {
    using namespace sdiff;
    if (name == "-") {
        return io::parse_stream(std::cin);
    }
    return io::parse_file(platform::path_from_utf8(name));
}

// ----------------------------------------------------------------------------
// Вывод
// ----------------------------------------------------------------------------

/// --quiet: без строки Summary и пустых строк
void write_rendered(const std::string& text, bool quiet, sdiff::output::Writer& writer) {
    using sdiff::output::Stream;

    if (!quiet) {
        writer.write_line(Stream::Stdout, text);
        return;
    }

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("Summary:", 0) == 0) {
            continue;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        writer.write_line(Stream::Stdout, line);
    }
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_diff(const sdiff::cli::DiffCommand& cmd, const sdiff::cli::GlobalOptions& global,
             sdiff::output::Writer& writer) {
    using namespace sdiff;

    if (global.output.has_value() && !writer.has_output_file()) {
        writer.error("cannot open output file: " + platform::path_to_utf8(*global.output));
        return EXIT_ERROR;
    }

    RunConfig cfg;
    if (!load_settings_layer(global, cfg, writer)) {
        return EXIT_ERROR;
    }
    apply_cli_layer(cmd, cfg);
    cfg.render.color = writer.use_color(output::Stream::Stdout);

    writer.debug("Parsing " + cmd.file1 + "...");
    auto old_doc = load_document(cmd.file1);
    if (!old_doc.ok) {
        writer.write(output::Stream::Stderr, old_doc.error.format());
        return EXIT_ERROR;
    }

    writer.debug("Parsing " + cmd.file2 + "...");
    auto new_doc = load_document(cmd.file2);
    if (!new_doc.ok) {
        writer.write(output::Stream::Stderr, new_doc.error.format());
        return EXIT_ERROR;
    }

    writer.debug(std::string("Computing diff (arrays: ") +
                 array_diff_strategy_to_string(cfg.diff.array_diff_strategy) + ")...");
    Diff diff = compute_diff(old_doc.value, new_doc.value, cfg.diff);
    writer.trace("Raw changes: " + std::to_string(diff.changes.size()));

    if (cfg.filter.has_filters()) {
        diff = filter_diff(diff, cfg.filter);
        writer.trace("Changes after filtering: " + std::to_string(diff.changes.size()));
    }

    writer.debug(std::string("Formatting output as ") + render::render_format_to_string(cfg.format) +
                 "...");
    auto rendered = render::format_diff(diff, cfg.format, cfg.render);
    if (!rendered.ok) {
        writer.error("Failed to format diff output: " + rendered.error);
        return EXIT_ERROR;
    }

    write_rendered(rendered.text, global.quiet, writer);

    // git считает ненулевой код внешнего diff'а фатальной ошибкой
    if (cmd.git_driver) {
        return EXIT_NO_CHANGES;
    }
    return diff.is_empty() ? EXIT_NO_CHANGES : EXIT_CHANGES;
}

int report_git(const sdiff::vcs::GitResult& result, sdiff::output::Writer& writer) {
    if (!result.ok) {
        writer.error(result.error.format());
        return EXIT_ERROR;
    }
    writer.write(sdiff::output::Stream::Stdout, result.output);
    return EXIT_NO_CHANGES;
}

int run(int argc, char** argv) {
    using namespace sdiff;

    // 1. Парсинг argv
    auto parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.color = parse_result.global.color;
    out_cfg.output_path = parse_result.global.output;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга идут в stderr как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return EXIT_NO_CHANGES;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return EXIT_NO_CHANGES;
            } else if constexpr (std::is_same_v<T, cli::GitInstallCommand>) {
                auto exe = platform::current_executable_path(argc > 0 ? argv[0] : "");
                return report_git(vcs::install(platform::path_to_utf8(exe)), writer);
            } else if constexpr (std::is_same_v<T, cli::GitUninstallCommand>) {
                return report_git(vcs::uninstall(), writer);
            } else if constexpr (std::is_same_v<T, cli::GitStatusCommand>) {
                return report_git(vcs::status(), writer);
            } else {
                return run_diff(cmd, parse_result.global, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::fprintf(stderr, "[x] %s\n", e.what());
        return EXIT_ERROR;
    }
}
