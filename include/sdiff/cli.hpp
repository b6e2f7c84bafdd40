// ==============================================================================
// sdiff/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Распознавание вызова git как внешнего diff driver'а
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef SDIFF_CLI_HPP
#define SDIFF_CLI_HPP

#include <sdiff/diff.hpp>
#include <sdiff/output.hpp>
#include <sdiff/render.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sdiff::cli {

constexpr const char* VERSION = "0.1.0";

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;                                  // -v (repeatable)
    bool quiet = false;                               // -q
    output::ColorMode color = output::ColorMode::Auto;  // --color
    std::optional<std::filesystem::path> output;      // -o, --output
    std::optional<std::filesystem::path> config;      // --config
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Сравнение двух файлов ("-" - stdin).
/// Незаданные опции остаются пустыми, чтобы не перекрывать файл настроек.
struct DiffCommand {
    std::string file1;
    std::string file2;

    std::optional<render::RenderFormat> format;       // -f, --format
    std::optional<bool> compact;                      // -c, --compact
    std::optional<std::size_t> max_value_length;      // --max-value-length
    std::optional<ArrayDiffStrategy> array_diff;      // --array-diff
    bool show_values = false;                         // --show-values
    bool null_as_missing = false;                     // --null-as-missing
    bool ignore_whitespace = false;                   // --ignore-whitespace
    std::vector<std::string> ignore;                  // --ignore (repeatable)
    std::vector<std::string> only;                    // --only (repeatable)

    bool git_driver = false;  // вызван git'ом с 7 аргументами
};

struct GitInstallCommand {};
struct GitUninstallCommand {};
struct GitStatusCommand {};
struct HelpCommand {};
struct VersionCommand {};

using Command = std::variant<DiffCommand, GitInstallCommand, GitUninstallCommand,
                             GitStatusCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// То же для уже собранного списка (без имени программы)
ParseResult parse_args(const std::vector<std::string>& args);

/// Текст --help
std::string render_help();

/// Текст --version: "sdiff <VERSION>\n"
std::string render_version();

}  // namespace sdiff::cli

#endif  // SDIFF_CLI_HPP
