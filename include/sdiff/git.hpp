// ==============================================================================
// sdiff/git.hpp - Интеграция с git
// ==============================================================================
//
// Назначение:
// - Установка sdiff как git difftool / diff driver (git config --global)
// - Удаление и просмотр этой конфигурации
// - Распознавание 7-аргументного протокола внешнего diff driver'а git
//
// Модуль ничего не печатает сам: текст для пользователя возвращается
// в GitResult::output и выводится через output::Writer.
//
// ==============================================================================

#ifndef SDIFF_GIT_HPP
#define SDIFF_GIT_HPP

#include <sdiff/platform.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sdiff::vcs {

// ----------------------------------------------------------------------------
// GitError / GitResult
// ----------------------------------------------------------------------------

enum class GitErrorKind {
    CommandFailed,       // Не удалось запустить процесс
    GitNotFound,         // git нет в PATH
    ExecutableNotFound,  // Не удалось определить путь к sdiff
    GitError             // git завершился с ошибкой
};

struct GitError {
    GitErrorKind kind = GitErrorKind::GitError;
    std::string message;

    /// Текст ошибки для пользователя
    std::string format() const;
};

struct GitResult {
    bool ok = false;
    std::string output;  // Текст для stdout
    GitError error;

    explicit operator bool() const { return ok; }
};

/// Запуск внешней команды; по умолчанию platform::run_command.
/// Подменяется в тестах.
using CommandRunner = std::function<platform::CommandOutput(const std::vector<std::string>&)>;

// ----------------------------------------------------------------------------
// Ключи конфигурации
// ----------------------------------------------------------------------------

constexpr const char* KEY_DIFFTOOL_CMD = "difftool.sdiff.cmd";
constexpr const char* KEY_DIFFTOOL_PROMPT = "difftool.sdiff.prompt";
constexpr const char* KEY_DIFF_COMMAND = "diff.sdiff.command";

// ----------------------------------------------------------------------------
// Операции
// ----------------------------------------------------------------------------

/// Прописать sdiff в глобальный git config.
/// exe - путь к исполняемому файлу sdiff (пустой -> ExecutableNotFound)
GitResult install(const std::string& exe, const CommandRunner& run = platform::run_command);

/// Удалить ключи sdiff. Код 5 (ключ не задан) ошибкой не считается.
GitResult uninstall(const CommandRunner& run = platform::run_command);

/// Текущие значения ключей и итог "настроен / не настроен"
GitResult status(const CommandRunner& run = platform::run_command);

/// 40 шестнадцатеричных символов
bool is_git_hash(std::string_view s);

/// git вызывает внешний diff driver с 7 аргументами:
///   path old-file old-hex old-mode new-file new-hex new-mode
/// args - аргументы без имени программы (argv[1..]).
/// Возвращает (old-file, new-file), если протокол распознан.
std::optional<std::pair<std::string, std::string>> detect_git_diff_driver_args(
    const std::vector<std::string>& args);

}  // namespace sdiff::vcs

#endif  // SDIFF_GIT_HPP
