// ==============================================================================
// sdiff/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для stdout/stderr
// - Временные файлы
// - Путь к текущему исполняемому файлу
// - Запуск внешних команд с захватом вывода
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована здесь.
//
// ==============================================================================

#ifndef SDIFF_PLATFORM_HPP
#define SDIFF_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sdiff::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файлы и процесс
// ----------------------------------------------------------------------------

/// Создать пустой временный файл (в TMPDIR или /tmp)
/// @throws std::runtime_error при ошибке создания
std::filesystem::path make_temp_file(std::string_view prefix);

/// Абсолютный путь текущего исполняемого файла.
/// Linux: /proc/self/exe; при ошибке - fallback (обычно argv[0]).
std::filesystem::path current_executable_path(std::string_view fallback);

/// "Windows" / "macOS" / "Linux" / "Unknown"
std::string os_name();

// ----------------------------------------------------------------------------
// Внешние команды
// ----------------------------------------------------------------------------

struct CommandOutput {
    bool started = false;  // false - процесс не удалось запустить
    int exit_code = -1;    // 127 - команда не найдена shell'ом
    std::string stdout_text;
    std::string stderr_text;

    bool success() const { return started && exit_code == 0; }
};

/// Экранировать аргумент для POSIX shell (одинарные кавычки)
std::string shell_quote(std::string_view arg);

/// Запустить команду (argv[0] ищется в PATH), дождаться завершения,
/// захватить stdout и stderr.
CommandOutput run_command(const std::vector<std::string>& argv);

}  // namespace sdiff::platform

#endif  // SDIFF_PLATFORM_HPP
