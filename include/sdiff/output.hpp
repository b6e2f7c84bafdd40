// ==============================================================================
// sdiff/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностика с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes)
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef SDIFF_OUTPUT_HPP
#define SDIFF_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sdiff::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,    // Added, информация
    Yellow,   // Modified, предупреждения
    Red,      // Removed, ошибки
    Cyan,     // Отладка
    Magenta,  // Трассировка
    Dim       // Unchanged
};

/// Политика цвета (--color)
enum class ColorMode {
    Auto,    // Только если поток - TTY
    Always,
    Never
};

/// "auto" / "always" / "never"
std::optional<ColorMode> color_mode_from_string(std::string_view s);

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;                  // -q: подавить [+] и [!]
    int verbose = 0;                     // -v: уровень подробности (0..2+)
    ColorMode color = ColorMode::Auto;   // --color

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Управление
    // -------------------------------------------------------------------------

    /// Нужно ли раскрашивать вывод в поток с учётом ColorMode и --output
    bool use_color(Stream s) const;

    /// Сбросить буферы
    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    /// Закрыть файл вывода
    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);

    /// Префикс диагностики (с цветом для TTY)
    void write_prefix(std::string_view prefix, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // Файл для вывода (если --output)
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[!] <message>\n"
std::string format_warning(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

/// ANSI escape code для цвета ("" для Default)
std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Обернуть текст в цвет (без изменений для Default)
std::string colorize(std::string_view text, Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace sdiff::output

#endif  // SDIFF_OUTPUT_HPP
