// ==============================================================================
// sdiff/settings.hpp - Файл настроек (.sdiff.yaml)
// ==============================================================================
//
// Назначение:
// - Загрузка YAML-файла настроек (yaml-cpp)
// - Наложение настроек поверх встроенных значений по умолчанию
//
// Порядок слоёв: значения по умолчанию -> файл настроек -> флаги CLI.
//
// Формат файла (все ключи необязательны):
//
//   format: terminal | plain | json
//   array_diff: positional | lcs
//   ignore_whitespace: true
//   null_as_missing: false
//   compact: true
//   show_values: false
//   max_value_length: 80
//   ignore: ["metadata.**"]
//   only: ["spec.**"]
//
// ==============================================================================

#ifndef SDIFF_SETTINGS_HPP
#define SDIFF_SETTINGS_HPP

#include <sdiff/diff.hpp>
#include <sdiff/filter.hpp>
#include <sdiff/render.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdiff::io {

/// Имя файла настроек по умолчанию (ищется в текущем каталоге)
constexpr const char* DEFAULT_SETTINGS_FILE = ".sdiff.yaml";

/// Настройки из файла: только то, что там явно задано
struct Settings {
    std::optional<render::RenderFormat> format;
    std::optional<ArrayDiffStrategy> array_diff;
    std::optional<bool> ignore_whitespace;
    std::optional<bool> null_as_missing;
    std::optional<bool> compact;
    std::optional<bool> show_values;
    std::optional<std::size_t> max_value_length;
    std::vector<std::string> ignore;
    std::vector<std::string> only;
};

struct SettingsResult {
    bool ok = false;
    Settings settings;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать настройки из YAML-текста.
/// Неизвестный ключ или значение неверного типа - ошибка с именем ключа.
SettingsResult parse_settings(std::string_view yaml_text);

/// Загрузить файл настроек
SettingsResult load_settings(const std::filesystem::path& path);

/// Наложить настройки: меняется только то, что задано в Settings;
/// ignore/only добавляются к уже заданным шаблонам.
void apply_settings(const Settings& settings, DiffConfig& diff_config, FilterConfig& filter,
                    render::RenderOptions& render_options, render::RenderFormat& format);

}  // namespace sdiff::io

#endif  // SDIFF_SETTINGS_HPP
