// ==============================================================================
// sdiff/render.hpp - Представление Diff для вывода
// ==============================================================================
//
// Назначение:
// - Terminal: строки изменений с ANSI-цветами
// - Plain: то же без цветов
// - Json: {"changes": [...], "stats": {...}} через RapidJSON
//
// Рендерер ничего не пишет сам: результат - строка в RenderResult,
// запись выполняет output::Writer.
//
// ==============================================================================

#ifndef SDIFF_RENDER_HPP
#define SDIFF_RENDER_HPP

#include <sdiff/diff.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sdiff::render {

// ----------------------------------------------------------------------------
// Формат и опции
// ----------------------------------------------------------------------------

enum class RenderFormat {
    Terminal,  // Цветной текст
    Plain,     // Текст без цветов
    Json       // JSON документ
};

/// "terminal" / "plain" / "json"
const char* render_format_to_string(RenderFormat format);

/// Разобрать имя формата (регистр не важен)
std::optional<RenderFormat> render_format_from_string(std::string_view s);

struct RenderOptions {
    bool compact = true;              // скрывать Unchanged
    bool show_values = false;         // полный JSON вместо preview
    std::size_t max_value_length = 80;
    bool color = true;                // только для Terminal
};

// ----------------------------------------------------------------------------
// RenderResult
// ----------------------------------------------------------------------------

struct RenderResult {
    bool ok = false;
    std::string text;
    std::string error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

/// "users[0].age"; "(root)" для пустого пути
std::string format_path(const Path& path);

/// preview(max_value_length) или компактный JSON при show_values
std::string format_value(const Value& value, const RenderOptions& options);

/// "Summary: 1 added, 2 modified" (только ненулевые) или "Summary: No changes"
std::string format_summary(const DiffStats& stats);

/// Отрендерить Diff. Текст без завершающего перевода строки.
/// В Json значения NaN/Inf выводятся как null.
RenderResult format_diff(const Diff& diff, RenderFormat format, const RenderOptions& options);

}  // namespace sdiff::render

#endif  // SDIFF_RENDER_HPP
