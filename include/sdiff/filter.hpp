// ==============================================================================
// sdiff/filter.hpp - Шаблоны путей и фильтрация Diff
// ==============================================================================
//
// Назначение:
// - PathPattern: шаблон вида "spec.*.image" / "metadata.**"
// - FilterConfig: списки ignore / only
// - filter_diff: подмножество изменений с пересчитанной статистикой
//
// Сегменты шаблона разделяются '.':
//   *   - ровно один сегмент пути
//   **  - ноль или больше сегментов
//   иначе - литерал, сравнивается с текстом сегмента ("[0]" для индекса)
//
// ==============================================================================

#ifndef SDIFF_FILTER_HPP
#define SDIFF_FILTER_HPP

#include <sdiff/diff.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sdiff {

// ----------------------------------------------------------------------------
// PathPattern
// ----------------------------------------------------------------------------

class PathPattern {
public:
    enum class SegmentKind { Literal, SingleWildcard, DoubleWildcard };

    struct Segment {
        SegmentKind kind = SegmentKind::Literal;
        std::string text;  // только для Literal
    };

    /// Разобрать шаблон. Никогда не падает: пустая строка даёт один
    /// пустой литерал.
    static PathPattern parse(std::string_view pattern);

    /// Проверить путь. Сопоставление мемоизировано по
    /// (позиция в шаблоне, позиция в пути).
    bool matches(const Path& path) const;

    /// То же для уже отрендеренных сегментов
    bool matches(const std::vector<std::string>& segments) const;

    const std::vector<Segment>& segments() const { return segments_; }

    /// Исходный текст шаблона
    const std::string& source() const { return source_; }

private:
    std::vector<Segment> segments_;
    std::string source_;
};

// ----------------------------------------------------------------------------
// FilterConfig
// ----------------------------------------------------------------------------

struct FilterConfig {
    std::vector<PathPattern> ignore_patterns;
    std::vector<PathPattern> only_patterns;

    /// Добавить ignore-шаблон (цепочкой)
    FilterConfig& ignore(std::string_view pattern);

    /// Добавить only-шаблон (цепочкой)
    FilterConfig& only(std::string_view pattern);

    bool has_filters() const { return !ignore_patterns.empty() || !only_patterns.empty(); }

    /// ignore всегда побеждает only; пустой only-список пропускает всё
    bool should_include(const Path& path) const;
};

/// Отфильтровать изменения. Исходный Diff не меняется.
Diff filter_diff(const Diff& diff, const FilterConfig& config);

}  // namespace sdiff

#endif  // SDIFF_FILTER_HPP
