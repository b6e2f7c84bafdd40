// ==============================================================================
// sdiff/diff.hpp - Движок семантического сравнения
// ==============================================================================
//
// Назначение:
// - Путь до узла (PathSegment / Path)
// - Изменения (Change) и статистика (DiffStats)
// - Семантическое равенство узлов с учётом DiffConfig
// - compute_diff: рекурсивное сравнение двух деревьев Value
//
// Ядро не делает I/O и не бросает исключений для корректных деревьев:
// несовпадение типов - это обычное изменение Modified.
//
// ==============================================================================

#ifndef SDIFF_DIFF_HPP
#define SDIFF_DIFF_HPP

#include <sdiff/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdiff {

// ----------------------------------------------------------------------------
// PathSegment / Path
// ----------------------------------------------------------------------------

/// Сегмент пути: ключ объекта или индекс массива
class PathSegment {
public:
    enum class Kind { Key, Index };

    static PathSegment key(std::string name) {
        PathSegment seg;
        seg.kind_ = Kind::Key;
        seg.key_ = std::move(name);
        return seg;
    }

    static PathSegment index(std::size_t i) {
        PathSegment seg;
        seg.kind_ = Kind::Index;
        seg.index_ = i;
        return seg;
    }

    Kind kind() const { return kind_; }
    bool is_key() const { return kind_ == Kind::Key; }
    bool is_index() const { return kind_ == Kind::Index; }

    /// Текст ключа (пустая строка для индекса)
    const std::string& key_name() const { return key_; }

    /// Значение индекса (0 для ключа)
    std::size_t index_value() const { return index_; }

    /// Текстовая форма: ключ как есть, индекс как "[i]"
    std::string to_string() const;

    bool operator==(const PathSegment& other) const {
        return kind_ == other.kind_ && key_ == other.key_ && index_ == other.index_;
    }
    bool operator!=(const PathSegment& other) const { return !(*this == other); }

private:
    PathSegment() = default;

    Kind kind_ = Kind::Key;
    std::string key_;
    std::size_t index_ = 0;
};

/// Путь от корня; пустой путь - корень документа
using Path = std::vector<PathSegment>;

/// Текстовые формы всех сегментов пути
std::vector<std::string> path_to_strings(const Path& path);

// ----------------------------------------------------------------------------
// ChangeType / Change
// ----------------------------------------------------------------------------

enum class ChangeType { Added, Removed, Modified, Unchanged };

/// "added" / "removed" / "modified" / "unchanged"
const char* change_type_to_string(ChangeType type);

/// Одно изменение.
/// Added: только new_value, Removed: только old_value, Modified: оба.
struct Change {
    Path path;
    ChangeType type = ChangeType::Modified;
    std::optional<Value> old_value;
    std::optional<Value> new_value;

    static Change added(Path path, Value value);
    static Change removed(Path path, Value value);
    static Change modified(Path path, Value old_value, Value new_value);
};

// ----------------------------------------------------------------------------
// DiffStats / Diff
// ----------------------------------------------------------------------------

struct DiffStats {
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t modified = 0;
    std::size_t unchanged = 0;

    /// added + removed + modified
    std::size_t total_changes() const { return added + removed + modified; }

    bool is_empty() const { return total_changes() == 0; }

    /// Подсчёт по списку изменений
    static DiffStats from_changes(const std::vector<Change>& changes);
};

/// Результат сравнения. Владеет глубокими копиями значений,
/// поэтому не зависит от времени жизни исходных деревьев.
struct Diff {
    std::vector<Change> changes;
    DiffStats stats;

    bool is_empty() const { return stats.is_empty(); }
};

// ----------------------------------------------------------------------------
// DiffConfig
// ----------------------------------------------------------------------------

enum class ArrayDiffStrategy {
    Positional,  // попарно по индексу
    Lcs          // наибольшая общая подпоследовательность
};

const char* array_diff_strategy_to_string(ArrayDiffStrategy strategy);

/// "positional" / "lcs" (регистр не важен)
std::optional<ArrayDiffStrategy> array_diff_strategy_from_string(std::string_view s);

struct DiffConfig {
    /// Сравнивать строки с нормализацией пробелов
    bool ignore_whitespace = false;

    /// Принимается, но на алгоритм не влияет
    bool treat_null_as_missing = false;

    ArrayDiffStrategy array_diff_strategy = ArrayDiffStrategy::Positional;
};

// ----------------------------------------------------------------------------
// Равенство
// ----------------------------------------------------------------------------

/// Схлопнуть пробельные последовательности в один пробел, обрезать края
std::string normalize_whitespace(std::string_view s);

/// Равенство узлов: строки с учётом ignore_whitespace, остальное через
/// Value::semantic_equals. ignore_whitespace не распространяется внутрь
/// контейнеров.
bool nodes_equal(const Value& a, const Value& b, const DiffConfig& config);

// ----------------------------------------------------------------------------
// compute_diff
// ----------------------------------------------------------------------------

/// Сравнить два дерева.
/// Ключи объекта обходятся группами: добавленные, удалённые, общие;
/// внутри группы по возрастанию. Unchanged никогда не создаётся.
Diff compute_diff(const Value& old_value, const Value& new_value, const DiffConfig& config = {});

}  // namespace sdiff

#endif  // SDIFF_DIFF_HPP
