// ==============================================================================
// sdiff/align.hpp - Выравнивание массивов
// ==============================================================================
//
// Назначение:
// - PositionalAligner: попарное сравнение по индексу, хвост - Added/Removed
// - LcsAligner: выравнивание по наибольшей общей подпоследовательности
// - build_lcs_script: скрипт правок Keep/Insert/Delete
//
// Выравниватель не знает про Diff: результаты уходят в AlignSink,
// рекурсию по парам элементов выполняет движок сравнения.
//
// ==============================================================================

#ifndef SDIFF_ALIGN_HPP
#define SDIFF_ALIGN_HPP

#include <sdiff/diff.hpp>
#include <sdiff/value.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace sdiff {

// ----------------------------------------------------------------------------
// EditOp - операция скрипта правок
// ----------------------------------------------------------------------------

enum class EditKind { Keep, Insert, Delete };

struct EditOp {
    EditKind kind = EditKind::Keep;
    std::size_t old_index = 0;  // Keep, Delete
    std::size_t new_index = 0;  // Keep, Insert

    static EditOp keep(std::size_t oi, std::size_t ni) { return {EditKind::Keep, oi, ni}; }
    static EditOp insert(std::size_t ni) { return {EditKind::Insert, 0, ni}; }
    static EditOp remove(std::size_t oi) { return {EditKind::Delete, oi, 0}; }

    bool operator==(const EditOp& other) const {
        return kind == other.kind && old_index == other.old_index && new_index == other.new_index;
    }
};

/// Построить скрипт правок old -> new в прямом порядке.
///
/// Таблица (n+1)x(m+1) длин LCS, предикат совпадения - nodes_equal.
/// Обратный проход от [n][m]: совпадение -> Keep; иначе при j > 0 и
/// (i == 0 или dp[i][j-1] >= dp[i-1][j]) -> Insert(j-1), иначе Delete(i-1).
/// При равенстве Insert предпочтительнее Delete.
std::vector<EditOp> build_lcs_script(const ValueArray& old_items, const ValueArray& new_items,
                                     const DiffConfig& config);

// ----------------------------------------------------------------------------
// AlignSink - получатель результатов выравнивания
// ----------------------------------------------------------------------------

class AlignSink {
public:
    virtual ~AlignSink() = default;

    /// Пара сопоставленных элементов: сравнить рекурсивно по пути path
    virtual void compare(const Value& old_item, const Value& new_item, const Path& path) = 0;

    /// Элемент есть только в новом массиве
    virtual void added(const Value& item, const Path& path) = 0;

    /// Элемент есть только в старом массиве
    virtual void removed(const Value& item, const Path& path) = 0;
};

// ----------------------------------------------------------------------------
// ArrayAligner - базовый класс выравнивателя
// ----------------------------------------------------------------------------

class ArrayAligner {
public:
    virtual ~ArrayAligner() = default;

    /// Выровнять два массива; base - путь до самих массивов
    virtual void align(const ValueArray& old_items, const ValueArray& new_items, const Path& base,
                       AlignSink& sink) const = 0;

    virtual ArrayDiffStrategy strategy() const = 0;
};

class PositionalAligner final : public ArrayAligner {
public:
    void align(const ValueArray& old_items, const ValueArray& new_items, const Path& base,
               AlignSink& sink) const override;

    ArrayDiffStrategy strategy() const override { return ArrayDiffStrategy::Positional; }
};

/// Удалённые элементы адресуются позицией курсора в координатах нового
/// массива, а не своим старым индексом; Delete курсор не сдвигает.
class LcsAligner final : public ArrayAligner {
public:
    explicit LcsAligner(const DiffConfig& config) : config_(config) {}

    void align(const ValueArray& old_items, const ValueArray& new_items, const Path& base,
               AlignSink& sink) const override;

    ArrayDiffStrategy strategy() const override { return ArrayDiffStrategy::Lcs; }

private:
    DiffConfig config_;
};

/// Создать выравниватель для config.array_diff_strategy
std::unique_ptr<ArrayAligner> make_aligner(const DiffConfig& config);

}  // namespace sdiff

#endif  // SDIFF_ALIGN_HPP
