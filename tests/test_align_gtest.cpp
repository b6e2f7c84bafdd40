// ==============================================================================
// test_align_gtest.cpp - Тесты выравнивания массивов
// ==============================================================================
//
// - build_lcs_script: скрипты правок и тай-брейк Insert/Delete
// - PositionalAligner / LcsAligner через compute_diff
// - адресация удалённых элементов в LCS
//
// ==============================================================================

#include <sdiff/align.hpp>
#include <sdiff/diff.hpp>

#include <gtest/gtest.h>
#include <initializer_list>
#include <vector>

namespace sdiff::test {

namespace {

ValueArray numbers(std::initializer_list<int> items) {
    ValueArray arr;
    for (int n : items) {
        arr.emplace_back(n);
    }
    return arr;
}

Value array_of(std::initializer_list<int> items) {
    return Value(numbers(items));
}

DiffConfig lcs_config() {
    DiffConfig config;
    config.array_diff_strategy = ArrayDiffStrategy::Lcs;
    return config;
}

/// Запоминает вызовы sink'а
class RecordingSink final : public AlignSink {
public:
    struct Event {
        char kind;  // 'c', '+', '-'
        std::size_t index;
    };

    void compare(const Value&, const Value&, const Path& path) override {
        events.push_back({'c', path.back().index_value()});
    }
    void added(const Value&, const Path& path) override {
        events.push_back({'+', path.back().index_value()});
    }
    void removed(const Value&, const Path& path) override {
        events.push_back({'-', path.back().index_value()});
    }

    std::vector<Event> events;
};

}  // namespace

// ============================================================================
// build_lcs_script
// ============================================================================

TEST(AlignTest, LcsScript_Identical_AllKeep) {
    auto script = build_lcs_script(numbers({1, 2, 3}), numbers({1, 2, 3}), {});
    std::vector<EditOp> expected = {EditOp::keep(0, 0), EditOp::keep(1, 1), EditOp::keep(2, 2)};
    EXPECT_EQ(script, expected);
}

TEST(AlignTest, LcsScript_Insertion) {
    auto script = build_lcs_script(numbers({1, 2, 3}), numbers({1, 4, 2, 3}), {});
    std::vector<EditOp> expected = {EditOp::keep(0, 0), EditOp::insert(1), EditOp::keep(1, 2),
                                    EditOp::keep(2, 3)};
    EXPECT_EQ(script, expected);
}

TEST(AlignTest, LcsScript_Deletion) {
    auto script = build_lcs_script(numbers({1, 2, 3, 4}), numbers({1, 3, 4}), {});
    std::vector<EditOp> expected = {EditOp::keep(0, 0), EditOp::remove(1), EditOp::keep(2, 1),
                                    EditOp::keep(3, 2)};
    EXPECT_EQ(script, expected);
}

TEST(AlignTest, LcsScript_EmptySides) {
    auto inserts = build_lcs_script({}, numbers({7, 8}), {});
    std::vector<EditOp> expected_inserts = {EditOp::insert(0), EditOp::insert(1)};
    EXPECT_EQ(inserts, expected_inserts);

    auto deletes = build_lcs_script(numbers({7, 8}), {}, {});
    std::vector<EditOp> expected_deletes = {EditOp::remove(0), EditOp::remove(1)};
    EXPECT_EQ(deletes, expected_deletes);

    EXPECT_TRUE(build_lcs_script({}, {}, {}).empty());
}

TEST(AlignTest, LcsScript_TieBreakPrefersInsert) {
    // [1] -> [2]: LCS пуст; при равенстве Insert выбирается раньше в обратном
    // проходе, поэтому в прямом порядке Delete идёт первым
    auto script = build_lcs_script(numbers({1}), numbers({2}), {});
    std::vector<EditOp> expected = {EditOp::remove(0), EditOp::insert(0)};
    EXPECT_EQ(script, expected);
}

TEST(AlignTest, LcsScript_RespectsIgnoreWhitespace) {
    ValueArray a;
    a.emplace_back("x  y");
    ValueArray b;
    b.emplace_back("x y");

    DiffConfig config;
    config.ignore_whitespace = true;
    auto script = build_lcs_script(a, b, config);
    std::vector<EditOp> expected = {EditOp::keep(0, 0)};
    EXPECT_EQ(script, expected);
}

// ============================================================================
// Выравниватели
// ============================================================================

TEST(AlignTest, MakeAligner_SelectsStrategy) {
    EXPECT_EQ(make_aligner(DiffConfig{})->strategy(), ArrayDiffStrategy::Positional);
    EXPECT_EQ(make_aligner(lcs_config())->strategy(), ArrayDiffStrategy::Lcs);
}

TEST(AlignTest, Positional_PairsThenTail) {
    RecordingSink sink;
    PositionalAligner aligner;
    aligner.align(numbers({1, 2}), numbers({1, 2, 3, 4}), Path{}, sink);
    ASSERT_EQ(sink.events.size(), 4u);
    EXPECT_EQ(sink.events[0].kind, 'c');
    EXPECT_EQ(sink.events[1].kind, 'c');
    EXPECT_EQ(sink.events[2].kind, '+');
    EXPECT_EQ(sink.events[2].index, 2u);
    EXPECT_EQ(sink.events[3].kind, '+');
    EXPECT_EQ(sink.events[3].index, 3u);
}

TEST(AlignTest, Positional_ShorterNewRemovesTail) {
    Diff diff = compute_diff(array_of({1, 2, 3}), array_of({1}));
    ASSERT_EQ(diff.changes.size(), 2u);
    EXPECT_EQ(diff.changes[0].type, ChangeType::Removed);
    EXPECT_EQ(diff.changes[0].path[0].index_value(), 1u);
    EXPECT_EQ(diff.changes[1].type, ChangeType::Removed);
    EXPECT_EQ(diff.changes[1].path[0].index_value(), 2u);
}

TEST(AlignTest, Positional_InsertShiftsEverything) {
    Diff diff = compute_diff(array_of({1, 2, 3}), array_of({1, 4, 2, 3}));
    ASSERT_EQ(diff.changes.size(), 3u);

    EXPECT_EQ(diff.changes[0].type, ChangeType::Modified);
    EXPECT_EQ(diff.changes[0].path[0].index_value(), 1u);
    EXPECT_DOUBLE_EQ(diff.changes[0].old_value->as_number(), 2.0);
    EXPECT_DOUBLE_EQ(diff.changes[0].new_value->as_number(), 4.0);

    EXPECT_EQ(diff.changes[1].type, ChangeType::Modified);
    EXPECT_EQ(diff.changes[1].path[0].index_value(), 2u);

    EXPECT_EQ(diff.changes[2].type, ChangeType::Added);
    EXPECT_EQ(diff.changes[2].path[0].index_value(), 3u);
    EXPECT_DOUBLE_EQ(diff.changes[2].new_value->as_number(), 3.0);
}

TEST(AlignTest, Lcs_InsertIsSingleAdded) {
    Diff diff = compute_diff(array_of({1, 2, 3}), array_of({1, 4, 2, 3}), lcs_config());
    ASSERT_EQ(diff.changes.size(), 1u);
    EXPECT_EQ(diff.changes[0].type, ChangeType::Added);
    EXPECT_EQ(diff.changes[0].path[0].index_value(), 1u);
    EXPECT_DOUBLE_EQ(diff.changes[0].new_value->as_number(), 4.0);
}

TEST(AlignTest, Lcs_DeleteIsSingleRemoved) {
    Diff diff = compute_diff(array_of({1, 2, 3, 4}), array_of({1, 3, 4}), lcs_config());
    ASSERT_EQ(diff.changes.size(), 1u);
    EXPECT_EQ(diff.changes[0].type, ChangeType::Removed);
    EXPECT_EQ(diff.changes[0].path[0].index_value(), 1u);
    EXPECT_DOUBLE_EQ(diff.changes[0].old_value->as_number(), 2.0);
}

TEST(AlignTest, Lcs_RotationRemovedAtCursor) {
    Diff diff = compute_diff(array_of({1, 2, 3}), array_of({3, 1, 2}), lcs_config());
    ASSERT_EQ(diff.changes.size(), 2u);

    EXPECT_EQ(diff.changes[0].type, ChangeType::Added);
    EXPECT_EQ(diff.changes[0].path[0].index_value(), 0u);
    EXPECT_DOUBLE_EQ(diff.changes[0].new_value->as_number(), 3.0);

    // Удалённый элемент адресуется позицией курсора в новом массиве
    EXPECT_EQ(diff.changes[1].type, ChangeType::Removed);
    EXPECT_EQ(diff.changes[1].path[0].index_value(), 3u);
    EXPECT_DOUBLE_EQ(diff.changes[1].old_value->as_number(), 3.0);
}

TEST(AlignTest, Lcs_ObjectsComparedRecursively) {
    ValueArray a;
    Value item = Value::make_object();
    item.set("id", Value(1));
    a.push_back(item);

    ValueArray b;
    b.push_back(item);
    Value extra = Value::make_object();
    extra.set("id", Value(2));
    b.push_back(extra);

    Diff diff = compute_diff(Value(a), Value(b), lcs_config());
    ASSERT_EQ(diff.changes.size(), 1u);
    EXPECT_EQ(diff.changes[0].type, ChangeType::Added);
    EXPECT_EQ(diff.changes[0].path[0].index_value(), 1u);
}

TEST(AlignTest, Lcs_EmptyToItems) {
    Diff diff = compute_diff(array_of({}), array_of({5, 6}), lcs_config());
    EXPECT_EQ(diff.stats.added, 2u);
    EXPECT_EQ(diff.stats.total_changes(), 2u);
}

}  // namespace sdiff::test
