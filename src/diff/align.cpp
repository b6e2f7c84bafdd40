// ==============================================================================
// align.cpp - Выравнивание массивов (Positional / LCS)
// ==============================================================================

#include <sdiff/align.hpp>

#include <algorithm>

namespace sdiff {

namespace {

Path child_path(const Path& base, std::size_t index) {
    Path path = base;
    path.push_back(PathSegment::index(index));
    return path;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// build_lcs_script
// ----------------------------------------------------------------------------

std::vector<EditOp> build_lcs_script(const ValueArray& old_items, const ValueArray& new_items,
                                     const DiffConfig& config) {
    const std::size_t n = old_items.size();
    const std::size_t m = new_items.size();

    // dp[i][j] - длина LCS для old[0..i) и new[0..j)
    std::vector<std::vector<std::size_t>> dp(n + 1, std::vector<std::size_t>(m + 1, 0));
    for (std::size_t i = 1; i <= n; ++i) {
        for (std::size_t j = 1; j <= m; ++j) {
            if (nodes_equal(old_items[i - 1], new_items[j - 1], config)) {
                dp[i][j] = dp[i - 1][j - 1] + 1;
            } else {
                dp[i][j] = std::max(dp[i - 1][j], dp[i][j - 1]);
            }
        }
    }

    std::vector<EditOp> script;
    script.reserve(n + m);

    std::size_t i = n;
    std::size_t j = m;
    while (i > 0 || j > 0) {
        if (i > 0 && j > 0 && nodes_equal(old_items[i - 1], new_items[j - 1], config)) {
            script.push_back(EditOp::keep(i - 1, j - 1));
            --i;
            --j;
        } else if (j > 0 && (i == 0 || dp[i][j - 1] >= dp[i - 1][j])) {
            script.push_back(EditOp::insert(j - 1));
            --j;
        } else {
            script.push_back(EditOp::remove(i - 1));
            --i;
        }
    }

    std::reverse(script.begin(), script.end());
    return script;
}

// ----------------------------------------------------------------------------
// PositionalAligner
// ----------------------------------------------------------------------------

void PositionalAligner::align(const ValueArray& old_items, const ValueArray& new_items,
                              const Path& base, AlignSink& sink) const {
    const std::size_t common = std::min(old_items.size(), new_items.size());

    for (std::size_t i = 0; i < common; ++i) {
        sink.compare(old_items[i], new_items[i], child_path(base, i));
    }
    for (std::size_t i = common; i < old_items.size(); ++i) {
        sink.removed(old_items[i], child_path(base, i));
    }
    for (std::size_t i = common; i < new_items.size(); ++i) {
        sink.added(new_items[i], child_path(base, i));
    }
}

// ----------------------------------------------------------------------------
// LcsAligner
// ----------------------------------------------------------------------------

void LcsAligner::align(const ValueArray& old_items, const ValueArray& new_items,
                       const Path& base, AlignSink& sink) const {
    // Таблица живёт только внутри build_lcs_script
    const std::vector<EditOp> script = build_lcs_script(old_items, new_items, config_);

    std::size_t cursor = 0;
    for (const auto& op : script) {
        switch (op.kind) {
        case EditKind::Keep:
            sink.compare(old_items[op.old_index], new_items[op.new_index],
                         child_path(base, op.new_index));
            cursor = op.new_index + 1;
            break;
        case EditKind::Insert:
            sink.added(new_items[op.new_index], child_path(base, op.new_index));
            cursor = op.new_index + 1;
            break;
        case EditKind::Delete:
            sink.removed(old_items[op.old_index], child_path(base, cursor));
            break;
        }
    }
}

// ----------------------------------------------------------------------------
// make_aligner
// ----------------------------------------------------------------------------

std::unique_ptr<ArrayAligner> make_aligner(const DiffConfig& config) {
    if (config.array_diff_strategy == ArrayDiffStrategy::Lcs) {
        return std::make_unique<LcsAligner>(config);
    }
    return std::make_unique<PositionalAligner>();
}

}  // namespace sdiff
