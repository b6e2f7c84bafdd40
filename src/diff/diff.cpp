// ==============================================================================
// diff.cpp - Рекурсивное сравнение деревьев Value
// ==============================================================================
//
// Назначение:
// - PathSegment / Change / DiffStats
// - DiffWalker: обход пары деревьев с накоплением изменений
//
// ==============================================================================

#include <sdiff/align.hpp>
#include <sdiff/diff.hpp>

#include <algorithm>
#include <cctype>

namespace sdiff {

// ----------------------------------------------------------------------------
// PathSegment
// ----------------------------------------------------------------------------

std::string PathSegment::to_string() const {
    if (kind_ == Kind::Index) {
        return "[" + std::to_string(index_) + "]";
    }
    return key_;
}

std::vector<std::string> path_to_strings(const Path& path) {
    std::vector<std::string> result;
    result.reserve(path.size());
    for (const auto& seg : path) {
        result.push_back(seg.to_string());
    }
    return result;
}

// ----------------------------------------------------------------------------
// ChangeType / Change
// ----------------------------------------------------------------------------

const char* change_type_to_string(ChangeType type) {
    switch (type) {
    case ChangeType::Added:
        return "added";
    case ChangeType::Removed:
        return "removed";
    case ChangeType::Modified:
        return "modified";
    case ChangeType::Unchanged:
        return "unchanged";
    }
    return "modified";
}

Change Change::added(Path path, Value value) {
    Change c;
    c.path = std::move(path);
    c.type = ChangeType::Added;
    c.new_value = std::move(value);
    return c;
}

Change Change::removed(Path path, Value value) {
    Change c;
    c.path = std::move(path);
    c.type = ChangeType::Removed;
    c.old_value = std::move(value);
    return c;
}

Change Change::modified(Path path, Value old_value, Value new_value) {
    Change c;
    c.path = std::move(path);
    c.type = ChangeType::Modified;
    c.old_value = std::move(old_value);
    c.new_value = std::move(new_value);
    return c;
}

// ----------------------------------------------------------------------------
// DiffStats
// ----------------------------------------------------------------------------

DiffStats DiffStats::from_changes(const std::vector<Change>& changes) {
    DiffStats stats;
    for (const auto& c : changes) {
        switch (c.type) {
        case ChangeType::Added:
            ++stats.added;
            break;
        case ChangeType::Removed:
            ++stats.removed;
            break;
        case ChangeType::Modified:
            ++stats.modified;
            break;
        case ChangeType::Unchanged:
            ++stats.unchanged;
            break;
        }
    }
    return stats;
}

// ----------------------------------------------------------------------------
// ArrayDiffStrategy
// ----------------------------------------------------------------------------

const char* array_diff_strategy_to_string(ArrayDiffStrategy strategy) {
    return strategy == ArrayDiffStrategy::Lcs ? "lcs" : "positional";
}

std::optional<ArrayDiffStrategy> array_diff_strategy_from_string(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "positional") {
        return ArrayDiffStrategy::Positional;
    }
    if (lower == "lcs") {
        return ArrayDiffStrategy::Lcs;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// DiffWalker
// ----------------------------------------------------------------------------

namespace {

std::vector<std::string> sorted_keys(const ValueObject& obj) {
    std::vector<std::string> keys;
    keys.reserve(obj.size());
    for (const auto& kv : obj) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

Path child_path(const Path& base, const std::string& key) {
    Path path = base;
    path.push_back(PathSegment::key(key));
    return path;
}

class DiffWalker final : public AlignSink {
public:
    explicit DiffWalker(const DiffConfig& config)
        : config_(config), aligner_(make_aligner(config)) {}

    void diff_nodes(const Value& old_value, const Value& new_value, const Path& path) {
        if (nodes_equal(old_value, new_value, config_)) {
            // Равные контейнеры всё равно обходятся; изменений это не даёт
            if (old_value.is_object() && new_value.is_object()) {
                diff_objects(old_value.as_object(), new_value.as_object(), path);
            } else if (old_value.is_array() && new_value.is_array()) {
                aligner_->align(old_value.as_array(), new_value.as_array(), path, *this);
            }
            return;
        }

        if (old_value.is_object() && new_value.is_object()) {
            diff_objects(old_value.as_object(), new_value.as_object(), path);
        } else if (old_value.is_array() && new_value.is_array()) {
            aligner_->align(old_value.as_array(), new_value.as_array(), path, *this);
        } else {
            changes_.push_back(Change::modified(path, old_value, new_value));
        }
    }

    void compare(const Value& old_item, const Value& new_item, const Path& path) override {
        diff_nodes(old_item, new_item, path);
    }

    void added(const Value& item, const Path& path) override {
        changes_.push_back(Change::added(path, item));
    }

    void removed(const Value& item, const Path& path) override {
        changes_.push_back(Change::removed(path, item));
    }

    std::vector<Change> take_changes() { return std::move(changes_); }

private:
    void diff_objects(const ValueObject& old_obj, const ValueObject& new_obj, const Path& path) {
        const std::vector<std::string> new_keys = sorted_keys(new_obj);
        const std::vector<std::string> old_keys = sorted_keys(old_obj);

        // Добавленные
        for (const auto& key : new_keys) {
            if (old_obj.find(key) == old_obj.end()) {
                added(new_obj.at(key), child_path(path, key));
            }
        }

        // Удалённые
        for (const auto& key : old_keys) {
            if (new_obj.find(key) == new_obj.end()) {
                removed(old_obj.at(key), child_path(path, key));
            }
        }

        // Общие
        for (const auto& key : old_keys) {
            auto it = new_obj.find(key);
            if (it != new_obj.end()) {
                diff_nodes(old_obj.at(key), it->second, child_path(path, key));
            }
        }
    }

    const DiffConfig& config_;
    std::unique_ptr<ArrayAligner> aligner_;
    std::vector<Change> changes_;
};

}  // anonymous namespace

// ----------------------------------------------------------------------------
// compute_diff
// ----------------------------------------------------------------------------

Diff compute_diff(const Value& old_value, const Value& new_value, const DiffConfig& config) {
    DiffWalker walker(config);
    walker.diff_nodes(old_value, new_value, Path{});

    Diff diff;
    diff.changes = walker.take_changes();
    diff.stats = DiffStats::from_changes(diff.changes);
    return diff;
}

}  // namespace sdiff
