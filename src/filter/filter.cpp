// ==============================================================================
// filter.cpp - Шаблоны путей и фильтрация Diff
// ==============================================================================

#include <sdiff/filter.hpp>

#include <cstdint>

namespace sdiff {

// ----------------------------------------------------------------------------
// PathPattern
// ----------------------------------------------------------------------------

PathPattern PathPattern::parse(std::string_view pattern) {
    PathPattern result;
    result.source_ = std::string(pattern);

    std::size_t start = 0;
    while (true) {
        std::size_t dot = pattern.find('.', start);
        std::string_view part = pattern.substr(
            start, dot == std::string_view::npos ? std::string_view::npos : dot - start);

        Segment seg;
        if (part == "**") {
            seg.kind = SegmentKind::DoubleWildcard;
        } else if (part == "*") {
            seg.kind = SegmentKind::SingleWildcard;
        } else {
            seg.kind = SegmentKind::Literal;
            seg.text = std::string(part);
        }
        result.segments_.push_back(std::move(seg));

        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return result;
}

bool PathPattern::matches(const Path& path) const {
    return matches(path_to_strings(path));
}

namespace {

using Segment = PathPattern::Segment;
using SegmentKind = PathPattern::SegmentKind;

// Таблица мемоизации: 0 - не вычислено, 1 - нет, 2 - да
class Matcher {
public:
    Matcher(const std::vector<Segment>& pattern, const std::vector<std::string>& path)
        : pattern_(pattern),
          path_(path),
          memo_((pattern.size() + 1) * (path.size() + 1), 0) {}

    bool run(std::size_t pi, std::size_t si) {
        std::uint8_t& slot = memo_[pi * (path_.size() + 1) + si];
        if (slot != 0) {
            return slot == 2;
        }
        bool result = compute(pi, si);
        slot = result ? 2 : 1;
        return result;
    }

private:
    bool compute(std::size_t pi, std::size_t si) {
        const bool pattern_done = pi == pattern_.size();
        const bool path_done = si == path_.size();

        if (pattern_done) {
            return path_done;
        }
        if (path_done) {
            for (std::size_t k = pi; k < pattern_.size(); ++k) {
                if (pattern_[k].kind != SegmentKind::DoubleWildcard) {
                    return false;
                }
            }
            return true;
        }

        const Segment& head = pattern_[pi];
        switch (head.kind) {
        case SegmentKind::Literal:
            return head.text == path_[si] && run(pi + 1, si + 1);
        case SegmentKind::SingleWildcard:
            return run(pi + 1, si + 1);
        case SegmentKind::DoubleWildcard:
            return run(pi + 1, si) || run(pi, si + 1);
        }
        return false;
    }

    const std::vector<Segment>& pattern_;
    const std::vector<std::string>& path_;
    std::vector<std::uint8_t> memo_;
};

}  // anonymous namespace

bool PathPattern::matches(const std::vector<std::string>& segments) const {
    Matcher matcher(segments_, segments);
    return matcher.run(0, 0);
}

// ----------------------------------------------------------------------------
// FilterConfig
// ----------------------------------------------------------------------------

FilterConfig& FilterConfig::ignore(std::string_view pattern) {
    ignore_patterns.push_back(PathPattern::parse(pattern));
    return *this;
}

FilterConfig& FilterConfig::only(std::string_view pattern) {
    only_patterns.push_back(PathPattern::parse(pattern));
    return *this;
}

bool FilterConfig::should_include(const Path& path) const {
    const std::vector<std::string> segments = path_to_strings(path);

    for (const auto& p : ignore_patterns) {
        if (p.matches(segments)) {
            return false;
        }
    }

    if (only_patterns.empty()) {
        return true;
    }
    for (const auto& p : only_patterns) {
        if (p.matches(segments)) {
            return true;
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// filter_diff
// ----------------------------------------------------------------------------

Diff filter_diff(const Diff& diff, const FilterConfig& config) {
    if (!config.has_filters()) {
        return diff;
    }

    Diff result;
    for (const auto& change : diff.changes) {
        if (config.should_include(change.path)) {
            result.changes.push_back(change);
        }
    }
    result.stats = DiffStats::from_changes(result.changes);
    return result;
}

}  // namespace sdiff
