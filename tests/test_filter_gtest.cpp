// ==============================================================================
// test_filter_gtest.cpp - Тесты шаблонов путей и filter_diff
// ==============================================================================

#include <sdiff/filter.hpp>
#include <sdiff/parser.hpp>

#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace sdiff::test {

namespace {

Path path_of(std::initializer_list<const char*> keys) {
    Path path;
    for (const char* k : keys) {
        path.push_back(PathSegment::key(k));
    }
    return path;
}

Value json(const char* text) {
    auto result = io::parse_json(text);
    EXPECT_TRUE(result.ok) << result.error.message;
    return result.value;
}

}  // namespace

// ============================================================================
// PathPattern::parse
// ============================================================================

TEST(FilterTest, Parse_SegmentKinds) {
    PathPattern p = PathPattern::parse("spec.*.image.**");
    ASSERT_EQ(p.segments().size(), 4u);
    EXPECT_EQ(p.segments()[0].kind, PathPattern::SegmentKind::Literal);
    EXPECT_EQ(p.segments()[0].text, "spec");
    EXPECT_EQ(p.segments()[1].kind, PathPattern::SegmentKind::SingleWildcard);
    EXPECT_EQ(p.segments()[2].kind, PathPattern::SegmentKind::Literal);
    EXPECT_EQ(p.segments()[3].kind, PathPattern::SegmentKind::DoubleWildcard);
    EXPECT_EQ(p.source(), "spec.*.image.**");
}

TEST(FilterTest, Parse_EmptyPatternIsEmptyLiteral) {
    PathPattern p = PathPattern::parse("");
    ASSERT_EQ(p.segments().size(), 1u);
    EXPECT_EQ(p.segments()[0].kind, PathPattern::SegmentKind::Literal);
    EXPECT_TRUE(p.segments()[0].text.empty());
    EXPECT_FALSE(p.matches(Path{}));
}

TEST(FilterTest, Parse_PartialWildcardIsLiteral) {
    PathPattern p = PathPattern::parse("a*");
    EXPECT_EQ(p.segments()[0].kind, PathPattern::SegmentKind::Literal);
    EXPECT_FALSE(p.matches(path_of({"abc"})));
    EXPECT_TRUE(p.matches(path_of({"a*"})));
}

// ============================================================================
// matches
// ============================================================================

TEST(FilterTest, Match_Literal) {
    PathPattern p = PathPattern::parse("metadata.name");
    EXPECT_TRUE(p.matches(path_of({"metadata", "name"})));
    EXPECT_FALSE(p.matches(path_of({"metadata"})));
    EXPECT_FALSE(p.matches(path_of({"metadata", "name", "x"})));
}

TEST(FilterTest, Match_SingleWildcardExactlyOne) {
    PathPattern p = PathPattern::parse("spec.*.image");
    EXPECT_TRUE(p.matches(path_of({"spec", "web", "image"})));
    EXPECT_FALSE(p.matches(path_of({"spec", "image"})));
    EXPECT_FALSE(p.matches(path_of({"spec", "a", "b", "image"})));
}

TEST(FilterTest, Match_DoubleWildcardZeroOrMore) {
    PathPattern p = PathPattern::parse("metadata.**");
    EXPECT_TRUE(p.matches(path_of({"metadata"})));
    EXPECT_TRUE(p.matches(path_of({"metadata", "labels", "app"})));
    EXPECT_FALSE(p.matches(path_of({"spec", "metadata"})));

    PathPattern mid = PathPattern::parse("**.name");
    EXPECT_TRUE(mid.matches(path_of({"name"})));
    EXPECT_TRUE(mid.matches(path_of({"a", "b", "name"})));
    EXPECT_FALSE(mid.matches(path_of({"a", "name", "b"})));
}

TEST(FilterTest, Match_DoubleWildcardAlone) {
    PathPattern p = PathPattern::parse("**");
    EXPECT_TRUE(p.matches(Path{}));
    EXPECT_TRUE(p.matches(path_of({"x", "y", "z"})));
}

TEST(FilterTest, Match_IndexSegment) {
    Path path = path_of({"items"});
    path.push_back(PathSegment::index(0));
    path.push_back(PathSegment::key("name"));

    EXPECT_TRUE(PathPattern::parse("items.[0].name").matches(path));
    EXPECT_TRUE(PathPattern::parse("items.*.name").matches(path));
    EXPECT_FALSE(PathPattern::parse("items.[1].name").matches(path));
    EXPECT_FALSE(PathPattern::parse("items.0.name").matches(path));
}

TEST(FilterTest, Match_ManyDoubleWildcards) {
    // Мемоизация держит перебор полиномиальным
    PathPattern p = PathPattern::parse("**.**.**.**.**.**.**.**.z");
    std::vector<std::string> segments(40, "a");
    EXPECT_FALSE(p.matches(segments));
    segments.push_back("z");
    EXPECT_TRUE(p.matches(segments));
}

// ============================================================================
// FilterConfig
// ============================================================================

TEST(FilterTest, ShouldInclude_NoFilters) {
    FilterConfig config;
    EXPECT_FALSE(config.has_filters());
    EXPECT_TRUE(config.should_include(path_of({"anything"})));
}

TEST(FilterTest, ShouldInclude_IgnoreExcludes) {
    FilterConfig config;
    config.ignore("metadata.**");
    EXPECT_FALSE(config.should_include(path_of({"metadata", "timestamp"})));
    EXPECT_TRUE(config.should_include(path_of({"spec", "replicas"})));
}

TEST(FilterTest, ShouldInclude_OnlyRestricts) {
    FilterConfig config;
    config.only("spec.**");
    EXPECT_TRUE(config.should_include(path_of({"spec", "replicas"})));
    EXPECT_FALSE(config.should_include(path_of({"status", "ready"})));
}

TEST(FilterTest, ShouldInclude_IgnoreBeatsOnly) {
    FilterConfig config;
    config.only("spec.**").ignore("spec.internal.**");
    EXPECT_TRUE(config.should_include(path_of({"spec", "replicas"})));
    EXPECT_FALSE(config.should_include(path_of({"spec", "internal", "id"})));
    EXPECT_FALSE(config.should_include(path_of({"status"})));
}

// ============================================================================
// filter_diff
// ============================================================================

TEST(FilterTest, FilterDiff_RecomputesStats) {
    Diff diff = compute_diff(
        json(R"({"metadata": {"timestamp": 1}, "spec": {"replicas": 1}})"),
        json(R"({"metadata": {"timestamp": 2}, "spec": {"replicas": 3, "image": "x"}})"));
    ASSERT_EQ(diff.stats.total_changes(), 3u);

    FilterConfig config;
    config.ignore("metadata.**");
    Diff filtered = filter_diff(diff, config);

    ASSERT_EQ(filtered.changes.size(), 2u);
    EXPECT_EQ(filtered.stats.added, 1u);
    EXPECT_EQ(filtered.stats.modified, 1u);
    for (const auto& c : filtered.changes) {
        EXPECT_EQ(c.path[0].key_name(), "spec");
    }

    // Исходный Diff не тронут
    EXPECT_EQ(diff.changes.size(), 3u);
    EXPECT_EQ(diff.stats.total_changes(), 3u);
}

TEST(FilterTest, FilterDiff_NoFiltersIsCopy) {
    Diff diff = compute_diff(json(R"({"a": 1})"), json(R"({"a": 2, "b": 1})"));
    Diff copy = filter_diff(diff, FilterConfig{});
    ASSERT_EQ(copy.changes.size(), diff.changes.size());
    EXPECT_EQ(copy.stats.added, diff.stats.added);
    EXPECT_EQ(copy.stats.modified, diff.stats.modified);
    for (std::size_t i = 0; i < diff.changes.size(); ++i) {
        EXPECT_EQ(copy.changes[i].path, diff.changes[i].path);
        EXPECT_EQ(copy.changes[i].type, diff.changes[i].type);
    }
}

TEST(FilterTest, FilterDiff_EverythingFilteredIsEmpty) {
    Diff diff = compute_diff(json(R"({"a": 1})"), json(R"({"a": 2})"));
    FilterConfig config;
    config.only("b.**");
    Diff filtered = filter_diff(diff, config);
    EXPECT_TRUE(filtered.is_empty());
    EXPECT_TRUE(filtered.changes.empty());
}

}  // namespace sdiff::test
