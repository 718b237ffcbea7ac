#include <gtest/gtest.h>
#include <managers/query_builder.hpp>

static const std::string SRC = "project_logs('p1')";

TEST(QueryBuilder, SpansQueryPlain) {
    EXPECT_EQ(build_spans_query(SRC, std::nullopt, 200, std::nullopt),
              "select: * | from: project_logs('p1') spans | limit: 200 | "
              "sort: _pagination_key DESC");
}

TEST(QueryBuilder, SpansQueryFilterAndCursor) {
    EXPECT_EQ(build_spans_query(SRC, std::string("  score > 0 "), 50, std::string("abc")),
              "select: * | from: project_logs('p1') spans | limit: 50 | "
              "sort: _pagination_key DESC | filter: score > 0 | cursor: \"abc\"");
}

TEST(QueryBuilder, BlankFilterIgnored) {
    EXPECT_EQ(build_spans_query(SRC, std::string("   "), 10, std::nullopt),
              build_spans_query(SRC, std::nullopt, 10, std::nullopt));
}

TEST(QueryBuilder, RootDiscoveryQuery) {
    EXPECT_EQ(build_root_discovery_query(SRC, std::string("a = 1"), 1000, std::string("c1")),
              "select: root_span_id, span_id, id | from: project_logs('p1') spans | "
              "limit: 1000 | sort: _pagination_key DESC | filter: a = 1 | cursor: \"c1\"");
}

TEST(QueryBuilder, RootSpansSingleId) {
    EXPECT_EQ(build_root_spans_query(SRC, {"r1"}, std::nullopt, 25, std::nullopt),
              "select: * | from: project_logs('p1') spans | "
              "filter: (root_span_id = 'r1' OR span_id = 'r1' OR id = 'r1') | "
              "limit: 25 | sort: _pagination_key ASC");
}

TEST(QueryBuilder, RootSpansManyIdsWithFilter) {
    EXPECT_EQ(build_root_spans_query(SRC, {"a", "b"}, std::string("score > 0"), 25,
                                     std::string("next")),
              "select: * | from: project_logs('p1') spans | "
              "filter: ((root_span_id IN ['a', 'b'] OR span_id IN ['a', 'b'] OR id IN ['a', 'b'])) "
              "AND (score > 0) | limit: 25 | sort: _pagination_key ASC | cursor: \"next\"");
}

TEST(QueryBuilder, Quoting) {
    EXPECT_EQ(sql_quote("it's"), "'it''s'");
    EXPECT_EQ(sql_quote(""), "''");
    EXPECT_EQ(cursor_quote("a\"b"), "\"a\\\"b\"");
}

TEST(QueryBuilder, RootIdsAreQuoted) {
    auto q = build_root_spans_query(SRC, {"o'brien"}, std::nullopt, 5, std::nullopt);
    EXPECT_NE(q.find("root_span_id = 'o''brien'"), std::string::npos);
}
