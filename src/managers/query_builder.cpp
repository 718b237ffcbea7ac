#include "query_builder.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

static std::optional<std::string> non_blank(const std::optional<std::string>& filter) {
    return trim_optional(filter);
}

static std::string join_clauses(const std::vector<std::string>& parts) {
    return fmt::format("{}", fmt::join(parts, " | "));
}

std::string sql_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string cursor_quote(const std::string& value) {
    return nlohmann::json(value).dump();
}

std::string build_spans_query(const std::string& source,
                              const std::optional<std::string>& filter,
                              size_t page_size,
                              const std::optional<std::string>& cursor) {
    std::vector<std::string> parts = {
        "select: *",
        fmt::format("from: {} spans", source),
        fmt::format("limit: {}", page_size),
        "sort: _pagination_key DESC",
    };
    if (auto f = non_blank(filter)) parts.push_back("filter: " + *f);
    if (cursor) parts.push_back("cursor: " + cursor_quote(*cursor));
    return join_clauses(parts);
}

std::string build_root_discovery_query(const std::string& source,
                                       const std::optional<std::string>& filter,
                                       size_t page_size,
                                       const std::optional<std::string>& cursor) {
    std::vector<std::string> parts = {
        "select: root_span_id, span_id, id",
        fmt::format("from: {} spans", source),
        fmt::format("limit: {}", page_size),
        "sort: _pagination_key DESC",
    };
    if (auto f = non_blank(filter)) parts.push_back("filter: " + *f);
    if (cursor) parts.push_back("cursor: " + cursor_quote(*cursor));
    return join_clauses(parts);
}

std::string build_root_spans_query(const std::string& source,
                                   const std::vector<std::string>& root_ids,
                                   const std::optional<std::string>& filter,
                                   size_t page_size,
                                   const std::optional<std::string>& cursor) {
    std::string root_filter;
    if (root_ids.size() == 1) {
        std::string q = sql_quote(root_ids[0]);
        root_filter = fmt::format("(root_span_id = {0} OR span_id = {0} OR id = {0})", q);
    } else {
        std::vector<std::string> quoted;
        quoted.reserve(root_ids.size());
        for (const auto& id : root_ids) quoted.push_back(sql_quote(id));
        std::string joined = fmt::format("{}", fmt::join(quoted, ", "));
        root_filter = fmt::format(
            "(root_span_id IN [{0}] OR span_id IN [{0}] OR id IN [{0}])", joined);
    }

    std::string combined = root_filter;
    if (auto f = non_blank(filter)) {
        combined = fmt::format("({}) AND ({})", root_filter, *f);
    }

    std::vector<std::string> parts = {
        "select: *",
        fmt::format("from: {} spans", source),
        "filter: " + combined,
        fmt::format("limit: {}", page_size),
        "sort: _pagination_key ASC",
    };
    if (cursor) parts.push_back("cursor: " + cursor_quote(*cursor));
    return join_clauses(parts);
}
