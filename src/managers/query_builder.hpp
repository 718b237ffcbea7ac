#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

// Query text for the remote query service. Clauses are joined with " | ".
// A blank filter is treated as absent.

// Newest-first page of spans.
std::string build_spans_query(const std::string& source,
                              const std::optional<std::string>& filter,
                              size_t page_size,
                              const std::optional<std::string>& cursor);

// Newest-first page of id columns, used to discover root span ids.
std::string build_root_discovery_query(const std::string& source,
                                       const std::optional<std::string>& filter,
                                       size_t page_size,
                                       const std::optional<std::string>& cursor);

// Every span belonging to the given roots, oldest first. root_ids must not be empty.
std::string build_root_spans_query(const std::string& source,
                                   const std::vector<std::string>& root_ids,
                                   const std::optional<std::string>& filter,
                                   size_t page_size,
                                   const std::optional<std::string>& cursor);

// 'it''s' style literal
std::string sql_quote(const std::string& value);

// JSON string literal, used for cursors
std::string cursor_quote(const std::string& value);
