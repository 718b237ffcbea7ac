#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include "sync_types.hpp"

// Resolved --traces / --spans flags
struct PullScope {
    Scope scope = Scope::Traces;
    size_t limit = 0;
};

struct OpenScope {
    Scope scope = Scope::All;
    std::optional<size_t> limit;    // nullopt = everything
};

// "project_logs:<id>" -> ObjectRef. Splits on the first ':' and trims both halves.
Result<ObjectRef> parse_object_ref(const std::string& value);

// Query source expression, e.g. project_logs('abc')
std::string source_expr(const ObjectRef& object);

// Pull defaults to the 100 most recent traces.
Result<PullScope> resolve_pull_scope(std::optional<size_t> traces, std::optional<size_t> spans);

// Push and status default to everything.
Result<OpenScope> resolve_push_scope(std::optional<size_t> traces, std::optional<size_t> spans);
Result<OpenScope> resolve_status_scope(std::optional<size_t> traces, std::optional<size_t> spans);

SyncSpec make_sync_spec(const ObjectRef& object, Direction direction, Scope scope,
                        const std::optional<std::string>& filter,
                        std::optional<size_t> limit, size_t page_size);

// Lowercase hex SHA-256 of the compact, key-sorted JSON form of the spec.
std::string spec_hash(const SyncSpec& spec);

PullState new_pull_state(Scope scope, size_t limit, size_t page_size,
                         std::optional<std::string> filter,
                         std::optional<std::string> cursor,
                         std::string output_path);

PushState new_push_state(Scope scope, std::optional<size_t> limit, size_t page_size,
                         std::string source_path);

// First of root_span_id, span_id, id that is a string or number.
std::optional<std::string> row_root_span_id(const json& row);
