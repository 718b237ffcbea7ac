#include "sync_spec.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>
#include <memory>
#include <stdexcept>
#include "query_builder.hpp"

Result<ObjectRef> parse_object_ref(const std::string& value) {
    auto colon = value.find(':');
    if (colon == std::string::npos) {
        return Result<ObjectRef>::Err(fmt::format(
            "invalid object ref '{}'. expected format object_type:object_id "
            "(for example: project_logs:<project_id>)", value));
    }

    ObjectRef ref;
    ref.object_type = value.substr(0, colon);
    ref.object_name = value.substr(colon + 1);
    trim(ref.object_type);
    trim(ref.object_name);

    if (ref.object_type != "project_logs" && ref.object_type != "experiment" &&
        ref.object_type != "dataset") {
        return Result<ObjectRef>::Err(fmt::format(
            "unsupported object type '{}'. supported types: project_logs, experiment, dataset",
            ref.object_type));
    }
    if (ref.object_name.empty()) {
        return Result<ObjectRef>::Err(fmt::format("object id cannot be empty in '{}'", value));
    }
    return Result<ObjectRef>::Ok(ref);
}

std::string source_expr(const ObjectRef& object) {
    return fmt::format("{}({})", object.object_type, sql_quote(object.object_name));
}

// ── Scope resolution ────────────────────────────────────────

static std::optional<std::string> check_limit_flags(std::optional<size_t> traces,
                                                    std::optional<size_t> spans) {
    if (traces && spans) return std::string("--traces and --spans are mutually exclusive");
    if (traces && *traces == 0) return std::string("--traces must be > 0");
    if (spans && *spans == 0) return std::string("--spans must be > 0");
    return std::nullopt;
}

Result<PullScope> resolve_pull_scope(std::optional<size_t> traces, std::optional<size_t> spans) {
    if (auto err = check_limit_flags(traces, spans)) {
        return Result<PullScope>::Err(*err);
    }
    if (traces) return Result<PullScope>::Ok({Scope::Traces, *traces});
    if (spans) return Result<PullScope>::Ok({Scope::Spans, *spans});
    return Result<PullScope>::Ok({Scope::Traces, DEFAULT_PULL_LIMIT});
}

Result<OpenScope> resolve_push_scope(std::optional<size_t> traces, std::optional<size_t> spans) {
    if (auto err = check_limit_flags(traces, spans)) {
        return Result<OpenScope>::Err(*err);
    }
    if (traces) return Result<OpenScope>::Ok({Scope::Traces, traces});
    if (spans) return Result<OpenScope>::Ok({Scope::Spans, spans});
    return Result<OpenScope>::Ok({Scope::All, std::nullopt});
}

Result<OpenScope> resolve_status_scope(std::optional<size_t> traces, std::optional<size_t> spans) {
    return resolve_push_scope(traces, spans);
}

// ── Spec ────────────────────────────────────────────────────

SyncSpec make_sync_spec(const ObjectRef& object, Direction direction, Scope scope,
                        const std::optional<std::string>& filter,
                        std::optional<size_t> limit, size_t page_size) {
    SyncSpec spec;
    spec.schema_version = STATE_SCHEMA_VERSION;
    spec.object_ref = object.object_type + ":" + object.object_name;
    spec.object_type = object.object_type;
    spec.object_name = object.object_name;
    spec.direction = to_string(direction);
    spec.scope = to_string(scope);
    spec.filter = filter;
    spec.limit = limit;
    spec.page_size = page_size;
    return spec;
}

std::string spec_hash(const SyncSpec& spec) {
    // nlohmann objects are key-ordered, so dump() is canonical
    std::string canonical = json(spec).dump();

    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx.get(), canonical.data(), canonical.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::string hex;
    hex.reserve(out_len * 2);
    for (unsigned int i = 0; i < out_len; i++) {
        hex += "0123456789abcdef"[out[i] >> 4];
        hex += "0123456789abcdef"[out[i] & 0x0F];
    }
    return hex;
}

// ── Fresh run state ─────────────────────────────────────────

PullState new_pull_state(Scope scope, size_t limit, size_t page_size,
                         std::optional<std::string> filter,
                         std::optional<std::string> cursor,
                         std::string output_path) {
    uint64_t now = epoch_seconds();
    PullState state;
    state.schema_version = STATE_SCHEMA_VERSION;
    state.run_id = fmt::format("run-{}", now);
    state.status = RunStatus::Running;
    state.phase = scope == Scope::Traces ? PullPhase::DiscoverRoots : PullPhase::Spans;
    state.scope = to_string(scope);
    state.limit = limit;
    state.filter = std::move(filter);
    state.page_size = page_size;
    state.cursor = std::move(cursor);
    state.output_path = std::move(output_path);
    state.started_at = now;
    state.updated_at = now;
    return state;
}

PushState new_push_state(Scope scope, std::optional<size_t> limit, size_t page_size,
                         std::string source_path) {
    uint64_t now = epoch_seconds();
    PushState state;
    state.schema_version = STATE_SCHEMA_VERSION;
    state.run_id = fmt::format("run-{}", now);
    state.status = RunStatus::Running;
    state.scope = to_string(scope);
    state.limit = limit;
    state.page_size = page_size;
    state.source_path = std::move(source_path);
    state.started_at = now;
    state.updated_at = now;
    return state;
}

// ── Rows ────────────────────────────────────────────────────

static std::optional<std::string> value_as_string(const json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return std::nullopt;
}

std::optional<std::string> row_root_span_id(const json& row) {
    if (!row.is_object()) return std::nullopt;
    if (auto v = value_as_string(row, "root_span_id")) return v;
    if (auto v = value_as_string(row, "span_id")) return v;
    return value_as_string(row, "id");
}
