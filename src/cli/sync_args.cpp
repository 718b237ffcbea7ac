#include "sync_args.hpp"
#include <core/utils.hpp>
#include <map>
#include <set>
#include <fmt/format.h>

namespace {

// Raw split of an argument list into flag values, switches and positionals.
struct RawArgs {
    std::map<std::string, std::string> values;
    std::set<std::string> switches;
    std::vector<std::string> positionals;
};

Result<RawArgs> split_args(const std::vector<std::string>& args,
                           const std::set<std::string>& value_flags,
                           const std::set<std::string>& switch_flags) {
    RawArgs raw;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            raw.positionals.push_back(arg);
            continue;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        if (switch_flags.count(name)) {
            if (inline_value) {
                return Result<RawArgs>::Err(fmt::format("{} does not take a value", name));
            }
            raw.switches.insert(name);
        } else if (value_flags.count(name)) {
            if (raw.values.count(name)) {
                return Result<RawArgs>::Err(fmt::format("{} given more than once", name));
            }
            if (inline_value) {
                raw.values[name] = *inline_value;
            } else if (i + 1 < args.size()) {
                raw.values[name] = args[++i];
            } else {
                return Result<RawArgs>::Err(fmt::format("missing value for {}", name));
            }
        } else {
            return Result<RawArgs>::Err(fmt::format("unknown option: {}", name));
        }
    }
    return Result<RawArgs>::Ok(std::move(raw));
}

Result<std::optional<size_t>> size_flag(const RawArgs& raw, const std::string& name) {
    auto it = raw.values.find(name);
    if (it == raw.values.end()) return Result<std::optional<size_t>>::Ok(std::nullopt);
    auto parsed = parse_size(it->second);
    if (!parsed) {
        return Result<std::optional<size_t>>::Err(
            fmt::format("{} expects a non-negative integer, got '{}'", name, it->second));
    }
    return Result<std::optional<size_t>>::Ok(parsed);
}

std::optional<std::string> string_flag(const RawArgs& raw, const std::string& name) {
    auto it = raw.values.find(name);
    if (it == raw.values.end()) return std::nullopt;
    return it->second;
}

// Object ref, filter, --traces/--spans, --page-size and --root.
Result<void> fill_common(const RawArgs& raw, const SyncDefaults& defaults,
                         CommonSyncArgs& out) {
    if (raw.positionals.empty()) {
        return Result<void>::Err("missing object ref (e.g. project_logs:<project_id>)");
    }
    if (raw.positionals.size() > 1) {
        return Result<void>::Err(fmt::format("unexpected argument: {}", raw.positionals[1]));
    }
    out.object_ref = raw.positionals[0];
    out.filter = string_flag(raw, "--filter");

    auto traces = size_flag(raw, "--traces");
    if (traces.is_err()) return Result<void>::Err(traces.error);
    auto spans = size_flag(raw, "--spans");
    if (spans.is_err()) return Result<void>::Err(spans.error);
    out.traces = traces.value;
    out.spans = spans.value;

    auto page_size = size_flag(raw, "--page-size");
    if (page_size.is_err()) return Result<void>::Err(page_size.error);
    out.page_size = page_size.value.value_or(defaults.page_size);
    if (out.page_size == 0) return Result<void>::Err("--page-size must be > 0");

    auto root = string_flag(raw, "--root");
    out.root = root ? fs::path(*root) : fs::path(defaults.root);
    return Result<void>::Ok();
}

Result<size_t> workers_flag(const RawArgs& raw, const SyncDefaults& defaults) {
    auto workers = size_flag(raw, "--workers");
    if (workers.is_err()) return Result<size_t>::Err(workers.error);
    size_t n = workers.value.value_or(defaults.workers);
    if (n == 0) return Result<size_t>::Err("--workers must be > 0");
    return Result<size_t>::Ok(n);
}

const std::set<std::string> kCommonValueFlags = {
    "--filter", "--traces", "--spans", "--page-size", "--root",
};

std::set<std::string> with(std::set<std::string> base, std::initializer_list<const char*> extra) {
    for (const char* e : extra) base.insert(e);
    return base;
}

} // namespace

Result<PullArgs> parse_pull_args(const std::vector<std::string>& args,
                                 const SyncDefaults& defaults) {
    auto raw = split_args(args, with(kCommonValueFlags, {"--cursor", "--workers"}),
                          {"--fresh"});
    if (raw.is_err()) return Result<PullArgs>::Err(raw.error);

    PullArgs out;
    auto common = fill_common(raw.value, defaults, out);
    if (common.is_err()) return Result<PullArgs>::Err(common.error);

    out.cursor = string_flag(raw.value, "--cursor");
    out.fresh = raw.value.switches.count("--fresh") > 0;
    auto workers = workers_flag(raw.value, defaults);
    if (workers.is_err()) return Result<PullArgs>::Err(workers.error);
    out.workers = workers.value;
    return Result<PullArgs>::Ok(std::move(out));
}

Result<PushArgs> parse_push_args(const std::vector<std::string>& args,
                                 const SyncDefaults& defaults) {
    auto raw = split_args(args, with(kCommonValueFlags, {"--in", "--workers"}),
                          {"--fresh"});
    if (raw.is_err()) return Result<PushArgs>::Err(raw.error);

    PushArgs out;
    auto common = fill_common(raw.value, defaults, out);
    if (common.is_err()) return Result<PushArgs>::Err(common.error);

    if (auto in = string_flag(raw.value, "--in")) out.input = fs::path(*in);
    out.fresh = raw.value.switches.count("--fresh") > 0;
    auto workers = workers_flag(raw.value, defaults);
    if (workers.is_err()) return Result<PushArgs>::Err(workers.error);
    out.workers = workers.value;
    return Result<PushArgs>::Ok(std::move(out));
}

Result<StatusArgs> parse_status_args(const std::vector<std::string>& args,
                                     const SyncDefaults& defaults) {
    auto raw = split_args(args, with(kCommonValueFlags, {"--direction"}), {});
    if (raw.is_err()) return Result<StatusArgs>::Err(raw.error);

    StatusArgs out;
    auto common = fill_common(raw.value, defaults, out);
    if (common.is_err()) return Result<StatusArgs>::Err(common.error);

    std::string direction = string_flag(raw.value, "--direction").value_or("pull");
    if (direction == "pull") {
        out.direction = Direction::Pull;
    } else if (direction == "push") {
        out.direction = Direction::Push;
    } else {
        return Result<StatusArgs>::Err(
            fmt::format("--direction must be 'pull' or 'push', got '{}'", direction));
    }
    return Result<StatusArgs>::Ok(std::move(out));
}
