#include "status_reporter.hpp"
#include <core/utils.hpp>
#include "sync_spec.hpp"
#include "state_store.hpp"
#include <fmt/format.h>
#include <stdexcept>

json build_status_report(const StatusQuery& query) {
    SyncSpec spec = make_sync_spec(query.object, query.direction, query.scope,
                                   trim_optional(query.filter), query.limit, query.page_size);
    std::string hash = spec_hash(spec);
    fs::path dir = resolve_spec_dir(query.root, query.object, query.direction, query.scope,
                                    hash, true);
    if (!fs::exists(dir)) {
        throw std::runtime_error(fmt::format("no sync state found for spec at {}", dir.string()));
    }

    StateStore store(dir);
    json report = json::object();
    report["spec_dir"] = dir.string();
    report["spec_hash"] = hash;
    report["direction"] = to_string(query.direction);

    if (fs::exists(store.spec_path())) report["spec"] = read_json_file(store.spec_path());
    if (fs::exists(store.state_path())) report["state"] = read_json_file(store.state_path());
    if (fs::exists(store.manifest_path())) report["manifest"] = read_json_file(store.manifest_path());
    return report;
}
