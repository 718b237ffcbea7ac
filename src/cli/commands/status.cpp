#include "../tracesync_cli.hpp"
#include "../theme.hpp"
#include "../sync_args.hpp"
#include <managers/sync_spec.hpp>
#include <managers/status_reporter.hpp>
#include <iostream>

static int cmd_status(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_config()) return 1;

    auto parsed = parse_status_args(args, cli.config->defaults());
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    const StatusArgs& a = parsed.value;

    auto object = parse_object_ref(a.object_ref);
    if (object.is_err()) {
        std::cout << theme::fail(object.error);
        return 1;
    }
    auto scope = resolve_status_scope(a.traces, a.spans);
    if (scope.is_err()) {
        std::cout << theme::fail(scope.error);
        return 1;
    }

    StatusQuery query;
    query.object = object.value;
    query.direction = a.direction;
    query.scope = scope.value.scope;
    query.limit = scope.value.limit;
    query.filter = a.filter;
    query.page_size = a.page_size;
    query.root = a.root;

    json report = build_status_report(query);
    if (cli.json_output) {
        std::cout << report.dump(2) << "\n";
        return 0;
    }

    std::cout << theme::kv("Spec", report["spec_dir"].get<std::string>());
    std::cout << theme::kv("Hash", report["spec_hash"].get<std::string>());
    std::cout << theme::section("State");
    std::cout << (report.contains("state") ? report["state"].dump(2) : "(missing)") << "\n";
    std::cout << theme::section("Manifest");
    std::cout << (report.contains("manifest") ? report["manifest"].dump(2) : "(missing)") << "\n";
    return 0;
}

void register_status_commands(BaseCLI& cli) {
    cli.add_command("status", cmd_status, "Show the stored checkpoint of a sync spec");
}
