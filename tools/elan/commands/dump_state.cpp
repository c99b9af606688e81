/**
 * elan CLI - dump-state command
 *
 * Machine-readable snapshot for editor integrations: installed
 * toolchains, the default, and the toolchain governing the current
 * directory, each with the error that prevented resolving it, if any.
 */

#include "../common.hpp"
#include <elan/resolver.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

struct DumpStateOptions {
    bool no_net = false;
};

nlohmann::json resolution_to_json(const Result<ToolchainDesc>& resolved) {
    nlohmann::json j;
    if (resolved.isOk()) {
        j["ok"] = true;
        j["toolchain"] = resolved.value().toString();
    } else {
        j["ok"] = false;
        j["error"] = resolved.error().message();
        j["code"] = error_code_to_string(resolved.error().code());
    }
    return j;
}

int cmd_dump_state(const GlobalOptions& opts, const DumpStateOptions& dump_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;
    bool allow_network = !dump_opts.no_net;

    nlohmann::json j;
    j["elan_version"] = ELAN_VERSION;
    j["home"] = cfg.paths().home;

    auto installed = cfg.listToolchains();
    if (installed.isErr()) {
        print_error(installed.error(), true);
        return 1;
    }
    j["toolchains"] = nlohmann::json::array();
    for (const auto& desc : installed.value()) {
        Toolchain toolchain(cfg, desc);
        nlohmann::json tc;
        tc["resolved_name"] = desc.toString();
        tc["path"] = toolchain.path();
        tc["custom"] = toolchain.isCustom();
        j["toolchains"].push_back(tc);
    }

    auto def = cfg.getDefault();
    if (def.isErr()) {
        j["default"] = nlohmann::json{{"ok", false}, {"error", def.error().message()}};
    } else if (!def.value()) {
        j["default"] = nullptr;
    } else {
        nlohmann::json d;
        d["unresolved"] = def.value()->toString();
        d["resolved"] = resolution_to_json(
            resolve_toolchain_desc_ext(cfg, *def.value(), allow_network, true));
        j["default"] = d;
    }

    auto found = cfg.findOverride(current_dir());
    if (found.isErr()) {
        j["active_override"] = nlohmann::json{{"ok", false}, {"error", found.error().message()}};
    } else if (!found.value()) {
        j["active_override"] = nullptr;
    } else {
        const OverrideMatch& match = *found.value();
        nlohmann::json o;
        o["unresolved"] = match.desc.toString();
        o["reason"] = match.reason.toString();
        o["resolved"] = resolution_to_json(
            resolve_toolchain_desc_ext(cfg, match.desc, allow_network, true));
        j["active_override"] = o;
    }

    output_json(j);
    return 0;
}

} // anonymous namespace

void setup_dump_state(CLI::App* app, GlobalOptions& opts) {
    static DumpStateOptions dump_opts;

    app->add_flag("--no-net", dump_opts.no_net, "Make no network requests");

    app->callback([&opts]() {
        // Output is always JSON; keep warnings inside the document
        opts.json = true;
        std::exit(cmd_dump_state(opts, dump_opts));
    });
}

} // namespace elan::cli::commands
