/**
 * elan CLI - show command
 *
 * Installed toolchains, the default, and the toolchain active in the
 * current directory together with the reason it was selected.
 */

#include "../common.hpp"
#include <elan/resolver.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

void print_heading(const std::string& title) {
    std::cout << title << "\n" << std::string(title.size(), '-') << "\n\n";
}

int cmd_show(const GlobalOptions& opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto installed = cfg.listToolchains();
    if (installed.isErr()) {
        print_error(installed.error(), opts.json);
        return 1;
    }

    // Offline resolution is enough to mark the default among installed toolchains
    std::optional<ToolchainDesc> default_desc;
    std::optional<std::string> default_name;
    auto def = cfg.getDefault();
    if (def.isErr()) {
        print_error(def.error(), opts.json);
        return 1;
    }
    if (def.value()) {
        default_name = def.value()->toString();
        auto resolved = resolve_toolchain_desc_ext(cfg, *def.value(), false, true);
        if (resolved.isOk()) default_desc = resolved.value();
    }

    auto active = cfg.findOverrideToolchainOrDefault(current_dir());

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["installed"] = nlohmann::json::array();
        for (const auto& desc : installed.value()) {
            nlohmann::json tc;
            tc["name"] = desc.toString();
            tc["path"] = Toolchain(cfg, desc).path();
            tc["default"] = default_desc && *default_desc == desc;
            j["installed"].push_back(tc);
        }
        j["default"] = default_name ? nlohmann::json(*default_name) : nlohmann::json(nullptr);
        if (active.isErr()) {
            j["active"] = nullptr;
            j["active_error"] = active.error().message();
        } else if (!active.value()) {
            j["active"] = nullptr;
        } else {
            const auto& [toolchain, reason] = *active.value();
            nlohmann::json a;
            a["name"] = toolchain.name();
            a["installed"] = toolchain.exists();
            a["reason"] = reason ? nlohmann::json(reason->toString()) : nlohmann::json("default");
            j["active"] = a;
        }
        output_json(j);
        return 0;
    }

    if (installed.value().size() > 1) {
        print_heading("installed toolchains");
        for (const auto& desc : installed.value()) {
            std::cout << desc.toString();
            if (default_desc && *default_desc == desc) std::cout << " (default)";
            std::cout << "\n";
        }
        std::cout << "\n";
        print_heading("active toolchain");
    }

    if (active.isErr()) {
        std::cout << "error: " << active.error().message() << std::endl;
        return 1;
    }
    if (!active.value()) {
        std::cout << "no active toolchain" << std::endl;
        return 0;
    }

    const auto& [toolchain, reason] = *active.value();
    std::cout << toolchain.name();
    if (reason) {
        std::cout << " (" << reason->toString() << ")";
    } else {
        std::cout << " (default)";
    }
    std::cout << std::endl;
    if (!toolchain.exists()) {
        std::cout << "toolchain '" << toolchain.name() << "' is not installed" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_show(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_show(opts));
    });
}

} // namespace elan::cli::commands
