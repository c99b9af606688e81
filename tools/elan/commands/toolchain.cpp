/**
 * elan CLI - toolchain commands
 *
 * `toolchain list|install|uninstall|link`, plus the top-level `install`
 * and `uninstall` shortcuts.
 */

#include "../common.hpp"
#include <elan/resolver.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

struct InstallOptions {
    std::vector<std::string> names;
};

struct UninstallOptions {
    std::vector<std::string> names;
};

struct LinkOptions {
    std::string name;
    std::string path;
};

int cmd_list(const GlobalOptions& opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto installed = cfg.listToolchains();
    if (installed.isErr()) {
        print_error(installed.error(), opts.json);
        return 1;
    }

    std::optional<ToolchainDesc> default_desc;
    auto def = cfg.getDefault();
    if (def.isOk() && def.value()) {
        auto resolved = resolve_toolchain_desc_ext(cfg, *def.value(), false, true);
        if (resolved.isOk()) default_desc = resolved.value();
    }

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& desc : installed.value()) {
            Toolchain tc(cfg, desc);
            nlohmann::json entry;
            entry["name"] = desc.toString();
            entry["path"] = tc.path();
            entry["custom"] = tc.isCustom();
            entry["default"] = default_desc && *default_desc == desc;
            j.push_back(entry);
        }
        output_json(j);
        return 0;
    }

    if (installed.value().empty()) {
        std::cout << "no installed toolchains" << std::endl;
        return 0;
    }
    for (const auto& desc : installed.value()) {
        std::cout << desc.toString();
        if (default_desc && *default_desc == desc) std::cout << " (default)";
        std::cout << std::endl;
    }
    return 0;
}

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto home = cfg.ensureHome();
    if (home.isErr()) {
        print_error(home.error(), opts.json);
        return 1;
    }

    nlohmann::json installed = nlohmann::json::array();
    for (const auto& name : install_opts.names) {
        auto toolchain = cfg.resolveToolchain(name);
        if (toolchain.isErr()) {
            print_error(toolchain.error(), opts.json);
            return 1;
        }

        auto result = toolchain.value().installFromDistIfNotInstalled();
        if (result.isErr()) {
            print_error(result.error(), opts.json);
            return 1;
        }
        nlohmann::json entry;
        entry["name"] = toolchain.value().name();
        entry["path"] = toolchain.value().path();
        installed.push_back(entry);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["installed"] = installed;
        output_json(j);
    }
    return 0;
}

int cmd_uninstall(const GlobalOptions& opts, const UninstallOptions& uninstall_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    for (const auto& name : uninstall_opts.names) {
        auto toolchain = cfg.resolveToolchain(name);
        if (toolchain.isErr()) {
            print_error(toolchain.error(), opts.json);
            return 1;
        }

        auto removed = toolchain.value().remove();
        if (removed.isErr()) {
            print_error(removed.error(), opts.json);
            return 1;
        }
    }

    output_ok(opts.json);
    return 0;
}

int cmd_link(const GlobalOptions& opts, const LinkOptions& link_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto desc = ToolchainDesc::fromResolvedStr(link_opts.name);
    if (desc.isErr() || !desc.value().isLocal()) {
        print_error(Error(ErrorCode::INVALID_NAME,
            "invalid custom toolchain name: '" + link_opts.name + "'"), opts.json);
        return 1;
    }

    auto home = cfg.ensureHome();
    if (home.isErr()) {
        print_error(home.error(), opts.json);
        return 1;
    }

    Toolchain toolchain(cfg, desc.value());
    auto linked = toolchain.installFromDir(link_opts.path, true);
    if (linked.isErr()) {
        print_error(linked.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = toolchain.name();
        j["path"] = toolchain.path();
        output_json(j);
    }
    return 0;
}

void add_install_options(CLI::App* app, InstallOptions& install_opts, GlobalOptions& opts) {
    app->add_option("toolchain", install_opts.names, "Toolchain name, such as 'stable' or 'v4.9.0'")
        ->required();
    app->callback([&opts, &install_opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

void add_uninstall_options(CLI::App* app, UninstallOptions& uninstall_opts, GlobalOptions& opts) {
    app->add_option("toolchain", uninstall_opts.names, "Toolchain name")->required();
    app->callback([&opts, &uninstall_opts]() {
        std::exit(cmd_uninstall(opts, uninstall_opts));
    });
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;
    add_install_options(app, install_opts, opts);
}

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallOptions uninstall_opts;
    add_uninstall_options(app, uninstall_opts, opts);
}

void setup_toolchain(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;
    static UninstallOptions uninstall_opts;
    static LinkOptions link_opts;

    app->require_subcommand(1);

    auto* list_cmd = app->add_subcommand("list", "List installed toolchains");
    list_cmd->callback([&opts]() {
        std::exit(cmd_list(opts));
    });

    auto* install_cmd = app->add_subcommand("install", "Install or update a given toolchain");
    add_install_options(install_cmd, install_opts, opts);

    auto* uninstall_cmd = app->add_subcommand("uninstall", "Uninstall a toolchain");
    add_uninstall_options(uninstall_cmd, uninstall_opts, opts);

    auto* link_cmd = app->add_subcommand("link", "Create a custom toolchain by symlinking to a directory");
    link_cmd->add_option("toolchain", link_opts.name, "Custom toolchain name")->required();
    link_cmd->add_option("path", link_opts.path, "Path to the directory")->required();
    link_cmd->callback([&opts]() {
        std::exit(cmd_link(opts, link_opts));
    });
}

} // namespace elan::cli::commands
