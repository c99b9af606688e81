/**
 * elan CLI - override commands
 *
 * Directory overrides live in the settings file and take precedence
 * over pin files found at the same directory level.
 */

#include "../common.hpp"
#include <elan/platform.hpp>
#include <elan/settings.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

struct OverrideSetOptions {
    std::string name;
    std::string path;
};

struct OverrideUnsetOptions {
    std::string path;
    bool nonexistent = false;
};

int cmd_override_list(const GlobalOptions& opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto overrides = cfg.settings().with([](const Settings& s) {
        return Result<std::map<std::string, std::string>>::ok(s.overrides);
    });
    if (overrides.isErr()) {
        print_error(overrides.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& [path, toolchain] : overrides.value()) {
            nlohmann::json entry;
            entry["path"] = path;
            entry["toolchain"] = toolchain;
            entry["exists"] = is_directory(path);
            j.push_back(entry);
        }
        output_json(j);
        return 0;
    }

    if (overrides.value().empty()) {
        std::cout << "no overrides" << std::endl;
        return 0;
    }
    bool any_missing = false;
    for (const auto& [path, toolchain] : overrides.value()) {
        std::cout << path << "\t" << toolchain;
        if (!is_directory(path)) {
            std::cout << " (not a directory)";
            any_missing = true;
        }
        std::cout << std::endl;
    }
    if (any_missing) {
        std::cout << "\nto remove overrides for missing directories, run 'elan override unset --nonexistent'"
                  << std::endl;
    }
    return 0;
}

int cmd_override_set(const GlobalOptions& opts, const OverrideSetOptions& set_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto home = cfg.ensureHome();
    if (home.isErr()) {
        print_error(home.error(), opts.json);
        return 1;
    }

    auto toolchain = cfg.resolveToolchain(set_opts.name);
    if (toolchain.isErr()) {
        print_error(toolchain.error(), opts.json);
        return 1;
    }
    if (toolchain.value().desc().isLocal() && !toolchain.value().exists()) {
        print_error(Error(ErrorCode::NOT_INSTALLED,
            "toolchain '" + toolchain.value().name() + "' is not installed"), opts.json);
        return 1;
    }
    auto installed = toolchain.value().installFromDistIfNotInstalled();
    if (installed.isErr()) {
        print_error(installed.error(), opts.json);
        return 1;
    }

    std::string dir = set_opts.path.empty() ? current_dir() : set_opts.path;
    auto made = toolchain.value().makeOverride(dir);
    if (made.isErr()) {
        print_error(made.error(), opts.json);
        return 1;
    }

    output_ok(opts.json);
    return 0;
}

int cmd_override_unset(const GlobalOptions& opts, const OverrideUnsetOptions& unset_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    std::vector<std::string> removed;
    auto result = cfg.settings().withMut([&](Settings& s) {
        std::vector<std::string> keys;
        if (unset_opts.nonexistent) {
            for (const auto& entry : s.overrides) {
                if (!is_directory(entry.first)) keys.push_back(entry.first);
            }
        } else {
            std::string dir = unset_opts.path.empty() ? current_dir() : unset_opts.path;
            keys.push_back(path_to_override_key(dir));
        }

        for (const auto& key : keys) {
            if (s.removeOverride(key)) {
                removed.push_back(key);
            } else {
                spdlog::info("no override set for '{}'", key);
            }
        }
        return VoidResult::ok();
    });
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["removed"] = removed;
        output_json(j);
    } else {
        for (const auto& path : removed) {
            spdlog::info("override toolchain for '{}' removed", path);
        }
    }
    return 0;
}

} // anonymous namespace

void setup_override(CLI::App* app, GlobalOptions& opts) {
    static OverrideSetOptions set_opts;
    static OverrideUnsetOptions unset_opts;

    app->require_subcommand(1);

    auto* list_cmd = app->add_subcommand("list", "List directory toolchain overrides");
    list_cmd->callback([&opts]() {
        std::exit(cmd_override_list(opts));
    });

    auto* set_cmd = app->add_subcommand("set", "Set the override toolchain for a directory");
    set_cmd->add_option("toolchain", set_opts.name, "Toolchain name")->required();
    set_cmd->add_option("--path", set_opts.path, "Path to the directory (default: current directory)");
    set_cmd->callback([&opts]() {
        std::exit(cmd_override_set(opts, set_opts));
    });

    auto* unset_cmd = app->add_subcommand("unset", "Remove the override toolchain for a directory");
    unset_cmd->add_option("--path", unset_opts.path, "Path to the directory (default: current directory)");
    unset_cmd->add_flag("--nonexistent", unset_opts.nonexistent,
                        "Remove override toolchains for all nonexistent directories");
    unset_cmd->callback([&opts]() {
        std::exit(cmd_override_unset(opts, unset_opts));
    });
}

} // namespace elan::cli::commands
