/**
 * elan CLI - default command
 */

#include "../common.hpp"
#include <elan/resolver.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

struct DefaultOptions {
    std::string name;
};

int print_default(const GlobalOptions& opts, Cfg& cfg) {
    auto def = cfg.getDefault();
    if (def.isErr()) {
        print_error(def.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["default"] = def.value() ? nlohmann::json(def.value()->toString()) : nlohmann::json(nullptr);
        output_json(j);
        return 0;
    }

    if (!def.value()) {
        std::cout << "no default toolchain configured" << std::endl;
        return 0;
    }
    std::cout << def.value()->toString();
    auto resolved = resolve_toolchain_desc_ext(cfg, *def.value(), false, true);
    if (resolved.isOk() && resolved.value().toString() != def.value()->toString()) {
        std::cout << " (currently " << resolved.value().toString() << ")";
    }
    std::cout << std::endl;
    return 0;
}

int cmd_default(const GlobalOptions& opts, const DefaultOptions& default_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    if (default_opts.name.empty()) {
        return print_default(opts, cfg);
    }

    if (default_opts.name != "none") {
        auto home = cfg.ensureHome();
        if (home.isErr()) {
            print_error(home.error(), opts.json);
            return 1;
        }

        // Make sure the toolchain is usable before recording it
        auto toolchain = cfg.resolveToolchain(default_opts.name);
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
    }

    auto set = cfg.setDefault(default_opts.name);
    if (set.isErr()) {
        print_error(set.error(), opts.json);
        return 1;
    }

    output_ok(opts.json);
    return 0;
}

} // anonymous namespace

void setup_default(CLI::App* app, GlobalOptions& opts) {
    static DefaultOptions default_opts;

    app->add_option("toolchain", default_opts.name,
                    "Toolchain to use by default ('none' to unset)");

    app->callback([&opts]() {
        std::exit(cmd_default(opts, default_opts));
    });
}

} // namespace elan::cli::commands
