/**
 * elan CLI - gc command
 *
 * Lists toolchains nothing refers to; `--delete` removes them.
 */

#include "../common.hpp"
#include <elan/gc.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

struct GcOptions {
    bool remove = false;
};

int cmd_gc(const GlobalOptions& opts, const GcOptions& gc_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto analysis = analyze_toolchains(cfg);
    if (analysis.isErr()) {
        print_error(analysis.error(), opts.json);
        return 1;
    }
    const GcAnalysis& result = analysis.value();

    if (gc_opts.remove) {
        for (const auto& desc : result.unused) {
            Toolchain toolchain(cfg, desc);
            auto removed = toolchain.remove();
            if (removed.isErr()) {
                print_error(removed.error(), opts.json);
                return 1;
            }
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["deleted"] = gc_opts.remove;
        j["unused"] = nlohmann::json::array();
        for (const auto& desc : result.unused) {
            j["unused"].push_back(desc.toString());
        }
        j["used"] = nlohmann::json::array();
        for (const auto& [label, desc] : result.used) {
            nlohmann::json entry;
            entry["source"] = label;
            entry["toolchain"] = desc.toString();
            j["used"].push_back(entry);
        }
        output_json(j);
        return 0;
    }

    if (opts.verbose) {
        for (const auto& [label, desc] : result.used) {
            std::cout << desc.toString() << " is used by " << label << std::endl;
        }
    }

    if (result.unused.empty()) {
        std::cout << "no unused toolchains found" << std::endl;
        return 0;
    }
    if (gc_opts.remove) {
        return 0;
    }

    std::cout << "the following toolchains are not used by any known project:" << std::endl;
    for (const auto& desc : result.unused) {
        std::cout << "  " << desc.toString() << std::endl;
    }
    std::cout << "rerun with 'elan gc --delete' to remove them" << std::endl;
    return 0;
}

} // anonymous namespace

void setup_gc(CLI::App* app, GlobalOptions& opts) {
    static GcOptions gc_opts;

    app->add_flag("--delete", gc_opts.remove, "Delete the unused toolchains");

    app->callback([&opts]() {
        std::exit(cmd_gc(opts, gc_opts));
    });
}

} // namespace elan::cli::commands
