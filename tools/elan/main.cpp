/**
 * elan CLI - Entry Point
 *
 * Lean toolchain manager. When invoked under a toolchain binary name
 * (`lean`, `lake`, ...) it acts as a proxy for that binary instead.
 */

#include <CLI/CLI.hpp>
#include <elan/command.hpp>
#include "common.hpp"

#include <filesystem>

// Forward declarations for commands
namespace elan::cli::commands {
    void setup_show(CLI::App* app, GlobalOptions& opts);
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_default(CLI::App* app, GlobalOptions& opts);
    void setup_toolchain(CLI::App* app, GlobalOptions& opts);
    void setup_override(CLI::App* app, GlobalOptions& opts);
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_which(CLI::App* app, GlobalOptions& opts);
    void setup_gc(CLI::App* app, GlobalOptions& opts);
    void setup_dump_state(CLI::App* app, GlobalOptions& opts);
}

namespace elan::cli {
    int run_proxy(const std::string& binary, const std::vector<std::string>& args);
}

int main(int argc, char** argv) {
    using namespace elan::cli;

    std::string invoked_as = std::filesystem::path(argv[0]).stem().string();
    if (elan::is_proxy_binary_name(invoked_as)) {
        return run_proxy(invoked_as, std::vector<std::string>(argv + 1, argv + argc));
    }

    CLI::App app{"elan - Lean toolchain manager"};
    app.set_version_flag("-V,--version", ELAN_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_option("--home", opts.home, "elan home directory (default: $ELAN_HOME or ~/.elan)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* show_cmd = app.add_subcommand("show", "Show the active and installed toolchains");
    commands::setup_show(show_cmd, opts);

    auto* install_cmd = app.add_subcommand("install", "Install a toolchain");
    commands::setup_install(install_cmd, opts);

    auto* uninstall_cmd = app.add_subcommand("uninstall", "Uninstall toolchains");
    commands::setup_uninstall(uninstall_cmd, opts);

    auto* default_cmd = app.add_subcommand("default", "Show or set the default toolchain");
    commands::setup_default(default_cmd, opts);

    auto* toolchain_cmd = app.add_subcommand("toolchain", "Modify or query the installed toolchains");
    commands::setup_toolchain(toolchain_cmd, opts);

    auto* override_cmd = app.add_subcommand("override", "Modify directory toolchain overrides");
    commands::setup_override(override_cmd, opts);

    auto* run_cmd = app.add_subcommand("run", "Run a command with a specific toolchain");
    commands::setup_run(run_cmd, opts);

    auto* which_cmd = app.add_subcommand("which", "Display which binary will be run for a given command");
    commands::setup_which(which_cmd, opts);

    auto* gc_cmd = app.add_subcommand("gc", "Find and remove toolchains no longer in use");
    commands::setup_gc(gc_cmd, opts);

    auto* dump_cmd = app.add_subcommand("dump-state", "Print the current configuration as JSON");
    commands::setup_dump_state(dump_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
