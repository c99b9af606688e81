/**
 * elan CLI - run command
 *
 * Run a command from a named toolchain's bin directory, regardless of
 * what the current directory would select.
 */

#include "../common.hpp"
#include <elan/command.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

struct RunOptions {
    std::string toolchain;
    std::vector<std::string> command;
    bool install = false;
};

int cmd_run(const GlobalOptions& opts, const RunOptions& run_opts) {
    if (run_opts.command.empty()) {
        print_error("no command given", opts.json);
        return 1;
    }

    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto toolchain = cfg.resolveToolchain(run_opts.toolchain);
    if (toolchain.isErr()) {
        print_error(toolchain.error(), opts.json);
        return 1;
    }

    if (!toolchain.value().exists()) {
        if (!run_opts.install || toolchain.value().desc().isLocal()) {
            print_error(Error(ErrorCode::NOT_INSTALLED,
                "toolchain '" + toolchain.value().name() +
                "' is not installed (pass --install to install it)"), opts.json);
            return 1;
        }
        auto home = cfg.ensureHome();
        if (home.isErr()) {
            print_error(home.error(), opts.json);
            return 1;
        }
        auto installed = toolchain.value().installFromDistIfNotInstalled();
        if (installed.isErr()) {
            print_error(installed.error(), opts.json);
            return 1;
        }
    }

    auto cmd = create_command_for_toolchain(toolchain.value(), run_opts.command.front());
    if (cmd.isErr()) {
        print_error(cmd.error(), opts.json);
        return 1;
    }
    cmd.value().arguments.assign(run_opts.command.begin() + 1, run_opts.command.end());

    // exec_command replaces the process on success
    auto exec_result = exec_command(cmd.value());
    if (!exec_result.ok) {
        print_error(exec_result.error, opts.json);
        return 1;
    }
    return exec_result.exit_code;
}

} // anonymous namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunOptions run_opts;

    app->add_flag("--install", run_opts.install, "Install the requested toolchain if needed");
    app->add_option("toolchain", run_opts.toolchain, "Toolchain name")->required();

    // Everything after the toolchain belongs to the command, options included
    app->prefix_command();

    app->callback([&opts, app]() {
        run_opts.command = app->remaining();
        std::exit(cmd_run(opts, run_opts));
    });
}

} // namespace elan::cli::commands
