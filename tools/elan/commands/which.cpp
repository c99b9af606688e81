/**
 * elan CLI - which command
 *
 * Print the path of the binary that would run for a command in the
 * current directory.
 */

#include "../common.hpp"
#include <elan/platform.hpp>
#include <CLI/CLI.hpp>

namespace elan::cli::commands {

namespace {

struct WhichOptions {
    std::string binary;
};

int cmd_which(const GlobalOptions& opts, const WhichOptions& which_opts) {
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    auto selected = cfg.toolchainForDir(current_dir(), true);
    if (selected.isErr()) {
        print_error(selected.error(), opts.json);
        return 1;
    }

    const Toolchain& toolchain = selected.value().first;
    std::string path = toolchain.binaryFile(which_opts.binary);
    if (!path_exists(path)) {
        print_error(Error(ErrorCode::BINARY_NOT_FOUND,
            "toolchain '" + toolchain.name() + "' does not have the binary '" +
            which_opts.binary + "'"), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["toolchain"] = toolchain.name();
        j["path"] = path;
        output_json(j);
    } else {
        std::cout << path << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_which(CLI::App* app, GlobalOptions& opts) {
    static WhichOptions which_opts;

    app->add_option("command", which_opts.binary, "Binary to look up, such as 'lean'")->required();

    app->callback([&opts]() {
        std::exit(cmd_which(opts, which_opts));
    });
}

} // namespace elan::cli::commands
