/**
 * elan CLI - proxy mode
 *
 * `lean`, `lake`, ... installed as links to elan end up here. A leading
 * `+<toolchain>` argument picks the toolchain; otherwise the toolchain
 * governing the current directory is used.
 */

#include "common.hpp"
#include <elan/command.hpp>

namespace elan::cli {

int run_proxy(const std::string& binary, const std::vector<std::string>& args) {
    GlobalOptions opts;
    auto session = open_session(opts);
    Cfg& cfg = session->cfg;

    std::vector<std::string> forwarded = args;
    Result<Command> cmd = Result<Command>::err(Error(ErrorCode::BINARY_NOT_FOUND, binary));

    if (!forwarded.empty() && forwarded.front().size() > 1 && forwarded.front()[0] == '+') {
        std::string name = forwarded.front().substr(1);
        forwarded.erase(forwarded.begin());

        auto toolchain = cfg.resolveToolchain(name);
        if (toolchain.isErr()) {
            print_error(toolchain.error(), false);
            return 1;
        }
        if (toolchain.value().desc().isRemote()) {
            auto installed = toolchain.value().installFromDistIfNotInstalled();
            if (installed.isErr()) {
                print_error(installed.error(), false);
                return 1;
            }
        }
        cmd = create_command_for_toolchain(toolchain.value(), binary);
    } else {
        cmd = cfg.createCommandForDir(current_dir(), binary);
    }

    if (cmd.isErr()) {
        print_error(cmd.error(), false);
        return 1;
    }

    cmd.value().arguments = forwarded;
    auto result = exec_command(cmd.value());
    if (!result.ok) {
        print_error(result.error, false);
        return 1;
    }
    return result.exit_code;
}

} // namespace elan::cli
