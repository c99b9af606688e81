#pragma once

/**
 * @file command.hpp
 * @brief Running a toolchain binary
 *
 * The child sees `ELAN_TOOLCHAIN` pinned to the selected toolchain, so a
 * nested `lake` -> `lean` call through the proxy picks the same one, and
 * `LEAN_RECURSION_COUNT` one higher than ours, so a proxy that keeps
 * invoking itself gives up instead of looping forever.
 */

#include "elan/errors.hpp"

#include <map>
#include <string>
#include <vector>

namespace elan {

class Toolchain;

constexpr const char* RECURSION_COUNT_ENV = "LEAN_RECURSION_COUNT";
constexpr int MAX_RECURSION = 20;

/// Binary names under which the executable acts as a proxy
const std::vector<std::string>& proxy_binary_names();

bool is_proxy_binary_name(const std::string& name);

struct Command {
    std::string binary;                          // absolute path of the executable
    std::vector<std::string> arguments;          // argv[1..]
    std::map<std::string, std::string> environment;  // set on top of the inherited environment
};

struct ExecResult {
    bool ok = false;
    int exit_code = -1;
    std::string error;
};

/**
 * @brief Prepare `bin/<binary>` of `toolchain` for execution
 *
 * BINARY_NOT_FOUND when the toolchain has no such binary, RECURSION_LIMIT
 * when the recursion counter already exceeds MAX_RECURSION.
 */
Result<Command> create_command_for_toolchain(const Toolchain& toolchain, const std::string& binary);

/// Inherited environment with `cmd.environment` applied, as `KEY=value` strings
std::vector<std::string> build_environment(const Command& cmd);

/**
 * @brief Run the command in place of this process
 *
 * On POSIX the process image is replaced and this only returns on
 * failure. On Windows the child is waited for and its exit code returned.
 */
ExecResult exec_command(const Command& cmd);

} // namespace elan
