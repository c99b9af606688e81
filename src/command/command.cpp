#include "elan/command.hpp"
#include "elan/config.hpp"
#include "elan/platform.hpp"
#include "elan/toolchain.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#ifdef _WIN32
#include <process.h>
#include <stdlib.h>
#else
#include <unistd.h>
extern char** environ;
#endif

namespace fs = std::filesystem;

namespace elan {

namespace {

#ifdef _WIN32
constexpr char PATH_LIST_SEPARATOR = ';';
#else
constexpr char PATH_LIST_SEPARATOR = ':';
#endif

int current_recursion_count() {
    auto value = get_env(RECURSION_COUNT_ENV);
    if (!value) return 0;
    char* end = nullptr;
    long parsed = std::strtol(value->c_str(), &end, 10);
    if (end == value->c_str() || parsed < 0) return 0;
    return static_cast<int>(std::min<long>(parsed, MAX_RECURSION + 1));
}

std::map<std::string, std::string> inherited_environment() {
    std::map<std::string, std::string> env;
#ifdef _WIN32
    char** entries = _environ;
#else
    char** entries = environ;
#endif
    for (char** e = entries; e && *e; ++e) {
        std::string entry(*e);
        size_t eq = entry.find('=');
        // Windows keeps per-drive entries such as "=C:=C:\\"
        if (eq == std::string::npos || eq == 0) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

} // namespace

const std::vector<std::string>& proxy_binary_names() {
    static const std::vector<std::string> names = {
        "lean", "lake", "leanc", "leanchecker", "leanmake",
    };
    return names;
}

bool is_proxy_binary_name(const std::string& name) {
    const auto& names = proxy_binary_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

Result<Command> create_command_for_toolchain(const Toolchain& toolchain, const std::string& binary) {
    if (!toolchain.exists()) {
        return Result<Command>::err(Error(ErrorCode::NOT_INSTALLED,
            "toolchain '" + toolchain.name() + "' is not installed"));
    }

    std::string path = toolchain.binaryFile(binary);
    if (!path_exists(path)) {
        return Result<Command>::err(Error(ErrorCode::BINARY_NOT_FOUND,
            "toolchain '" + toolchain.name() + "' does not have the binary '" + binary + "'"));
    }

    int count = current_recursion_count();
    if (count > MAX_RECURSION) {
        return Result<Command>::err(Error(ErrorCode::RECURSION_LIMIT,
            "infinite recursion detected while running '" + binary + "'"));
    }

    Command cmd;
    cmd.binary = path;
    cmd.environment[ELAN_TOOLCHAIN_ENV] = toolchain.name();
    cmd.environment[RECURSION_COUNT_ENV] = std::to_string(count + 1);

    std::string bin_dir = (fs::path(toolchain.path()) / "bin").string();
    auto current_path = get_env("PATH");
    cmd.environment["PATH"] = current_path && !current_path->empty()
        ? bin_dir + PATH_LIST_SEPARATOR + *current_path
        : bin_dir;

    return Result<Command>::ok(std::move(cmd));
}

std::vector<std::string> build_environment(const Command& cmd) {
    auto env = inherited_environment();
    for (const auto& entry : cmd.environment) {
        env[entry.first] = entry.second;
    }

    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& entry : env) {
        result.push_back(entry.first + "=" + entry.second);
    }
    return result;
}

ExecResult exec_command(const Command& cmd) {
    ExecResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(cmd.binary);
    argv_strings.insert(argv_strings.end(), cmd.arguments.begin(), cmd.arguments.end());

#ifdef _WIN32
    for (const auto& entry : cmd.environment) {
        std::string assignment = entry.first + "=" + entry.second;
        _putenv(assignment.c_str());
    }

    std::vector<const char*> argv_ptrs;
    for (const auto& s : argv_strings) {
        argv_ptrs.push_back(s.c_str());
    }
    argv_ptrs.push_back(nullptr);

    intptr_t status = _spawnv(_P_WAIT, cmd.binary.c_str(), argv_ptrs.data());
    if (status == -1) {
        result.error = "failed to execute '" + cmd.binary + "': " + std::strerror(errno);
        return result;
    }
    result.ok = true;
    result.exit_code = static_cast<int>(status);
    return result;
#else
    auto env_strings = build_environment(cmd);

    std::vector<char*> argv_ptrs;
    for (auto& s : argv_strings) {
        argv_ptrs.push_back(&s[0]);
    }
    argv_ptrs.push_back(nullptr);

    std::vector<char*> env_ptrs;
    for (auto& s : env_strings) {
        env_ptrs.push_back(&s[0]);
    }
    env_ptrs.push_back(nullptr);

    execve(cmd.binary.c_str(), argv_ptrs.data(), env_ptrs.data());

    // Only reached when execve failed
    result.error = "failed to execute '" + cmd.binary + "': " + std::strerror(errno);
    return result;
#endif
}

} // namespace elan
