#pragma once

/**
 * @file config.hpp
 * @brief Per-invocation session state
 *
 * A Cfg is built once per process from the elan home directory and
 * threaded by reference through every operation. It owns the settings
 * store and borrows the HTTP client and notification sink chosen by the
 * caller.
 *
 * @example
 * ```cpp
 * elan::CurlHttpClient http;
 * elan::LogSink sink;
 * elan::Cfg cfg(elan::resolve_elan_home(std::nullopt), http, sink);
 *
 * auto tc = cfg.toolchainForDir(std::filesystem::current_path().string());
 * if (tc.isOk()) {
 *     std::cout << tc.value().first.path() << "\n";
 * }
 * ```
 */

#include "elan/download.hpp"
#include "elan/errors.hpp"
#include "elan/notifications.hpp"
#include "elan/override.hpp"
#include "elan/settings.hpp"
#include "elan/toolchain_desc.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace elan {

class Toolchain;
struct Command;

constexpr const char* ELAN_HOME_ENV = "ELAN_HOME";
constexpr const char* ELAN_TOOLCHAIN_ENV = "ELAN_TOOLCHAIN";

// ============================================================================
// Home layout
// ============================================================================

struct ElanPaths {
    std::string home;
    std::string toolchains;      // <home>/toolchains
    std::string settings_file;   // <home>/settings.toml
    std::string known_projects;  // <home>/known-projects
    std::string tmp;             // <home>/tmp
    std::string bin;             // <home>/bin
};

ElanPaths get_elan_paths(const std::string& home);

/**
 * Resolve the elan home directory.
 * Priority: explicit value > ELAN_HOME env > ~/.elan
 */
std::string resolve_elan_home(const std::optional<std::string>& explicit_home);

// ============================================================================
// Cfg
// ============================================================================

class Cfg {
public:
    /**
     * @param home elan home directory (created on demand)
     * @param http transport used for every remote lookup and download
     * @param sink receives all notifications
     * @param env_override value of ELAN_TOOLCHAIN, if any
     */
    Cfg(std::string home, HttpClient& http, NotificationSink& sink,
        std::optional<std::string> env_override);

    /// Same, reading ELAN_TOOLCHAIN from the process environment
    Cfg(std::string home, HttpClient& http, NotificationSink& sink);

    const ElanPaths& paths() const { return paths_; }
    SettingsFile& settings() { return settings_; }
    HttpClient& http() { return http_; }
    NotificationSink& sink() { return sink_; }
    const std::optional<std::string>& envOverride() const { return env_override_; }

    /// Create the home directory tree if it does not exist yet
    VoidResult ensureHome();

    /// Installed toolchains decoded from the toolchains directory, sorted
    Result<std::vector<ToolchainDesc>> listToolchains() const;

    /// Configured default toolchain, not yet resolved
    Result<std::optional<UnresolvedToolchainDesc>> getDefault();

    /// Resolve `name` and store it as the default ("none" clears it)
    VoidResult setDefault(const std::string& name);

    /// See find_override()
    Result<std::optional<OverrideMatch>> findOverride(const std::string& dir);

    /**
     * @brief Toolchain governing `dir`: override if any, else the default
     *
     * The unresolved descriptor is resolved with cache fallback enabled.
     * Returns nullopt when neither an override nor a default exists.
     */
    Result<std::optional<std::pair<Toolchain, std::optional<OverrideReason>>>>
    findOverrideToolchainOrDefault(const std::string& dir);

    /**
     * @brief Like findOverrideToolchainOrDefault() but never empty
     *
     * Fails with NO_DEFAULT_TOOLCHAIN when nothing applies. With
     * `install`, a missing remote toolchain is installed on the spot.
     */
    Result<std::pair<Toolchain, std::optional<OverrideReason>>>
    toolchainForDir(const std::string& dir, bool install = true);

    /// `binary` of the toolchain governing `dir`, installed on demand
    Result<Command> createCommandForDir(const std::string& dir, const std::string& binary);

    /// Toolchain named by user input, resolved with cache fallback (not installed)
    Result<Toolchain> resolveToolchain(const std::string& name);

private:
    ElanPaths paths_;
    SettingsFile settings_;
    HttpClient& http_;
    NotificationSink& sink_;
    std::optional<std::string> env_override_;
};

} // namespace elan
