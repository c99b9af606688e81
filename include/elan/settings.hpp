#pragma once

/**
 * @file settings.hpp
 * @brief Persistent user settings (`<home>/settings.toml`)
 *
 * Holds the default toolchain and the override database (canonical
 * directory path -> toolchain name).
 *
 * ```toml
 * version = "12"
 * default_toolchain = "leanprover/lean4:stable"
 * telemetry = false
 *
 * [overrides]
 * "/home/me/proj" = "leanprover/lean4:v4.9.0"
 * ```
 */

#include "elan/errors.hpp"
#include "elan/notifications.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace elan {

constexpr const char* SETTINGS_CURRENT_VERSION = "12";

/// Metadata versions this build can read
bool is_supported_settings_version(const std::string& version);

struct Settings {
    std::string version = SETTINGS_CURRENT_VERSION;
    std::optional<std::string> default_toolchain;
    std::map<std::string, std::string> overrides;
    bool telemetry = false;

    /// Parse settings TOML; `source` names the file in error messages
    static Result<Settings> parse(const std::string& content, const std::string& source);

    std::string stringify() const;

    void addOverride(const std::string& path, const std::string& toolchain,
                     NotificationSink& sink);

    /// Returns false when no override was recorded for `path`
    bool removeOverride(const std::string& path);
};

/**
 * @brief Key under which a directory is stored in the override database
 *
 * Existing paths are canonicalized; anything else is used verbatim.
 */
std::string path_to_override_key(const std::string& path);

/**
 * @brief Scoped access to the settings file
 *
 * The file is read once on first access and cached. A missing file reads
 * as default settings. withMut() writes the file back atomically after
 * the callback succeeds.
 */
class SettingsFile {
public:
    explicit SettingsFile(std::string path) : path_(std::move(path)) {}

    const std::string& path() const { return path_; }

    template<typename F>
    auto with(F func) -> decltype(func(std::declval<const Settings&>())) {
        using R = decltype(func(std::declval<const Settings&>()));
        auto loaded = load();
        if (loaded.isErr()) return R::err(loaded.error());
        return func(static_cast<const Settings&>(*cache_));
    }

    template<typename F>
    auto withMut(F func) -> decltype(func(std::declval<Settings&>())) {
        using R = decltype(func(std::declval<Settings&>()));
        auto loaded = load();
        if (loaded.isErr()) return R::err(loaded.error());
        auto result = func(*cache_);
        if (result.isErr()) return result;
        auto saved = save();
        if (saved.isErr()) return R::err(saved.error());
        return result;
    }

    /// Drop the cached copy so the next access rereads the file
    void invalidate() { cache_.reset(); }

private:
    VoidResult load();
    VoidResult save();

    std::string path_;
    std::unique_ptr<Settings> cache_;
};

} // namespace elan
