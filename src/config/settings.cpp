#include "elan/settings.hpp"
#include "elan/platform.hpp"

#include <filesystem>
#include <sstream>

#include <toml.hpp>

namespace elan {

namespace {

Error invalid_settings(const std::string& source, const std::string& detail) {
    return Error(ErrorCode::INVALID_CONFIG_FILE,
                 "error parsing settings file '" + source + "': " + detail);
}

} // namespace

bool is_supported_settings_version(const std::string& version) {
    return version == "2" || version == "12";
}

// ============================================================================
// TOML (de)serialization
// ============================================================================

Result<Settings> Settings::parse(const std::string& content, const std::string& source) {
    Settings settings;

    toml::value root;
    try {
        std::istringstream stream(content);
        root = toml::parse(stream, source);
    } catch (const std::exception& e) {
        return Result<Settings>::err(invalid_settings(source, e.what()));
    }

    if (!root.is_table()) {
        return Result<Settings>::err(invalid_settings(source, "expected a table"));
    }

    if (root.contains("version")) {
        const auto& v = root.at("version");
        if (!v.is_string()) {
            return Result<Settings>::err(invalid_settings(source, "'version' must be a string"));
        }
        settings.version = toml::get<std::string>(v);
    }
    if (!is_supported_settings_version(settings.version)) {
        return Result<Settings>::err(invalid_settings(source,
            "unknown metadata version: '" + settings.version + "'"));
    }

    if (root.contains("default_toolchain")) {
        const auto& v = root.at("default_toolchain");
        if (!v.is_string()) {
            return Result<Settings>::err(
                invalid_settings(source, "'default_toolchain' must be a string"));
        }
        settings.default_toolchain = toml::get<std::string>(v);
    }

    if (root.contains("telemetry")) {
        const auto& v = root.at("telemetry");
        if (!v.is_boolean()) {
            return Result<Settings>::err(invalid_settings(source, "'telemetry' must be a boolean"));
        }
        settings.telemetry = toml::get<bool>(v);
    }

    if (root.contains("overrides")) {
        const auto& v = root.at("overrides");
        if (!v.is_table()) {
            return Result<Settings>::err(invalid_settings(source, "'overrides' must be a table"));
        }
        for (const auto& [key, value] : toml::get<toml::table>(v)) {
            if (!value.is_string()) {
                return Result<Settings>::err(
                    invalid_settings(source, "override for '" + key + "' must be a string"));
            }
            settings.overrides[key] = toml::get<std::string>(value);
        }
    }

    return Result<Settings>::ok(std::move(settings));
}

std::string Settings::stringify() const {
    toml::table overrides_table;
    for (const auto& [path, toolchain] : overrides) {
        overrides_table[path] = toml::value(toolchain);
    }

    toml::table root;
    root["version"] = toml::value(version);
    if (default_toolchain) {
        root["default_toolchain"] = toml::value(*default_toolchain);
    }
    root["telemetry"] = toml::value(telemetry);
    root["overrides"] = toml::value(overrides_table);

    return toml::format(toml::value(root));
}

// ============================================================================
// Override database
// ============================================================================

void Settings::addOverride(const std::string& path, const std::string& toolchain,
                           NotificationSink& sink) {
    sink.notify(Event::SetOverrideToolchain, path, toolchain);
    overrides[path] = toolchain;
}

bool Settings::removeOverride(const std::string& path) {
    return overrides.erase(path) > 0;
}

std::string path_to_override_key(const std::string& path) {
    if (auto canonical = canonicalize(path)) {
        return *canonical;
    }
    return path;
}

// ============================================================================
// SettingsFile
// ============================================================================

VoidResult SettingsFile::load() {
    if (cache_) return VoidResult::ok();

    if (!path_exists(path_)) {
        cache_ = std::make_unique<Settings>();
        return VoidResult::ok();
    }

    auto content = read_file(path_);
    if (!content) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not read settings file: '" + path_ + "'"));
    }

    auto parsed = Settings::parse(*content, path_);
    if (parsed.isErr()) return VoidResult::err(parsed.error());

    cache_ = std::make_unique<Settings>(std::move(parsed.value()));
    return VoidResult::ok();
}

VoidResult SettingsFile::save() {
    std::string dir = std::filesystem::path(path_).parent_path().string();
    if (!dir.empty() && !create_directories(dir)) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not create directory '" + dir + "'"));
    }
    auto written = atomic_write_file(path_, cache_->stringify());
    if (!written.ok) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not write settings file '" + path_ + "': " + written.error));
    }
    return VoidResult::ok();
}

} // namespace elan
