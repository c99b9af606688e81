#include "elan/override.hpp"
#include "elan/config.hpp"
#include "elan/gc.hpp"
#include "elan/platform.hpp"
#include "elan/resolver.hpp"

#include <cctype>
#include <filesystem>
#include <map>
#include <sstream>

#include <toml.hpp>

namespace elan {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

const char* toml_type_name(const toml::value& v) {
    switch (v.type()) {
        case toml::value_t::boolean: return "boolean";
        case toml::value_t::integer: return "integer";
        case toml::value_t::floating: return "float";
        case toml::value_t::string: return "string";
        case toml::value_t::array: return "array";
        case toml::value_t::table: return "table";
        default: return "datetime";
    }
}

// Start of the walk: canonical when possible, absolute otherwise
fs::path walk_start(Cfg& cfg, const std::string& start_dir) {
    if (auto canonical = canonicalize(start_dir)) {
        return fs::path(*canonical);
    }
    cfg.sink().notify(Event::NoCanonicalPath, start_dir);
    std::error_code ec;
    fs::path abs = fs::absolute(start_dir, ec);
    return ec ? fs::path(start_dir) : abs;
}

} // namespace

std::string OverrideReason::toString() const {
    switch (kind) {
        case OverrideReasonKind::Environment:
            return "environment override by " + std::string(ELAN_TOOLCHAIN_ENV);
        case OverrideReasonKind::OverrideDatabase:
            return "directory override for '" + path + "'";
        case OverrideReasonKind::ToolchainFile:
        case OverrideReasonKind::PackageManifestFile:
            return "overridden by '" + path + "'";
        case OverrideReasonKind::InsideToolchainDirectory:
            return "override because inside toolchain directory '" + path + "'";
    }
    return path;
}

Result<UnresolvedToolchainDesc> read_toolchain_file(Cfg& cfg, const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<UnresolvedToolchainDesc>::err(Error(ErrorCode::IO_ERROR,
            "could not read toolchain file '" + path + "'"));
    }

    std::string name = trim(content->substr(0, content->find('\n')));
    if (name.empty()) {
        return Result<UnresolvedToolchainDesc>::err(Error(ErrorCode::INVALID_CONFIG_FILE,
            "empty toolchain file '" + path + "'"));
    }

    auto desc = lookup_unresolved_toolchain_desc(cfg, name);
    if (desc.isErr()) {
        Error e(ErrorCode::INVALID_CONFIG_FILE, desc.error().message());
        return Result<UnresolvedToolchainDesc>::err(e.withContext("in '" + path + "'"));
    }
    return desc;
}

Result<std::optional<std::string>> read_package_manifest_version(const std::string& path) {
    using R = Result<std::optional<std::string>>;

    auto content = read_file(path);
    if (!content) {
        return R::err(Error(ErrorCode::IO_ERROR, "could not read '" + path + "'"));
    }

    toml::value root;
    try {
        std::istringstream stream(*content);
        root = toml::parse(stream, path);
    } catch (const std::exception& e) {
        return R::err(Error(ErrorCode::INVALID_CONFIG_FILE,
            "invalid leanpkg.toml file '" + path + "': " + e.what()));
    }

    if (!root.is_table() || !root.contains("package")) {
        return R::ok(std::nullopt);
    }
    const auto& package = root.at("package");
    if (!package.is_table()) {
        return R::err(Error(ErrorCode::INVALID_CONFIG_FILE,
            "invalid leanpkg.toml file '" + path + "': 'package' must be a table"));
    }
    if (!package.contains("lean_version")) {
        return R::ok(std::nullopt);
    }

    const auto& version = package.at("lean_version");
    if (!version.is_string()) {
        return R::err(Error(ErrorCode::INVALID_CONFIG_FILE,
            "invalid 'package.lean_version' value in '" + path + "': expected string instead of " +
            toml_type_name(version)));
    }
    return R::ok(toml::get<std::string>(version));
}

Result<std::optional<OverrideMatch>> find_override(Cfg& cfg, const std::string& start_dir) {
    using R = Result<std::optional<OverrideMatch>>;

    if (const auto& env = cfg.envOverride(); env && !env->empty()) {
        auto desc = lookup_unresolved_toolchain_desc(cfg, *env);
        if (desc.isErr()) return R::err(desc.error());
        return R::ok(OverrideMatch{desc.value(), OverrideReason{OverrideReasonKind::Environment, ""}});
    }

    fs::path toolchains_dir(cfg.paths().toolchains);
    if (auto canonical = canonicalize(cfg.paths().toolchains)) {
        toolchains_dir = *canonical;
    }

    // Fetch the override database once; it does not change during the walk
    auto overrides = cfg.settings().with([](const Settings& s) {
        return Result<std::map<std::string, std::string>>::ok(s.overrides);
    });
    if (overrides.isErr()) return R::err(overrides.error());

    fs::path dir = walk_start(cfg, start_dir);
    while (true) {
        std::string dir_str = dir.string();

        auto db = overrides.value().find(dir_str);
        if (db != overrides.value().end()) {
            auto desc = ToolchainDesc::fromResolvedStr(db->second);
            if (desc.isErr()) {
                return R::err(desc.error().withContext("invalid override for '" + dir_str + "'"));
            }
            return R::ok(OverrideMatch{UnresolvedToolchainDesc{desc.value()},
                                       OverrideReason{OverrideReasonKind::OverrideDatabase, dir_str}});
        }

        std::string toolchain_file = (dir / TOOLCHAIN_FILE_NAME).string();
        if (path_exists(toolchain_file) && !is_directory(toolchain_file)) {
            auto desc = read_toolchain_file(cfg, toolchain_file);
            if (desc.isErr()) return R::err(desc.error());

            auto added = add_root(cfg, dir_str);
            if (added.isErr()) return R::err(added.error());

            return R::ok(OverrideMatch{desc.value(),
                                       OverrideReason{OverrideReasonKind::ToolchainFile, toolchain_file}});
        }

        std::string manifest_file = (dir / PACKAGE_MANIFEST_FILE_NAME).string();
        if (path_exists(manifest_file)) {
            auto version = read_package_manifest_version(manifest_file);
            if (version.isErr()) return R::err(version.error());
            if (version.value()) {
                auto desc = lookup_unresolved_toolchain_desc(cfg, *version.value());
                if (desc.isErr()) return R::err(desc.error());
                return R::ok(OverrideMatch{desc.value(),
                    OverrideReason{OverrideReasonKind::PackageManifestFile, manifest_file}});
            }
        }

        fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir) break;

        if (parent == toolchains_dir) {
            auto desc = ToolchainDesc::fromToolchainDir(dir.filename().string());
            if (desc.isErr()) return R::err(desc.error());
            return R::ok(OverrideMatch{UnresolvedToolchainDesc{desc.value()},
                OverrideReason{OverrideReasonKind::InsideToolchainDirectory, dir_str}});
        }
        dir = parent;
    }

    return R::ok(std::nullopt);
}

} // namespace elan
