#pragma once

/**
 * @file override.hpp
 * @brief Which toolchain governs a directory
 *
 * Lookup order: ELAN_TOOLCHAIN, then for the start directory and each
 * ancestor in turn the override database, a `lean-toolchain` pin file
 * and a `leanpkg.toml` manifest. Reaching an installed toolchain's own
 * directory selects that toolchain.
 */

#include "elan/errors.hpp"
#include "elan/toolchain_desc.hpp"

#include <optional>
#include <string>

namespace elan {

class Cfg;

/// Legacy package manifest consulted for `[package] lean_version`
constexpr const char* PACKAGE_MANIFEST_FILE_NAME = "leanpkg.toml";

enum class OverrideReasonKind {
    Environment,
    OverrideDatabase,
    ToolchainFile,
    PackageManifestFile,
    InsideToolchainDirectory,
};

struct OverrideReason {
    OverrideReasonKind kind = OverrideReasonKind::Environment;
    /// Directory (database, toolchain directory) or file (pin, manifest); empty for Environment
    std::string path;

    std::string toString() const;

    bool operator==(const OverrideReason& other) const {
        return kind == other.kind && path == other.path;
    }
};

struct OverrideMatch {
    UnresolvedToolchainDesc desc;
    OverrideReason reason;
};

/**
 * @brief Find the override applying to `start_dir`
 *
 * Returns nullopt when nothing applies (the caller falls back to the
 * default toolchain). Performs no resolution and no installation.
 * Directories holding a pin file are recorded as GC roots.
 */
Result<std::optional<OverrideMatch>> find_override(Cfg& cfg, const std::string& start_dir);

/// Parse the first line of a pin file as a toolchain name
Result<UnresolvedToolchainDesc> read_toolchain_file(Cfg& cfg, const std::string& path);

/**
 * @brief Read `[package] lean_version` from a package manifest
 *
 * nullopt when the field is absent; INVALID_CONFIG_FILE when the TOML is
 * malformed or the field is not a string.
 */
Result<std::optional<std::string>> read_package_manifest_version(const std::string& path);

} // namespace elan
