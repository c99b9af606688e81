#pragma once

/**
 * @file toolchain.hpp
 * @brief One toolchain and its installation directory
 */

#include "elan/errors.hpp"
#include "elan/toolchain_desc.hpp"

#include <string>

namespace elan {

class Cfg;

/**
 * @brief Installation root of a toolchain
 *
 * Nothing is cached: whether the toolchain is installed is decided by
 * probing the directory each time.
 */
class InstallPrefix {
public:
    explicit InstallPrefix(std::string path) : path_(std::move(path)) {}

    static InstallPrefix forToolchain(const std::string& toolchains_dir, const ToolchainDesc& desc);

    const std::string& path() const { return path_; }
    std::string lockPath() const { return path_ + ".lock"; }
    std::string stagingPath() const { return path_ + ".tmp"; }

    /// Directory present (a symlink to a directory counts)
    bool exists() const;

private:
    std::string path_;
};

class Toolchain {
public:
    Toolchain(Cfg& cfg, ToolchainDesc desc);

    const ToolchainDesc& desc() const { return desc_; }
    const std::string& path() const { return prefix_.path(); }
    const InstallPrefix& prefix() const { return prefix_; }
    std::string name() const { return desc_.toString(); }

    bool exists() const;

    /// Installed by `toolchain link`: the install path is a symlink
    bool isCustom() const;

    /// Path of `bin/<name>` inside the toolchain (".exe" added on Windows)
    std::string binaryFile(const std::string& binary) const;

    /// Download and install; ALREADY_INSTALLED if present
    VoidResult installFromDist();

    /// Download and install unless present
    VoidResult installFromDistIfNotInstalled();

    /**
     * @brief Install a local build as this (Local) toolchain
     * @param src directory containing `bin/lean`
     * @param link symlink `src` instead of copying it
     */
    VoidResult installFromDir(const std::string& src, bool link);

    /// Uninstall; an absent toolchain is reported and treated as success
    VoidResult remove();

    /// Record this toolchain in the override database for `dir`
    VoidResult makeOverride(const std::string& dir);

    VoidResult makeDefault();

private:
    Cfg* cfg_;
    ToolchainDesc desc_;
    InstallPrefix prefix_;
};

} // namespace elan
