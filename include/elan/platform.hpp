#pragma once

#include <optional>
#include <string>
#include <vector>

namespace elan {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown,
};

Platform get_current_platform();

enum class Arch {
    X86_64,
    AArch64,
    Unknown,
};

Arch get_current_arch();

/**
 * @brief Substring identifying this host's release asset
 *
 * "linux", "darwin" or "windows", with "_aarch64" appended on ARM64.
 * x86_64 carries no suffix.
 */
std::string informal_target(Platform platform, Arch arch);
std::string informal_target();

/// ".exe" on Windows, empty elsewhere
std::string exe_suffix();

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Canonical form of an existing path, or nullopt
std::optional<std::string> canonicalize(const std::string& path);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_symlink(const std::string& path);

// Names (not paths) of the entries of a directory
std::vector<std::string> list_directory_names(const std::string& path);

// Create a directory and its parents
bool create_directories(const std::string& path);

// Remove a file, directory tree or symlink; absent paths succeed
bool remove_path(const std::string& path, std::string* error = nullptr);

// Recursively copy a directory tree, preserving symlinks
bool copy_directory(const std::string& src, const std::string& dst, std::string* error = nullptr);

// Create a directory symlink at `link` pointing to `target`
bool symlink_directory(const std::string& target, const std::string& link,
                       std::string* error = nullptr);

// Unique path inside `dir` with the given extension
std::string make_temp_path(const std::string& dir, const std::string& extension);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// User home directory ($HOME, %USERPROFILE%)
std::optional<std::string> get_home_dir();

int get_process_id();

} // namespace elan
