#pragma once

/**
 * @file archive.hpp
 * @brief Unpacking release archives
 *
 * Release archives wrap everything in one top-level directory
 * (`lean-4.9.0-linux/bin/lean`); that first path component is dropped so
 * the contents land directly in the destination.
 */

#include "elan/errors.hpp"

#include <string>

namespace elan {

enum class ArchiveFormat {
    TarGz,
    TarZst,
    Zip,
    Unknown,
};

/// Format implied by a file name suffix (.tar.gz/.tgz, .tar.zst, .zip)
ArchiveFormat archive_format_for(const std::string& file_name);

/// Canonical suffix of a format, including the leading dot
const char* archive_suffix(ArchiveFormat format);

/// `a/b/c` -> `b/c`; empty when nothing is left
std::string strip_first_component(const std::string& entry_path);

/**
 * @brief Extract `archive_path` into `dest_dir` without its top-level directory
 *
 * `dest_dir` is created if needed. Entries that would land outside it are
 * rejected. An unknown suffix fails with ARCHIVE_FORMAT_UNSUPPORTED.
 */
VoidResult extract_archive(const std::string& archive_path, const std::string& dest_dir);

} // namespace elan
