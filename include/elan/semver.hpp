#pragma once

/**
 * @file semver.hpp
 * @brief Semantic version handling for release tags
 *
 * Release tags such as `v4.9.0` or `v4.10.0-rc1` are compared as SemVer
 * 2.0.0 versions once the leading `v` is dropped.
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace elan {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Parse a release tag as a version
 * @param tag Tag with or without a leading `v` (e.g. "v4.9.0", "4.10.0-rc1")
 * @return Parsed version or nullopt when the tag is not SemVer
 */
std::optional<Version> parse_release_version(const std::string& tag);

/// True if the tag parses and carries a pre-release part (`-rc1`, `-beta`, ...)
bool is_prerelease_tag(const std::string& tag);

} // namespace elan
