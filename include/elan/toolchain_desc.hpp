#pragma once

/**
 * @file toolchain_desc.hpp
 * @brief Canonical toolchain identity and its directory-name encoding
 *
 * A toolchain is either Local (a user-linked directory known by a bare
 * name) or Remote (origin repository + immutable release tag). The
 * display form is `origin:release` or the bare local name; the
 * directory form replaces `/` with `--` and `:` with `---`.
 *
 * @example
 * ```cpp
 * auto d = elan::ToolchainDesc::remote("my-fork/lean4", "nightly-2023-09-06");
 * d.toDirName();   // "my-fork--lean4---nightly-2023-09-06"
 * elan::ToolchainDesc::fromToolchainDir(d.toDirName()).value() == d;  // true
 * ```
 */

#include "elan/errors.hpp"

#include <optional>
#include <string>

namespace elan {

/// Origin used when a name carries no `org/repo:` prefix
constexpr const char* DEFAULT_ORIGIN = "leanprover/lean4";

/// Suffix appended to an origin for nightly releases
constexpr const char* NIGHTLY_ORIGIN_SUFFIX = "-nightly";

/// Release sentinel meaning "read the pin file from the origin's default branch"
constexpr const char* LEAN_TOOLCHAIN_SENTINEL = "lean-toolchain";

/// Name of the toolchain pin file looked up during the override walk
constexpr const char* TOOLCHAIN_FILE_NAME = "lean-toolchain";

// ============================================================================
// ToolchainDesc
// ============================================================================

enum class ToolchainKind {
    Local,
    Remote,
};

class ToolchainDesc {
public:
    static ToolchainDesc local(std::string name);
    static ToolchainDesc remote(std::string origin, std::string release,
                                std::optional<std::string> from_channel = std::nullopt);

    /**
     * @brief Parse an already-resolved display string
     *
     * `origin:release` yields Remote with no channel; a bare name yields
     * Local. Fails with INVALID_NAME when the grammar does not match.
     */
    static Result<ToolchainDesc> fromResolvedStr(const std::string& name);

    /// Inverse of toDirName()
    static Result<ToolchainDesc> fromToolchainDir(const std::string& dir_name);

    ToolchainKind kind() const { return kind_; }
    bool isLocal() const { return kind_ == ToolchainKind::Local; }
    bool isRemote() const { return kind_ == ToolchainKind::Remote; }

    /// Local name (Local only)
    const std::string& name() const { return name_; }
    const std::string& origin() const { return origin_; }
    const std::string& release() const { return release_; }
    const std::optional<std::string>& fromChannel() const { return from_channel_; }

    /// Display form: `origin:release` or the local name
    std::string toString() const;

    /// Filesystem-safe encoding of toString()
    std::string toDirName() const;

    /// Identity ignores from_channel
    bool operator==(const ToolchainDesc& other) const;
    bool operator!=(const ToolchainDesc& other) const { return !(*this == other); }

private:
    ToolchainKind kind_ = ToolchainKind::Local;
    std::string name_;
    std::string origin_;
    std::string release_;
    std::optional<std::string> from_channel_;
};

/**
 * @brief A descriptor whose release may still be a floating channel
 *
 * Produced by parsing user or file input; only the resolver consumes it.
 */
struct UnresolvedToolchainDesc {
    ToolchainDesc desc;

    std::string toString() const { return desc.toString(); }
    bool operator==(const UnresolvedToolchainDesc& other) const {
        return desc == other.desc && desc.fromChannel() == other.desc.fromChannel();
    }
};

// ============================================================================
// Encoding helpers
// ============================================================================

/// `/` -> `--`, `:` -> `---`
std::string encode_toolchain_dir_name(const std::string& display);

/// `---` -> `:`, then `--` -> `/`
std::string decode_toolchain_dir_name(const std::string& dir_name);

/// True for "stable", "beta" and "nightly"
bool is_channel_name(const std::string& release);

/**
 * @brief Ordering used when listing toolchains and picking the newest local one
 *
 * stable < beta < nightly < semver tags (ascending) < everything else (lexical).
 * Returns true when `a` sorts before `b`.
 */
bool toolchain_release_less(const std::string& a, const std::string& b);

/// Sort descriptors by origin, then by toolchain_release_less on the release
bool toolchain_less(const ToolchainDesc& a, const ToolchainDesc& b);

} // namespace elan
