#pragma once

/**
 * @file resolver.hpp
 * @brief From user-supplied names to concrete toolchain descriptors
 *
 * Parsing (lookup_unresolved_toolchain_desc) only checks the grammar and
 * applies local conventions. Resolution turns channels and the
 * `lean-toolchain` sentinel into concrete release tags, which may need
 * the network.
 *
 * | input                      | unresolved                               |
 * |----------------------------|------------------------------------------|
 * | `stable`                   | leanprover/lean4:stable (channel stable) |
 * | `nightly-2023-09-06`       | leanprover/lean4-nightly:nightly-...     |
 * | `4.9.0`                    | leanprover/lean4:v4.9.0                  |
 * | `my-fork/lean4:nightly`    | my-fork/lean4-nightly:nightly            |
 * | `mybuild` (linked)         | Local mybuild                            |
 */

#include "elan/errors.hpp"
#include "elan/toolchain_desc.hpp"

#include <optional>
#include <string>

namespace elan {

class Cfg;

/// Bound on nested `lean-toolchain` redirections
constexpr int MAX_RESOLVE_DEPTH = 20;

/// Parse a raw name; INVALID_NAME on grammar mismatch
Result<UnresolvedToolchainDesc> lookup_unresolved_toolchain_desc(Cfg& cfg, const std::string& name);

/**
 * @brief Resolve channels and sentinels to a concrete release
 * @param allow_network false behaves as if every remote query failed
 * @param allow_cache_fallback on query failure, substitute the newest
 *        matching installed toolchain instead of failing
 */
Result<ToolchainDesc> resolve_toolchain_desc_ext(Cfg& cfg, const UnresolvedToolchainDesc& unresolved,
                                                 bool allow_network, bool allow_cache_fallback);

/// Network allowed, cache fallback enabled
Result<ToolchainDesc> resolve_toolchain_desc(Cfg& cfg, const UnresolvedToolchainDesc& unresolved);

/// lookup_unresolved_toolchain_desc() followed by resolve_toolchain_desc()
Result<ToolchainDesc> lookup_toolchain_desc(Cfg& cfg, const std::string& name);

/**
 * @brief Newest installed toolchain of `origin` that could stand in for `channel`
 *
 * nightly: `nightly-*` tags. stable: SemVer tags without pre-release.
 * beta: any SemVer tag.
 */
std::optional<ToolchainDesc> find_latest_local_toolchain(Cfg& cfg, const std::string& origin,
                                                         const std::string& channel);

} // namespace elan
