#pragma once

/**
 * @file gc.hpp
 * @brief Finding installed toolchains that nothing refers to any more
 *
 * Every directory in which a `lean-toolchain` file was seen is recorded
 * in `<home>/known-projects`. A toolchain is in use if a recorded
 * project, the default, ELAN_TOOLCHAIN or an override database entry
 * resolves to it.
 */

#include "elan/errors.hpp"
#include "elan/toolchain_desc.hpp"

#include <string>
#include <utility>
#include <vector>

namespace elan {

class Cfg;

/// Record a project directory; duplicates are ignored
VoidResult add_root(Cfg& cfg, const std::string& root);

/// Recorded project directories, in insertion order (missing file = none)
Result<std::vector<std::string>> get_roots(Cfg& cfg);

struct GcAnalysis {
    /// Installed, not linked, and referenced by nothing
    std::vector<ToolchainDesc> unused;
    /// Each reference with a label saying where it came from
    std::vector<std::pair<std::string, ToolchainDesc>> used;
};

/// Classify installed toolchains; never modifies anything
Result<GcAnalysis> analyze_toolchains(Cfg& cfg);

} // namespace elan
