#pragma once

/**
 * @file manifestation.hpp
 * @brief Materializing a toolchain directory from a release archive
 *
 * The install protocol for `<toolchains>/<dir>`:
 *   1. lock `<dir>.lock` (other processes wait and poll)
 *   2. return early if `<dir>` appeared meanwhile
 *   3. find the asset for this platform and download it to `<home>/tmp`
 *   4. unpack into `<dir>.tmp` (a stale one is removed first)
 *   5. rename `<dir>.tmp` to `<dir>`
 * A crash before step 5 never leaves a partial `<dir>` behind.
 */

#include "elan/errors.hpp"
#include "elan/notifications.hpp"
#include "elan/toolchain.hpp"
#include "elan/toolchain_desc.hpp"

namespace elan {

class Cfg;

/// Install a Remote toolchain into `prefix`; succeeds without work if it exists
VoidResult install_from_dist(Cfg& cfg, const ToolchainDesc& desc, const InstallPrefix& prefix);

/// Delete an installed toolchain (a linked one only loses its link); NOT_INSTALLED if absent
VoidResult uninstall(const InstallPrefix& prefix, NotificationSink& sink);

} // namespace elan
