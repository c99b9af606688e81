#pragma once

/**
 * @file release_feed.hpp
 * @brief Channel-to-tag lookup and release asset discovery
 *
 * The default origins (`leanprover/lean4` and its `-nightly` twin) are
 * described by a JSON release feed. Any other origin is assumed to be a
 * GitHub repository and its release pages are scanned for links.
 */

#include "elan/download.hpp"
#include "elan/errors.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace elan {

constexpr const char* RELEASE_FEED_URL = "https://release.lean-lang.org/";

/// True if releases for `origin` are listed in the JSON feed
bool uses_release_feed(const std::string& origin);

// ============================================================================
// JSON release feed
// ============================================================================

struct ReleaseAsset {
    std::string name;
    std::string url;
    std::optional<std::string> sha256;  ///< hex digest when the feed provides one
};

struct ReleaseInfo {
    std::string tag;
    std::vector<ReleaseAsset> assets;
};

/**
 * @brief Parsed feed: channel name -> releases, newest first
 *
 * ```json
 * { "stable": [ { "name": "v4.9.0",
 *                 "assets": [ { "name": "lean-4.9.0-linux.tar.zst",
 *                               "browser_download_url": "https://...",
 *                               "digest": "sha256:..." } ] } ],
 *   "beta": [ ... ], "nightly": [ ... ] }
 * ```
 */
struct ReleaseFeed {
    std::map<std::string, std::vector<ReleaseInfo>> channels;

    static Result<ReleaseFeed> parse(const std::string& json_text);

    /// Newest tag of a channel
    std::optional<std::string> latest(const std::string& channel) const;

    /// Release with the given tag in any channel
    std::optional<ReleaseInfo> findRelease(const std::string& tag) const;
};

/// Latest tag for `channel` from the feed at `feed_url`
Result<std::string> fetch_latest_release_json(HttpClient& http, const std::string& feed_url,
                                              const std::string& channel, bool allow_network);

// ============================================================================
// GitHub release pages
// ============================================================================

/// Latest release tag of `origin`, read from its `releases/latest` page
Result<std::string> fetch_latest_release_tag(HttpClient& http, const std::string& origin,
                                             bool allow_network);

/// First `/tag/<tag>` link target in a page
std::optional<std::string> scrape_latest_tag(const std::string& html);

/// Absolute download URLs of `origin` linked from a page
std::vector<std::string> scrape_asset_links(const std::string& html, const std::string& origin);

// ============================================================================
// Asset selection
// ============================================================================

/**
 * @brief Whether an asset file name is built for `target`
 *
 * `target` must appear in the name and must not be immediately followed
 * by `_`, so "linux" does not pick up "linux_aarch64" assets.
 */
bool asset_matches_target(const std::string& asset_name, const std::string& target);

/// Among matching assets prefer .tar.zst, then .tar.gz, then .zip
std::optional<ReleaseAsset> select_asset(const std::vector<ReleaseAsset>& assets,
                                         const std::string& target);

/**
 * @brief Locate the download for `origin:tag` on this platform
 *
 * Consults the feed for default origins (falling back to the release
 * page when the tag is not listed) and the release page otherwise.
 * Fails with ASSET_NOT_FOUND_FOR_PLATFORM when no asset matches.
 */
Result<ReleaseAsset> find_release_asset(HttpClient& http, const std::string& origin,
                                        const std::string& tag, const std::string& target);

} // namespace elan
