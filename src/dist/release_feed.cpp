#include "elan/release_feed.hpp"
#include "elan/toolchain_desc.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace elan {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_tag_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

std::string file_name_of_url(const std::string& url) {
    auto slash = url.rfind('/');
    return slash == std::string::npos ? url : url.substr(slash + 1);
}

int archive_preference(const std::string& name) {
    if (ends_with(name, ".tar.zst")) return 0;
    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) return 1;
    if (ends_with(name, ".zip")) return 2;
    return 3;
}

VoidResult require_network(bool allow_network) {
    if (!allow_network) {
        return VoidResult::err(Error(ErrorCode::NETWORK_UNAVAILABLE, "network access disabled"));
    }
    return VoidResult::ok();
}

Error no_asset_error(const std::string& target) {
    return Error(ErrorCode::ASSET_NOT_FOUND_FOR_PLATFORM,
                 "binary package was not provided for '" + target + "'");
}

Result<ReleaseAsset> find_asset_on_release_page(HttpClient& http, const std::string& origin,
                                                const std::string& tag,
                                                const std::string& target) {
    // Asset lists are rendered lazily on the release page itself
    std::string url = "https://github.com/" + origin + "/releases/expanded_assets/" + tag;
    auto page = http.fetchUrl(url);
    if (page.isErr()) {
        return Result<ReleaseAsset>::err(page.error().withContext(
            "failed to list release assets for '" + origin + ":" + tag + "'"));
    }

    std::vector<ReleaseAsset> assets;
    for (const auto& link : scrape_asset_links(page.value(), origin)) {
        assets.push_back(ReleaseAsset{file_name_of_url(link), link, std::nullopt});
    }

    auto asset = select_asset(assets, target);
    if (!asset) return Result<ReleaseAsset>::err(no_asset_error(target));
    return Result<ReleaseAsset>::ok(*asset);
}

} // namespace

bool uses_release_feed(const std::string& origin) {
    return origin == DEFAULT_ORIGIN ||
           origin == std::string(DEFAULT_ORIGIN) + NIGHTLY_ORIGIN_SUFFIX;
}

// ============================================================================
// JSON release feed
// ============================================================================

Result<ReleaseFeed> ReleaseFeed::parse(const std::string& json_text) {
    ReleaseFeed feed;

    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Result<ReleaseFeed>::err(
                Error(ErrorCode::REMOTE_FETCH_FAILED, "release feed must be a JSON object"));
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& releases = it.value();
            if (!releases.is_array()) continue;

            auto& list = feed.channels[it.key()];
            for (const auto& release : releases) {
                auto tag = get_string(release, "name");
                if (!tag) continue;

                ReleaseInfo info;
                info.tag = *tag;
                if (release.contains("assets") && release["assets"].is_array()) {
                    for (const auto& asset : release["assets"]) {
                        auto name = get_string(asset, "name");
                        auto url = get_string(asset, "browser_download_url");
                        if (!name || !url) continue;

                        ReleaseAsset a{*name, *url, std::nullopt};
                        if (auto digest = get_string(asset, "digest")) {
                            if (digest->rfind("sha256:", 0) == 0) {
                                a.sha256 = digest->substr(7);
                            }
                        }
                        info.assets.push_back(std::move(a));
                    }
                }
                list.push_back(std::move(info));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<ReleaseFeed>::err(Error(ErrorCode::REMOTE_FETCH_FAILED,
            std::string("invalid release feed: ") + e.what()));
    }

    return Result<ReleaseFeed>::ok(std::move(feed));
}

std::optional<std::string> ReleaseFeed::latest(const std::string& channel) const {
    auto it = channels.find(channel);
    if (it == channels.end() || it->second.empty()) return std::nullopt;
    return it->second.front().tag;
}

std::optional<ReleaseInfo> ReleaseFeed::findRelease(const std::string& tag) const {
    for (const auto& [channel, releases] : channels) {
        for (const auto& release : releases) {
            if (release.tag == tag) return release;
        }
    }
    return std::nullopt;
}

Result<std::string> fetch_latest_release_json(HttpClient& http, const std::string& feed_url,
                                              const std::string& channel, bool allow_network) {
    auto net = require_network(allow_network);
    if (net.isErr()) return Result<std::string>::err(net.error());

    auto body = http.fetchUrl(feed_url);
    if (body.isErr()) return Result<std::string>::err(body.error());

    auto feed = ReleaseFeed::parse(body.value());
    if (feed.isErr()) return Result<std::string>::err(feed.error());

    auto tag = feed.value().latest(channel);
    if (!tag) {
        return Result<std::string>::err(Error(ErrorCode::REMOTE_FETCH_FAILED,
            "no releases found for channel '" + channel + "' in " + feed_url));
    }
    return Result<std::string>::ok(*tag);
}

// ============================================================================
// GitHub release pages
// ============================================================================

Result<std::string> fetch_latest_release_tag(HttpClient& http, const std::string& origin,
                                             bool allow_network) {
    auto net = require_network(allow_network);
    if (net.isErr()) return Result<std::string>::err(net.error());

    std::string url = "https://github.com/" + origin + "/releases/latest";
    auto page = http.fetchUrl(url);
    if (page.isErr()) {
        return Result<std::string>::err(page.error().withContext(
            "failed to find latest release of '" + origin + "'"));
    }

    auto tag = scrape_latest_tag(page.value());
    if (!tag) {
        return Result<std::string>::err(Error(ErrorCode::REMOTE_FETCH_FAILED,
            "failed to parse latest release tag from " + url));
    }
    return Result<std::string>::ok(*tag);
}

std::optional<std::string> scrape_latest_tag(const std::string& html) {
    const std::string marker = "/tag/";
    size_t pos = 0;
    while ((pos = html.find(marker, pos)) != std::string::npos) {
        size_t start = pos + marker.size();
        size_t end = start;
        while (end < html.size() && is_tag_char(html[end])) ++end;
        if (end > start) {
            return html.substr(start, end - start);
        }
        pos = start;
    }
    return std::nullopt;
}

std::vector<std::string> scrape_asset_links(const std::string& html, const std::string& origin) {
    std::vector<std::string> links;
    const std::string marker = "/" + origin + "/releases/download/";
    size_t pos = 0;
    while ((pos = html.find(marker, pos)) != std::string::npos) {
        size_t end = html.find('"', pos + marker.size());
        if (end == std::string::npos) break;
        std::string link = "https://github.com" + html.substr(pos, end - pos);
        if (std::find(links.begin(), links.end(), link) == links.end()) {
            links.push_back(link);
        }
        pos = end;
    }
    return links;
}

// ============================================================================
// Asset selection
// ============================================================================

bool asset_matches_target(const std::string& asset_name, const std::string& target) {
    size_t pos = 0;
    while ((pos = asset_name.find(target, pos)) != std::string::npos) {
        size_t after = pos + target.size();
        if (after >= asset_name.size() || asset_name[after] != '_') {
            return true;
        }
        pos = after;
    }
    return false;
}

std::optional<ReleaseAsset> select_asset(const std::vector<ReleaseAsset>& assets,
                                         const std::string& target) {
    std::optional<ReleaseAsset> best;
    for (const auto& asset : assets) {
        if (!asset_matches_target(asset.name, target)) continue;
        if (!best || archive_preference(asset.name) < archive_preference(best->name)) {
            best = asset;
        }
    }
    return best;
}

Result<ReleaseAsset> find_release_asset(HttpClient& http, const std::string& origin,
                                        const std::string& tag, const std::string& target) {
    if (uses_release_feed(origin)) {
        auto body = http.fetchUrl(RELEASE_FEED_URL);
        if (body.isErr()) return Result<ReleaseAsset>::err(body.error());

        auto feed = ReleaseFeed::parse(body.value());
        if (feed.isErr()) return Result<ReleaseAsset>::err(feed.error());

        if (auto release = feed.value().findRelease(tag)) {
            auto asset = select_asset(release->assets, target);
            if (!asset) return Result<ReleaseAsset>::err(no_asset_error(target));
            return Result<ReleaseAsset>::ok(*asset);
        }
        // Older releases drop out of the feed but stay on GitHub
    }

    return find_asset_on_release_page(http, origin, tag, target);
}

} // namespace elan
