#include <doctest/doctest.h>
#include <elan/release_feed.hpp>
#include <elan/toolchain_desc.hpp>
#include "test_helpers.hpp"

using namespace elan;
using namespace elan::test;

namespace {

const char* FEED = R"({
  "stable": [
    { "name": "v4.9.0",
      "assets": [
        { "name": "lean-4.9.0-linux.tar.zst",
          "browser_download_url": "https://example.org/lean-4.9.0-linux.tar.zst",
          "digest": "sha256:abc123" },
        { "name": "lean-4.9.0-linux.zip",
          "browser_download_url": "https://example.org/lean-4.9.0-linux.zip" },
        { "name": "lean-4.9.0-linux_aarch64.tar.zst",
          "browser_download_url": "https://example.org/lean-4.9.0-linux_aarch64.tar.zst" },
        { "name": "lean-4.9.0-darwin.tar.zst",
          "browser_download_url": "https://example.org/lean-4.9.0-darwin.tar.zst" }
      ] },
    { "name": "v4.8.0", "assets": [] }
  ],
  "beta": [ { "name": "v4.10.0-rc1", "assets": [] } ],
  "nightly": [ { "name": "nightly-2024-05-01", "assets": [] } ]
})";

} // namespace

// ============================================================================
// JSON feed
// ============================================================================

TEST_CASE("ReleaseFeed::parse reads channels newest first") {
    auto feed = ReleaseFeed::parse(FEED);
    REQUIRE(feed.isOk());
    CHECK(feed.value().latest("stable") == std::optional<std::string>("v4.9.0"));
    CHECK(feed.value().latest("beta") == std::optional<std::string>("v4.10.0-rc1"));
    CHECK(feed.value().latest("nightly") == std::optional<std::string>("nightly-2024-05-01"));
    CHECK_FALSE(feed.value().latest("unknown"));

    auto release = feed.value().findRelease("v4.9.0");
    REQUIRE(release);
    REQUIRE(release->assets.size() == 4);
    REQUIRE(release->assets[0].sha256);
    CHECK(*release->assets[0].sha256 == "abc123");
    CHECK_FALSE(release->assets[1].sha256);
}

TEST_CASE("ReleaseFeed::parse rejects invalid JSON") {
    auto feed = ReleaseFeed::parse("{ not json");
    REQUIRE(feed.isErr());
    CHECK(feed.error().code() == ErrorCode::REMOTE_FETCH_FAILED);
    CHECK(ReleaseFeed::parse("[1, 2]").isErr());
}

TEST_CASE("fetch_latest_release_json respects the network switch") {
    FakeHttpClient http;
    http.serve(RELEASE_FEED_URL, FEED);

    auto tag = fetch_latest_release_json(http, RELEASE_FEED_URL, "stable", true);
    REQUIRE(tag.isOk());
    CHECK(tag.value() == "v4.9.0");

    auto offline = fetch_latest_release_json(http, RELEASE_FEED_URL, "stable", false);
    REQUIRE(offline.isErr());
    CHECK(offline.error().code() == ErrorCode::NETWORK_UNAVAILABLE);
    CHECK(http.fetches == 1);
}

// ============================================================================
// Release pages
// ============================================================================

TEST_CASE("scrape_latest_tag finds the first tag link") {
    std::string html = R"(<a href="/my-fork/lean4/releases/tag/nightly-2024-02-03">x</a>)";
    CHECK(scrape_latest_tag(html) == std::optional<std::string>("nightly-2024-02-03"));
    CHECK_FALSE(scrape_latest_tag("<html>no releases</html>"));
}

TEST_CASE("scrape_asset_links keeps links of the given origin only") {
    std::string html =
        R"(<a href="/my-fork/lean4/releases/download/v1/lean-linux.tar.gz" rel="nofollow">)"
        R"(<a href="/other/repo/releases/download/v1/lean-linux.tar.gz">)"
        R"(<a href="/my-fork/lean4/releases/download/v1/lean-darwin.zip">)"
        R"(<a href="/my-fork/lean4/releases/download/v1/lean-linux.tar.gz">)";

    auto links = scrape_asset_links(html, "my-fork/lean4");
    REQUIRE(links.size() == 2);
    CHECK(links[0] == "https://github.com/my-fork/lean4/releases/download/v1/lean-linux.tar.gz");
    CHECK(links[1] == "https://github.com/my-fork/lean4/releases/download/v1/lean-darwin.zip");
}

// ============================================================================
// Asset selection
// ============================================================================

TEST_CASE("asset_matches_target does not confuse architectures") {
    CHECK(asset_matches_target("lean-4.9.0-linux.tar.zst", "linux"));
    CHECK_FALSE(asset_matches_target("lean-4.9.0-linux_aarch64.tar.zst", "linux"));
    CHECK(asset_matches_target("lean-4.9.0-linux_aarch64.tar.zst", "linux_aarch64"));
    CHECK_FALSE(asset_matches_target("lean-4.9.0-darwin.tar.zst", "linux"));
}

TEST_CASE("select_asset prefers zstd, then gzip, then zip") {
    std::vector<ReleaseAsset> assets = {
        {"lean-linux.zip", "u1", std::nullopt},
        {"lean-linux.tar.gz", "u2", std::nullopt},
        {"lean-linux.tar.zst", "u3", std::nullopt},
    };
    CHECK(select_asset(assets, "linux")->url == "u3");
    assets.pop_back();
    CHECK(select_asset(assets, "linux")->url == "u2");
    CHECK_FALSE(select_asset(assets, "windows"));
}

TEST_CASE("find_release_asset uses the feed for the default origin") {
    FakeHttpClient http;
    http.serve(RELEASE_FEED_URL, FEED);

    auto asset = find_release_asset(http, DEFAULT_ORIGIN, "v4.9.0", "linux");
    REQUIRE(asset.isOk());
    CHECK(asset.value().name == "lean-4.9.0-linux.tar.zst");
    REQUIRE(asset.value().sha256);

    auto missing = find_release_asset(http, DEFAULT_ORIGIN, "v4.9.0", "windows");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::ASSET_NOT_FOUND_FOR_PLATFORM);
    CHECK(missing.error().message() == "binary package was not provided for 'windows'");
}

TEST_CASE("find_release_asset falls back to the release page for unlisted tags") {
    FakeHttpClient http;
    http.serve(RELEASE_FEED_URL, FEED);
    http.serve("https://github.com/leanprover/lean4/releases/expanded_assets/v4.0.0",
               R"(<a href="/leanprover/lean4/releases/download/v4.0.0/lean-4.0.0-linux.zip">)");

    auto asset = find_release_asset(http, DEFAULT_ORIGIN, "v4.0.0", "linux");
    REQUIRE(asset.isOk());
    CHECK(asset.value().url ==
          "https://github.com/leanprover/lean4/releases/download/v4.0.0/lean-4.0.0-linux.zip");
    CHECK_FALSE(asset.value().sha256);
}

TEST_CASE("find_release_asset scrapes custom origins") {
    FakeHttpClient http;
    http.serve("https://github.com/my-fork/lean4/releases/expanded_assets/v1",
               R"(<a href="/my-fork/lean4/releases/download/v1/lean-darwin.tar.gz">)");

    auto asset = find_release_asset(http, "my-fork/lean4", "v1", "linux");
    REQUIRE(asset.isErr());
    CHECK(asset.error().code() == ErrorCode::ASSET_NOT_FOUND_FOR_PLATFORM);
    CHECK(http.fetches == 1);
}
