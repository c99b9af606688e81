#include <doctest/doctest.h>
#include <elan/release_feed.hpp>
#include <elan/resolver.hpp>
#include "test_helpers.hpp"

using namespace elan;
using namespace elan::test;

namespace {

const char* FEED = R"({
  "stable": [ { "name": "v4.9.0", "assets": [] } ],
  "beta": [ { "name": "v4.10.0-rc1", "assets": [] } ],
  "nightly": [ { "name": "nightly-2024-05-01", "assets": [] } ]
})";

ToolchainDesc unresolved_of(Cfg& cfg, const std::string& name) {
    auto u = lookup_unresolved_toolchain_desc(cfg, name);
    REQUIRE(u.isOk());
    return u.value().desc;
}

} // namespace

// ============================================================================
// Name normalization
// ============================================================================

TEST_CASE("lookup_unresolved_toolchain_desc applies naming conventions") {
    CfgFixture f;

    auto stable = unresolved_of(f.cfg, "stable");
    CHECK(stable.toString() == "leanprover/lean4:stable");
    CHECK(stable.fromChannel() == std::optional<std::string>("stable"));

    auto dated = unresolved_of(f.cfg, "nightly-2023-09-06");
    CHECK(dated.toString() == "leanprover/lean4-nightly:nightly-2023-09-06");
    CHECK_FALSE(dated.fromChannel());

    CHECK(unresolved_of(f.cfg, "4.9.0").toString() == "leanprover/lean4:v4.9.0");
    CHECK(unresolved_of(f.cfg, "v4.9.0").toString() == "leanprover/lean4:v4.9.0");
    CHECK(unresolved_of(f.cfg, "my-fork/lean4:nightly").toString() == "my-fork/lean4-nightly:nightly");
    CHECK(unresolved_of(f.cfg, "leanprover/lean4-nightly:nightly").toString() ==
          "leanprover/lean4-nightly:nightly");
    CHECK(unresolved_of(f.cfg, "my-fork/lean4:v1.0").toString() == "my-fork/lean4:v1.0");
}

TEST_CASE("lookup_unresolved_toolchain_desc prefers linked toolchains") {
    CfgFixture f;
    f.fakeLink("mybuild");

    auto linked = unresolved_of(f.cfg, "mybuild");
    CHECK(linked.isLocal());
    CHECK(linked.name() == "mybuild");

    // Not linked: read as a release of the default origin
    auto other = unresolved_of(f.cfg, "otherbuild");
    CHECK(other.isRemote());
    CHECK(other.toString() == "leanprover/lean4:otherbuild");
}

TEST_CASE("lookup_unresolved_toolchain_desc rejects bad names") {
    CfgFixture f;
    auto r = lookup_unresolved_toolchain_desc(f.cfg, "a/b:c d");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_NAME);
}

// ============================================================================
// Channel resolution
// ============================================================================

TEST_CASE("channels resolve through the release feed") {
    CfgFixture f;
    f.http.serve(RELEASE_FEED_URL, FEED);

    auto stable = lookup_toolchain_desc(f.cfg, "stable");
    REQUIRE(stable.isOk());
    CHECK(stable.value().toString() == "leanprover/lean4:v4.9.0");
    CHECK(stable.value().fromChannel() == std::optional<std::string>("stable"));

    auto nightly = lookup_toolchain_desc(f.cfg, "nightly");
    REQUIRE(nightly.isOk());
    CHECK(nightly.value().toString() == "leanprover/lean4-nightly:nightly-2024-05-01");

    auto beta = lookup_toolchain_desc(f.cfg, "beta");
    REQUIRE(beta.isOk());
    CHECK(beta.value().release() == "v4.10.0-rc1");
}

TEST_CASE("concrete releases resolve without the network") {
    CfgFixture f;
    auto r = lookup_toolchain_desc(f.cfg, "v4.9.0");
    REQUIRE(r.isOk());
    CHECK(r.value().toString() == "leanprover/lean4:v4.9.0");
    CHECK(f.http.fetches == 0);
}

TEST_CASE("custom origins resolve channels from the latest release page") {
    CfgFixture f;
    f.http.serve("https://github.com/my-fork/lean4/releases/latest",
                 R"(<a href="/my-fork/lean4/releases/tag/v2.1.0">v2.1.0</a>)");

    auto r = lookup_toolchain_desc(f.cfg, "my-fork/lean4:stable");
    REQUIRE(r.isOk());
    CHECK(r.value().toString() == "my-fork/lean4:v2.1.0");
}

TEST_CASE("beta is only known for the default origin") {
    CfgFixture f;
    auto r = lookup_toolchain_desc(f.cfg, "my-fork/lean4:beta");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::UNSUPPORTED_CHANNEL);
}

// ============================================================================
// Cache fallback
// ============================================================================

TEST_CASE("offline channel lookup falls back to the newest installed nightly") {
    CfgFixture f;
    f.fakeInstall(ToolchainDesc::remote("leanprover/lean4-nightly", "nightly-2024-01-01"));
    f.fakeInstall(ToolchainDesc::remote("leanprover/lean4-nightly", "nightly-2024-02-01"));
    f.fakeInstall(ToolchainDesc::remote("my-fork/lean4-nightly", "nightly-2024-03-01"));

    auto r = lookup_toolchain_desc(f.cfg, "nightly");
    REQUIRE(r.isOk());
    CHECK(r.value().toString() == "leanprover/lean4-nightly:nightly-2024-02-01");
    CHECK(r.value().fromChannel() == std::optional<std::string>("nightly"));
    REQUIRE(f.sink.count(Event::UsingExistingRelease) == 1);
    CHECK(f.sink.events.back().toString().find("nightly-2024-02-01") != std::string::npos);
}

TEST_CASE("stable fallback skips release candidates, beta does not") {
    CfgFixture f;
    f.fakeInstall(ToolchainDesc::remote(DEFAULT_ORIGIN, "v4.9.0"));
    f.fakeInstall(ToolchainDesc::remote(DEFAULT_ORIGIN, "v4.10.0-rc1"));

    auto stable = lookup_toolchain_desc(f.cfg, "stable");
    REQUIRE(stable.isOk());
    CHECK(stable.value().release() == "v4.9.0");

    auto beta = lookup_toolchain_desc(f.cfg, "beta");
    REQUIRE(beta.isOk());
    CHECK(beta.value().release() == "v4.10.0-rc1");
}

TEST_CASE("disabled network does not report the fallback") {
    CfgFixture f;
    f.fakeInstall(ToolchainDesc::remote(DEFAULT_ORIGIN, "v4.9.0"));

    auto u = lookup_unresolved_toolchain_desc(f.cfg, "stable");
    REQUIRE(u.isOk());
    auto r = resolve_toolchain_desc_ext(f.cfg, u.value(), false, true);
    REQUIRE(r.isOk());
    CHECK(r.value().release() == "v4.9.0");
    CHECK_FALSE(f.sink.contains(Event::UsingExistingRelease));
    CHECK(f.http.fetches == 0);
}

TEST_CASE("without a cached toolchain the query error is returned") {
    CfgFixture f;
    auto r = lookup_toolchain_desc(f.cfg, "stable");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::NETWORK_UNAVAILABLE);

    f.fakeInstall(ToolchainDesc::remote(DEFAULT_ORIGIN, "v4.9.0"));
    auto u = lookup_unresolved_toolchain_desc(f.cfg, "stable");
    REQUIRE(u.isOk());
    CHECK(resolve_toolchain_desc_ext(f.cfg, u.value(), true, false).isErr());
}

// ============================================================================
// lean-toolchain sentinel
// ============================================================================

TEST_CASE("the lean-toolchain release follows the repository's pin file") {
    CfgFixture f;
    f.http.serve("https://raw.githubusercontent.com/my-org/proj/HEAD/lean-toolchain",
                 "leanprover/lean4:v4.8.0\n");

    auto r = lookup_toolchain_desc(f.cfg, "my-org/proj:lean-toolchain");
    REQUIRE(r.isOk());
    CHECK(r.value().toString() == "leanprover/lean4:v4.8.0");
}

TEST_CASE("the lean-toolchain release can chain to a channel") {
    CfgFixture f;
    f.http.serve("https://raw.githubusercontent.com/my-org/proj/HEAD/lean-toolchain", "stable\n");
    f.http.serve(RELEASE_FEED_URL, FEED);

    auto r = lookup_toolchain_desc(f.cfg, "my-org/proj:lean-toolchain");
    REQUIRE(r.isOk());
    CHECK(r.value().toString() == "leanprover/lean4:v4.9.0");
}

TEST_CASE("self-referencing pin files hit the recursion limit") {
    CfgFixture f;
    f.http.serve("https://raw.githubusercontent.com/my-org/proj/HEAD/lean-toolchain",
                 "my-org/proj:lean-toolchain\n");

    auto r = lookup_toolchain_desc(f.cfg, "my-org/proj:lean-toolchain");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::RECURSION_LIMIT);
    CHECK(f.http.fetches == MAX_RESOLVE_DEPTH);
}

TEST_CASE("an unreachable pin file is a remote fetch failure") {
    CfgFixture f;
    auto r = lookup_toolchain_desc(f.cfg, "my-org/proj:lean-toolchain");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::REMOTE_FETCH_FAILED);
}
