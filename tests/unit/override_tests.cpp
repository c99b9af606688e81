#include <doctest/doctest.h>
#include <elan/gc.hpp>
#include <elan/override.hpp>
#include "test_helpers.hpp"

using namespace elan;
using namespace elan::test;

namespace {

void set_db_override(CfgFixture& f, const std::string& dir, const std::string& name) {
    auto r = f.cfg.settings().withMut([&](Settings& s) {
        s.addOverride(dir, name, f.sink);
        return VoidResult::ok();
    });
    REQUIRE(r.isOk());
}

OverrideMatch require_match(CfgFixture& f, const std::string& dir) {
    auto r = find_override(f.cfg, dir);
    REQUIRE(r.isOk());
    REQUIRE(r.value().has_value());
    return *r.value();
}

} // namespace

// ============================================================================
// Pin files
// ============================================================================

TEST_CASE("a pin file governs its directory and subdirectories") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/lean-toolchain", "leanprover/lean4:v4.9.0\n");
    fs::create_directories(proj + "/sub");

    auto m = require_match(f, proj + "/sub");
    CHECK(m.desc.toString() == "leanprover/lean4:v4.9.0");
    CHECK(m.reason.kind == OverrideReasonKind::ToolchainFile);
    CHECK(m.reason.path == proj + "/lean-toolchain");
    CHECK(m.reason.toString() == "overridden by '" + proj + "/lean-toolchain'");

    auto roots = get_roots(f.cfg);
    REQUIRE(roots.isOk());
    REQUIRE(roots.value().size() == 1);
    CHECK(roots.value()[0] == proj);
}

TEST_CASE("a pinned channel stays unresolved") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/lean-toolchain", "leanprover/lean4:stable\n");
    fs::create_directories(proj + "/sub");

    auto m = require_match(f, proj + "/sub");
    CHECK(m.desc.desc.isRemote());
    CHECK(m.desc.desc.origin() == "leanprover/lean4");
    CHECK(m.desc.desc.release() == "stable");
    CHECK(m.desc.desc.fromChannel() == std::optional<std::string>("stable"));
    OverrideReason expected{OverrideReasonKind::ToolchainFile, proj + "/lean-toolchain"};
    CHECK(m.reason == expected);
    CHECK(f.http.fetches == 0);
}

TEST_CASE("pin files only use their first line") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/lean-toolchain", "  4.9.0  \r\nignored trailing text\n");

    auto m = require_match(f, proj);
    CHECK(m.desc.toString() == "leanprover/lean4:v4.9.0");
}

TEST_CASE("an empty pin file is a configuration error") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/lean-toolchain", "\n");

    auto r = find_override(f.cfg, proj);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_CONFIG_FILE);
}

TEST_CASE("a malformed pin file is a configuration error") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/lean-toolchain", "not a toolchain\n");

    auto r = find_override(f.cfg, proj);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_CONFIG_FILE);
    CHECK(r.error().message().find(proj) != std::string::npos);
}

// ============================================================================
// Precedence
// ============================================================================

TEST_CASE("ELAN_TOOLCHAIN beats everything") {
    TempDir tmp;
    FakeHttpClient http;
    CollectingSink sink;
    Cfg cfg(tmp.sub("elan"), http, sink, std::string("leanprover/lean4:v4.0.0"));
    write_text(tmp.sub("proj/lean-toolchain"), "leanprover/lean4:v4.9.0\n");

    auto r = find_override(cfg, tmp.sub("proj"));
    REQUIRE(r.isOk());
    REQUIRE(r.value());
    CHECK(r.value()->desc.toString() == "leanprover/lean4:v4.0.0");
    CHECK(r.value()->reason.kind == OverrideReasonKind::Environment);
    CHECK(r.value()->reason.toString() == "environment override by ELAN_TOOLCHAIN");
}

TEST_CASE("an empty ELAN_TOOLCHAIN is ignored") {
    TempDir tmp;
    FakeHttpClient http;
    NullSink sink;
    Cfg cfg(tmp.sub("elan"), http, sink, std::string());
    CHECK_FALSE(cfg.envOverride());
}

TEST_CASE("the override database beats a pin file in the same directory") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/lean-toolchain", "leanprover/lean4:v4.9.0\n");
    set_db_override(f, proj, "leanprover/lean4:v4.0.0");

    auto m = require_match(f, proj);
    CHECK(m.desc.toString() == "leanprover/lean4:v4.0.0");
    CHECK(m.reason.kind == OverrideReasonKind::OverrideDatabase);
    CHECK(m.reason.toString() == "directory override for '" + proj + "'");

    auto removed = f.cfg.settings().withMut([&](Settings& s) {
        return s.removeOverride(proj) ? VoidResult::ok()
                                      : VoidResult::err(Error(ErrorCode::IO_ERROR, "missing"));
    });
    REQUIRE(removed.isOk());

    auto after = require_match(f, proj);
    CHECK(after.desc.toString() == "leanprover/lean4:v4.9.0");
    CHECK(after.reason.kind == OverrideReasonKind::ToolchainFile);
}

TEST_CASE("the nearest directory wins regardless of the source") {
    CfgFixture f;
    std::string a = f.tmp.sub("a");
    fs::create_directories(a + "/b/c");
    set_db_override(f, a, "leanprover/lean4:v4.0.0");
    write_text(a + "/b/lean-toolchain", "leanprover/lean4:v4.9.0\n");

    auto m = require_match(f, a + "/b/c");
    CHECK(m.reason.kind == OverrideReasonKind::ToolchainFile);
    CHECK(m.desc.toString() == "leanprover/lean4:v4.9.0");

    auto outer = require_match(f, a);
    CHECK(outer.reason.kind == OverrideReasonKind::OverrideDatabase);
}

TEST_CASE("no override applies outside any project") {
    CfgFixture f;
    fs::create_directories(f.tmp.sub("plain"));
    auto r = find_override(f.cfg, f.tmp.sub("plain"));
    REQUIRE(r.isOk());
    CHECK_FALSE(r.value());
    CHECK_FALSE(fs::exists(f.cfg.paths().known_projects));
}

// ============================================================================
// Package manifests
// ============================================================================

TEST_CASE("leanpkg.toml lean_version selects a toolchain") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/leanpkg.toml",
               "[package]\nname = \"demo\"\nlean_version = \"leanprover/lean4:v4.8.0\"\n");

    auto m = require_match(f, proj);
    CHECK(m.desc.toString() == "leanprover/lean4:v4.8.0");
    CHECK(m.reason.kind == OverrideReasonKind::PackageManifestFile);
    CHECK(m.reason.path == proj + "/leanpkg.toml");
}

TEST_CASE("leanpkg.toml without lean_version is skipped") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/leanpkg.toml", "[package]\nname = \"demo\"\n");
    write_text(f.tmp.sub("lean-toolchain"), "leanprover/lean4:v4.9.0\n");

    auto m = require_match(f, proj);
    CHECK(m.reason.kind == OverrideReasonKind::ToolchainFile);
}

TEST_CASE("a malformed leanpkg.toml stops the search") {
    CfgFixture f;
    std::string proj = f.tmp.sub("proj");
    write_text(proj + "/leanpkg.toml", "[package\nname = \"demo\"\n");
    write_text(f.tmp.sub("lean-toolchain"), "leanprover/lean4:v4.9.0\n");

    auto r = find_override(f.cfg, proj);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_CONFIG_FILE);
    CHECK(r.error().message().find(proj + "/leanpkg.toml") != std::string::npos);
}

TEST_CASE("a non-string lean_version is rejected") {
    TempDir tmp;
    write_text(tmp.sub("leanpkg.toml"), "[package]\nlean_version = 4\n");

    auto r = read_package_manifest_version(tmp.sub("leanpkg.toml"));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_CONFIG_FILE);
    CHECK(r.error().message().find("expected string instead of integer") != std::string::npos);
}

// ============================================================================
// Toolchain directories
// ============================================================================

TEST_CASE("directories inside an installed toolchain select that toolchain") {
    CfgFixture f;
    auto desc = ToolchainDesc::remote(DEFAULT_ORIGIN, "v4.9.0");
    f.fakeInstall(desc);

    auto m = require_match(f, f.toolchainPath(desc) + "/bin");
    CHECK(m.desc.desc == desc);
    CHECK(m.reason.kind == OverrideReasonKind::InsideToolchainDirectory);
    CHECK(m.reason.path == f.toolchainPath(desc));
}
