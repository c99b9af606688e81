#include <doctest/doctest.h>
#include <elan/archive.hpp>
#include "test_helpers.hpp"

using namespace elan;
using namespace elan::test;

TEST_CASE("archive_format_for recognizes release suffixes") {
    CHECK(archive_format_for("lean-4.9.0-linux.tar.gz") == ArchiveFormat::TarGz);
    CHECK(archive_format_for("lean.tgz") == ArchiveFormat::TarGz);
    CHECK(archive_format_for("lean-4.9.0-linux.tar.zst") == ArchiveFormat::TarZst);
    CHECK(archive_format_for("lean-4.9.0-windows.zip") == ArchiveFormat::Zip);
    CHECK(archive_format_for("lean-4.9.0-linux.tar.xz") == ArchiveFormat::Unknown);
    CHECK(std::string(archive_suffix(ArchiveFormat::TarZst)) == ".tar.zst");
}

TEST_CASE("strip_first_component drops the top-level directory") {
    CHECK(strip_first_component("lean-4.9.0-linux/bin/lean") == "bin/lean");
    CHECK(strip_first_component("./lean-4.9.0-linux/bin/") == "bin");
    CHECK(strip_first_component("lean-4.9.0-linux/") == "");
    CHECK(strip_first_component("README") == "");
}

TEST_CASE("extract_archive unpacks a gzipped tarball") {
    TempDir tmp;
    std::string archive = tmp.sub("lean.tar.gz");
    write_text(archive, make_toolchain_archive("lean-4.9.0-linux"));

    std::string dest = tmp.sub("out");
    auto r = extract_archive(archive, dest);
    REQUIRE(r.isOk());

    CHECK(read_text(dest + "/bin/lean") == "#!/bin/sh\necho lean\n");
    CHECK(read_text(dest + "/lib/libleanshared.so") == "ELF");
    CHECK_FALSE(fs::exists(dest + "/lean-4.9.0-linux"));

    auto perms = fs::status(dest + "/bin/lake").permissions();
    CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
    auto lib_perms = fs::status(dest + "/lib/libleanshared.so").permissions();
    CHECK((lib_perms & fs::perms::owner_exec) == fs::perms::none);

    REQUIRE(fs::is_symlink(dest + "/bin/leanc"));
    CHECK(fs::read_symlink(dest + "/bin/leanc") == fs::path("lean"));
}

TEST_CASE("extract_archive rejects unknown formats") {
    TempDir tmp;
    write_text(tmp.sub("lean.tar.xz"), "xz");
    auto r = extract_archive(tmp.sub("lean.tar.xz"), tmp.sub("out"));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::ARCHIVE_FORMAT_UNSUPPORTED);
}

TEST_CASE("extract_archive refuses entries escaping the destination") {
    TempDir tmp;
    std::string archive = tmp.sub("evil.tar.gz");
    write_text(archive, gzip(build_tar({
        {"top/", "", '5', "", 0755},
        {"top/../../evil", "boom", '0', "", 0644},
    })));

    auto r = extract_archive(archive, tmp.sub("out"));
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("unsafe entry path") != std::string::npos);
    CHECK_FALSE(fs::exists(tmp.sub("evil")));
}

TEST_CASE("extract_archive refuses absolute symlinks") {
    TempDir tmp;
    std::string archive = tmp.sub("link.tar.gz");
    write_text(archive, gzip(build_tar({
        {"top/bin/lean", "", '2', "/usr/bin/env", 0777},
    })));

    CHECK(extract_archive(archive, tmp.sub("out")).isErr());
}

TEST_CASE("extract_archive refuses relative symlinks leaving the destination") {
    TempDir tmp;
    std::string archive = tmp.sub("escape.tar.gz");
    write_text(archive, gzip(build_tar({
        {"top/", "", '5', "", 0755},
        {"top/escape", "", '2', "../../..", 0777},
        {"top/escape/pwned.txt", "boom", '0', "", 0644},
    })));

    auto r = extract_archive(archive, tmp.sub("home/toolchains/leanprover--lean4---v4.9.0.tmp"));
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("unsafe symlink") != std::string::npos);
    CHECK_FALSE(fs::exists(tmp.sub("pwned.txt")));
    CHECK_FALSE(fs::exists(tmp.sub("home/pwned.txt")));
}

TEST_CASE("extract_archive keeps relative symlinks between toolchain directories") {
    TempDir tmp;
    std::string archive = tmp.sub("lean.tar.gz");
    write_text(archive, gzip(build_tar({
        {"top/bin/lean", "lean", '0', "", 0755},
        {"top/lib/lean", "", '2', "../bin/lean", 0777},
    })));

    std::string dest = tmp.sub("out");
    REQUIRE(extract_archive(archive, dest).isOk());
    REQUIRE(fs::is_symlink(dest + "/lib/lean"));
    CHECK(read_text(dest + "/lib/lean") == "lean");
}

TEST_CASE("extract_archive reports corrupt gzip data") {
    TempDir tmp;
    // Valid gzip header followed by a broken deflate stream
    write_text(tmp.sub("broken.tar.gz"), std::string("\x1f\x8b\x08\x00\x00\x00\x00\x00\x00\x03", 10) +
                                             "definitely not deflate data");
    auto r = extract_archive(tmp.sub("broken.tar.gz"), tmp.sub("out"));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::IO_ERROR);
}
