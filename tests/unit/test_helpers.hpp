#pragma once

#include <elan/config.hpp>
#include <elan/download.hpp>
#include <elan/errors.hpp>
#include <elan/notifications.hpp>
#include <elan/platform.hpp>
#include <elan/toolchain_desc.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <zlib.h>

namespace elan::test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("elan_test_" + std::to_string(rd()) + "_" +
                                             std::to_string(rd()));
        fs::create_directories(path_);
        // Tests compare against canonical paths produced by the override walk
        path_ = fs::canonical(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string sub(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ============================================================================
// In-memory transport
// ============================================================================

/**
 * Serves canned bodies by URL; anything else fails as if offline.
 * Safe to use from several threads once populated.
 */
class FakeHttpClient : public HttpClient {
public:
    void serve(const std::string& url, const std::string& body) { bodies_[url] = body; }

    Result<std::string> fetchUrl(const std::string& url) override {
        fetches.fetch_add(1);
        auto it = bodies_.find(url);
        if (it == bodies_.end()) {
            return Result<std::string>::err(Error(ErrorCode::NETWORK_UNAVAILABLE,
                "could not resolve host for " + url));
        }
        return Result<std::string>::ok(it->second);
    }

    VoidResult download(const std::string& url, const std::string& dest_path,
                        NotificationSink& sink) override {
        downloads.fetch_add(1);
        auto it = bodies_.find(url);
        if (it == bodies_.end()) {
            return VoidResult::err(Error(ErrorCode::NETWORK_UNAVAILABLE,
                "could not resolve host for " + url));
        }
        sink.notify(Event::DownloadingFile, url);
        if (download_delay.count() > 0) {
            std::this_thread::sleep_for(download_delay);
        }
        std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
        out.write(it->second.data(), static_cast<std::streamsize>(it->second.size()));
        if (!out) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR, "could not write " + dest_path));
        }
        sink.notify(Event::DownloadFinished, url);
        return VoidResult::ok();
    }

    std::atomic<int> fetches{0};
    std::atomic<int> downloads{0};
    std::chrono::milliseconds download_delay{0};

private:
    std::map<std::string, std::string> bodies_;
};

/// Thread-safe collecting sink
class LockedCollectingSink : public NotificationSink {
public:
    void on_event(const Notification& n) override {
        std::lock_guard<std::mutex> lock(mutex_);
        inner_.on_event(n);
    }

    size_t count(Event kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        return inner_.count(kind);
    }

    std::vector<Notification> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return inner_.events;
    }

private:
    std::mutex mutex_;
    CollectingSink inner_;
};

// ============================================================================
// Session fixture
// ============================================================================

/// Fresh elan home with a canned transport; ELAN_TOOLCHAIN is never consulted
struct CfgFixture {
    TempDir tmp;
    FakeHttpClient http;
    CollectingSink sink;
    Cfg cfg{tmp.sub("elan"), http, sink, std::nullopt};

    std::string toolchainPath(const ToolchainDesc& desc) const {
        return (fs::path(cfg.paths().toolchains) / desc.toDirName()).string();
    }

    /// Lay out an installed toolchain with a `bin/lean` entry
    void fakeInstall(const ToolchainDesc& desc) {
        write_text(toolchainPath(desc) + "/bin/lean" + exe_suffix(), "#!/bin/sh\n");
    }

    /// Local build directory suitable for `toolchain link`
    std::string fakeBuild(const std::string& name) {
        std::string dir = tmp.sub("builds/" + name);
        write_text(dir + "/bin/lean" + exe_suffix(), "#!/bin/sh\n");
        return dir;
    }

    /// Link a local build as a custom toolchain
    void fakeLink(const std::string& name) {
        std::string build = fakeBuild(name);
        fs::create_directories(cfg.paths().toolchains);
        fs::create_directory_symlink(build, toolchainPath(ToolchainDesc::local(name)));
    }
};

// ============================================================================
// Tarball builder
// ============================================================================

struct TarEntry {
    std::string path;
    std::string content;
    char type = '0';          // '0' file, '5' directory, '2' symlink
    std::string link;
    unsigned mode = 0644;
};

inline void put_octal(char* field, size_t size, uint64_t value) {
    std::snprintf(field, size, "%0*llo", static_cast<int>(size - 1),
                  static_cast<unsigned long long>(value));
}

/// ustar stream (names up to 100 bytes) with the two terminating zero blocks
inline std::string build_tar(const std::vector<TarEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        char header[512] = {};
        std::snprintf(header, 100, "%s", e.path.c_str());
        put_octal(header + 100, 8, e.mode);
        put_octal(header + 108, 8, 0);
        put_octal(header + 116, 8, 0);
        put_octal(header + 124, 12, e.type == '0' ? e.content.size() : 0);
        put_octal(header + 136, 12, 0);
        header[156] = e.type;
        std::snprintf(header + 157, 100, "%s", e.link.c_str());
        std::memcpy(header + 257, "ustar", 6);
        std::memcpy(header + 263, "00", 2);

        std::memset(header + 148, ' ', 8);
        unsigned sum = 0;
        for (unsigned char c : header) sum += c;
        std::snprintf(header + 148, 8, "%06o", sum);

        out.append(header, sizeof(header));
        if (e.type == '0') {
            out += e.content;
            size_t pad = (512 - e.content.size() % 512) % 512;
            out.append(pad, '\0');
        }
    }
    out.append(1024, '\0');
    return out;
}

inline std::string gzip(const std::string& data) {
    z_stream strm{};
    // 15 + 16: gzip wrapper
    deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[16384];
    int ret = Z_OK;
    do {
        strm.next_out = reinterpret_cast<Bytef*>(chunk);
        strm.avail_out = sizeof(chunk);
        ret = deflate(&strm, Z_FINISH);
        out.append(chunk, sizeof(chunk) - strm.avail_out);
    } while (ret == Z_OK);
    deflateEnd(&strm);
    return out;
}

/// Gzipped release archive laid out like an official toolchain package
inline std::string make_toolchain_archive(const std::string& top_dir) {
    return gzip(build_tar({
        {top_dir + "/", "", '5', "", 0755},
        {top_dir + "/bin/", "", '5', "", 0755},
        {top_dir + "/bin/lean", "#!/bin/sh\necho lean\n", '0', "", 0755},
        {top_dir + "/bin/lake", "#!/bin/sh\necho lake\n", '0', "", 0755},
        {top_dir + "/lib/", "", '5', "", 0755},
        {top_dir + "/lib/libleanshared.so", "ELF", '0', "", 0644},
        {top_dir + "/bin/leanc", "", '2', "lean", 0777},
    }));
}

} // namespace elan::test
