#include "elan/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <process.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace elan {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

Arch get_current_arch() {
#if defined(__x86_64__) || defined(_M_X64)
    return Arch::X86_64;
#elif defined(__aarch64__) || defined(_M_ARM64)
    return Arch::AArch64;
#else
    return Arch::Unknown;
#endif
}

std::string informal_target(Platform platform, Arch arch) {
    std::string target;
    switch (platform) {
        case Platform::Windows: target = "windows"; break;
        case Platform::macOS: target = "darwin"; break;
        case Platform::Linux: target = "linux"; break;
        case Platform::Unknown: target = "unknown"; break;
    }
    if (arch == Arch::AArch64) {
        target += "_aarch64";
    }
    return target;
}

std::string informal_target() {
    return informal_target(get_current_platform(), get_current_arch());
}

std::string exe_suffix() {
    return get_current_platform() == Platform::Windows ? ".exe" : "";
}

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

std::string random_suffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 12; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }
    return suffix;
}

} // namespace

// ============================================================================
// Atomic File Operations
// ============================================================================

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    std::string temp_path = path + ".tmp." + random_suffix();

#ifdef _WIN32
    {
        std::ofstream temp_file(temp_path, std::ios::binary);
        if (!temp_file) {
            result.error = "failed to create temp file: " + temp_path;
            return result;
        }
        temp_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file onto " + path;
        return result;
    }
#else
    std::string dir_path = fs::path(path).parent_path().string();

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write " + path;
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }
    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }
#endif

    result.ok = true;
    return result;
}

// ============================================================================
// Path Utilities
// ============================================================================

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::string> canonicalize(const std::string& path) {
    std::error_code ec;
    auto p = fs::canonical(path, ec);
    if (ec) return std::nullopt;
    return p.string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

std::vector<std::string> list_directory_names(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    return names;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool remove_path(const std::string& path, std::string* error) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        if (error) *error = "could not remove '" + path + "': " + ec.message();
        return false;
    }
    return true;
}

bool copy_directory(const std::string& src, const std::string& dst, std::string* error) {
    std::error_code ec;
    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        if (error) *error = "could not copy '" + src + "' to '" + dst + "': " + ec.message();
        return false;
    }
    return true;
}

bool symlink_directory(const std::string& target, const std::string& link, std::string* error) {
    std::error_code ec;
    fs::create_directory_symlink(target, link, ec);
    if (ec) {
        if (error) *error = "could not symlink '" + link + "' to '" + target + "': " + ec.message();
        return false;
    }
    return true;
}

std::string make_temp_path(const std::string& dir, const std::string& extension) {
    return (fs::path(dir) / ("elan-" + random_suffix() + extension)).string();
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name.c_str()) == 0 && buf != nullptr) {
        std::string value(buf);
        free(buf);
        return value;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (!val) return std::nullopt;
    return std::string(val);
#endif
}

std::optional<std::string> get_home_dir() {
    auto home = get_env("HOME");
    if (home && !home->empty()) return home;
    auto profile = get_env("USERPROFILE");
    if (profile && !profile->empty()) return profile;
    return std::nullopt;
}

int get_process_id() {
#ifdef _WIN32
    return _getpid();
#else
    return static_cast<int>(getpid());
#endif
}

} // namespace elan
