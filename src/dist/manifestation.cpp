#include "elan/manifestation.hpp"
#include "elan/archive.hpp"
#include "elan/config.hpp"
#include "elan/file_lock.hpp"
#include "elan/platform.hpp"
#include "elan/release_feed.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace elan {

namespace {

// Removes a path when it goes out of scope unless released
class ScopedRemove {
public:
    explicit ScopedRemove(std::string path) : path_(std::move(path)) {}
    ~ScopedRemove() {
        if (path_.empty()) return;
        std::string error;
        if (!remove_path(path_, &error)) {
            spdlog::warn("{}", error);
        }
    }

    ScopedRemove(const ScopedRemove&) = delete;
    ScopedRemove& operator=(const ScopedRemove&) = delete;

    void release() { path_.clear(); }

private:
    std::string path_;
};

VoidResult install_locked(Cfg& cfg, const ToolchainDesc& desc, const InstallPrefix& prefix) {
    // Another process may have finished while we waited for the lock
    if (prefix.exists()) {
        spdlog::debug("'{}' appeared while waiting for the install lock", prefix.path());
        return VoidResult::ok();
    }

    std::string target = informal_target();
    auto asset = find_release_asset(cfg.http(), desc.origin(), desc.release(), target);
    if (asset.isErr()) {
        return VoidResult::err(asset.error().withContext(
            "failed to install toolchain '" + desc.toString() + "'"));
    }

    ArchiveFormat format = archive_format_for(asset.value().name);
    if (format == ArchiveFormat::Unknown) {
        return VoidResult::err(Error(ErrorCode::ARCHIVE_FORMAT_UNSUPPORTED,
            "unsupported archive format: '" + asset.value().name + "'"));
    }

    if (!create_directories(cfg.paths().tmp)) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not create temp directory '" + cfg.paths().tmp + "'"));
    }
    std::string download_path = make_temp_path(cfg.paths().tmp, archive_suffix(format));
    ScopedRemove download_guard(download_path);

    auto downloaded = cfg.http().download(asset.value().url, download_path, cfg.sink());
    if (downloaded.isErr()) return downloaded;

    if (asset.value().sha256) {
        auto verified = verify_sha256_file(download_path, *asset.value().sha256);
        if (verified.isErr()) return verified;
        cfg.sink().notify(Event::ChecksumVerified, asset.value().name);
    }

    std::string staging = prefix.stagingPath();
    if (path_exists(staging)) {
        cfg.sink().notify(Event::RemovingDirectory, staging);
        std::string error;
        if (!remove_path(staging, &error)) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR, error));
        }
    }

    ScopedRemove staging_guard(staging);
    cfg.sink().notify(Event::Extracting, asset.value().name, staging);
    auto extracted = extract_archive(download_path, staging);
    if (extracted.isErr()) return extracted;

    std::error_code ec;
    fs::rename(staging, prefix.path(), ec);
    if (ec) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not rename '" + staging + "' to '" + prefix.path() + "': " + ec.message()));
    }
    staging_guard.release();
    return VoidResult::ok();
}

} // namespace

VoidResult install_from_dist(Cfg& cfg, const ToolchainDesc& desc, const InstallPrefix& prefix) {
    if (!desc.isRemote()) {
        return VoidResult::err(Error(ErrorCode::NOT_INSTALLED,
            "toolchain '" + desc.toString() + "' is not installed"));
    }

    std::string parent = fs::path(prefix.path()).parent_path().string();
    if (!create_directories(parent)) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not create directory '" + parent + "'"));
    }

    auto lock = FileLock::acquire(prefix.lockPath(), cfg.sink());
    if (lock.isErr()) return VoidResult::err(lock.error());

    // The lock file is removed when `lock` goes out of scope, whatever the outcome
    return install_locked(cfg, desc, prefix);
}

VoidResult uninstall(const InstallPrefix& prefix, NotificationSink& sink) {
    if (!prefix.exists() && !is_symlink(prefix.path())) {
        return VoidResult::err(Error(ErrorCode::NOT_INSTALLED,
            "toolchain directory '" + prefix.path() + "' does not exist"));
    }

    sink.notify(Event::RemovingDirectory, prefix.path());
    std::string error;
    if (!remove_path(prefix.path(), &error)) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR, error));
    }
    return VoidResult::ok();
}

} // namespace elan
