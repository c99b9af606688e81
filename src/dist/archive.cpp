#include "elan/archive.hpp"
#include "elan/platform.hpp"

#include <filesystem>
#include <optional>

#include <archive.h>
#include <archive_entry.h>

namespace fs = std::filesystem;

namespace elan {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Error extract_error(const std::string& archive_path, const std::string& detail) {
    return Error(ErrorCode::IO_ERROR, "failed to extract '" + archive_path + "': " + detail);
}

// Reject absolute paths and `..` components; returns the normalized relative path
std::optional<fs::path> safe_relative_path(const std::string& entry_path) {
    if (entry_path.empty() || entry_path[0] == '/' || entry_path[0] == '\\') {
        return std::nullopt;
    }
    fs::path normalized;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") return std::nullopt;
        if (comp != "." && !comp.empty()) normalized /= comp;
    }
    if (normalized.empty()) return std::nullopt;
    return normalized;
}

// A link at `entry` (relative to the destination) pointing at `target` must resolve inside it
bool symlink_stays_inside(const fs::path& entry, const std::string& target) {
    if (target.empty() || target[0] == '/' || target[0] == '\\') return false;
    fs::path target_path(target);
    if (target_path.has_root_name() || target_path.has_root_directory()) return false;
    fs::path resolved = (entry.parent_path() / target_path).lexically_normal();
    if (resolved.empty()) return true;
    return *resolved.begin() != "..";
}

// ============================================================================
// libarchive
// ============================================================================

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// RAII wrapper for a libarchive reader
class ArchiveReader {
public:
    ArchiveReader() : archive_(archive_read_new()) {
        if (archive_) {
            archive_read_support_filter_all(archive_);
            archive_read_support_format_all(archive_);
        }
    }
    ~ArchiveReader() {
        if (archive_) {
            archive_read_close(archive_);
            archive_read_free(archive_);
        }
    }

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    struct archive* get() { return archive_; }
    explicit operator bool() const { return archive_ != nullptr; }

private:
    struct archive* archive_;
};

VoidResult extract_with_libarchive(const std::string& archive_path, const fs::path& dest) {
    ArchiveReader reader;
    if (!reader) {
        return VoidResult::err(extract_error(archive_path, "archive_read_new failed"));
    }

    if (archive_read_open_filename(reader.get(), archive_path.c_str(), 16384) != ARCHIVE_OK) {
        return VoidResult::err(extract_error(archive_path, archive_message(reader.get())));
    }

    const int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                      ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS;

    while (true) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            return VoidResult::err(extract_error(archive_path, archive_message(reader.get())));
        }

        const char* name = archive_entry_pathname(entry);
        if (!name) {
            return VoidResult::err(extract_error(archive_path, "entry without a name"));
        }

        std::string stripped = strip_first_component(name);
        if (stripped.empty()) {
            archive_read_data_skip(reader.get());
            continue;
        }
        auto rel = safe_relative_path(stripped);
        if (!rel) {
            return VoidResult::err(extract_error(archive_path, std::string("unsafe entry path: ") + name));
        }
        archive_entry_copy_pathname(entry, (dest / *rel).string().c_str());

        if (const char* link = archive_entry_symlink(entry)) {
            if (!symlink_stays_inside(*rel, link)) {
                return VoidResult::err(extract_error(archive_path,
                    std::string("unsafe symlink: ") + name + " -> " + link));
            }
        }

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            auto target = safe_relative_path(strip_first_component(hardlink));
            if (!target) {
                return VoidResult::err(extract_error(archive_path,
                    std::string("unsafe hardlink: ") + hardlink));
            }
            archive_entry_copy_hardlink(entry, (dest / *target).string().c_str());
        }

        r = archive_read_extract(reader.get(), entry, flags);
        if (r < ARCHIVE_WARN) {
            return VoidResult::err(extract_error(archive_path, archive_message(reader.get())));
        }
    }

    return VoidResult::ok();
}

} // namespace

ArchiveFormat archive_format_for(const std::string& file_name) {
    if (ends_with(file_name, ".tar.gz") || ends_with(file_name, ".tgz")) return ArchiveFormat::TarGz;
    if (ends_with(file_name, ".tar.zst")) return ArchiveFormat::TarZst;
    if (ends_with(file_name, ".zip")) return ArchiveFormat::Zip;
    return ArchiveFormat::Unknown;
}

const char* archive_suffix(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::TarGz: return ".tar.gz";
        case ArchiveFormat::TarZst: return ".tar.zst";
        case ArchiveFormat::Zip: return ".zip";
        case ArchiveFormat::Unknown: return "";
    }
    return "";
}

std::string strip_first_component(const std::string& entry_path) {
    std::string path = entry_path;
    while (path.rfind("./", 0) == 0) path = path.substr(2);
    auto slash = path.find('/');
    if (slash == std::string::npos) return "";
    std::string rest = path.substr(slash + 1);
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    return rest;
}

VoidResult extract_archive(const std::string& archive_path, const std::string& dest_dir) {
    ArchiveFormat format = archive_format_for(archive_path);
    if (format == ArchiveFormat::Unknown) {
        return VoidResult::err(Error(ErrorCode::ARCHIVE_FORMAT_UNSUPPORTED,
            "unsupported archive format: '" + archive_path + "'"));
    }

    if (!create_directories(dest_dir)) {
        return VoidResult::err(extract_error(archive_path,
            "could not create directory '" + dest_dir + "'"));
    }

    // Secure-symlink checks walk the whole destination path, so it must not contain links itself
    std::error_code ec;
    fs::path dest = fs::weakly_canonical(dest_dir, ec);
    if (ec) {
        return VoidResult::err(extract_error(archive_path,
            "could not resolve '" + dest_dir + "': " + ec.message()));
    }
    return extract_with_libarchive(archive_path, dest);
}

} // namespace elan
