#include "elan/file_lock.hpp"
#include "elan/platform.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace elan {

namespace {

std::string read_holder(const std::string& path) {
    auto content = read_file(path);
    if (!content) return "unknown";
    std::string pid = *content;
    while (!pid.empty() && (pid.back() == '\n' || pid.back() == ' ')) pid.pop_back();
    return pid.empty() ? "unknown" : pid;
}

#ifndef _WIN32

enum class TryLock { Acquired, Busy, Failed };

// One attempt: open (creating), flock, then make sure the file we locked
// is still the one at `path` (a previous holder may have unlinked it).
TryLock try_lock(const std::string& path, int& out_fd, std::string& error) {
    int fd = open(path.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd < 0) {
        error = "could not open lock file '" + path + "': " + std::strerror(errno);
        return TryLock::Failed;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) return TryLock::Busy;
        error = "could not lock '" + path + "': " + std::strerror(err);
        return TryLock::Failed;
    }

    struct stat locked_st;
    struct stat path_st;
    if (fstat(fd, &locked_st) != 0 || stat(path.c_str(), &path_st) != 0 ||
        locked_st.st_ino != path_st.st_ino || locked_st.st_dev != path_st.st_dev) {
        close(fd);
        return TryLock::Busy;
    }

    std::string pid = std::to_string(get_process_id()) + "\n";
    if (ftruncate(fd, 0) != 0 || pwrite(fd, pid.data(), pid.size(), 0) < 0) {
        error = "could not write lock file '" + path + "': " + std::strerror(errno);
        close(fd);
        return TryLock::Failed;
    }

    out_fd = fd;
    return TryLock::Acquired;
}

#endif

} // namespace

Result<std::unique_ptr<FileLock>> FileLock::acquire(const std::string& path, NotificationSink& sink,
                                                    std::chrono::milliseconds poll_interval) {
    using R = Result<std::unique_ptr<FileLock>>;
    bool notified = false;

#ifdef _WIN32
    while (true) {
        HANDLE h = CreateFileA(path.c_str(), GENERIC_READ | GENERIC_WRITE, FILE_SHARE_READ,
                               nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h != INVALID_HANDLE_VALUE) {
            std::string pid = std::to_string(get_process_id()) + "\n";
            DWORD written = 0;
            WriteFile(h, pid.data(), static_cast<DWORD>(pid.size()), &written, nullptr);
            return R::ok(std::unique_ptr<FileLock>(
                new FileLock(path, reinterpret_cast<intptr_t>(h))));
        }
        if (GetLastError() != ERROR_SHARING_VIOLATION) {
            return R::err(Error(ErrorCode::IO_ERROR, "could not open lock file '" + path + "'"));
        }
        if (!notified) {
            sink.notify(Event::WaitingForFileLock, path, read_holder(path));
            notified = true;
        }
        std::this_thread::sleep_for(poll_interval);
    }
#else
    while (true) {
        int fd = -1;
        std::string error;
        switch (try_lock(path, fd, error)) {
            case TryLock::Acquired:
                return R::ok(std::unique_ptr<FileLock>(new FileLock(path, fd)));
            case TryLock::Failed:
                return R::err(Error(ErrorCode::IO_ERROR, error));
            case TryLock::Busy:
                break;
        }
        if (!notified) {
            sink.notify(Event::WaitingForFileLock, path, read_holder(path));
            notified = true;
        }
        std::this_thread::sleep_for(poll_interval);
    }
#endif
}

FileLock::~FileLock() {
#ifdef _WIN32
    HANDLE h = reinterpret_cast<HANDLE>(handle_);
    CloseHandle(h);
    DeleteFileA(path_.c_str());
#else
    // Unlink while still holding the lock so waiters notice the inode change
    unlink(path_.c_str());
    close(static_cast<int>(handle_));
#endif
}

} // namespace elan
