#pragma once

/**
 * @file file_lock.hpp
 * @brief Inter-process exclusive lock on a lock file
 *
 * The holder writes its PID into the file so a waiting process can say
 * who it is waiting for. The lock file is deleted when the guard is
 * released.
 */

#include "elan/errors.hpp"
#include "elan/notifications.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace elan {

class FileLock {
public:
    /**
     * @brief Block until the lock at `path` is held
     *
     * Tries once; if another process holds the lock, emits
     * WaitingForFileLock (with the holder's PID) a single time and retries
     * every `poll_interval`. Only I/O failures produce an error.
     */
    static Result<std::unique_ptr<FileLock>> acquire(
        const std::string& path, NotificationSink& sink,
        std::chrono::milliseconds poll_interval = std::chrono::seconds(1));

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& path() const { return path_; }

private:
    FileLock(std::string path, intptr_t handle) : path_(std::move(path)), handle_(handle) {}

    std::string path_;
    intptr_t handle_;
};

} // namespace elan
