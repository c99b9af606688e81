#pragma once

/**
 * @file notifications.hpp
 * @brief Typed progress and diagnostic events
 *
 * Library code reports what it is doing through a NotificationSink
 * instead of printing. The CLI installs a LogSink that forwards each
 * event to spdlog; tests install a collecting sink.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace elan {

enum class Event {
    // Settings / selection
    SetDefaultToolchain,
    SetOverrideToolchain,
    UsingExistingRelease,

    // Toolchain lifecycle
    InstallingToolchain,
    InstalledToolchain,
    UsingExistingToolchain,
    UninstallingToolchain,
    UninstalledToolchain,
    ToolchainNotInstalled,

    // Filesystem
    CreatingDirectory,
    LinkingDirectory,
    CopyingDirectory,
    RemovingDirectory,
    NoCanonicalPath,

    // Download / install
    DownloadingFile,
    DownloadContentLengthReceived,
    DownloadDataReceived,
    DownloadFinished,
    ChecksumVerified,
    Extracting,
    WaitingForFileLock,
};

enum class NotificationLevel {
    Debug,
    Verbose,
    Info,
    Warn,
    Error,
};

/**
 * @brief One event with its context
 *
 * `subject` is the toolchain, path or URL the event is about; `detail`
 * carries a second string where needed (override target, lock holder);
 * `amount` carries byte counts for download progress.
 */
struct Notification {
    Event kind;
    std::string subject;
    std::string detail;
    uint64_t amount = 0;

    NotificationLevel level() const;
    std::string toString() const;
};

/**
 * @brief Observer receiving every event emitted during an operation
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void on_event(const Notification& n) = 0;

    void notify(Event kind, std::string subject = {}, std::string detail = {},
                uint64_t amount = 0) {
        on_event(Notification{kind, std::move(subject), std::move(detail), amount});
    }
};

/// Discards every event
class NullSink : public NotificationSink {
public:
    void on_event(const Notification&) override {}
};

/// Forwards events to spdlog at their level (download progress is logged at debug)
class LogSink : public NotificationSink {
public:
    void on_event(const Notification& n) override;
};

/// Keeps every event; used to inspect what an operation reported
class CollectingSink : public NotificationSink {
public:
    void on_event(const Notification& n) override { events.push_back(n); }

    bool contains(Event kind) const;
    size_t count(Event kind) const;

    std::vector<Notification> events;
};

} // namespace elan
