#include "elan/notifications.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace elan {

NotificationLevel Notification::level() const {
    switch (kind) {
        case Event::SetDefaultToolchain:
        case Event::SetOverrideToolchain:
        case Event::InstallingToolchain:
        case Event::InstalledToolchain:
        case Event::UninstallingToolchain:
        case Event::UninstalledToolchain:
        case Event::ToolchainNotInstalled:
        case Event::DownloadingFile:
        case Event::WaitingForFileLock:
            return NotificationLevel::Info;

        case Event::UsingExistingRelease:
        case Event::NoCanonicalPath:
            return NotificationLevel::Warn;

        case Event::UsingExistingToolchain:
        case Event::CreatingDirectory:
        case Event::LinkingDirectory:
        case Event::CopyingDirectory:
        case Event::RemovingDirectory:
        case Event::ChecksumVerified:
        case Event::Extracting:
            return NotificationLevel::Verbose;

        case Event::DownloadContentLengthReceived:
        case Event::DownloadDataReceived:
        case Event::DownloadFinished:
            return NotificationLevel::Debug;
    }
    return NotificationLevel::Debug;
}

std::string Notification::toString() const {
    switch (kind) {
        case Event::SetDefaultToolchain:
            if (subject.empty()) return "default toolchain unset";
            return "default toolchain set to '" + subject + "'";
        case Event::SetOverrideToolchain:
            return "override toolchain for '" + subject + "' set to '" + detail + "'";
        case Event::UsingExistingRelease:
            return "failed to query latest release, using existing version '" + subject + "'";
        case Event::InstallingToolchain:
            return "installing toolchain '" + subject + "'";
        case Event::InstalledToolchain:
            return "toolchain '" + subject + "' installed";
        case Event::UsingExistingToolchain:
            return "using existing install for '" + subject + "'";
        case Event::UninstallingToolchain:
            return "uninstalling toolchain '" + subject + "'";
        case Event::UninstalledToolchain:
            return "toolchain '" + subject + "' uninstalled";
        case Event::ToolchainNotInstalled:
            return "no toolchain installed for '" + subject + "'";
        case Event::CreatingDirectory:
            return "creating " + detail + " directory: '" + subject + "'";
        case Event::LinkingDirectory:
            return "linking directory from: '" + subject + "'";
        case Event::CopyingDirectory:
            return "copying directory from: '" + subject + "'";
        case Event::RemovingDirectory:
            return "removing directory: '" + subject + "'";
        case Event::NoCanonicalPath:
            return "could not canonicalize path: '" + subject + "'";
        case Event::DownloadingFile:
            return "downloading " + subject;
        case Event::DownloadContentLengthReceived:
            return "download size is " + std::to_string(amount) + " bytes";
        case Event::DownloadDataReceived:
            return "received " + std::to_string(amount) + " bytes";
        case Event::DownloadFinished:
            return "download finished";
        case Event::ChecksumVerified:
            return "checksum verified for '" + subject + "'";
        case Event::Extracting:
            return "extracting " + subject + " to " + detail;
        case Event::WaitingForFileLock:
            return "waiting for previous installation request to finish (" + subject +
                   ", held by PID " + detail + ")";
    }
    return subject;
}

void LogSink::on_event(const Notification& n) {
    switch (n.level()) {
        case NotificationLevel::Debug:
            spdlog::trace("{}", n.toString());
            break;
        case NotificationLevel::Verbose:
            spdlog::debug("{}", n.toString());
            break;
        case NotificationLevel::Info:
            spdlog::info("{}", n.toString());
            break;
        case NotificationLevel::Warn:
            spdlog::warn("{}", n.toString());
            break;
        case NotificationLevel::Error:
            spdlog::error("{}", n.toString());
            break;
    }
}

bool CollectingSink::contains(Event kind) const {
    return count(kind) > 0;
}

size_t CollectingSink::count(Event kind) const {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [kind](const Notification& n) { return n.kind == kind; }));
}

} // namespace elan
