#include "elan/errors.hpp"

namespace elan {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_NAME: return "invalid_name";
        case ErrorCode::INVALID_CONFIG_FILE: return "invalid_config_file";
        case ErrorCode::NO_DEFAULT_TOOLCHAIN: return "no_default_toolchain";
        case ErrorCode::NETWORK_UNAVAILABLE: return "network_unavailable";
        case ErrorCode::REMOTE_FETCH_FAILED: return "remote_fetch_failed";
        case ErrorCode::UNSUPPORTED_CHANNEL: return "unsupported_channel";
        case ErrorCode::ASSET_NOT_FOUND_FOR_PLATFORM: return "asset_not_found_for_platform";
        case ErrorCode::CHECKSUM_FAILED: return "checksum_failed";
        case ErrorCode::ARCHIVE_FORMAT_UNSUPPORTED: return "archive_format_unsupported";
        case ErrorCode::ALREADY_INSTALLED: return "already_installed";
        case ErrorCode::NOT_INSTALLED: return "not_installed";
        case ErrorCode::BINARY_NOT_FOUND: return "binary_not_found";
        case ErrorCode::RECURSION_LIMIT: return "recursion_limit";
        case ErrorCode::IO_ERROR: return "io_error";
    }
    return "unknown";
}

} // namespace elan
