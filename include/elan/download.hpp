#pragma once

/**
 * @file download.hpp
 * @brief HTTP transport and download verification
 *
 * HttpClient is the seam between elan and the network. The library only
 * ever talks to the network through the client held by Cfg, so tests can
 * substitute an in-memory implementation.
 */

#include "elan/errors.hpp"
#include "elan/notifications.hpp"

#include <string>

namespace elan {

// ============================================================================
// HTTP Client
// ============================================================================

class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// GET a URL and return its body; non-2xx statuses are errors
    virtual Result<std::string> fetchUrl(const std::string& url) = 0;

    /**
     * @brief Stream a URL to a file
     *
     * Reports DownloadContentLengthReceived once the size is known,
     * DownloadDataReceived per chunk and DownloadFinished at the end.
     */
    virtual VoidResult download(const std::string& url, const std::string& dest_path,
                                NotificationSink& sink) = 0;
};

/**
 * @brief libcurl-backed client
 *
 * Follows redirects, verifies TLS peers and applies connect and transfer
 * timeouts.
 */
class CurlHttpClient : public HttpClient {
public:
    Result<std::string> fetchUrl(const std::string& url) override;
    VoidResult download(const std::string& url, const std::string& dest_path,
                        NotificationSink& sink) override;
};

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

/// Lowercase hex SHA-256 of a file
Result<std::string> compute_sha256_file(const std::string& file_path);

/// Compare a file against an expected hex digest (case-insensitive)
VoidResult verify_sha256_file(const std::string& file_path, const std::string& expected_hex);

} // namespace elan
