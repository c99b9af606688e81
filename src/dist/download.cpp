#include "elan/download.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <vector>

#include <openssl/evp.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace elan {

// ============================================================================
// HTTP Fetching with libcurl
// ============================================================================

namespace {

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

struct FileSinkState {
    std::FILE* file = nullptr;
    NotificationSink* sink = nullptr;
    bool length_reported = false;
};

size_t write_to_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<FileSinkState*>(userdata);
    size_t total = size * nmemb;
    size_t written = std::fwrite(ptr, 1, total, state->file);
    if (written == total) {
        state->sink->notify(Event::DownloadDataReceived, {}, {}, total);
    }
    return written;
}

int progress_callback(void* userdata, curl_off_t dltotal, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<FileSinkState*>(userdata);
    if (!state->length_reported && dltotal > 0) {
        state->length_reported = true;
        state->sink->notify(Event::DownloadContentLengthReceived, {}, {},
                            static_cast<uint64_t>(dltotal));
    }
    return 0;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

void set_common_options(CURL* curl, const std::string& url, char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    // Abort transfers that stall below 10 bytes/s for 30s
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 10L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 30L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "elan");
}

// Map a failed transfer to NETWORK_UNAVAILABLE or REMOTE_FETCH_FAILED
Error transfer_error(CURLcode res, const char* error_buffer, const std::string& url) {
    std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
    ErrorCode code = ErrorCode::REMOTE_FETCH_FAILED;
    if (res == CURLE_COULDNT_RESOLVE_HOST || res == CURLE_COULDNT_CONNECT ||
        res == CURLE_COULDNT_RESOLVE_PROXY || res == CURLE_OPERATION_TIMEDOUT) {
        code = ErrorCode::NETWORK_UNAVAILABLE;
    }
    return Error(code, "failed to fetch '" + url + "': " + detail);
}

} // namespace

Result<std::string> CurlHttpClient::fetchUrl(const std::string& url) {
    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        return Result<std::string>::err(
            Error(ErrorCode::REMOTE_FETCH_FAILED, "failed to initialize CURL"));
    }

    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    set_common_options(curl.get(), url, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 120L);

    spdlog::debug("fetching {}", url);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Result<std::string>::err(transfer_error(res, error_buffer, url));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return Result<std::string>::err(Error(ErrorCode::REMOTE_FETCH_FAILED,
            "failed to fetch '" + url + "': HTTP " + std::to_string(status)));
    }

    return Result<std::string>::ok(std::move(body));
}

VoidResult CurlHttpClient::download(const std::string& url, const std::string& dest_path,
                                    NotificationSink& sink) {
    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        return VoidResult::err(Error(ErrorCode::REMOTE_FETCH_FAILED, "failed to initialize CURL"));
    }

    std::FILE* file = std::fopen(dest_path.c_str(), "wb");
    if (!file) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not create download file '" + dest_path + "'"));
    }

    FileSinkState state;
    state.file = file;
    state.sink = &sink;

    char error_buffer[CURL_ERROR_SIZE] = {0};
    set_common_options(curl.get(), url, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    sink.notify(Event::DownloadingFile, url);
    CURLcode res = curl_easy_perform(curl.get());
    bool close_failed = std::fclose(file) != 0;

    if (res != CURLE_OK) {
        return VoidResult::err(transfer_error(res, error_buffer, url));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return VoidResult::err(Error(ErrorCode::REMOTE_FETCH_FAILED,
            "failed to download '" + url + "': HTTP " + std::to_string(status)));
    }
    if (close_failed) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR, "could not write '" + dest_path + "'"));
    }

    sink.notify(Event::DownloadFinished, url);
    return VoidResult::ok();
}

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

} // namespace

Result<std::string> compute_sha256_file(const std::string& file_path) {
    auto fail = [](const std::string& msg) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, msg));
    };

    std::ifstream file(file_path, std::ios::binary);
    if (!file) return fail("failed to open file: " + file_path);

    EvpMdCtx ctx;
    if (!ctx) return fail("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return fail("EVP_DigestInit_ex failed");
    }

    std::vector<char> buffer(64 * 1024);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
           file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
            return fail("EVP_DigestUpdate failed");
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return fail("EVP_DigestFinal_ex failed");
    }

    return Result<std::string>::ok(bytes_to_hex(hash, hash_len));
}

VoidResult verify_sha256_file(const std::string& file_path, const std::string& expected_hex) {
    std::string expected = expected_hex;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto actual = compute_sha256_file(file_path);
    if (actual.isErr()) return VoidResult::err(actual.error());

    if (actual.value() != expected) {
        return VoidResult::err(Error(ErrorCode::CHECKSUM_FAILED,
            "checksum failed for '" + file_path + "': expected " + expected +
            ", calculated " + actual.value()));
    }
    return VoidResult::ok();
}

} // namespace elan
