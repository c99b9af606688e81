/**
 * elan CLI - Common utilities and types
 */

#pragma once

#include <elan/config.hpp>
#include <elan/download.hpp>
#include <elan/errors.hpp>
#include <elan/notifications.hpp>
#include <elan/toolchain.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace elan::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string home;              // --home
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings go to the log as they happen.
 */
struct WarningCollector {
    std::vector<std::string> warnings;

    void add(const std::string& msg) { warnings.push_back(msg); }
    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

/**
 * Notification sink used by the CLI.
 * Logs every event; in JSON mode warnings are collected instead so they
 * end up in the JSON document rather than interleaved on stderr.
 */
class CliSink : public NotificationSink {
public:
    explicit CliSink(bool json_mode) : json_mode_(json_mode) {}

    void on_event(const Notification& n) override {
        if (json_mode_ && n.level() == NotificationLevel::Warn) {
            get_warning_collector().add(n.toString());
            return;
        }
        log_.on_event(n);
    }

private:
    bool json_mode_;
    LogSink log_;
};

/**
 * Logging goes to stderr so stdout stays parseable.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("elan");
    if (!logger) {
        logger = spdlog::stderr_color_mt("elan");
    }
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    get_warning_collector().clear();
}

/**
 * Per-invocation session: transport, sink and the Cfg built on them.
 */
struct Session {
    CurlHttpClient http;
    CliSink sink;
    Cfg cfg;

    explicit Session(const GlobalOptions& opts)
        : sink(opts.json),
          cfg(resolve_elan_home(opts.home.empty() ? std::nullopt
                                                  : std::make_optional(opts.home)),
              http, sink) {}
};

inline std::unique_ptr<Session> open_session(const GlobalOptions& opts) {
    init_logging(opts);
    return std::make_unique<Session>(opts);
}

inline std::string current_dir() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_to_string(error.code());
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "error: " << error.message() << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/// Short OK document for commands that only change state
inline void output_ok(bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = true;
        output_json(j);
    }
}

} // namespace elan::cli
