#include "elan/resolver.hpp"
#include "elan/config.hpp"
#include "elan/release_feed.hpp"
#include "elan/semver.hpp"
#include "elan/toolchain.hpp"

#include <cctype>

namespace elan {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Latest tag of a channel according to the release host
Result<std::string> query_channel(Cfg& cfg, const std::string& origin, const std::string& channel,
                                  bool allow_network) {
    if (uses_release_feed(origin)) {
        return fetch_latest_release_json(cfg.http(), RELEASE_FEED_URL, channel, allow_network);
    }
    return fetch_latest_release_tag(cfg.http(), origin, allow_network);
}

Result<ToolchainDesc> resolve_at_depth(Cfg& cfg, const UnresolvedToolchainDesc& unresolved,
                                       bool allow_network, bool allow_cache_fallback, int depth) {
    const ToolchainDesc& desc = unresolved.desc;
    if (desc.isLocal()) {
        return Result<ToolchainDesc>::ok(desc);
    }

    const std::string& origin = desc.origin();
    const std::string& release = desc.release();

    if (release == LEAN_TOOLCHAIN_SENTINEL) {
        if (depth >= MAX_RESOLVE_DEPTH) {
            return Result<ToolchainDesc>::err(Error(ErrorCode::RECURSION_LIMIT,
                "too many nested 'lean-toolchain' references while resolving '" +
                desc.toString() + "'"));
        }
        if (!allow_network) {
            return Result<ToolchainDesc>::err(Error(ErrorCode::NETWORK_UNAVAILABLE,
                "network access disabled; cannot resolve '" + desc.toString() + "'"));
        }

        std::string url = "https://raw.githubusercontent.com/" + origin + "/HEAD/lean-toolchain";
        auto body = cfg.http().fetchUrl(url);
        if (body.isErr()) {
            Error e(ErrorCode::REMOTE_FETCH_FAILED, body.error().message());
            return Result<ToolchainDesc>::err(e.withContext(
                "could not read toolchain file of '" + origin + "'"));
        }

        std::string content = body.value();
        std::string first_line = trim(content.substr(0, content.find('\n')));
        auto next = lookup_unresolved_toolchain_desc(cfg, first_line);
        if (next.isErr()) return Result<ToolchainDesc>::err(next.error());
        return resolve_at_depth(cfg, next.value(), allow_network, allow_cache_fallback, depth + 1);
    }

    if (!is_channel_name(release)) {
        return Result<ToolchainDesc>::ok(ToolchainDesc::remote(origin, release, desc.fromChannel()));
    }

    if (release == "beta" && !uses_release_feed(origin)) {
        return Result<ToolchainDesc>::err(Error(ErrorCode::UNSUPPORTED_CHANNEL,
            "channel 'beta' is not supported for custom origin '" + origin + "'"));
    }

    auto tag = query_channel(cfg, origin, release, allow_network);
    if (tag.isOk()) {
        return Result<ToolchainDesc>::ok(ToolchainDesc::remote(origin, tag.value(), release));
    }

    if (allow_cache_fallback) {
        if (auto local = find_latest_local_toolchain(cfg, origin, release)) {
            if (allow_network) {
                cfg.sink().notify(Event::UsingExistingRelease, local->toString());
            }
            return Result<ToolchainDesc>::ok(
                ToolchainDesc::remote(local->origin(), local->release(), release));
        }
    }

    return Result<ToolchainDesc>::err(tag.error());
}

} // namespace

Result<UnresolvedToolchainDesc> lookup_unresolved_toolchain_desc(Cfg& cfg, const std::string& name) {
    auto parsed = ToolchainDesc::fromResolvedStr(name);
    if (parsed.isErr()) return Result<UnresolvedToolchainDesc>::err(parsed.error());

    std::string origin = DEFAULT_ORIGIN;
    std::string release;
    if (parsed.value().isLocal()) {
        release = parsed.value().name();

        // A linked toolchain wins over any remote reading of the same name
        Toolchain local_tc(cfg, ToolchainDesc::local(release));
        if (local_tc.exists() && local_tc.isCustom()) {
            return Result<UnresolvedToolchainDesc>::ok(UnresolvedToolchainDesc{local_tc.desc()});
        }
    } else {
        origin = parsed.value().origin();
        release = parsed.value().release();
    }

    if (release.rfind("nightly", 0) == 0 && !ends_with(origin, NIGHTLY_ORIGIN_SUFFIX)) {
        origin += NIGHTLY_ORIGIN_SUFFIX;
    }

    std::optional<std::string> from_channel;
    if (release == LEAN_TOOLCHAIN_SENTINEL || is_channel_name(release)) {
        from_channel = release;
    }

    if (!release.empty() && std::isdigit(static_cast<unsigned char>(release[0]))) {
        release = "v" + release;
    }

    return Result<UnresolvedToolchainDesc>::ok(
        UnresolvedToolchainDesc{ToolchainDesc::remote(origin, release, from_channel)});
}

Result<ToolchainDesc> resolve_toolchain_desc_ext(Cfg& cfg, const UnresolvedToolchainDesc& unresolved,
                                                 bool allow_network, bool allow_cache_fallback) {
    return resolve_at_depth(cfg, unresolved, allow_network, allow_cache_fallback, 0);
}

Result<ToolchainDesc> resolve_toolchain_desc(Cfg& cfg, const UnresolvedToolchainDesc& unresolved) {
    return resolve_toolchain_desc_ext(cfg, unresolved, true, true);
}

Result<ToolchainDesc> lookup_toolchain_desc(Cfg& cfg, const std::string& name) {
    auto unresolved = lookup_unresolved_toolchain_desc(cfg, name);
    if (unresolved.isErr()) return Result<ToolchainDesc>::err(unresolved.error());
    return resolve_toolchain_desc(cfg, unresolved.value());
}

std::optional<ToolchainDesc> find_latest_local_toolchain(Cfg& cfg, const std::string& origin,
                                                         const std::string& channel) {
    auto installed = cfg.listToolchains();
    if (installed.isErr()) return std::nullopt;

    std::optional<ToolchainDesc> best;
    for (const auto& tc : installed.value()) {
        if (!tc.isRemote() || tc.origin() != origin) continue;

        const std::string& tag = tc.release();
        bool candidate = false;
        if (channel == "nightly") {
            candidate = tag.rfind("nightly-", 0) == 0;
        } else if (parse_release_version(tag)) {
            candidate = channel != "stable" || !is_prerelease_tag(tag);
        }

        if (candidate && (!best || toolchain_release_less(best->release(), tag))) {
            best = tc;
        }
    }
    return best;
}

} // namespace elan
