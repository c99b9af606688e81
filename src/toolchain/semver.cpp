#include "elan/semver.hpp"

namespace elan {

std::optional<Version> parse_release_version(const std::string& tag) {
    std::string s = tag;
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s = s.substr(1);
    }
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

bool is_prerelease_tag(const std::string& tag) {
    if (!parse_release_version(tag)) return false;
    // Build metadata follows '+' and never marks a pre-release
    std::string core = tag.substr(0, tag.find('+'));
    return core.find('-') != std::string::npos;
}

} // namespace elan
