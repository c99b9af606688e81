#include "elan/toolchain_desc.hpp"
#include "elan/semver.hpp"

#include <cctype>
#include <tuple>

namespace elan {

namespace {

bool is_origin_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

bool is_release_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
}

bool all_of_class(const std::string& s, bool (*pred)(char)) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!pred(c)) return false;
    }
    return true;
}

// `--` and `---` are the directory-name separators, so a component may not
// contain `--`; origin parts additionally may not begin or end with `-`
bool survives_dir_encoding(const std::string& s, bool dash_at_edges) {
    if (s.find("--") != std::string::npos) return false;
    if (!dash_at_edges && !s.empty() && (s.front() == '-' || s.back() == '-')) return false;
    return true;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// Rank of a release in toolchain ordering; lower sorts first
int release_rank(const std::string& release) {
    if (release == "stable") return 0;
    if (release == "beta") return 1;
    if (release == "nightly") return 2;
    if (parse_release_version(release)) return 3;
    return 4;
}

} // namespace

// ============================================================================
// Construction / Parsing
// ============================================================================

ToolchainDesc ToolchainDesc::local(std::string name) {
    ToolchainDesc d;
    d.kind_ = ToolchainKind::Local;
    d.name_ = std::move(name);
    return d;
}

ToolchainDesc ToolchainDesc::remote(std::string origin, std::string release,
                                    std::optional<std::string> from_channel) {
    ToolchainDesc d;
    d.kind_ = ToolchainKind::Remote;
    d.origin_ = std::move(origin);
    d.release_ = std::move(release);
    d.from_channel_ = std::move(from_channel);
    return d;
}

Result<ToolchainDesc> ToolchainDesc::fromResolvedStr(const std::string& name) {
    auto invalid = [&]() {
        return Result<ToolchainDesc>::err(
            Error(ErrorCode::INVALID_NAME, "invalid toolchain name: '" + name + "'"));
    };

    auto colon = name.find(':');
    if (colon == std::string::npos) {
        if (!all_of_class(name, is_release_char) || !survives_dir_encoding(name, true)) {
            return invalid();
        }
        return Result<ToolchainDesc>::ok(local(name));
    }

    std::string origin = name.substr(0, colon);
    std::string release = name.substr(colon + 1);

    auto slash = origin.find('/');
    if (slash == std::string::npos) return invalid();
    std::string owner = origin.substr(0, slash);
    std::string repo = origin.substr(slash + 1);
    if (!all_of_class(owner, is_origin_char) || !survives_dir_encoding(owner, false) ||
        !all_of_class(repo, is_origin_char) || !survives_dir_encoding(repo, false) ||
        !all_of_class(release, is_release_char) || !survives_dir_encoding(release, true)) {
        return invalid();
    }

    return Result<ToolchainDesc>::ok(remote(origin, release));
}

Result<ToolchainDesc> ToolchainDesc::fromToolchainDir(const std::string& dir_name) {
    return fromResolvedStr(decode_toolchain_dir_name(dir_name));
}

// ============================================================================
// Display
// ============================================================================

std::string ToolchainDesc::toString() const {
    if (kind_ == ToolchainKind::Local) return name_;
    return origin_ + ":" + release_;
}

std::string ToolchainDesc::toDirName() const {
    return encode_toolchain_dir_name(toString());
}

bool ToolchainDesc::operator==(const ToolchainDesc& other) const {
    if (kind_ != other.kind_) return false;
    if (kind_ == ToolchainKind::Local) return name_ == other.name_;
    return origin_ == other.origin_ && release_ == other.release_;
}

std::string encode_toolchain_dir_name(const std::string& display) {
    return replace_all(replace_all(display, "/", "--"), ":", "---");
}

std::string decode_toolchain_dir_name(const std::string& dir_name) {
    return replace_all(replace_all(dir_name, "---", ":"), "--", "/");
}

bool is_channel_name(const std::string& release) {
    return release == "stable" || release == "beta" || release == "nightly";
}

// ============================================================================
// Ordering
// ============================================================================

bool toolchain_release_less(const std::string& a, const std::string& b) {
    int ra = release_rank(a);
    int rb = release_rank(b);
    if (ra != rb) return ra < rb;

    if (ra == 3) {
        auto va = parse_release_version(a);
        auto vb = parse_release_version(b);
        if (*va != *vb) return *va < *vb;
    }
    return a < b;
}

bool toolchain_less(const ToolchainDesc& a, const ToolchainDesc& b) {
    // Linked toolchains list before remote ones
    if (a.kind() != b.kind()) return a.isLocal();
    if (a.isLocal()) return a.name() < b.name();
    if (a.origin() != b.origin()) return a.origin() < b.origin();
    return toolchain_release_less(a.release(), b.release());
}

} // namespace elan
