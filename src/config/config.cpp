#include "elan/config.hpp"
#include "elan/command.hpp"
#include "elan/platform.hpp"
#include "elan/resolver.hpp"
#include "elan/toolchain.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace elan {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> non_empty(std::optional<std::string> value) {
    if (value && value->empty()) return std::nullopt;
    return value;
}

} // namespace

// ============================================================================
// Home layout
// ============================================================================

ElanPaths get_elan_paths(const std::string& home) {
    fs::path root(home);
    ElanPaths paths;
    paths.home = home;
    paths.toolchains = (root / "toolchains").string();
    paths.settings_file = (root / "settings.toml").string();
    paths.known_projects = (root / "known-projects").string();
    paths.tmp = (root / "tmp").string();
    paths.bin = (root / "bin").string();
    return paths;
}

std::string resolve_elan_home(const std::optional<std::string>& explicit_home) {
    if (explicit_home && !explicit_home->empty()) {
        return *explicit_home;
    }
    if (auto env = non_empty(get_env(ELAN_HOME_ENV))) {
        return *env;
    }
    if (auto home = non_empty(get_home_dir())) {
        return (fs::path(*home) / ".elan").string();
    }
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return (ec ? fs::path(".elan") : cwd / ".elan").string();
}

// ============================================================================
// Cfg
// ============================================================================

Cfg::Cfg(std::string home, HttpClient& http, NotificationSink& sink,
         std::optional<std::string> env_override)
    : paths_(get_elan_paths(home)),
      settings_(paths_.settings_file),
      http_(http),
      sink_(sink),
      env_override_(non_empty(std::move(env_override))) {}

Cfg::Cfg(std::string home, HttpClient& http, NotificationSink& sink)
    : Cfg(std::move(home), http, sink, get_env(ELAN_TOOLCHAIN_ENV)) {}

VoidResult Cfg::ensureHome() {
    const std::pair<const std::string*, const char*> dirs[] = {
        {&paths_.home, "home"},
        {&paths_.toolchains, "toolchains"},
        {&paths_.tmp, "temp"},
    };
    for (const auto& dir : dirs) {
        if (is_directory(*dir.first)) continue;
        sink_.notify(Event::CreatingDirectory, *dir.first, dir.second);
        if (!create_directories(*dir.first)) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR,
                "could not create " + std::string(dir.second) + " directory '" + *dir.first + "'"));
        }
    }
    return VoidResult::ok();
}

Result<std::vector<ToolchainDesc>> Cfg::listToolchains() const {
    std::vector<ToolchainDesc> toolchains;
    if (!is_directory(paths_.toolchains)) {
        return Result<std::vector<ToolchainDesc>>::ok(toolchains);
    }

    for (const auto& name : list_directory_names(paths_.toolchains)) {
        // In-flight installs leave lock files and staging directories next to real entries
        if (ends_with(name, ".lock") || ends_with(name, ".tmp")) continue;

        std::string full = (fs::path(paths_.toolchains) / name).string();
        if (!is_directory(full) && !is_symlink(full)) continue;

        auto desc = ToolchainDesc::fromToolchainDir(name);
        if (desc.isErr()) {
            spdlog::debug("ignoring unrecognized toolchain directory '{}'", name);
            continue;
        }
        toolchains.push_back(desc.value());
    }

    std::sort(toolchains.begin(), toolchains.end(), toolchain_less);
    return Result<std::vector<ToolchainDesc>>::ok(std::move(toolchains));
}

Result<std::optional<UnresolvedToolchainDesc>> Cfg::getDefault() {
    using R = Result<std::optional<UnresolvedToolchainDesc>>;

    auto name = settings_.with([](const Settings& s) {
        return Result<std::optional<std::string>>::ok(s.default_toolchain);
    });
    if (name.isErr()) return R::err(name.error());
    if (!name.value()) return R::ok(std::nullopt);

    auto desc = lookup_unresolved_toolchain_desc(*this, *name.value());
    if (desc.isErr()) {
        return R::err(desc.error().withContext("invalid default toolchain"));
    }
    return R::ok(desc.value());
}

VoidResult Cfg::setDefault(const std::string& name) {
    std::optional<std::string> stored;
    if (name != "none") {
        auto desc = lookup_unresolved_toolchain_desc(*this, name);
        if (desc.isErr()) return VoidResult::err(desc.error());
        stored = desc.value().toString();
    }

    auto saved = settings_.withMut([&](Settings& s) {
        s.default_toolchain = stored;
        return VoidResult::ok();
    });
    if (saved.isErr()) return saved;

    sink_.notify(Event::SetDefaultToolchain, stored.value_or(""));
    return VoidResult::ok();
}

Result<std::optional<OverrideMatch>> Cfg::findOverride(const std::string& dir) {
    return find_override(*this, dir);
}

Result<std::optional<std::pair<Toolchain, std::optional<OverrideReason>>>>
Cfg::findOverrideToolchainOrDefault(const std::string& dir) {
    using Found = std::pair<Toolchain, std::optional<OverrideReason>>;
    using R = Result<std::optional<Found>>;

    auto found = findOverride(dir);
    if (found.isErr()) return R::err(found.error());

    if (found.value()) {
        const OverrideMatch& match = *found.value();
        auto desc = resolve_toolchain_desc(*this, match.desc);
        if (desc.isErr()) {
            return R::err(desc.error().withContext(
                "could not resolve toolchain '" + match.desc.toString() + "' (" +
                match.reason.toString() + ")"));
        }
        return R::ok(Found(Toolchain(*this, desc.value()), match.reason));
    }

    auto def = getDefault();
    if (def.isErr()) return R::err(def.error());
    if (!def.value()) return R::ok(std::nullopt);

    auto desc = resolve_toolchain_desc(*this, *def.value());
    if (desc.isErr()) {
        return R::err(desc.error().withContext(
            "could not resolve default toolchain '" + def.value()->toString() + "'"));
    }
    return R::ok(Found(Toolchain(*this, desc.value()), std::nullopt));
}

Result<std::pair<Toolchain, std::optional<OverrideReason>>>
Cfg::toolchainForDir(const std::string& dir, bool install) {
    using R = Result<std::pair<Toolchain, std::optional<OverrideReason>>>;

    auto found = findOverrideToolchainOrDefault(dir);
    if (found.isErr()) return R::err(found.error());
    if (!found.value()) {
        return R::err(Error(ErrorCode::NO_DEFAULT_TOOLCHAIN,
            "no default toolchain configured. run 'elan default stable' to install & "
            "configure the latest Lean 4 stable release."));
    }

    auto selected = *found.value();
    Toolchain& toolchain = selected.first;
    if (!toolchain.exists()) {
        if (toolchain.desc().isLocal()) {
            return R::err(Error(ErrorCode::NOT_INSTALLED,
                "toolchain '" + toolchain.name() + "' is not installed"));
        }
        if (install) {
            auto installed = toolchain.installFromDistIfNotInstalled();
            if (installed.isErr()) return R::err(installed.error());
        }
    }
    return R::ok(std::move(selected));
}

Result<Command> Cfg::createCommandForDir(const std::string& dir, const std::string& binary) {
    auto selected = toolchainForDir(dir, true);
    if (selected.isErr()) return Result<Command>::err(selected.error());
    return create_command_for_toolchain(selected.value().first, binary);
}

Result<Toolchain> Cfg::resolveToolchain(const std::string& name) {
    auto desc = lookup_toolchain_desc(*this, name);
    if (desc.isErr()) return Result<Toolchain>::err(desc.error());
    return Result<Toolchain>::ok(Toolchain(*this, desc.value()));
}

} // namespace elan
