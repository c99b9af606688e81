#include "elan/gc.hpp"
#include "elan/config.hpp"
#include "elan/override.hpp"
#include "elan/platform.hpp"
#include "elan/resolver.hpp"
#include "elan/toolchain.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>

namespace elan {

namespace fs = std::filesystem;

Result<std::vector<std::string>> get_roots(Cfg& cfg) {
    using R = Result<std::vector<std::string>>;

    const std::string& path = cfg.paths().known_projects;
    if (!path_exists(path)) return R::ok({});

    auto content = read_file(path);
    if (!content) {
        return R::err(Error(ErrorCode::IO_ERROR, "could not read '" + path + "'"));
    }

    std::vector<std::string> roots;
    std::istringstream lines(*content);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) roots.push_back(line);
    }
    return R::ok(std::move(roots));
}

VoidResult add_root(Cfg& cfg, const std::string& root) {
    auto roots = get_roots(cfg);
    if (roots.isErr()) return VoidResult::err(roots.error());

    auto& list = roots.value();
    if (std::find(list.begin(), list.end(), root) != list.end()) {
        return VoidResult::ok();
    }
    list.push_back(root);

    std::string content;
    for (const auto& r : list) {
        content += r;
        content += '\n';
    }

    if (!create_directories(cfg.paths().home)) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not create elan home '" + cfg.paths().home + "'"));
    }
    auto written = atomic_write_file(cfg.paths().known_projects, content);
    if (!written.ok) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not update '" + cfg.paths().known_projects + "': " + written.error));
    }
    return VoidResult::ok();
}

Result<GcAnalysis> analyze_toolchains(Cfg& cfg) {
    GcAnalysis analysis;

    auto roots = get_roots(cfg);
    if (roots.isErr()) return Result<GcAnalysis>::err(roots.error());

    for (const auto& root : roots.value()) {
        std::string file = (fs::path(root) / TOOLCHAIN_FILE_NAME).string();
        if (!path_exists(file)) continue;

        auto unresolved = read_toolchain_file(cfg, file);
        if (unresolved.isErr()) {
            spdlog::debug("skipping project '{}': {}", root, unresolved.error().message());
            continue;
        }
        auto desc = resolve_toolchain_desc(cfg, unresolved.value());
        if (desc.isErr()) {
            spdlog::debug("skipping project '{}': {}", root, desc.error().message());
            continue;
        }
        analysis.used.emplace_back(root, desc.value());
    }

    auto def = cfg.getDefault();
    if (def.isErr()) return Result<GcAnalysis>::err(def.error());
    if (def.value()) {
        // Cache fallback found nothing installed, so nothing installed is the default
        auto desc = resolve_toolchain_desc_ext(cfg, *def.value(), true, true);
        if (desc.isOk()) {
            analysis.used.emplace_back("default toolchain", desc.value());
        } else {
            spdlog::debug("default toolchain not counted: {}", desc.error().message());
        }
    }

    if (const auto& env = cfg.envOverride(); env && !env->empty()) {
        auto unresolved = lookup_unresolved_toolchain_desc(cfg, *env);
        if (unresolved.isErr()) return Result<GcAnalysis>::err(unresolved.error());
        auto desc = resolve_toolchain_desc_ext(cfg, unresolved.value(), true, true);
        if (desc.isOk()) {
            analysis.used.emplace_back(ELAN_TOOLCHAIN_ENV, desc.value());
        } else {
            spdlog::debug("{} not counted: {}", ELAN_TOOLCHAIN_ENV, desc.error().message());
        }
    }

    auto overrides = cfg.settings().with([](const Settings& s) {
        return Result<std::map<std::string, std::string>>::ok(s.overrides);
    });
    if (overrides.isErr()) return Result<GcAnalysis>::err(overrides.error());
    for (const auto& [path, name] : overrides.value()) {
        auto desc = ToolchainDesc::fromResolvedStr(name);
        if (desc.isErr()) return Result<GcAnalysis>::err(desc.error());
        analysis.used.emplace_back(path + " (override)", desc.value());
    }

    std::set<std::string> used_names;
    for (const auto& entry : analysis.used) {
        used_names.insert(entry.second.toString());
    }

    auto installed = cfg.listToolchains();
    if (installed.isErr()) return Result<GcAnalysis>::err(installed.error());
    for (const auto& desc : installed.value()) {
        if (used_names.count(desc.toString())) continue;
        // Linked toolchains cannot be reinstalled, so they are never collected
        if (desc.isLocal() || Toolchain(cfg, desc).isCustom()) continue;
        analysis.unused.push_back(desc);
    }

    return Result<GcAnalysis>::ok(std::move(analysis));
}

} // namespace elan
