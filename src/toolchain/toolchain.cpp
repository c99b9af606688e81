#include "elan/toolchain.hpp"
#include "elan/config.hpp"
#include "elan/manifestation.hpp"
#include "elan/platform.hpp"
#include "elan/settings.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace elan {

InstallPrefix InstallPrefix::forToolchain(const std::string& toolchains_dir, const ToolchainDesc& desc) {
    return InstallPrefix((fs::path(toolchains_dir) / desc.toDirName()).string());
}

bool InstallPrefix::exists() const {
    return is_directory(path_);
}

Toolchain::Toolchain(Cfg& cfg, ToolchainDesc desc)
    : cfg_(&cfg),
      desc_(std::move(desc)),
      prefix_(InstallPrefix::forToolchain(cfg.paths().toolchains, desc_)) {}

bool Toolchain::exists() const {
    // A dangling link left behind by a deleted local build does not count
    return prefix_.exists();
}

bool Toolchain::isCustom() const {
    return is_symlink(prefix_.path());
}

std::string Toolchain::binaryFile(const std::string& binary) const {
    return (fs::path(prefix_.path()) / "bin" / (binary + exe_suffix())).string();
}

VoidResult Toolchain::installFromDist() {
    if (exists()) {
        return VoidResult::err(Error(ErrorCode::ALREADY_INSTALLED,
            "toolchain '" + name() + "' is already installed"));
    }

    cfg_->sink().notify(Event::InstallingToolchain, name());
    auto installed = install_from_dist(*cfg_, desc_, prefix_);
    if (installed.isErr()) return installed;
    cfg_->sink().notify(Event::InstalledToolchain, name());
    return VoidResult::ok();
}

VoidResult Toolchain::installFromDistIfNotInstalled() {
    if (exists()) {
        cfg_->sink().notify(Event::UsingExistingToolchain, name());
        return VoidResult::ok();
    }
    return installFromDist();
}

VoidResult Toolchain::installFromDir(const std::string& src, bool link) {
    if (!desc_.isLocal()) {
        return VoidResult::err(Error(ErrorCode::INVALID_NAME,
            "invalid custom toolchain name '" + name() + "'"));
    }

    std::string lean = (fs::path(src) / "bin" / (std::string("lean") + exe_suffix())).string();
    if (!path_exists(lean)) {
        return VoidResult::err(Error(ErrorCode::BINARY_NOT_FOUND,
            "invalid toolchain path: '" + lean + "' does not exist"));
    }

    std::string abs_src = canonicalize(src).value_or(src);

    // Relinking replaces whatever was installed under this name
    if (exists() || isCustom()) {
        auto removed = uninstall(prefix_, cfg_->sink());
        if (removed.isErr()) return removed;
    }

    if (!create_directories(cfg_->paths().toolchains)) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "could not create directory '" + cfg_->paths().toolchains + "'"));
    }

    std::string error;
    if (link) {
        cfg_->sink().notify(Event::LinkingDirectory, abs_src, prefix_.path());
        if (!symlink_directory(abs_src, prefix_.path(), &error)) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR, error));
        }
    } else {
        cfg_->sink().notify(Event::CopyingDirectory, abs_src, prefix_.path());
        if (!copy_directory(abs_src, prefix_.path(), &error)) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR, error));
        }
    }
    return VoidResult::ok();
}

VoidResult Toolchain::remove() {
    if (!exists() && !isCustom()) {
        cfg_->sink().notify(Event::ToolchainNotInstalled, name());
        return VoidResult::ok();
    }

    cfg_->sink().notify(Event::UninstallingToolchain, name());
    auto removed = uninstall(prefix_, cfg_->sink());
    if (removed.isErr()) return removed;
    cfg_->sink().notify(Event::UninstalledToolchain, name());
    return VoidResult::ok();
}

VoidResult Toolchain::makeOverride(const std::string& dir) {
    std::string key = path_to_override_key(dir);
    std::string tc = name();
    NotificationSink& sink = cfg_->sink();
    return cfg_->settings().withMut([&](Settings& s) {
        s.addOverride(key, tc, sink);
        return VoidResult::ok();
    });
}

VoidResult Toolchain::makeDefault() {
    std::string tc = name();
    auto saved = cfg_->settings().withMut([&](Settings& s) {
        s.default_toolchain = tc;
        return VoidResult::ok();
    });
    if (saved.isErr()) return saved;
    cfg_->sink().notify(Event::SetDefaultToolchain, tc);
    return VoidResult::ok();
}

} // namespace elan
