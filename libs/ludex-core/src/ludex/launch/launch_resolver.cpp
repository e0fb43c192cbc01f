#include <ludex/launch/launch_resolver.hpp>

#include <ludex/catalog/platform.hpp>
#include <ludex/launch/launch_args.hpp>
#include <ludex/launch/process.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/string_ops.hpp>

#include <algorithm>
#include <array>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace ludex::launch {

namespace grp {

    struct launcher {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Launcher";
    };

} // namespace grp

static constexpr std::array<std::string_view, 3> kShortcutExtensions = {".lnk", ".url", ".desktop"};
static constexpr std::array<std::string_view, 5> kExecutableExtensions = {".exe", ".bat", ".cmd", ".appimage", ".sh"};

static std::string LowerExtension(const fs::path &path) {
    return util::ToLower(util::PathString(path.extension()));
}

bool IsShortcut(const fs::path &path) {
    const std::string ext = LowerExtension(path);
    return std::find(kShortcutExtensions.begin(), kShortcutExtensions.end(), ext) != kShortcutExtensions.end();
}

bool IsLaunchableFile(const fs::path &path) {
    std::error_code error{};
    const fs::file_status status = fs::status(path, error);
    if (error || !fs::is_regular_file(status)) {
        return false;
    }

    const std::string ext = LowerExtension(path);
    if (IsShortcut(path) ||
        std::find(kExecutableExtensions.begin(), kExecutableExtensions.end(), ext) != kExecutableExtensions.end()) {
        return true;
    }
#ifndef _WIN32
    constexpr auto kExecBits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    if ((status.permissions() & kExecBits) != fs::perms::none) {
        return true;
    }
#endif
    return false;
}

std::optional<fs::path> FindFolderExecutable(const fs::path &dir) {
    std::vector<fs::path> candidates{};
    std::error_code error{};
    for (fs::directory_iterator it{dir, fs::directory_options::skip_permission_denied, error}, end{};
         !error && it != end; it.increment(error)) {
        if (IsLaunchableFile(it->path())) {
            candidates.push_back(it->path());
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const fs::path &lhs, const fs::path &rhs) { return lhs.filename() < rhs.filename(); });

    for (std::string_view hint : {"game", "launch"}) {
        auto it = std::find_if(candidates.begin(), candidates.end(), [&](const fs::path &path) {
            return util::ToLower(util::FileName(path)).find(hint) != std::string::npos;
        });
        if (it != candidates.end()) {
            return *it;
        }
    }
    return candidates.front();
}

// Applies the nested package rule of the entry's platform. Returns nothing if a container has no launch target.
static std::optional<fs::path> ResolveTarget(const CatalogEntry &entry) {
    const NestedPackageRule *rule = FindNestedPackageRule(entry.platform);
    std::error_code error{};
    if (rule == nullptr || !fs::is_directory(entry.path, error)) {
        return entry.path;
    }

    const fs::path deep = entry.path / fs::path{rule->executable};
    if (fs::is_regular_file(deep, error)) {
        return deep;
    }
    if (fs::is_directory(entry.path / fs::path{rule->marker}, error)) {
        return entry.path;
    }
    return std::nullopt;
}

LaunchResolver::LaunchResolver()
    : LaunchResolver(FindShellOpener()) {}

LaunchResolver::LaunchResolver(fs::path shellOpener)
    : m_shellOpener(std::move(shellOpener)) {}

LaunchResult LaunchResolver::Resolve(const CatalogEntry &entry, const emu::EmulatorProfile *profile) const {
    if (entry.platform == kPlatformPS3 && LowerExtension(entry.path) == ".pkg") {
        std::error_code error{};
        if (!fs::is_directory(entry.path, error)) {
            return LaunchResult::PackageRequiresInstall(entry.path);
        }
    }

    const auto resolved = ResolveTarget(entry);
    if (!resolved) {
        return LaunchResult::NoLaunchTarget(entry.path);
    }
    const fs::path &target = *resolved;

    std::error_code error{};
    if (!fs::exists(target, error)) {
        devlog::debug<grp::launcher>("{} does not exist", util::PathString(target));
        return LaunchResult::NoLaunchTarget(target);
    }

    if (profile != nullptr) {
        return ResolveWithEmulator(target, *profile);
    }
    if (IsDirectExecution(entry.platform)) {
        return ResolveDirect(target);
    }
    return LaunchResult::MissingEmulator(fmt::format("no emulator selected for {}", entry.platform));
}

LaunchResult LaunchResolver::ResolveDirect(const fs::path &target) const {
    fs::path program = target;
    std::error_code error{};
    if (fs::is_directory(target, error)) {
        auto found = FindFolderExecutable(target);
        if (!found) {
            return LaunchResult::NoLaunchTarget(target);
        }
        program = *found;
    }
    program = program.lexically_normal();

    LaunchPlan plan{.argv = {}, .workingDirectory = program.parent_path(), .target = program};
    if (IsShortcut(program)) {
        plan.argv = {util::PathString(m_shellOpener), util::PathString(program)};
    } else {
        plan.argv = {util::PathString(program)};
    }
    devlog::debug<grp::launcher>("Direct launch of {}", util::PathString(program));
    return LaunchResult::Success(std::move(plan));
}

LaunchResult LaunchResolver::ResolveWithEmulator(const fs::path &target, const emu::EmulatorProfile &profile) const {
    LaunchPlan plan{.argv = {}, .workingDirectory = {}, .target = target.lexically_normal()};
    std::string error{};
    if (!BuildLaunchCommand(profile.executablePath, profile.argsTemplate, target, plan.argv, error)) {
        devlog::warn<grp::launcher>("Cannot split arguments of {}: {}", profile.name, error);
        return LaunchResult::InvalidArguments(std::move(error));
    }
    devlog::debug<grp::launcher>("Launching {} with {}", util::PathString(plan.target), profile.name);
    return LaunchResult::Success(std::move(plan));
}

LaunchResult LaunchResolver::Reveal(const CatalogEntry &entry) const {
    const fs::path location = entry.path.lexically_normal().parent_path();
    std::error_code error{};
    if (!fs::is_directory(location, error)) {
        return LaunchResult::NoLaunchTarget(location);
    }
    return LaunchResult::Success({
        .argv = {util::PathString(m_shellOpener), util::PathString(location)},
        .workingDirectory = {},
        .target = location,
    });
}

LaunchResult LaunchResolver::RunEmulator(const emu::EmulatorProfile &profile) const {
    const fs::path exe = profile.executablePath.lexically_normal();
    std::error_code error{};
    if (!fs::exists(exe, error)) {
        return LaunchResult::NoLaunchTarget(exe);
    }
    return LaunchResult::Success({
        .argv = {util::PathString(exe)},
        .workingDirectory = exe.parent_path(),
        .target = exe,
    });
}

} // namespace ludex::launch
