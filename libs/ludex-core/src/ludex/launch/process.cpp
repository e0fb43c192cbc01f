#include <ludex/launch/process.hpp>

#include <ludex/util/dev_log.hpp>

#include <boost/process/args.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/start_dir.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace bp = boost::process;

namespace ludex::launch {

namespace grp {

    struct process {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Launcher-Process";
    };

} // namespace grp

ProcessHandle::ProcessHandle(bp::child child)
    : m_child(std::move(child)) {}

ProcessHandle::~ProcessHandle() {
    if (!m_child.valid()) {
        return;
    }
    std::error_code error{};
    if (m_child.running(error)) {
        m_child.detach();
    }
}

int ProcessHandle::Id() const {
    return m_child.valid() ? static_cast<int>(m_child.id()) : 0;
}

bool BoostProcessSpawner::Spawn(const LaunchPlan &plan, ProcessHandle &handle, std::error_code &error) {
    error.clear();
    if (plan.argv.empty()) {
        error = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    const std::vector<std::string> args{plan.argv.begin() + 1, plan.argv.end()};
    devlog::debug<grp::process>("Spawning {}", fmt::join(plan.argv, " "));

    bp::child child{};
    if (plan.workingDirectory.empty()) {
        child = bp::child{bp::exe = plan.argv[0], bp::args = args, error};
    } else {
        child = bp::child{bp::exe = plan.argv[0], bp::args = args, bp::start_dir = plan.workingDirectory.string(),
                          error};
    }
    if (error) {
        devlog::warn<grp::process>("Could not start {}: {}", plan.argv[0], error.message());
        return false;
    }

    devlog::debug<grp::process>("Started process {}", child.id());
    handle = ProcessHandle{std::move(child)};
    return true;
}

bool ChildProcessWatcher::IsAlive(ProcessHandle &handle) {
    if (!handle.Valid()) {
        return false;
    }
    std::error_code error{};
    const bool running = handle.Child().running(error);
    return running && !error;
}

std::filesystem::path FindShellOpener() {
#if defined(_WIN32)
    constexpr const char *kOpener = "explorer.exe";
#elif defined(__APPLE__)
    constexpr const char *kOpener = "open";
#else
    constexpr const char *kOpener = "xdg-open";
#endif
    const boost::filesystem::path found = bp::search_path(kOpener);
    if (found.empty()) {
        return kOpener;
    }
    return std::filesystem::path{found.native()};
}

} // namespace ludex::launch
