#include <ludex/play/playtime_tracker.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/thread_name.hpp>

namespace ludex::play {

namespace grp {

    struct playtime {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Playtime";
    };

} // namespace grp

PlaytimeTracker::PlaytimeTracker(launch::ProcessWatcher &watcher, ExitCallback onExit,
                                 std::chrono::milliseconds pollInterval)
    : m_watcher(watcher)
    , m_onExit(std::move(onExit))
    , m_pollInterval(pollInterval) {}

PlaytimeTracker::~PlaytimeTracker() {
    WaitAll();
}

void PlaytimeTracker::Track(launch::ProcessHandle handle, Key key, Clock::time_point start) {
    devlog::debug<grp::playtime>("Tracking process {} for {}", handle.Id(), key);

    m_active.fetch_add(1, std::memory_order_acq_rel);
    std::unique_lock lock{m_threadsMutex};
    m_threads.emplace_back([this, handle = std::move(handle), key = std::move(key), start]() mutable {
        util::SetCurrentThreadName("Playtime tracker");

        while (m_watcher.IsAlive(handle)) {
            std::this_thread::sleep_for(m_pollInterval);
        }

        const double seconds = std::chrono::duration<double>(Clock::now() - start).count();
        devlog::info<grp::playtime>("{} ran for {:.0f} seconds", key, seconds);
        if (m_onExit) {
            m_onExit(key, seconds);
        }
        m_active.fetch_sub(1, std::memory_order_acq_rel);
    });
}

void PlaytimeTracker::WaitAll() {
    std::vector<std::thread> threads{};
    {
        std::unique_lock lock{m_threadsMutex};
        threads.swap(m_threads);
    }
    for (std::thread &thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace ludex::play
