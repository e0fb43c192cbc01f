#pragma once

/**
@file
@brief Playtime accounting for launched games.
*/

#include <ludex/core/types.hpp>
#include <ludex/launch/process.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ludex::play {

/// @brief Default interval between liveness checks.
inline constexpr std::chrono::milliseconds kDefaultPollInterval{5000};

/// @brief Watches launched processes and reports how long each one ran.
///
/// Every tracked launch gets its own polling thread. When the watcher first reports the process as gone, the elapsed
/// time is passed to the exit callback exactly once and the thread ends. Destroying the tracker waits for all
/// outstanding launches to exit.
class PlaytimeTracker {
public:
    using Clock = std::chrono::steady_clock;

    /// @brief Invoked from the polling thread with the entry key and the session length in seconds.
    using ExitCallback = std::function<void(const Key &key, double seconds)>;

    PlaytimeTracker(launch::ProcessWatcher &watcher, ExitCallback onExit,
                    std::chrono::milliseconds pollInterval = kDefaultPollInterval);
    ~PlaytimeTracker();

    PlaytimeTracker(const PlaytimeTracker &) = delete;
    PlaytimeTracker &operator=(const PlaytimeTracker &) = delete;

    /// @brief Starts tracking a launched process.
    /// @param[in] handle the process handle; ownership moves to the tracker
    /// @param[in] key the key of the launched entry
    /// @param[in] start the time the process was started
    void Track(launch::ProcessHandle handle, Key key, Clock::time_point start = Clock::now());

    /// @brief Retrieves the number of launches still being tracked.
    size_t ActiveCount() const {
        return m_active.load(std::memory_order_acquire);
    }

    /// @brief Blocks until every tracked process has exited and its playtime has been reported.
    void WaitAll();

private:
    launch::ProcessWatcher &m_watcher;
    ExitCallback m_onExit;
    std::chrono::milliseconds m_pollInterval;

    std::mutex m_threadsMutex;
    std::vector<std::thread> m_threads;
    std::atomic<size_t> m_active{0};
};

} // namespace ludex::play
