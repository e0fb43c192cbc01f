#pragma once

/**
@file
@brief Process spawning and liveness checks.

`ProcessSpawner` and `ProcessWatcher` are the seams between the launcher and the operating system. The Boost.Process
implementations are used in production; tests substitute their own.
*/

#include "launch_plan.hpp"

#include <boost/process/child.hpp>

#include <filesystem>
#include <system_error>

namespace ludex::launch {

/// @brief Owns a spawned child process.
///
/// A default-constructed handle refers to no process. Destroying a handle never terminates the process; a process
/// that is still running is detached.
class ProcessHandle {
public:
    ProcessHandle() = default;
    explicit ProcessHandle(boost::process::child child);
    ~ProcessHandle();

    ProcessHandle(ProcessHandle &&) = default;
    ProcessHandle &operator=(ProcessHandle &&) = default;

    bool Valid() const {
        return m_child.valid();
    }

    /// @brief Retrieves the OS process ID, or 0 if the handle is empty.
    int Id() const;

    boost::process::child &Child() {
        return m_child;
    }

private:
    boost::process::child m_child;
};

/// @brief Starts processes described by launch plans.
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    /// @brief Starts the process described by `plan`.
    /// @param[in] plan the launch plan
    /// @param[out] handle receives the process handle on success
    /// @param[out] error receives the OS error on failure
    /// @return `true` if the process started
    virtual bool Spawn(const LaunchPlan &plan, ProcessHandle &handle, std::error_code &error) = 0;
};

/// @brief Reports whether a spawned process is still running.
class ProcessWatcher {
public:
    virtual ~ProcessWatcher() = default;

    virtual bool IsAlive(ProcessHandle &handle) = 0;
};

/// @brief Spawns processes with Boost.Process.
class BoostProcessSpawner final : public ProcessSpawner {
public:
    bool Spawn(const LaunchPlan &plan, ProcessHandle &handle, std::error_code &error) override;
};

/// @brief Checks liveness of Boost.Process children, reaping them once they exit.
class ChildProcessWatcher final : public ProcessWatcher {
public:
    bool IsAlive(ProcessHandle &handle) override;
};

/// @brief Locates the host program that opens shortcut files (`xdg-open`, `open` or `explorer.exe`).
/// @return the opener path, or the bare program name if it is not on the search path
std::filesystem::path FindShellOpener();

} // namespace ludex::launch
