#pragma once

/**
@file
@brief Library scanner.

Walks the library roots on a worker thread, classifies every candidate file and directory and builds a fresh catalog.
Progress and the final result are delivered through a `ScanSession`.
*/

#include <ludex/catalog/catalog.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <thread>
#include <variant>
#include <vector>

namespace ludex::scan {

/// @brief Number of items visited so far out of the total counted by the pre-pass.
struct ScanProgress {
    uint64 processed = 0;
    uint64 total = 0;
};

/// @brief Parameters of a scan.
struct ScanRequest {
    std::vector<std::filesystem::path> roots; ///< Library roots, walked in order
    std::map<Key, EntryMetadata> metadata;    ///< Metadata overlay merged into entries with matching keys

    /// @brief Optional observer invoked on the scanning thread for every progress update, before the matching event is
    /// queued.
    std::function<void(const ScanProgress &)> observer;
};

/// @brief Outcome of a completed scan.
struct ScanResult {
    Catalog catalog;                                    ///< The new catalog snapshot
    std::vector<std::filesystem::path> unreadableRoots; ///< Roots that could not be opened and were skipped
    ScanProgress progress;                              ///< Final counters
};

struct ScanEvent {
    enum class Type {
        Progress,  // value is ScanProgress
        Completed, // value is ScanResult; always the last event of a session
    };

    Type type;
    std::variant<std::monostate, ScanProgress, ScanResult> value;
};

struct ScanChannel;

/// @brief Event stream of one scan.
///
/// Yields any number of progress events followed by exactly one completion event. Sessions cannot be restarted.
class ScanSession {
public:
    explicit ScanSession(std::shared_ptr<ScanChannel> channel);

    /// @brief Waits for the next event.
    /// @param[out] event receives the event
    /// @return `false` if the completion event was already consumed and the stream is exhausted
    bool Next(ScanEvent &event);

    bool Finished() const {
        return m_finished;
    }

private:
    std::shared_ptr<ScanChannel> m_channel;
    bool m_finished = false;
};

/// @brief Runs library scans on a dedicated worker thread, one at a time.
class LibraryScanner {
public:
    enum class State { Idle, Scanning };

    LibraryScanner() = default;
    ~LibraryScanner();

    LibraryScanner(const LibraryScanner &) = delete;
    LibraryScanner &operator=(const LibraryScanner &) = delete;

    /// @brief Starts a scan in the background.
    /// @param[in] request the scan parameters
    /// @return the session delivering the scan events, or `nullptr` if a scan is already running
    std::unique_ptr<ScanSession> Scan(ScanRequest request);

    State GetState() const {
        return m_state.load(std::memory_order_acquire);
    }

    bool IsScanning() const {
        return GetState() == State::Scanning;
    }

    /// @brief Walks the roots synchronously on the calling thread.
    /// @param[in] request the scan parameters
    /// @param[in] onProgress invoked after every visited directory and file
    /// @return the scan result
    static ScanResult Walk(const ScanRequest &request,
                           const std::function<void(const ScanProgress &)> &onProgress = {});

private:
    std::thread m_thread;
    std::atomic<State> m_state{State::Idle};
};

/// @brief Copies entries of `previous` that live under one of the result's unreadable roots into the result.
///
/// Keeps games on a temporarily unavailable drive from vanishing from the catalog.
///
/// @param[in] previous the catalog before the scan
/// @param[in,out] result the scan result to augment
/// @return the number of entries carried over
size_t CarryOverUnreadableRoots(const Catalog &previous, ScanResult &result);

} // namespace ludex::scan
