#pragma once

/**
@file
@brief The library facade.

`Library` wires the catalog, the scanner, the catalog store, the launch resolver and the playtime tracker together
around a `LibraryConfig`. Front ends talk to it instead of to the individual components.
*/

#include <ludex/catalog/catalog.hpp>
#include <ludex/config/library_config.hpp>
#include <ludex/launch/launch_plan.hpp>
#include <ludex/launch/launch_resolver.hpp>
#include <ludex/launch/process.hpp>
#include <ludex/play/playtime_tracker.hpp>
#include <ludex/scan/library_scanner.hpp>
#include <ludex/store/catalog_store.hpp>

#include <fmt/format.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace ludex {

/// @brief Caller choices for a launch.
struct LaunchOptions {
    std::optional<std::string> emulator; ///< Emulator to use, overriding the automatic selection
    bool setDefault = false;             ///< Store `emulator` as the platform default
};

struct DeleteGameResult {
    enum class Type { Success, EntryNotFound, FilesystemError };

    static DeleteGameResult Success() {
        return {.type = Type::Success};
    }

    static DeleteGameResult EntryNotFound(Key key) {
        return {.type = Type::EntryNotFound, .value = std::move(key)};
    }

    static DeleteGameResult FilesystemError(std::error_code error) {
        return {.type = Type::FilesystemError, .value = error};
    }

    operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::EntryNotFound: return fmt::format("No game with key {}", std::get<Key>(value));
        case Type::FilesystemError:
            return fmt::format("Could not delete files: {}", std::get<std::error_code>(value).message());
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, Key, std::error_code> value;
};

class Library {
public:
    /// @brief Creates the facade.
    /// @param[in] config the library configuration; must outlive the facade
    /// @param[in] store the catalog store; must outlive the facade
    /// @param[in] spawner starts launched processes; must outlive the facade
    /// @param[in] watcher checks process liveness; launches are not tracked if `nullptr`
    /// @param[in] pollInterval interval between liveness checks
    /// @param[in] resolver the launch resolver
    Library(config::LibraryConfig &config, store::CatalogStore &store, launch::ProcessSpawner &spawner,
            launch::ProcessWatcher *watcher, std::chrono::milliseconds pollInterval = play::kDefaultPollInterval,
            launch::LaunchResolver resolver = {});

    /// @brief Waits for tracked launches to exit.
    ~Library();

    Library(const Library &) = delete;
    Library &operator=(const Library &) = delete;

    // -------------------------------------------------------------------------
    // Catalog

    /// @brief Loads the cached catalog and overlays the configured metadata.
    store::CatalogLoadResult LoadCatalog();

    /// @brief Starts a background scan of the configured roots.
    /// @return the scan session, or `nullptr` if a scan is already running
    std::unique_ptr<scan::ScanSession> StartScan();

    /// @brief Replaces the catalog with a scan result and persists it.
    ///
    /// Entries under roots the scan could not read are carried over from the current catalog.
    store::CatalogSaveResult ApplyScanResult(scan::ScanResult result);

    /// @brief Runs a scan to completion and applies its result.
    /// @param[in] onProgress invoked for every progress event on the calling thread
    /// @return the roots that could not be read, or `std::nullopt` if a scan was already running
    std::optional<std::vector<std::filesystem::path>>
    Rescan(const std::function<void(const scan::ScanProgress &)> &onProgress = {});

    /// @brief Permanently deletes a game's file, or its whole folder for folder entries, from disk.
    ///
    /// The entry is dropped from the catalog and the catalog is persisted. Configured metadata is kept, so the game
    /// gets it back if it reappears at the same path.
    DeleteGameResult DeleteGame(const Key &key);

    /// @brief Deletes the catalog cache and empties the in-memory catalog.
    bool ClearCache();

    /// @brief Retrieves a copy of the current catalog.
    Catalog GetCatalog() const;

    /// @brief Retrieves a copy of one entry.
    std::optional<CatalogEntry> FindEntry(const Key &key) const;

    bool IsScanning() const {
        return m_scanner.IsScanning();
    }

    // -------------------------------------------------------------------------
    // Launching

    /// @brief Picks the emulator profile to launch an entry with.
    ///
    /// Order: the caller's choice, the entry's custom emulator, the platform default, then the only emulator that
    /// handles the platform. Direct-execution platforms fall back to no profile.
    ///
    /// @param[in] entry the entry to launch
    /// @param[in] options the caller's choices
    /// @param[out] profile receives the selected profile, or `std::nullopt` for a direct launch
    /// @return `Success` or the reason no emulator could be chosen
    launch::LaunchResult SelectEmulator(const CatalogEntry &entry, const LaunchOptions &options,
                                        std::optional<emu::EmulatorProfile> &profile);

    /// @brief Resolves, spawns and tracks an entry.
    ///
    /// On success the key is moved to the front of the recents list and, if a watcher is available, the process is
    /// tracked until it exits, at which point its playtime is added to the entry.
    launch::LaunchResult Launch(const Key &key, const LaunchOptions &options = {});

    /// @brief Opens the folder containing an entry in the host's file manager.
    launch::LaunchResult Reveal(const Key &key);

    /// @brief Starts an emulator without a game.
    launch::LaunchResult RunEmulator(const std::string &name);

    /// @brief Blocks until every tracked launch has exited.
    void WaitForTrackedLaunches();

    // -------------------------------------------------------------------------
    // Metadata

    /// @brief Toggles the favorite state of an entry.
    /// @return the new state, or `std::nullopt` if the key is not in the catalog
    std::optional<bool> ToggleFavorite(const Key &key);

    /// @brief Sets or clears the emulator override of an entry.
    /// @return `false` if the key is not in the catalog or the emulator is not configured
    bool SetCustomEmulator(const Key &key, std::optional<std::string> emulator);

    /// @brief Sets or clears the notes of an entry.
    bool SetNotes(const Key &key, std::optional<std::string> notes);

    /// @brief Replaces the tags of an entry.
    bool SetTags(const Key &key, std::vector<std::string> tags);

    /// @brief Adds playtime to an entry and persists it.
    void AddPlaytime(const Key &key, double seconds);

    // -------------------------------------------------------------------------
    // Configuration

    /// @brief Persists the configuration.
    config::ConfigSaveResult SaveConfig();

    const launch::LaunchResolver &Resolver() const {
        return m_resolver;
    }

private:
    config::LibraryConfig &m_config;
    store::CatalogStore &m_store;
    launch::ProcessSpawner &m_spawner;
    launch::LaunchResolver m_resolver;

    mutable std::mutex m_mutex;
    Catalog m_catalog;

    scan::LibraryScanner m_scanner;

    std::unique_ptr<play::PlaytimeTracker> m_tracker;

    // Requires m_mutex to be held
    void SyncEntryMetadata(const Key &key);
    config::ConfigSaveResult SaveConfigLocked();

    launch::LaunchResult Spawn(const launch::LaunchPlan &plan, launch::ProcessHandle &handle);
};

} // namespace ludex
