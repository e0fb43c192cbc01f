#include <ludex/library/library.hpp>

#include <ludex/catalog/platform.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/string_ops.hpp>

#include <fmt/format.h>

namespace ludex {

namespace grp {

    struct library {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Library";
    };

} // namespace grp

Library::Library(config::LibraryConfig &config, store::CatalogStore &store, launch::ProcessSpawner &spawner,
                 launch::ProcessWatcher *watcher, std::chrono::milliseconds pollInterval,
                 launch::LaunchResolver resolver)
    : m_config(config)
    , m_store(store)
    , m_spawner(spawner)
    , m_resolver(std::move(resolver)) {

    if (watcher != nullptr) {
        m_tracker = std::make_unique<play::PlaytimeTracker>(
            *watcher, [this](const Key &key, double seconds) { AddPlaytime(key, seconds); }, pollInterval);
    } else {
        devlog::info<grp::library>("No process watcher available; playtime will not be tracked");
    }
}

Library::~Library() {
    WaitForTrackedLaunches();
}

// -----------------------------------------------------------------------------
// Catalog

store::CatalogLoadResult Library::LoadCatalog() {
    Catalog catalog{};
    auto result = m_store.Load(catalog);

    std::unique_lock lock{m_mutex};
    m_catalog = std::move(catalog);
    for (const auto &[key, entry] : m_catalog.Entries()) {
        SyncEntryMetadata(key);
    }
    return result;
}

std::unique_ptr<scan::ScanSession> Library::StartScan() {
    scan::ScanRequest request{};
    {
        std::unique_lock lock{m_mutex};
        request.roots = m_config.libraryRoots;
        request.metadata = m_config.metadata;
    }
    return m_scanner.Scan(std::move(request));
}

store::CatalogSaveResult Library::ApplyScanResult(scan::ScanResult result) {
    std::unique_lock lock{m_mutex};
    scan::CarryOverUnreadableRoots(m_catalog, result);
    m_catalog = std::move(result.catalog);

    // Metadata may have changed while the scan was running
    for (const auto &[key, entry] : m_catalog.Entries()) {
        SyncEntryMetadata(key);
    }

    devlog::info<grp::library>("Catalog now holds {} entries", m_catalog.Size());
    return m_store.Save(m_catalog);
}

std::optional<std::vector<std::filesystem::path>>
Library::Rescan(const std::function<void(const scan::ScanProgress &)> &onProgress) {
    auto session = StartScan();
    if (!session) {
        return std::nullopt;
    }

    std::vector<std::filesystem::path> unreadableRoots{};
    scan::ScanEvent event{};
    while (session->Next(event)) {
        switch (event.type) {
        case scan::ScanEvent::Type::Progress:
            if (onProgress) {
                onProgress(std::get<scan::ScanProgress>(event.value));
            }
            break;
        case scan::ScanEvent::Type::Completed: //
        {
            auto &result = std::get<scan::ScanResult>(event.value);
            unreadableRoots = result.unreadableRoots;
            if (auto saveResult = ApplyScanResult(std::move(result)); !saveResult) {
                devlog::warn<grp::library>("Could not save catalog: {}", saveResult.string());
            }
            break;
        }
        }
    }
    return unreadableRoots;
}

DeleteGameResult Library::DeleteGame(const Key &key) {
    std::unique_lock lock{m_mutex};
    const CatalogEntry *entry = m_catalog.Find(key);
    if (entry == nullptr) {
        return DeleteGameResult::EntryNotFound(key);
    }
    const std::filesystem::path path = entry->path;

    std::error_code error{};
    const auto status = std::filesystem::symlink_status(path, error);
    if (!error && !std::filesystem::exists(status)) {
        error = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (error) {
        devlog::warn<grp::library>("Could not delete {}: {}", util::PathString(path), error.message());
        return DeleteGameResult::FilesystemError(error);
    }
    if (std::filesystem::is_directory(status)) {
        std::filesystem::remove_all(path, error);
    } else {
        std::filesystem::remove(path, error);
    }
    if (error) {
        devlog::warn<grp::library>("Could not delete {}: {}", util::PathString(path), error.message());
        return DeleteGameResult::FilesystemError(error);
    }

    devlog::info<grp::library>("Deleted {}", util::PathString(path));
    m_catalog.Remove(key);
    if (auto result = m_store.Save(m_catalog); !result) {
        devlog::warn<grp::library>("Could not save catalog: {}", result.string());
    }
    return DeleteGameResult::Success();
}

bool Library::ClearCache() {
    std::unique_lock lock{m_mutex};
    m_catalog.Clear();
    return m_store.Invalidate();
}

Catalog Library::GetCatalog() const {
    std::unique_lock lock{m_mutex};
    return m_catalog;
}

std::optional<CatalogEntry> Library::FindEntry(const Key &key) const {
    std::unique_lock lock{m_mutex};
    if (const CatalogEntry *entry = m_catalog.Find(key)) {
        return *entry;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Launching

launch::LaunchResult Library::SelectEmulator(const CatalogEntry &entry, const LaunchOptions &options,
                                             std::optional<emu::EmulatorProfile> &profile) {
    std::unique_lock lock{m_mutex};
    const emu::EmulatorRegistry &registry = m_config.emulators;
    profile.reset();

    if (options.emulator) {
        const emu::EmulatorProfile *chosen = registry.Find(*options.emulator);
        if (chosen == nullptr) {
            return launch::LaunchResult::MissingEmulator(
                fmt::format("emulator \"{}\" is not configured", *options.emulator));
        }
        profile = *chosen;
        if (options.setDefault) {
            m_config.emulators.SetDefault(entry.platform, *options.emulator);
            if (auto result = SaveConfigLocked(); !result) {
                devlog::warn<grp::library>("Could not save configuration: {}", result.string());
            }
        }
        return launch::LaunchResult::Success({});
    }

    if (const EntryMetadata *metadata = m_config.FindMetadata(entry.key); metadata && metadata->customEmulator) {
        const emu::EmulatorProfile *custom = registry.Find(*metadata->customEmulator);
        if (custom == nullptr) {
            return launch::LaunchResult::MissingEmulator(
                fmt::format("custom emulator \"{}\" is no longer configured", *metadata->customEmulator));
        }
        profile = *custom;
        return launch::LaunchResult::Success({});
    }

    if (const emu::EmulatorProfile *platformDefault = registry.Default(entry.platform)) {
        profile = *platformDefault;
        return launch::LaunchResult::Success({});
    }

    if (IsDirectExecution(entry.platform)) {
        return launch::LaunchResult::Success({});
    }

    const auto candidates = registry.ForSystem(entry.platform);
    if (candidates.empty()) {
        return launch::LaunchResult::MissingEmulator(fmt::format("no emulator handles {}", entry.platform));
    }
    if (candidates.size() > 1) {
        std::vector<std::string> names{};
        for (const emu::EmulatorProfile *candidate : candidates) {
            names.push_back(candidate->name);
        }
        return launch::LaunchResult::AmbiguousEmulator(std::move(names));
    }
    profile = *candidates.front();
    return launch::LaunchResult::Success({});
}

launch::LaunchResult Library::Launch(const Key &key, const LaunchOptions &options) {
    const auto entry = FindEntry(key);
    if (!entry) {
        return launch::LaunchResult::EntryNotFound(key);
    }

    std::optional<emu::EmulatorProfile> profile{};
    if (auto result = SelectEmulator(*entry, options, profile); !result) {
        return result;
    }

    auto result = m_resolver.Resolve(*entry, profile ? &*profile : nullptr);
    if (!result) {
        devlog::info<grp::library>("Cannot launch {}: {}", entry->title, result.string());
        return result;
    }

    launch::ProcessHandle handle{};
    const auto start = play::PlaytimeTracker::Clock::now();
    if (auto spawnResult = Spawn(result.Plan(), handle); !spawnResult) {
        return spawnResult;
    }

    {
        std::unique_lock lock{m_mutex};
        m_config.PushRecent(key);
        if (auto saveResult = SaveConfigLocked(); !saveResult) {
            devlog::warn<grp::library>("Could not save configuration: {}", saveResult.string());
        }
    }

    devlog::info<grp::library>("Launched {}", entry->title);
    if (m_tracker) {
        m_tracker->Track(std::move(handle), key, start);
    }
    return result;
}

launch::LaunchResult Library::Reveal(const Key &key) {
    const auto entry = FindEntry(key);
    if (!entry) {
        return launch::LaunchResult::EntryNotFound(key);
    }
    auto result = m_resolver.Reveal(*entry);
    if (!result) {
        return result;
    }
    launch::ProcessHandle handle{};
    if (auto spawnResult = Spawn(result.Plan(), handle); !spawnResult) {
        return spawnResult;
    }
    return result;
}

launch::LaunchResult Library::RunEmulator(const std::string &name) {
    std::optional<emu::EmulatorProfile> profile{};
    {
        std::unique_lock lock{m_mutex};
        if (const emu::EmulatorProfile *found = m_config.emulators.Find(name)) {
            profile = *found;
        }
    }
    if (!profile) {
        return launch::LaunchResult::MissingEmulator(fmt::format("emulator \"{}\" is not configured", name));
    }

    auto result = m_resolver.RunEmulator(*profile);
    if (!result) {
        return result;
    }
    launch::ProcessHandle handle{};
    if (auto spawnResult = Spawn(result.Plan(), handle); !spawnResult) {
        return spawnResult;
    }
    return result;
}

launch::LaunchResult Library::Spawn(const launch::LaunchPlan &plan, launch::ProcessHandle &handle) {
    std::error_code error{};
    if (!m_spawner.Spawn(plan, handle, error)) {
        return launch::LaunchResult::ProcessStartFailed(error);
    }
    return launch::LaunchResult::Success(plan);
}

void Library::WaitForTrackedLaunches() {
    if (m_tracker) {
        m_tracker->WaitAll();
    }
}

// -----------------------------------------------------------------------------
// Metadata

std::optional<bool> Library::ToggleFavorite(const Key &key) {
    std::unique_lock lock{m_mutex};
    if (!m_catalog.Contains(key)) {
        return std::nullopt;
    }
    const bool favorite = m_config.ToggleFavorite(key);
    if (auto result = SaveConfigLocked(); !result) {
        devlog::warn<grp::library>("Could not save configuration: {}", result.string());
    }
    return favorite;
}

bool Library::SetCustomEmulator(const Key &key, std::optional<std::string> emulator) {
    std::unique_lock lock{m_mutex};
    if (!m_catalog.Contains(key)) {
        return false;
    }
    if (emulator && !m_config.emulators.Contains(*emulator)) {
        return false;
    }
    m_config.MetadataFor(key).customEmulator = std::move(emulator);
    m_config.PruneMetadata(key);
    SyncEntryMetadata(key);
    return static_cast<bool>(SaveConfigLocked());
}

bool Library::SetNotes(const Key &key, std::optional<std::string> notes) {
    std::unique_lock lock{m_mutex};
    if (!m_catalog.Contains(key)) {
        return false;
    }
    m_config.MetadataFor(key).notes = std::move(notes);
    m_config.PruneMetadata(key);
    SyncEntryMetadata(key);
    return static_cast<bool>(SaveConfigLocked());
}

bool Library::SetTags(const Key &key, std::vector<std::string> tags) {
    std::unique_lock lock{m_mutex};
    if (!m_catalog.Contains(key)) {
        return false;
    }
    m_config.MetadataFor(key).tags = std::move(tags);
    m_config.PruneMetadata(key);
    SyncEntryMetadata(key);
    return static_cast<bool>(SaveConfigLocked());
}

void Library::AddPlaytime(const Key &key, double seconds) {
    std::unique_lock lock{m_mutex};
    EntryMetadata &metadata = m_config.MetadataFor(key);
    metadata.playtime = metadata.PlaytimeOrZero() + seconds;
    SyncEntryMetadata(key);

    if (auto result = SaveConfigLocked(); !result) {
        devlog::warn<grp::library>("Could not save configuration: {}", result.string());
    }
    if (auto result = m_store.Save(m_catalog); !result) {
        devlog::warn<grp::library>("Could not save catalog: {}", result.string());
    }
}

// -----------------------------------------------------------------------------
// Configuration

config::ConfigSaveResult Library::SaveConfig() {
    std::unique_lock lock{m_mutex};
    return SaveConfigLocked();
}

config::ConfigSaveResult Library::SaveConfigLocked() {
    // In-memory configuration
    if (m_config.path.empty()) {
        return config::ConfigSaveResult::Success();
    }
    return m_config.Save();
}

void Library::SyncEntryMetadata(const Key &key) {
    CatalogEntry *entry = m_catalog.Find(key);
    if (entry == nullptr) {
        return;
    }
    const EntryMetadata *metadata = m_config.FindMetadata(key);
    entry->metadata = metadata != nullptr ? *metadata : EntryMetadata{};
}

} // namespace ludex
