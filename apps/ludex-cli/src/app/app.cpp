#include "app.hpp"

#include "format.hpp"

#include <ludex/catalog/platform.hpp>
#include <ludex/emu/emulator_detector.hpp>
#include <ludex/launch/process.hpp>
#include <ludex/store/catalog_store.hpp>
#include <ludex/version.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/string_ops.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstdio>
#include <functional>
#include <map>
#include <string_view>
#include <vector>

namespace grp {

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "App";
};

} // namespace grp

using namespace ludex;

namespace app {

static std::string Join(const std::vector<std::string> &words, size_t first) {
    std::string out{};
    for (size_t i = first; i < words.size(); ++i) {
        if (!out.empty()) {
            out += ' ';
        }
        out += words[i];
    }
    return out;
}

App::App() = default;

int App::Run(const CommandLineOptions &options) {
    m_options = options;
    devlog::SetRuntimeLevel(options.verbose ? devlog::level::debug : devlog::level::warn);
    devlog::debug<grp::base>("Ludex {}", version::fullstring);

    if (!options.profilePath.empty()) {
        m_profile.UseProfilePath(options.profilePath);
    } else {
        m_profile.UseUserProfilePath();
    }

    std::error_code error{};
    if (!m_profile.CreateFolders(error)) {
        fmt::print(stderr, "Could not create profile directory {}: {}\n",
                   util::PathString(m_profile.GetPath(ProfilePath::Root)), error.message());
        return 1;
    }

    if (auto result = m_config.Load(m_profile.GetPath(ProfilePath::Config)); !result) {
        fmt::print(stderr, "Could not load configuration: {}\n", result.string());
        return 1;
    }

    store::CatalogStore catalogStore{m_profile.GetPath(ProfilePath::Catalog)};
    launch::BoostProcessSpawner spawner{};
    launch::ChildProcessWatcher watcher{};
    Library library{m_config, catalogStore, spawner, &watcher};

    if (auto result = library.LoadCatalog(); result.type == store::CatalogLoadResult::Type::MalformedCache) {
        fmt::print(stderr, "{}; run `ludex scan` to rebuild the catalog\n", result.string());
    }

    const std::map<std::string_view, std::function<int()>> commands = {
        {"scan", [&] { return CmdScan(library); }},
        {"list", [&] { return CmdList(library); }},
        {"info", [&] { return CmdInfo(library); }},
        {"launch", [&] { return CmdLaunch(library); }},
        {"reveal", [&] { return CmdReveal(library); }},
        {"favorite", [&] { return CmdFavorite(library); }},
        {"set-emulator", [&] { return CmdSetEmulator(library); }},
        {"notes", [&] { return CmdNotes(library); }},
        {"tags", [&] { return CmdTags(library); }},
        {"delete", [&] { return CmdDelete(library); }},
        {"roots", [&] { return CmdRoots(); }},
        {"emulators", [&] { return CmdEmulators(library); }},
        {"defaults", [&] { return CmdDefaults(); }},
        {"cache", [&] { return CmdCache(library); }},
    };

    const std::string command = options.command.empty() ? "list" : options.command;
    auto it = commands.find(command);
    if (it == commands.end()) {
        fmt::print(stderr, "Unknown command \"{}\". Run `ludex --help` for usage.\n", command);
        return 1;
    }
    return it->second();
}

// -----------------------------------------------------------------------------
// Catalog commands

int App::CmdScan(Library &library) {
    if (m_config.libraryRoots.empty()) {
        fmt::print(stderr, "No library roots configured. Add one with `ludex roots add <path>`.\n");
        return 1;
    }

    auto unreadableRoots = library.Rescan([](const scan::ScanProgress &progress) {
        if (progress.processed % 256 == 0 || progress.processed == progress.total) {
            fmt::print(stderr, "\rScanning... {}/{}", progress.processed, progress.total);
        }
    });
    fmt::print(stderr, "\n");

    if (!unreadableRoots) {
        fmt::print(stderr, "A scan is already in progress.\n");
        return 1;
    }
    for (const auto &root : *unreadableRoots) {
        fmt::print(stderr, "Could not read {}; its games were kept from the previous scan\n", util::PathString(root));
    }

    const Catalog catalog = library.GetCatalog();
    fmt::print("{} games found in {} platforms\n", catalog.Size(), catalog.Platforms().size());
    for (const auto &[platform, keys] : catalog.Platforms()) {
        fmt::print("  {:<20} {}\n", platform, keys.size());
    }
    return 0;
}

int App::CmdList(Library &library) {
    const Catalog catalog = library.GetCatalog();
    std::vector<const CatalogEntry *> entries{};

    if (m_options.recents) {
        for (const Key &key : m_config.recents) {
            if (const CatalogEntry *entry = catalog.Find(key)) {
                entries.push_back(entry);
            }
        }
    } else {
        for (const auto &[key, entry] : catalog.Entries()) {
            entries.push_back(&entry);
        }
    }

    const std::string search = util::ToLower(m_options.search);
    std::erase_if(entries, [&](const CatalogEntry *entry) {
        if (!m_options.platform.empty() && !util::EqualsIgnoreCase(entry->platform, m_options.platform)) {
            return true;
        }
        if (!search.empty() && util::ToLower(entry->title).find(search) == std::string::npos) {
            return true;
        }
        if (m_options.favorites && !m_config.IsFavorite(entry->key)) {
            return true;
        }
        return false;
    });

    const std::string sort = m_options.sort.empty() ? (m_options.recents ? "" : "name") : m_options.sort;
    if (sort == "name") {
        std::stable_sort(entries.begin(), entries.end(), [](const CatalogEntry *lhs, const CatalogEntry *rhs) {
            return util::ToLower(lhs->title) < util::ToLower(rhs->title);
        });
    } else if (sort == "size") {
        std::stable_sort(entries.begin(), entries.end(),
                         [](const CatalogEntry *lhs, const CatalogEntry *rhs) { return lhs->size > rhs->size; });
    } else if (sort == "size-asc") {
        std::stable_sort(entries.begin(), entries.end(),
                         [](const CatalogEntry *lhs, const CatalogEntry *rhs) { return lhs->size < rhs->size; });
    } else if (sort == "playtime") {
        std::stable_sort(entries.begin(), entries.end(), [](const CatalogEntry *lhs, const CatalogEntry *rhs) {
            return lhs->metadata.PlaytimeOrZero() > rhs->metadata.PlaytimeOrZero();
        });
    } else if (!sort.empty()) {
        fmt::print(stderr, "Unknown sort order \"{}\"; use name, size, size-asc or playtime\n", sort);
        return 1;
    }

    if (entries.empty()) {
        fmt::print(stderr, "No games. Add a library root with `ludex roots add <path>` and run `ludex scan`.\n");
        return 0;
    }

    for (const CatalogEntry *entry : entries) {
        fmt::print("{} {} {:<18} {:<40} {:>10}  {}\n", entry->key, m_config.IsFavorite(entry->key) ? '*' : ' ',
                   entry->platform, entry->title, FormatSize(entry->size), FormatPlaytime(entry->metadata.playtime));
    }
    return 0;
}

int App::CmdInfo(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }

    const EntryMetadata &metadata = entry->metadata;
    fmt::print("Title:     {}\n", entry->title);
    fmt::print("Platform:  {}\n", entry->platform);
    fmt::print("Path:      {}\n", util::PathString(entry->path));
    fmt::print("Size:      {}\n", FormatSize(entry->size));
    fmt::print("Key:       {}\n", entry->key);
    fmt::print("Favorite:  {}\n", m_config.IsFavorite(entry->key) ? "yes" : "no");
    fmt::print("Playtime:  {}\n", FormatPlaytime(metadata.playtime));
    if (metadata.customEmulator) {
        fmt::print("Emulator:  {}\n", *metadata.customEmulator);
    } else if (auto name = m_config.emulators.DefaultName(entry->platform)) {
        fmt::print("Emulator:  {} (platform default)\n", *name);
    }
    if (metadata.notes) {
        fmt::print("Notes:     {}\n", *metadata.notes);
    }
    if (!metadata.tags.empty()) {
        fmt::print("Tags:      {}\n", fmt::join(metadata.tags, ", "));
    }
    return 0;
}

int App::CmdLaunch(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }

    LaunchOptions launchOptions{};
    if (!m_options.emulator.empty()) {
        launchOptions.emulator = m_options.emulator;
        launchOptions.setDefault = m_options.setDefault;
    }

    auto result = library.Launch(entry->key, launchOptions);
    if (!result) {
        fmt::print(stderr, "{}\n", result.string());
        if (result.type == launch::LaunchResult::Type::AmbiguousEmulator) {
            fmt::print(stderr, "Pick one with --emulator <name>, optionally with --set-default.\n");
        }
        return 1;
    }

    fmt::print("Launching {}...\n", entry->title);
    devlog::debug<grp::base>("Command line: {}", fmt::join(result.Plan().argv, " "));
    library.WaitForTrackedLaunches();

    if (auto updated = library.FindEntry(entry->key)) {
        fmt::print("Total playtime: {}\n", FormatPlaytime(updated->metadata.playtime));
    }
    return 0;
}

int App::CmdReveal(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }
    if (auto result = library.Reveal(entry->key); !result) {
        fmt::print(stderr, "{}\n", result.string());
        return 1;
    }
    return 0;
}

int App::CmdFavorite(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }
    if (auto favorite = library.ToggleFavorite(entry->key)) {
        fmt::print("{} {} favorites\n", entry->title, *favorite ? "added to" : "removed from");
        return 0;
    }
    return 1;
}

int App::CmdSetEmulator(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }

    std::optional<std::string> emulator{};
    if (m_options.args.size() > 1) {
        emulator = Join(m_options.args, 1);
        if (!m_config.emulators.Contains(*emulator)) {
            fmt::print(stderr, "Emulator \"{}\" is not configured\n", *emulator);
            return 1;
        }
    }
    if (!library.SetCustomEmulator(entry->key, emulator)) {
        fmt::print(stderr, "Could not update {}\n", entry->title);
        return 1;
    }
    if (emulator) {
        fmt::print("{} will launch with {}\n", entry->title, *emulator);
    } else {
        fmt::print("{} will launch with the platform default\n", entry->title);
    }
    return 0;
}

int App::CmdNotes(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }
    std::optional<std::string> notes{};
    if (m_options.args.size() > 1) {
        notes = Join(m_options.args, 1);
    }
    return library.SetNotes(entry->key, std::move(notes)) ? 0 : 1;
}

int App::CmdTags(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }
    std::vector<std::string> tags{m_options.args.begin() + 1, m_options.args.end()};
    return library.SetTags(entry->key, std::move(tags)) ? 0 : 1;
}

int App::CmdDelete(Library &library) {
    auto entry = ResolveEntryArg(library);
    if (!entry) {
        return 1;
    }
    if (!m_options.confirmDelete) {
        fmt::print(stderr, "This permanently deletes {} from disk. Run again with --yes to confirm.\n",
                   util::PathString(entry->path));
        return 1;
    }
    if (auto result = library.DeleteGame(entry->key); !result) {
        fmt::print(stderr, "{}\n", result.string());
        return 1;
    }
    fmt::print("Deleted {}\n", util::PathString(entry->path));
    return 0;
}

// -----------------------------------------------------------------------------
// Configuration commands

int App::CmdRoots() {
    const std::string sub = m_options.args.empty() ? "list" : m_options.args[0];
    if (sub == "list") {
        for (const auto &root : m_config.libraryRoots) {
            fmt::print("{}\n", util::PathString(root));
        }
        return 0;
    }

    if (m_options.args.size() < 2) {
        fmt::print(stderr, "Usage: ludex roots {} <path>\n", sub);
        return 1;
    }
    const std::filesystem::path root = util::PathFromString(Join(m_options.args, 1));

    if (sub == "add") {
        std::error_code error{};
        const std::filesystem::path absRoot = std::filesystem::absolute(root, error);
        if (!std::filesystem::is_directory(absRoot, error)) {
            fmt::print(stderr, "Warning: {} is not a readable directory\n", util::PathString(absRoot));
        }
        if (!m_config.AddRoot(error ? root : absRoot)) {
            fmt::print(stderr, "{} is already a library root\n", util::PathString(root));
            return 1;
        }
        return SaveConfig();
    }
    if (sub == "remove") {
        std::error_code error{};
        const std::filesystem::path absRoot = std::filesystem::absolute(root, error);
        if (!m_config.RemoveRoot(root) && !m_config.RemoveRoot(absRoot)) {
            fmt::print(stderr, "{} is not a library root\n", util::PathString(root));
            return 1;
        }
        return SaveConfig();
    }

    fmt::print(stderr, "Unknown roots command \"{}\"; use list, add or remove\n", sub);
    return 1;
}

int App::CmdEmulators(Library &library) {
    emu::EmulatorRegistry &registry = m_config.emulators;
    const std::string sub = m_options.args.empty() ? "list" : m_options.args[0];

    if (sub == "list") {
        for (const auto &[name, profile] : registry.Profiles()) {
            fmt::print("{}\n", name);
            fmt::print("  Path:    {}\n", util::PathString(profile.executablePath));
            fmt::print("  Systems: {}\n", fmt::join(profile.systems, ", "));
            if (!profile.argsTemplate.empty()) {
                fmt::print("  Args:    {}\n", profile.argsTemplate);
            }
        }
        return 0;
    }

    if (m_options.args.size() < 2) {
        fmt::print(stderr, "Usage: ludex emulators {} <{}>\n", sub, sub == "add" || sub == "scan" ? "path" : "name");
        return 1;
    }
    const std::string arg = Join(m_options.args, 1);

    if (sub == "add") {
        const std::filesystem::path exe = util::PathFromString(arg);
        emu::EmulatorProfile profile{};
        if (!m_options.name.empty()) {
            profile.name = m_options.name;
            profile.executablePath = exe;
        } else if (auto detected = emu::Detect(exe)) {
            profile = std::move(*detected);
        } else {
            fmt::print(stderr, "{} is not a known emulator; pass --name and --systems\n", util::FileName(exe));
            return 1;
        }
        if (!m_options.systems.empty()) {
            profile.systems.clear();
            for (const auto &system : m_options.systems) {
                profile.AddSystem(util::Trim(system));
            }
        }
        if (!m_options.emulatorArgs.empty()) {
            profile.argsTemplate = m_options.emulatorArgs;
        }

        const std::string name = profile.name;
        if (!registry.Add(std::move(profile))) {
            fmt::print(stderr, "An emulator named \"{}\" already exists\n", name);
            return 1;
        }
        fmt::print("Added {}\n", name);
        return SaveConfig();
    }

    if (sub == "edit") {
        const emu::EmulatorProfile *current = registry.Find(arg);
        if (current == nullptr) {
            fmt::print(stderr, "Emulator \"{}\" is not configured\n", arg);
            return 1;
        }
        emu::EmulatorProfile profile = *current;
        if (!m_options.name.empty()) {
            profile.name = m_options.name;
        }
        if (!m_options.systems.empty()) {
            profile.systems.clear();
            for (const auto &system : m_options.systems) {
                profile.AddSystem(util::Trim(system));
            }
        }
        if (!m_options.emulatorArgs.empty()) {
            profile.argsTemplate = m_options.emulatorArgs;
        }
        if (!registry.Update(arg, std::move(profile))) {
            fmt::print(stderr, "An emulator named \"{}\" already exists\n", m_options.name);
            return 1;
        }
        return SaveConfig();
    }

    if (sub == "remove") {
        if (!registry.Remove(arg)) {
            fmt::print(stderr, "Emulator \"{}\" is not configured\n", arg);
            return 1;
        }
        return SaveConfig();
    }

    if (sub == "scan") {
        const size_t added = emu::ScanForEmulators(util::PathFromString(arg), registry);
        fmt::print("Found {} new emulators\n", added);
        return added > 0 ? SaveConfig() : 0;
    }

    if (sub == "run") {
        if (auto result = library.RunEmulator(arg); !result) {
            fmt::print(stderr, "{}\n", result.string());
            return 1;
        }
        return 0;
    }

    fmt::print(stderr, "Unknown emulators command \"{}\"; use list, add, edit, remove, scan or run\n", sub);
    return 1;
}

int App::CmdDefaults() {
    emu::EmulatorRegistry &registry = m_config.emulators;
    const std::string sub = m_options.args.empty() ? "list" : m_options.args[0];

    if (sub == "list") {
        for (const auto &[platform, name] : registry.Defaults()) {
            fmt::print("{:<20} {}{}\n", platform, name, registry.Contains(name) ? "" : " (missing)");
        }
        return 0;
    }

    if (sub == "set" && m_options.args.size() >= 3) {
        if (!registry.SetDefault(m_options.args[1], Join(m_options.args, 2))) {
            fmt::print(stderr, "Emulator \"{}\" is not configured\n", Join(m_options.args, 2));
            return 1;
        }
        return SaveConfig();
    }

    if (sub == "clear" && m_options.args.size() >= 2) {
        const std::string platform = Join(m_options.args, 1);
        if (!registry.ClearDefault(platform)) {
            fmt::print(stderr, "{} has no default emulator\n", platform);
            return 1;
        }
        return SaveConfig();
    }

    fmt::print(stderr, "Usage: ludex defaults list | set <platform> <emulator> | clear <platform>\n");
    return 1;
}

int App::CmdCache(Library &library) {
    if (m_options.args.empty() || m_options.args[0] != "clear") {
        fmt::print(stderr, "Usage: ludex cache clear\n");
        return 1;
    }
    if (library.ClearCache()) {
        fmt::print("Catalog cache cleared\n");
    }
    return 0;
}

// -----------------------------------------------------------------------------
// Helpers

std::optional<CatalogEntry> App::ResolveEntryArg(Library &library) const {
    if (m_options.args.empty()) {
        fmt::print(stderr, "Usage: ludex {} <key>\n", m_options.command);
        return std::nullopt;
    }
    const std::string prefix = util::ToLower(m_options.args[0]);

    if (auto entry = library.FindEntry(prefix)) {
        return entry;
    }

    const Catalog catalog = library.GetCatalog();
    std::vector<const CatalogEntry *> matches{};
    for (const auto &[key, entry] : catalog.Entries()) {
        if (key.starts_with(prefix)) {
            matches.push_back(&entry);
        }
    }
    if (matches.empty()) {
        fmt::print(stderr, "No game with key {}\n", prefix);
        return std::nullopt;
    }
    if (matches.size() > 1) {
        fmt::print(stderr, "Key prefix {} matches {} games\n", prefix, matches.size());
        return std::nullopt;
    }
    return *matches.front();
}

int App::SaveConfig() {
    if (auto result = m_config.Save(); !result) {
        fmt::print(stderr, "Could not save configuration: {}\n", result.string());
        return 1;
    }
    return 0;
}

} // namespace app
