#include <ludex/config/library_config.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/string_ops.hpp>

#include <algorithm>
#include <cerrno>
#include <fstream>

namespace ludex::config {

namespace grp {

    struct config {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Config";
    };

} // namespace grp

// -------------------------------------------------------------------------------------------------
// Parsers

template <typename T>
static void Parse(toml::node_view<toml::node> &node, T &value) {
    if (auto opt = node.value<T>()) {
        value = *opt;
    }
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

static void Parse(toml::node_view<toml::node> &node, std::filesystem::path &value) {
    if (auto opt = node.value<std::string>()) {
        value = util::PathFromString(*opt);
    }
}

static void Parse(toml::node_view<toml::node> &node, const char *name, std::filesystem::path &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, std::optional<T> &value) {
    if (auto opt = node[name].value<T>()) {
        value = *opt;
    }
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, std::vector<T> &value) {
    if (toml::array *arr = node[name].as_array()) {
        value.clear();
        for (toml::node &item : *arr) {
            toml::node_view view{item};
            Parse(view, value.emplace_back());
        }
    }
}

// -------------------------------------------------------------------------------------------------
// Value-to-TOML converters

static std::string ToTOML(const std::filesystem::path &value) {
    return util::PathString(value);
}

static const std::string &ToTOML(const std::string &value) {
    return value;
}

template <typename T>
static toml::array ToTOML(const std::vector<T> &value) {
    toml::array out{};
    for (auto &item : value) {
        out.push_back(ToTOML(item));
    }
    return out;
}

static toml::table ToTOML(const emu::EmulatorProfile &profile) {
    // clang-format off
    return toml::table{{
        {"Path", ToTOML(profile.executablePath)},
        {"Systems", ToTOML(profile.systems)},
        {"Args", profile.argsTemplate},
    }};
    // clang-format on
}

static toml::table ToTOML(const EntryMetadata &metadata) {
    toml::table out{};
    if (metadata.playtime) {
        out.insert_or_assign("Playtime", *metadata.playtime);
    }
    if (metadata.customEmulator) {
        out.insert_or_assign("CustomEmulator", *metadata.customEmulator);
    }
    if (metadata.notes) {
        out.insert_or_assign("Notes", *metadata.notes);
    }
    if (!metadata.tags.empty()) {
        out.insert_or_assign("Tags", ToTOML(metadata.tags));
    }
    return out;
}

// -------------------------------------------------------------------------------------------------
// Implementation

void LibraryConfig::ResetToDefaults() {
    libraryRoots.clear();
    emulators.Clear();
    favorites.clear();
    recents.clear();
    metadata.clear();
}

ConfigLoadResult LibraryConfig::Load(const std::filesystem::path &path) {
    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        ResetToDefaults();
        this->path = path;
        devlog::info<grp::config>("No configuration at {}; using defaults", util::PathString(path));
        return ConfigLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.native());
    if (parseResult.failed()) {
        return ConfigLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return ConfigLoadResult::UnsupportedConfigVersion(configVersion);
    }

    ResetToDefaults();
    this->path = path;

    {
        toml::node_view<toml::node> root{data};
        Parse(root, "LibraryRoots", libraryRoots);
        Parse(root, "Favorites", favorites);
        Parse(root, "Recents", recents);
    }
    if (recents.size() > kMaxRecents) {
        recents.resize(kMaxRecents);
    }

    if (toml::table *tblEmulators = data["Emulators"].as_table()) {
        for (auto &&[name, node] : *tblEmulators) {
            toml::node_view<toml::node> view{node};
            emu::EmulatorProfile profile{.name = std::string{name.str()}};
            Parse(view, "Path", profile.executablePath);
            std::vector<std::string> systems{};
            Parse(view, "Systems", systems);
            for (auto &system : systems) {
                profile.AddSystem(system);
            }
            Parse(view, "Args", profile.argsTemplate);
            if (!emulators.Add(std::move(profile))) {
                devlog::warn<grp::config>("Ignoring invalid emulator entry \"{}\"", name.str());
            }
        }
    }

    if (toml::table *tblDefaults = data["PlatformDefaults"].as_table()) {
        for (auto &&[platform, node] : *tblDefaults) {
            if (auto opt = node.value<std::string>()) {
                emulators.RestoreDefault(platform.str(), *opt);
            }
        }
    }

    if (toml::table *tblMetadata = data["Metadata"].as_table()) {
        for (auto &&[key, node] : *tblMetadata) {
            toml::node_view<toml::node> view{node};
            EntryMetadata entryMetadata{};
            Parse(view, "Playtime", entryMetadata.playtime);
            Parse(view, "CustomEmulator", entryMetadata.customEmulator);
            Parse(view, "Notes", entryMetadata.notes);
            Parse(view, "Tags", entryMetadata.tags);
            if (!entryMetadata.Empty()) {
                metadata.emplace(Key{key.str()}, std::move(entryMetadata));
            }
        }
    }

    devlog::info<grp::config>("Loaded {}: {} roots, {} emulators, {} metadata records", util::PathString(path),
                              libraryRoots.size(), emulators.Profiles().size(), metadata.size());
    return ConfigLoadResult::Success();
}

ConfigSaveResult LibraryConfig::Save() const {
    toml::table tblEmulators{};
    for (const auto &[name, profile] : emulators.Profiles()) {
        tblEmulators.insert_or_assign(name, ToTOML(profile));
    }

    toml::table tblDefaults{};
    for (const auto &[platform, name] : emulators.Defaults()) {
        tblDefaults.insert_or_assign(platform, name);
    }

    toml::table tblMetadata{};
    for (const auto &[key, entryMetadata] : metadata) {
        if (!entryMetadata.Empty()) {
            tblMetadata.insert_or_assign(key, ToTOML(entryMetadata));
        }
    }

    // clang-format off
    auto tbl = toml::table{{
        {"ConfigVersion", kConfigVersion},
        {"LibraryRoots", ToTOML(libraryRoots)},
        {"Favorites", ToTOML(favorites)},
        {"Recents", ToTOML(recents)},
        {"Emulators", std::move(tblEmulators)},
        {"PlatformDefaults", std::move(tblDefaults)},
        {"Metadata", std::move(tblMetadata)},
    }};
    // clang-format on

    std::error_code error{};
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), error);
        if (error) {
            return ConfigSaveResult::FilesystemError(error);
        }
    }

    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out << tbl;
    if (!out) {
        error = std::error_code{errno, std::generic_category()};
        return ConfigSaveResult::FilesystemError(error);
    }

    devlog::debug<grp::config>("Saved {}", util::PathString(path));
    return ConfigSaveResult::Success();
}

// Roots compare equal if they name the same location after normalization
static bool SameRoot(const std::filesystem::path &lhs, const std::filesystem::path &rhs) {
    auto normalize = [](const std::filesystem::path &path) {
        std::filesystem::path out = path.lexically_normal();
        if (!out.has_filename() && out.has_relative_path()) {
            out = out.parent_path();
        }
        return out;
    };
    return normalize(lhs) == normalize(rhs);
}

bool LibraryConfig::AddRoot(const std::filesystem::path &root) {
    if (root.empty()) {
        return false;
    }
    const bool exists =
        std::any_of(libraryRoots.begin(), libraryRoots.end(), [&](const auto &item) { return SameRoot(item, root); });
    if (exists) {
        return false;
    }
    libraryRoots.push_back(root);
    return true;
}

bool LibraryConfig::RemoveRoot(const std::filesystem::path &root) {
    return std::erase_if(libraryRoots, [&](const auto &item) { return SameRoot(item, root); }) > 0;
}

bool LibraryConfig::IsFavorite(const Key &key) const {
    return std::find(favorites.begin(), favorites.end(), key) != favorites.end();
}

bool LibraryConfig::ToggleFavorite(const Key &key) {
    if (std::erase(favorites, key) > 0) {
        return false;
    }
    favorites.push_back(key);
    return true;
}

void LibraryConfig::PushRecent(const Key &key) {
    std::erase(recents, key);
    recents.insert(recents.begin(), key);
    if (recents.size() > kMaxRecents) {
        recents.resize(kMaxRecents);
    }
}

EntryMetadata &LibraryConfig::MetadataFor(const Key &key) {
    return metadata[key];
}

const EntryMetadata *LibraryConfig::FindMetadata(const Key &key) const {
    auto it = metadata.find(key);
    return it != metadata.end() ? &it->second : nullptr;
}

void LibraryConfig::PruneMetadata(const Key &key) {
    auto it = metadata.find(key);
    if (it != metadata.end() && it->second.Empty()) {
        metadata.erase(it);
    }
}

} // namespace ludex::config
