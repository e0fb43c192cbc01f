#pragma once

/**
@file
@brief Catalog data model: entries, their metadata overlay and the platform grouping.
*/

#include <ludex/core/types.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ludex {

/// @brief User- and launcher-maintained data attached to a catalog entry.
///
/// The overlay lives in the library configuration and is merged into entries whenever a catalog is built, so it
/// survives rescans as long as the entry's key is unchanged.
struct EntryMetadata {
    std::optional<double> playtime;            ///< Accumulated play time in seconds
    std::optional<std::string> customEmulator; ///< Emulator profile that overrides the platform default
    std::optional<std::string> notes;          ///< Free-form notes
    std::vector<std::string> tags;             ///< Free-form tags

    /// @brief Determines if no field is set.
    bool Empty() const {
        return !playtime && !customEmulator && !notes && tags.empty();
    }

    /// @brief Returns the accumulated playtime, or zero if never played.
    double PlaytimeOrZero() const {
        return playtime.value_or(0.0);
    }

    bool operator==(const EntryMetadata &) const = default;
};

/// @brief A single game in the catalog.
struct CatalogEntry {
    Key key;                     ///< Path-derived identity
    std::string title;           ///< Cleaned display name
    std::filesystem::path path;  ///< Absolute path to the game file or directory
    uint64 size = 0;             ///< Size in bytes, recursive for directories
    Platform platform;           ///< Platform label
    EntryMetadata metadata;      ///< Overlay merged from the library configuration

    bool operator==(const CatalogEntry &) const = default;
};

/// @brief The full set of catalog entries plus their platform grouping.
///
/// Entries are unique by key. The grouping stores keys in insertion order, which for scanned catalogs is walk order.
class Catalog {
public:
    /// @brief Adds an entry. Does nothing if the key is already present.
    /// @param[in] entry the entry to add
    /// @return `true` if the entry was added, `false` if its key was already in the catalog
    bool Add(CatalogEntry entry);

    /// @brief Removes the entry with the given key, if present.
    bool Remove(const Key &key);

    bool Contains(const Key &key) const {
        return m_entries.contains(key);
    }

    CatalogEntry *Find(const Key &key);
    const CatalogEntry *Find(const Key &key) const;

    size_t Size() const {
        return m_entries.size();
    }

    bool Empty() const {
        return m_entries.empty();
    }

    void Clear();

    /// @brief Retrieves the flat key to entry map.
    const std::map<Key, CatalogEntry> &Entries() const {
        return m_entries;
    }

    /// @brief Retrieves the platform to keys grouping.
    const std::map<Platform, std::vector<Key>> &Platforms() const {
        return m_platforms;
    }

    /// @brief Retrieves the entries of one platform in insertion order.
    std::vector<const CatalogEntry *> EntriesFor(std::string_view platform) const;

private:
    std::map<Key, CatalogEntry> m_entries;
    std::map<Platform, std::vector<Key>> m_platforms;
};

/// @brief Derives a display title from a file or directory name.
///
/// Strips the last dotted suffix (and a trailing `.xiso`), removes `[...]` and `(...)` annotations, replaces `.` and
/// `_` with spaces and trims the result. Directory names go through the same steps, so `Game.BLUS30443` becomes
/// `Game`.
///
/// @param[in] name the file or directory name
/// @return the cleaned title
std::string CleanTitle(std::string_view name);

} // namespace ludex
