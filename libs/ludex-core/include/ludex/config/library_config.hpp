#pragma once

/**
@file
@brief Persisted library configuration.

The library configuration is the process-wide state of the launcher: library roots, emulator profiles and platform
defaults, favorites, recently played games and the per-entry metadata overlay. It is stored as a TOML file in the
profile directory.
*/

#include <ludex/catalog/catalog.hpp>
#include <ludex/emu/emulator_registry.hpp>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace ludex::config {

/// @brief Current version of the configuration file format.
inline constexpr int kConfigVersion = 1;

/// @brief Maximum number of entries in the recently played list.
inline constexpr size_t kMaxRecents = 20;

struct ConfigLoadResult {
    enum class Type { Success, TOMLParseError, UnsupportedConfigVersion };

    static ConfigLoadResult Success() {
        return {.type = Type::Success};
    }

    static ConfigLoadResult TOMLParseError(toml::parse_error error) {
        return {.type = Type::TOMLParseError, .value = error};
    }

    static ConfigLoadResult UnsupportedConfigVersion(int version) {
        return {.type = Type::UnsupportedConfigVersion, .value = version};
    }

    operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::TOMLParseError: //
        {
            auto &error = std::get<toml::parse_error>(value);
            std::ostringstream ss{};
            ss << error.source();
            return fmt::format("TOML parse error: {} (at {})", error.description(), ss.str());
        }
        case Type::UnsupportedConfigVersion:
            return fmt::format("Unsupported configuration version: {}", std::get<int>(value));
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, toml::parse_error, int> value;
};

struct ConfigSaveResult {
    enum class Type { Success, FilesystemError };

    static ConfigSaveResult Success() {
        return {.type = Type::Success};
    }

    static ConfigSaveResult FilesystemError(std::error_code error) {
        return {.type = Type::FilesystemError, .value = error};
    }

    operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::FilesystemError: return fmt::format("Filesystem error: {}", std::get<std::error_code>(value).message());
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, std::error_code> value;
};

/// @brief The library configuration.
///
/// Not thread-safe. Owners that share it across threads must serialize access.
struct LibraryConfig {
    /// @brief Resets every field to its default value. Keeps `path`.
    void ResetToDefaults();

    /// @brief Loads the configuration from the given file and remembers the path for subsequent saves.
    ///
    /// A missing file is not an error: the configuration is reset to defaults.
    ///
    /// @param[in] path the path to the TOML file
    /// @return the result of the operation
    ConfigLoadResult Load(const std::filesystem::path &path);

    /// @brief Writes the configuration to `path`, creating the parent directory if needed.
    ConfigSaveResult Save() const;

    // -------------------------------------------------------------------------
    // Library roots

    /// @brief Adds a library root.
    /// @return `false` if the root is already present
    bool AddRoot(const std::filesystem::path &root);

    /// @brief Removes a library root.
    /// @return `false` if the root was not present
    bool RemoveRoot(const std::filesystem::path &root);

    // -------------------------------------------------------------------------
    // Favorites and recents

    bool IsFavorite(const Key &key) const;

    /// @brief Adds the key to the favorites if absent, removes it otherwise.
    /// @return `true` if the key is now a favorite
    bool ToggleFavorite(const Key &key);

    /// @brief Moves the key to the front of the recents list, dropping the oldest entries past `kMaxRecents`.
    void PushRecent(const Key &key);

    // -------------------------------------------------------------------------
    // Metadata overlay

    /// @brief Retrieves the metadata of a key, creating an empty record if necessary.
    EntryMetadata &MetadataFor(const Key &key);

    /// @brief Retrieves the metadata of a key.
    /// @return a pointer to the record, or `nullptr` if the key has no metadata
    const EntryMetadata *FindMetadata(const Key &key) const;

    /// @brief Removes the metadata record of a key if all of its fields are empty.
    void PruneMetadata(const Key &key);

    std::filesystem::path path;

    std::vector<std::filesystem::path> libraryRoots;
    emu::EmulatorRegistry emulators;
    std::vector<Key> favorites;
    std::vector<Key> recents;
    std::map<Key, EntryMetadata> metadata;
};

} // namespace ludex::config
