#pragma once

/**
@file
@brief Catalog persistence.

The catalog cache is a flat JSON object mapping entry keys to entry records. It lets front ends show the library
instantly on startup without rescanning.
*/

#include <ludex/catalog/catalog.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <variant>

namespace ludex::store {

struct CatalogLoadResult {
    enum class Type { Success, NotFound, MalformedCache };

    static CatalogLoadResult Success() {
        return {.type = Type::Success};
    }

    static CatalogLoadResult NotFound() {
        return {.type = Type::NotFound};
    }

    static CatalogLoadResult MalformedCache(std::string reason) {
        return {.type = Type::MalformedCache, .value = std::move(reason)};
    }

    operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::NotFound: return "Catalog cache not found";
        case Type::MalformedCache: return fmt::format("Malformed catalog cache: {}", std::get<std::string>(value));
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, std::string> value;
};

struct CatalogSaveResult {
    enum class Type { Success, FilesystemError };

    static CatalogSaveResult Success() {
        return {.type = Type::Success};
    }

    static CatalogSaveResult FilesystemError(std::error_code error) {
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

/// @brief Loads and saves the catalog cache file. All operations are serialized.
class CatalogStore {
public:
    explicit CatalogStore(std::filesystem::path path);

    /// @brief Loads the catalog from the cache file.
    ///
    /// A cache that cannot be parsed or that has an entry with a missing or mistyped field is deleted and reported as
    /// `MalformedCache`. Callers should treat that the same as `NotFound` and rescan.
    ///
    /// @param[out] catalog receives the loaded catalog; cleared on failure
    /// @return the result of the operation
    CatalogLoadResult Load(Catalog &catalog);

    /// @brief Writes the catalog to the cache file, replacing it atomically.
    CatalogSaveResult Save(const Catalog &catalog);

    /// @brief Deletes the cache file.
    /// @return `true` if a file was deleted
    bool Invalidate();

    const std::filesystem::path &Path() const {
        return m_path;
    }

private:
    std::filesystem::path m_path;
    std::mutex m_mutex;

    bool InvalidateImpl();
};

} // namespace ludex::store
