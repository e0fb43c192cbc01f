#include <ludex/store/catalog_store.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/scope_guard.hpp>
#include <ludex/util/string_ops.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <fstream>
#include <optional>

using nlohmann::json;

namespace ludex::store {

namespace grp {

    struct store {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "CatalogStore";
    };

} // namespace grp

// Retrieves a string field. Missing fields and values of any other type yield nothing.
static std::optional<std::string> GetString(const json &node, const char *name) {
    auto it = node.find(name);
    if (it == node.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Parses one entry record. Returns an error description if the record is invalid.
static std::optional<std::string> ParseEntry(const std::string &key, const json &node, CatalogEntry &entry) {
    if (!node.is_object()) {
        return fmt::format("entry {} is not an object", key);
    }

    auto title = GetString(node, "title");
    auto path = GetString(node, "path");
    auto platform = GetString(node, "platform");
    auto hash = GetString(node, "hash");
    auto size = node.find("size");
    if (!title || !path || !platform || !hash || size == node.end()) {
        return fmt::format("entry {} is missing a required field", key);
    }
    // Non-negative integers are parsed as unsigned; negative ones and fractions are not sizes
    if (!size->is_number_unsigned()) {
        return fmt::format("entry {} has an invalid size", key);
    }

    entry.key = key;
    entry.title = std::move(*title);
    entry.path = util::PathFromString(*path);
    entry.size = size->get<uint64>();
    entry.platform = std::move(*platform);

    if (auto it = node.find("playtime"); it != node.end()) {
        if (!it->is_number()) {
            return fmt::format("entry {} has an invalid playtime", key);
        }
        entry.metadata.playtime = it->get<double>();
    }
    if (auto it = node.find("custom_emulator"); it != node.end()) {
        if (!it->is_string()) {
            return fmt::format("entry {} has an invalid custom emulator", key);
        }
        entry.metadata.customEmulator = it->get<std::string>();
    }
    if (auto it = node.find("notes"); it != node.end()) {
        if (!it->is_string()) {
            return fmt::format("entry {} has invalid notes", key);
        }
        entry.metadata.notes = it->get<std::string>();
    }
    if (auto it = node.find("tags"); it != node.end()) {
        if (!it->is_array()) {
            return fmt::format("entry {} has invalid tags", key);
        }
        for (const json &tag : *it) {
            if (!tag.is_string()) {
                return fmt::format("entry {} has invalid tags", key);
            }
            entry.metadata.tags.push_back(tag.get<std::string>());
        }
    }
    return std::nullopt;
}

static json ToJSON(const CatalogEntry &entry) {
    json node = {
        {"title", entry.title},
        {"path", util::PathString(entry.path)},
        {"size", entry.size},
        {"platform", entry.platform},
        {"hash", entry.key},
    };

    const EntryMetadata &metadata = entry.metadata;
    if (metadata.playtime) {
        node["playtime"] = *metadata.playtime;
    }
    if (metadata.customEmulator) {
        node["custom_emulator"] = *metadata.customEmulator;
    }
    if (metadata.notes) {
        node["notes"] = *metadata.notes;
    }
    if (!metadata.tags.empty()) {
        node["tags"] = metadata.tags;
    }
    return node;
}

CatalogStore::CatalogStore(std::filesystem::path path)
    : m_path(std::move(path)) {}

CatalogLoadResult CatalogStore::Load(Catalog &catalog) {
    std::unique_lock lock{m_mutex};
    catalog.Clear();

    std::error_code error{};
    if (!std::filesystem::is_regular_file(m_path, error)) {
        return CatalogLoadResult::NotFound();
    }

    auto reject = [&](std::string reason) {
        devlog::warn<grp::store>("Discarding catalog cache {}: {}", util::PathString(m_path), reason);
        catalog.Clear();
        InvalidateImpl();
        return CatalogLoadResult::MalformedCache(std::move(reason));
    };

    json root{};
    {
        std::ifstream in{m_path, std::ios::binary};
        root = json::parse(in, nullptr, false);
    }
    if (root.is_discarded()) {
        return reject("not valid JSON");
    }
    if (!root.is_object()) {
        return reject("top-level value is not an object");
    }

    for (const auto &item : root.items()) {
        CatalogEntry entry{};
        if (auto failure = ParseEntry(item.key(), item.value(), entry)) {
            return reject(std::move(*failure));
        }
        catalog.Add(std::move(entry));
    }

    devlog::info<grp::store>("Loaded {} entries from {}", catalog.Size(), util::PathString(m_path));
    return CatalogLoadResult::Success();
}

CatalogSaveResult CatalogStore::Save(const Catalog &catalog) {
    std::unique_lock lock{m_mutex};

    json root = json::object();
    for (const auto &[key, entry] : catalog.Entries()) {
        root[key] = ToJSON(entry);
    }

    std::error_code error{};
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), error);
        if (error) {
            return CatalogSaveResult::FilesystemError(error);
        }
    }

    std::filesystem::path tmpPath = m_path;
    tmpPath += ".tmp";
    util::ScopeGuard sgRemoveTemp{[&] {
        std::error_code removeError{};
        std::filesystem::remove(tmpPath, removeError);
    }};

    {
        std::ofstream out{tmpPath, std::ios::binary | std::ios::trunc};
        try {
            out << root.dump();
        } catch (const json::type_error &e) {
            // Raised for strings that are not valid UTF-8
            devlog::error<grp::store>("Could not write catalog: {}", e.what());
            return CatalogSaveResult::FilesystemError(std::make_error_code(std::errc::illegal_byte_sequence));
        }
        out.flush();
        if (!out) {
            return CatalogSaveResult::FilesystemError(std::error_code{errno, std::generic_category()});
        }
    }

    std::filesystem::rename(tmpPath, m_path, error);
    if (error) {
        return CatalogSaveResult::FilesystemError(error);
    }
    sgRemoveTemp.Cancel();

    devlog::debug<grp::store>("Saved {} entries to {}", catalog.Size(), util::PathString(m_path));
    return CatalogSaveResult::Success();
}

bool CatalogStore::Invalidate() {
    std::unique_lock lock{m_mutex};
    return InvalidateImpl();
}

bool CatalogStore::InvalidateImpl() {
    std::error_code error{};
    const bool removed = std::filesystem::remove(m_path, error);
    if (error) {
        devlog::warn<grp::store>("Could not delete {}: {}", util::PathString(m_path), error.message());
    }
    return removed;
}

} // namespace ludex::store
