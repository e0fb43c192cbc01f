#include <ludex/catalog/catalog.hpp>

#include <ludex/util/string_ops.hpp>

#include <algorithm>

namespace ludex {

bool Catalog::Add(CatalogEntry entry) {
    if (m_entries.contains(entry.key)) {
        return false;
    }
    m_platforms[entry.platform].push_back(entry.key);
    const Key key = entry.key;
    m_entries.emplace(key, std::move(entry));
    return true;
}

bool Catalog::Remove(const Key &key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return false;
    }

    auto bucketIt = m_platforms.find(it->second.platform);
    if (bucketIt != m_platforms.end()) {
        std::erase(bucketIt->second, key);
        if (bucketIt->second.empty()) {
            m_platforms.erase(bucketIt);
        }
    }
    m_entries.erase(it);
    return true;
}

CatalogEntry *Catalog::Find(const Key &key) {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? &it->second : nullptr;
}

const CatalogEntry *Catalog::Find(const Key &key) const {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? &it->second : nullptr;
}

void Catalog::Clear() {
    m_entries.clear();
    m_platforms.clear();
}

std::vector<const CatalogEntry *> Catalog::EntriesFor(std::string_view platform) const {
    std::vector<const CatalogEntry *> out{};
    auto it = m_platforms.find(Platform{platform});
    if (it == m_platforms.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (const Key &key : it->second) {
        if (const CatalogEntry *entry = Find(key)) {
            out.push_back(entry);
        }
    }
    return out;
}

// Removes every bracketed group opened by `open` and closed by the nearest following `close`.
// An unterminated group is kept as-is.
static std::string StripGroups(std::string str, char open, char close) {
    size_t start = str.find(open);
    while (start != std::string::npos) {
        const size_t end = str.find(close, start + 1);
        if (end == std::string::npos) {
            break;
        }
        str.erase(start, end - start + 1);
        start = str.find(open, start);
    }
    return str;
}

std::string CleanTitle(std::string_view name) {
    std::string title{name};

    // Stem: drop the last extension unless the name is a dotfile. Directory names are treated the same way.
    const size_t dot = title.rfind('.');
    if (dot != std::string::npos && dot != 0) {
        title.resize(dot);
    }
    constexpr std::string_view kXisoSuffix = ".xiso";
    if (title.size() > kXisoSuffix.size() &&
        util::EqualsIgnoreCase(std::string_view{title}.substr(title.size() - kXisoSuffix.size()), kXisoSuffix)) {
        title.resize(title.size() - kXisoSuffix.size());
    }

    title = StripGroups(std::move(title), '[', ']');
    title = StripGroups(std::move(title), '(', ')');
    std::replace(title.begin(), title.end(), '.', ' ');
    std::replace(title.begin(), title.end(), '_', ' ');

    return std::string{util::Trim(title)};
}

} // namespace ludex
