#include <ludex/emu/emulator_registry.hpp>

namespace ludex::emu {

bool EmulatorRegistry::Add(EmulatorProfile profile) {
    if (profile.name.empty() || m_profiles.contains(profile.name)) {
        return false;
    }
    std::string name = profile.name;
    m_profiles.emplace(std::move(name), std::move(profile));
    return true;
}

bool EmulatorRegistry::Update(std::string_view name, EmulatorProfile profile) {
    auto it = m_profiles.find(name);
    if (it == m_profiles.end() || profile.name.empty()) {
        return false;
    }
    if (profile.name == name) {
        it->second = std::move(profile);
        return true;
    }
    if (m_profiles.contains(profile.name)) {
        return false;
    }

    for (auto &[platform, emulator] : m_defaults) {
        if (emulator == name) {
            emulator = profile.name;
        }
    }
    m_profiles.erase(it);
    std::string newName = profile.name;
    m_profiles.emplace(std::move(newName), std::move(profile));
    return true;
}

bool EmulatorRegistry::Remove(std::string_view name) {
    auto it = m_profiles.find(name);
    if (it == m_profiles.end()) {
        return false;
    }
    std::erase_if(m_defaults, [&](const auto &item) { return item.second == name; });
    m_profiles.erase(it);
    return true;
}

const EmulatorProfile *EmulatorRegistry::Find(std::string_view name) const {
    auto it = m_profiles.find(name);
    return it != m_profiles.end() ? &it->second : nullptr;
}

std::vector<const EmulatorProfile *> EmulatorRegistry::ForSystem(std::string_view platform) const {
    std::vector<const EmulatorProfile *> out{};
    for (const auto &[name, profile] : m_profiles) {
        if (profile.Supports(platform)) {
            out.push_back(&profile);
        }
    }
    return out;
}

bool EmulatorRegistry::SetDefault(std::string_view platform, std::string_view name) {
    if (!m_profiles.contains(name)) {
        return false;
    }
    RestoreDefault(platform, name);
    return true;
}

bool EmulatorRegistry::ClearDefault(std::string_view platform) {
    auto it = m_defaults.find(platform);
    if (it == m_defaults.end()) {
        return false;
    }
    m_defaults.erase(it);
    return true;
}

std::optional<std::string> EmulatorRegistry::DefaultName(std::string_view platform) const {
    auto it = m_defaults.find(platform);
    if (it == m_defaults.end()) {
        return std::nullopt;
    }
    return it->second;
}

const EmulatorProfile *EmulatorRegistry::Default(std::string_view platform) const {
    auto it = m_defaults.find(platform);
    if (it == m_defaults.end()) {
        return nullptr;
    }
    return Find(it->second);
}

void EmulatorRegistry::RestoreDefault(std::string_view platform, std::string_view name) {
    auto it = m_defaults.find(platform);
    if (it != m_defaults.end()) {
        it->second = name;
    } else {
        m_defaults.emplace(Platform{platform}, std::string{name});
    }
}

void EmulatorRegistry::Clear() {
    m_profiles.clear();
    m_defaults.clear();
}

} // namespace ludex::emu
