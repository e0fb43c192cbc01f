#pragma once

/**
@file
@brief Registry of configured emulator profiles and per-platform defaults.
*/

#include "emulator_profile.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ludex::emu {

/// @brief Holds emulator profiles keyed by their unique names, plus the platform to default emulator mapping.
class EmulatorRegistry {
public:
    /// @brief Adds a profile.
    /// @param[in] profile the profile to add
    /// @return `false` if the name is empty or another profile already uses it
    bool Add(EmulatorProfile profile);

    /// @brief Replaces the profile named `name` with `profile`, which may carry a new name.
    ///
    /// Renaming also rewrites platform defaults that pointed at the old name.
    ///
    /// @param[in] name the current name of the profile
    /// @param[in] profile the new profile contents
    /// @return `false` if no profile named `name` exists, or if the new name is taken by another profile
    bool Update(std::string_view name, EmulatorProfile profile);

    /// @brief Removes a profile and every platform default that points at it.
    /// @return `false` if no profile named `name` exists
    bool Remove(std::string_view name);

    const EmulatorProfile *Find(std::string_view name) const;

    bool Contains(std::string_view name) const {
        return Find(name) != nullptr;
    }

    /// @brief Lists the profiles whose systems include `platform` (case-insensitive), in name order.
    std::vector<const EmulatorProfile *> ForSystem(std::string_view platform) const;

    /// @brief Makes `name` the default emulator for `platform`.
    /// @return `false` if no profile named `name` exists
    bool SetDefault(std::string_view platform, std::string_view name);

    /// @brief Removes the default emulator of `platform`.
    /// @return `false` if the platform had no default
    bool ClearDefault(std::string_view platform);

    /// @brief Retrieves the name of the default emulator of `platform`, whether or not it is still registered.
    std::optional<std::string> DefaultName(std::string_view platform) const;

    /// @brief Retrieves the default emulator of `platform`.
    /// @return the profile, or `nullptr` if there is no default or it no longer exists
    const EmulatorProfile *Default(std::string_view platform) const;

    const std::map<std::string, EmulatorProfile, std::less<>> &Profiles() const {
        return m_profiles;
    }

    const std::map<Platform, std::string, std::less<>> &Defaults() const {
        return m_defaults;
    }

    /// @brief Assigns a default without validating the emulator name. Used when loading persisted state.
    void RestoreDefault(std::string_view platform, std::string_view name);

    void Clear();

    bool operator==(const EmulatorRegistry &) const = default;

private:
    std::map<std::string, EmulatorProfile, std::less<>> m_profiles;
    std::map<Platform, std::string, std::less<>> m_defaults;
};

} // namespace ludex::emu
