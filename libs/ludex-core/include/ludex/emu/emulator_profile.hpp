#pragma once

#include <ludex/core/types.hpp>

#include <ludex/util/string_ops.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ludex::emu {

/// @brief Named configuration of an external emulator.
struct EmulatorProfile {
    std::string name;                     ///< Unique registry name
    std::filesystem::path executablePath; ///< Path to the emulator executable
    std::vector<Platform> systems;        ///< Platforms this emulator handles, in insertion order
    std::string argsTemplate;             ///< Argument string, optionally containing `%ROM%`

    /// @brief Determines if the emulator handles the given platform (case-insensitive).
    bool Supports(std::string_view platform) const {
        return std::any_of(systems.begin(), systems.end(),
                           [&](const Platform &system) { return util::EqualsIgnoreCase(system, platform); });
    }

    /// @brief Adds a system unless it is already listed.
    void AddSystem(std::string_view platform) {
        if (!Supports(platform)) {
            systems.emplace_back(platform);
        }
    }

    bool operator==(const EmulatorProfile &) const = default;
};

} // namespace ludex::emu
