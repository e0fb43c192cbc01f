#pragma once

/**
@file
@brief Emulator executable detection.

Recognizes well-known emulators by their executable file names and produces ready-to-use profiles for them.
*/

#include "emulator_profile.hpp"
#include "emulator_registry.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace ludex::emu {

/// @brief Signature of a known emulator.
struct KnownEmulator {
    std::string_view name;                     ///< Display name, used to build the profile name
    std::vector<std::string_view> executables; ///< Lower-case substrings matched against the executable file name
    std::vector<std::string_view> systems;     ///< Platforms the emulator handles
};

/// @brief Retrieves the table of known emulators in match priority order.
std::span<const KnownEmulator> KnownEmulators();

/// @brief Builds the profile name given to an auto-detected emulator.
std::string AutoProfileName(std::string_view emulatorName);

/// @brief Matches an executable against the known emulators table.
///
/// The lower-cased file name is tested for each executable substring in table order and the first match wins.
///
/// @param[in] executablePath path to the emulator executable
/// @return a profile named `[Auto] <Name>` with the table's systems and an empty argument template, or `std::nullopt`
/// if the executable is not recognized
std::optional<EmulatorProfile> Detect(const std::filesystem::path &executablePath);

/// @brief Detects every emulator found under a directory and registers the new ones.
///
/// Profiles whose names are already registered are left untouched.
///
/// @param[in] dir the directory to walk recursively
/// @param[in] registry the registry to add profiles to
/// @return the number of profiles added
size_t ScanForEmulators(const std::filesystem::path &dir, EmulatorRegistry &registry);

} // namespace ludex::emu
