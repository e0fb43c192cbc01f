#pragma once

/**
@file
@brief Platform classification.

Maps filesystem paths to platform labels using two signals: the names of the ancestor directories and the file
extension. Folder names always win over extensions.
*/

#include <ludex/core/types.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

namespace ludex {

/// @brief The direct-execution platform. Entries on this platform run without an emulator.
inline constexpr std::string_view kPlatformPC = "PC";

inline constexpr std::string_view kPlatformPS3 = "PlayStation 3";
inline constexpr std::string_view kPlatformGameBoy = "Game Boy";
inline constexpr std::string_view kPlatformGameBoyColor = "Game Boy Color";

/// @brief Describes a platform whose games are stored as a directory bundle with the executable nested inside.
struct NestedPackageRule {
    std::string_view platform;   ///< Platform assigned to containers matching this rule
    std::string_view marker;     ///< Name of the subdirectory that identifies a container
    std::string_view executable; ///< Path of the executable relative to the container
};

/// @brief Looks up the platform of a directory name.
/// @param[in] dirName the directory name, matched case-insensitively
/// @return the platform label, or `std::nullopt` if the name is not a known platform folder
std::optional<Platform> PlatformFromFolder(std::string_view dirName);

/// @brief Looks up the platform of a file by its extension.
///
/// The compound `.xiso.iso` suffix is checked before the plain extension.
///
/// @param[in] file the file path
/// @return the platform label, or `std::nullopt` if the extension is unknown
std::optional<Platform> PlatformFromExtension(const std::filesystem::path &file);

/// @brief Classifies a path.
///
/// Walks up the parent directories of `path` and returns the platform of the first one whose name is a known platform
/// folder. If none matches, falls back to the extension of `path`.
///
/// @param[in] path the path to classify
/// @return the platform label, or `std::nullopt` if the path is not a game
std::optional<Platform> Classify(const std::filesystem::path &path);

/// @brief Collapses platform aliases into the label that gets stored in the catalog.
Platform NormalizePlatform(std::string_view platform);

/// @brief Determines if entries of the platform are executed directly rather than through an emulator.
bool IsDirectExecution(std::string_view platform);

/// @brief Retrieves all nested package rules.
std::span<const NestedPackageRule> NestedPackageRules();

/// @brief Retrieves the nested package rule of a platform.
/// @return a pointer to the rule, or `nullptr` if the platform has none
const NestedPackageRule *FindNestedPackageRule(std::string_view platform);

} // namespace ludex
