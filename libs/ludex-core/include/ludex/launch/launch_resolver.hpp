#pragma once

/**
@file
@brief Launch resolution.

Turns a catalog entry, plus an emulator profile where one is needed, into a `LaunchPlan`: the concrete file to run and
the process invocation that runs it.
*/

#include "launch_plan.hpp"

#include <ludex/catalog/catalog.hpp>
#include <ludex/emu/emulator_profile.hpp>

#include <filesystem>
#include <optional>

namespace ludex::launch {

/// @brief Determines if a file is a shortcut that must be handed to the host's opener.
bool IsShortcut(const std::filesystem::path &path);

/// @brief Determines if a file can be run directly: a known executable or shortcut extension, or, on POSIX hosts, a
/// regular file with an execute permission bit.
bool IsLaunchableFile(const std::filesystem::path &path);

/// @brief Picks the program to run from a folder-based game.
///
/// Launchable immediate children are considered in name order. The first one whose name contains "game" wins, then
/// the first whose name contains "launch", then the first one found.
///
/// @param[in] dir the game folder
/// @return the chosen file, or `std::nullopt` if the folder has no launchable files
std::optional<std::filesystem::path> FindFolderExecutable(const std::filesystem::path &dir);

class LaunchResolver {
public:
    /// @brief Creates a resolver that opens shortcuts with the host's default opener.
    LaunchResolver();

    /// @brief Creates a resolver that opens shortcuts with the given program.
    explicit LaunchResolver(std::filesystem::path shellOpener);

    /// @brief Resolves how to launch an entry.
    ///
    /// Direct-execution platforms need no profile; when one is given it is used like an emulator. Every other platform
    /// requires a profile. Nested-package containers are resolved to their inner executable when present.
    ///
    /// @param[in] entry the entry to launch
    /// @param[in] profile the emulator to launch it with, or `nullptr`
    /// @return the launch plan, or the reason the entry cannot be launched
    LaunchResult Resolve(const CatalogEntry &entry, const emu::EmulatorProfile *profile) const;

    /// @brief Builds a plan that shows the entry's location in the host's file manager.
    LaunchResult Reveal(const CatalogEntry &entry) const;

    /// @brief Builds a plan that starts an emulator on its own, without a game.
    LaunchResult RunEmulator(const emu::EmulatorProfile &profile) const;

    const std::filesystem::path &ShellOpener() const {
        return m_shellOpener;
    }

private:
    std::filesystem::path m_shellOpener;

    LaunchResult ResolveDirect(const std::filesystem::path &target) const;
    LaunchResult ResolveWithEmulator(const std::filesystem::path &target, const emu::EmulatorProfile &profile) const;
};

} // namespace ludex::launch
