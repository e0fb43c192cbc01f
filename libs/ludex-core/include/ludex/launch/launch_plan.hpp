#pragma once

/**
@file
@brief Launch plans and launch results.
*/

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace ludex::launch {

/// @brief A fully resolved process invocation.
struct LaunchPlan {
    std::vector<std::string> argv;           ///< Program and arguments; `argv[0]` is the program to run
    std::filesystem::path workingDirectory;  ///< Working directory of the process, empty to inherit
    std::filesystem::path target;            ///< The file or directory the plan launches

    bool operator==(const LaunchPlan &) const = default;
};

/// @brief Outcome of resolving or launching an entry.
struct LaunchResult {
    enum class Type {
        Success,                // value is LaunchPlan
        EntryNotFound,          // value is the key (std::string)
        MissingEmulator,        // value is a description of what is missing (std::string)
        AmbiguousEmulator,      // value is the candidate emulator names (std::vector<std::string>)
        NoLaunchTarget,         // value is the path that has no launchable target (std::filesystem::path)
        PackageRequiresInstall, // value is the package path (std::filesystem::path)
        InvalidArguments,       // value is the argument splitter's message (std::string)
        ProcessStartFailed,     // value is the OS error (std::error_code)
    };

    static LaunchResult Success(LaunchPlan plan) {
        return {.type = Type::Success, .value = std::move(plan)};
    }

    static LaunchResult EntryNotFound(std::string key) {
        return {.type = Type::EntryNotFound, .value = std::move(key)};
    }

    static LaunchResult MissingEmulator(std::string what) {
        return {.type = Type::MissingEmulator, .value = std::move(what)};
    }

    static LaunchResult AmbiguousEmulator(std::vector<std::string> candidates) {
        return {.type = Type::AmbiguousEmulator, .value = std::move(candidates)};
    }

    static LaunchResult NoLaunchTarget(std::filesystem::path path) {
        return {.type = Type::NoLaunchTarget, .value = std::move(path)};
    }

    static LaunchResult PackageRequiresInstall(std::filesystem::path path) {
        return {.type = Type::PackageRequiresInstall, .value = std::move(path)};
    }

    static LaunchResult InvalidArguments(std::string message) {
        return {.type = Type::InvalidArguments, .value = std::move(message)};
    }

    static LaunchResult ProcessStartFailed(std::error_code error) {
        return {.type = Type::ProcessStartFailed, .value = error};
    }

    operator bool() const {
        return type == Type::Success;
    }

    const LaunchPlan &Plan() const {
        return std::get<LaunchPlan>(value);
    }

    /// @brief Retrieves the candidate names of an `AmbiguousEmulator` result.
    const std::vector<std::string> &Candidates() const {
        return std::get<std::vector<std::string>>(value);
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::EntryNotFound: return fmt::format("No catalog entry with key {}", std::get<std::string>(value));
        case Type::MissingEmulator: return fmt::format("Missing emulator: {}", std::get<std::string>(value));
        case Type::AmbiguousEmulator:
            return fmt::format("Several emulators can run this game: {}", fmt::join(Candidates(), ", "));
        case Type::NoLaunchTarget:
            return fmt::format("Nothing to launch in {}", PathValue());
        case Type::PackageRequiresInstall:
            return fmt::format("{} is a package; install it through the emulator first", PathValue());
        case Type::InvalidArguments: return fmt::format("Invalid emulator arguments: {}", std::get<std::string>(value));
        case Type::ProcessStartFailed:
            return fmt::format("Could not start process: {}", std::get<std::error_code>(value).message());
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, LaunchPlan, std::string, std::vector<std::string>, std::filesystem::path,
                 std::error_code>
        value;

private:
    std::string PathValue() const {
        const std::u8string u8 = std::get<std::filesystem::path>(value).u8string();
        return std::string{u8.begin(), u8.end()};
    }
};

} // namespace ludex::launch
