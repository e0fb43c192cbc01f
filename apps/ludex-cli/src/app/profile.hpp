#pragma once

#include <filesystem>
#include <system_error>

namespace app {

enum class ProfilePath {
    Root,    // Root of the profile       <profile>/
    Config,  // Library configuration     <profile>/ludex.toml
    Catalog, // Catalog cache             <profile>/catalog.json

    _Count,
};

class Profile {
public:
    // Creates the profile pointing to the OS's standard user profile path.
    Profile();

    // Retrieves the OS's standard user profile path:
    // - $XDG_DATA_HOME/Ludex or ~/.local/share/Ludex on Linux and other POSIX systems
    // - ~/Library/Application Support/Ludex on macOS
    // - %APPDATA%\Ludex on Windows
    // Falls back to the current working directory if none of the variables are set.
    static std::filesystem::path GetUserProfilePath();

    // Uses the OS's standard user profile path.
    void UseUserProfilePath();

    // Uses the specified profile path.
    void UseProfilePath(std::filesystem::path path);

    // Creates the profile folder. Returns true if the folder exists or was created successfully.
    bool CreateFolders(std::error_code &error);

    // Gets the specified path relative to the profile path.
    std::filesystem::path GetPath(ProfilePath profPath) const;

private:
    std::filesystem::path m_profilePath;
};

} // namespace app
