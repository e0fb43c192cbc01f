#include "profile.hpp"

#include <cstdlib>
#include <string>

namespace app {

// Must match the order listed in the ProfilePath enum.
const std::filesystem::path kPathSuffixes[] = {
    "",             // Root
    "ludex.toml",   // Config
    "catalog.json", // Catalog
};

static const char *GetEnv(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr && *value != '\0' ? value : nullptr;
}

static std::filesystem::path FromEnv(const char *value) {
    const std::string str = value;
    return std::filesystem::path{std::u8string{str.begin(), str.end()}};
}

Profile::Profile() {
    UseUserProfilePath();
}

std::filesystem::path Profile::GetUserProfilePath() {
#if defined(_WIN32)
    if (const char *appData = GetEnv("APPDATA")) {
        return FromEnv(appData) / "Ludex";
    }
#elif defined(__APPLE__)
    if (const char *home = GetEnv("HOME")) {
        return FromEnv(home) / "Library" / "Application Support" / "Ludex";
    }
#else
    if (const char *dataHome = GetEnv("XDG_DATA_HOME")) {
        return FromEnv(dataHome) / "Ludex";
    }
    if (const char *home = GetEnv("HOME")) {
        return FromEnv(home) / ".local" / "share" / "Ludex";
    }
#endif
    std::error_code error{};
    std::filesystem::path cwd = std::filesystem::current_path(error);
    return error ? std::filesystem::path{"."} : cwd;
}

void Profile::UseUserProfilePath() {
    m_profilePath = GetUserProfilePath();
}

void Profile::UseProfilePath(std::filesystem::path path) {
    m_profilePath = std::move(path);
}

bool Profile::CreateFolders(std::error_code &error) {
    error.clear();
    if (!std::filesystem::is_directory(m_profilePath)) {
        std::filesystem::create_directories(m_profilePath, error);
    }
    return !error;
}

std::filesystem::path Profile::GetPath(ProfilePath profPath) const {
    const auto index = static_cast<size_t>(profPath);
    if (index < std::size(kPathSuffixes)) {
        return m_profilePath / kPathSuffixes[index];
    } else {
        return m_profilePath / "";
    }
}

} // namespace app
