#include <ludex/catalog/platform.hpp>

#include <ludex/util/string_ops.hpp>

#include <array>
#include <string>
#include <unordered_map>

namespace ludex {

// clang-format off
static const std::unordered_map<std::string_view, std::string_view> kFolderPlatforms = {
    {"gamecube", "GameCube"},
    {"gc",       "GameCube"},
    {"wii",      "Wii"},

    {"playstation 2", "PlayStation 2"},
    {"ps2",           "PlayStation 2"},
    {"playstation 3", "PlayStation 3"},
    {"ps3",           "PlayStation 3"},

    {"nintendo switch", "Nintendo Switch"},
    {"switch",          "Nintendo Switch"},

    {"playstation",          "PlayStation"},
    {"psx",                  "PlayStation"},
    {"ps1",                  "PlayStation"},
    {"psp",                  "PSP"},
    {"playstation portable", "PSP"},

    {"xbox",     "Xbox"},
    {"xbox 360", "Xbox 360"},
    {"x360",     "Xbox 360"},

    {"nintendo 3ds", "Nintendo 3DS"},
    {"3ds",          "Nintendo 3DS"},
    {"nintendo ds",  "Nintendo DS"},
    {"ds",           "Nintendo DS"},

    {"dreamcast", "Dreamcast"},
    {"dc",        "Dreamcast"},

    {"super nintendo", "Super Nintendo"},
    {"snes",           "Super Nintendo"},

    {"sega genesis", "Sega Genesis"},
    {"genesis",      "Sega Genesis"},
    {"mega drive",   "Sega Genesis"},

    {"turbografx-16", "TurboGrafx-16"},
    {"pc engine",     "TurboGrafx-16"},

    {"game boy",          "Game Boy"},
    {"gb",                "Game Boy"},
    {"game boy color",    "Game Boy Color"},
    {"gbc",               "Game Boy Color"},
    {"game boy advance",  "Game Boy Advance"},
    {"gba",               "Game Boy Advance"},

    {"sega game gear", "Sega Game Gear"},
    {"gg",             "Sega Game Gear"},
    {"atari lynx",     "Atari Lynx"},
    {"lynx",           "Atari Lynx"},

    {"pc",       "PC"},
    {"pc games", "PC"},
    {"windows",  "PC"},
};

static const std::unordered_map<std::string_view, std::string_view> kExtensionPlatforms = {
    {".iso",  "PlayStation 2"},
    {".pkg",  "PlayStation 3"},
    {".gcz",  "GameCube"},
    {".rvz",  "GameCube"},
    {".wbfs", "Wii"},
    {".xci",  "Nintendo Switch"},
    {".nsp",  "Nintendo Switch"},
    {".chd",  "PlayStation"},
    {".cue",  "PlayStation"},
    {".bin",  "PlayStation"},
    {".cso",  "PSP"},
    {".3ds",  "Nintendo 3DS"},
    {".cci",  "Nintendo 3DS"},
    {".nds",  "Nintendo DS"},
    {".gdi",  "Dreamcast"},
    {".cdi",  "Dreamcast"},
    {".z64",  "Nintendo 64"},
    {".sfc",  "Super Nintendo"},
    {".smc",  "Super Nintendo"},
    {".md",   "Sega Genesis"},
    {".smd",  "Sega Genesis"},
    {".gen",  "Sega Genesis"},
    {".pce",  "TurboGrafx-16"},
    {".gb",   "Game Boy"},
    {".gbc",  "Game Boy Color"},
    {".gba",  "Game Boy Advance"},
    {".gg",   "Sega Game Gear"},
    {".lnx",  "Atari Lynx"},

    {".exe",      "PC"},
    {".lnk",      "PC"},
    {".url",      "PC"},
    {".desktop",  "PC"},
    {".appimage", "PC"},
};

static constexpr std::array<NestedPackageRule, 1> kNestedPackageRules = {{
    {.platform = kPlatformPS3, .marker = "PS3_GAME", .executable = "PS3_GAME/USRDIR/EBOOT.BIN"},
}};
// clang-format on

static constexpr std::string_view kXisoSuffix = ".xiso.iso";

std::optional<Platform> PlatformFromFolder(std::string_view dirName) {
    const std::string lower = util::ToLower(dirName);
    if (auto it = kFolderPlatforms.find(lower); it != kFolderPlatforms.end()) {
        return Platform{it->second};
    }
    return std::nullopt;
}

std::optional<Platform> PlatformFromExtension(const std::filesystem::path &file) {
    const std::string name = util::ToLower(util::FileName(file));

    if (name.size() > kXisoSuffix.size() && name.ends_with(kXisoSuffix)) {
        return Platform{"Xbox"};
    }

    const size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return std::nullopt;
    }
    if (auto it = kExtensionPlatforms.find(std::string_view{name}.substr(dot)); it != kExtensionPlatforms.end()) {
        return Platform{it->second};
    }
    return std::nullopt;
}

std::optional<Platform> Classify(const std::filesystem::path &path) {
    std::filesystem::path current = path.parent_path();
    while (!current.empty()) {
        const std::string name = util::FileName(current);
        if (!name.empty()) {
            if (auto platform = PlatformFromFolder(name)) {
                return platform;
            }
        }

        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = std::move(parent);
    }

    return PlatformFromExtension(path);
}

Platform NormalizePlatform(std::string_view platform) {
    if (platform == kPlatformGameBoyColor) {
        return Platform{kPlatformGameBoy};
    }
    return Platform{platform};
}

bool IsDirectExecution(std::string_view platform) {
    return platform == kPlatformPC;
}

std::span<const NestedPackageRule> NestedPackageRules() {
    return kNestedPackageRules;
}

const NestedPackageRule *FindNestedPackageRule(std::string_view platform) {
    for (const NestedPackageRule &rule : kNestedPackageRules) {
        if (rule.platform == platform) {
            return &rule;
        }
    }
    return nullptr;
}

} // namespace ludex
