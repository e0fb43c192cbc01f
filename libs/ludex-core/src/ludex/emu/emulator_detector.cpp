#include <ludex/emu/emulator_detector.hpp>

#include <ludex/util/dev_log.hpp>
#include <ludex/util/string_ops.hpp>

#include <fmt/format.h>

#include <system_error>

namespace ludex::emu {

namespace grp {

    struct detector {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Detector";
    };

} // namespace grp

// clang-format off
static const std::vector<KnownEmulator> kKnownEmulators = {
    // Handhelds
    {"mGBA",               {"mgba"},                     {"Game Boy", "Game Boy Color", "Game Boy Advance"}},
    {"VisualBoyAdvance-M", {"visualboyadvance-m", "vbam"}, {"Game Boy", "Game Boy Color", "Game Boy Advance"}},
    {"SameBoy",            {"sameboy"},                  {"Game Boy", "Game Boy Color"}},

    // 16-bit consoles
    {"Snes9x",      {"snes9x"},  {"Super Nintendo"}},
    {"Mesen",       {"mesen"},   {"Super Nintendo"}},
    {"Kega Fusion", {"fusion"},  {"Sega Genesis", "Sega Game Gear"}},
    {"BlastEm",     {"blastem"}, {"Sega Genesis"}},

    // Disc-based consoles
    {"Dolphin", {"dolphin"},           {"GameCube", "Wii"}},
    {"PCSX2",   {"pcsx2", "pcsx2-qt"}, {"PlayStation 2"}},
    {"Xemu",    {"xemu"},              {"Xbox"}},
    {"Redream", {"redream"},           {"Dreamcast"}},
    {"Flycast", {"flycast"},           {"Dreamcast"}},

    {"DuckStation",  {"duckstation-qt", "duckstation-nogui"}, {"PlayStation"}},
    {"Project64",    {"project64"},                           {"Nintendo 64"}},
    {"simple64",     {"simple64-gui", "simple64-cli"},        {"Nintendo 64"}},
    {"Mednafen",     {"mednafen"},
                     {"PlayStation", "Sega Saturn", "Super Nintendo", "Sega Genesis", "TurboGrafx-16", "Atari Lynx"}},
    {"YabaSanshiro", {"yabasanshiro"},                        {"Sega Saturn"}},
    {"Kronos",       {"kronos"},                              {"Sega Saturn"}},

    {"RPCS3", {"rpcs3"}, {"PlayStation 3"}},
    {"Xenia", {"xenia"}, {"Xbox 360"}},
};
// clang-format on

std::span<const KnownEmulator> KnownEmulators() {
    return kKnownEmulators;
}

std::string AutoProfileName(std::string_view emulatorName) {
    return fmt::format("[Auto] {}", emulatorName);
}

std::optional<EmulatorProfile> Detect(const std::filesystem::path &executablePath) {
    const std::string fileName = util::ToLower(util::FileName(executablePath));
    if (fileName.empty()) {
        return std::nullopt;
    }

    for (const KnownEmulator &known : kKnownEmulators) {
        for (std::string_view exe : known.executables) {
            if (fileName.find(exe) == std::string::npos) {
                continue;
            }

            EmulatorProfile profile{
                .name = AutoProfileName(known.name),
                .executablePath = executablePath,
                .systems = {},
                .argsTemplate = "",
            };
            for (std::string_view system : known.systems) {
                profile.AddSystem(system);
            }
            devlog::debug<grp::detector>("{} matched {}", fileName, known.name);
            return profile;
        }
    }
    return std::nullopt;
}

size_t ScanForEmulators(const std::filesystem::path &dir, EmulatorRegistry &registry) {
    std::error_code error{};
    auto it = std::filesystem::recursive_directory_iterator(
        dir, std::filesystem::directory_options::skip_permission_denied, error);
    if (error) {
        devlog::warn<grp::detector>("Cannot scan {} for emulators: {}", util::PathString(dir), error.message());
        return 0;
    }

    size_t added = 0;
    for (auto end = std::filesystem::recursive_directory_iterator{}; it != end; it.increment(error)) {
        if (error) {
            devlog::debug<grp::detector>("Stopping emulator scan: {}", error.message());
            break;
        }

        std::error_code typeError{};
        if (!it->is_regular_file(typeError)) {
            continue;
        }
        auto profile = Detect(it->path());
        if (!profile) {
            continue;
        }
        const std::string name = profile->name;
        if (registry.Add(std::move(*profile))) {
            devlog::info<grp::detector>("Registered {} at {}", name, util::PathString(it->path()));
            ++added;
        }
    }
    return added;
}

} // namespace ludex::emu
