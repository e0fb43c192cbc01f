#include <catch2/catch_test_macros.hpp>

#include <ludex/config/library_config.hpp>

#include <support/temp_dir.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace library_config {

using namespace ludex::config;

struct TestSubject {
    testutil::TempDir dir{};
    std::filesystem::path configPath = dir / "profile/ludex.toml";

    static LibraryConfig MakeConfig() {
        LibraryConfig config{};
        config.libraryRoots = {"/games", "/mnt/usb/roms"};
        config.emulators.Add({
            .name = "[Auto] Dolphin",
            .executablePath = "/opt/dolphin/dolphin-emu",
            .systems = {"GameCube", "Wii"},
            .argsTemplate = "-b -e %ROM%",
        });
        config.emulators.Add({
            .name = "RetroArch SNES",
            .executablePath = "/usr/bin/retroarch",
            .systems = {"Super Nintendo"},
            .argsTemplate = "",
        });
        config.emulators.SetDefault("GameCube", "[Auto] Dolphin");
        config.favorites = {"aaaa", "bbbb"};
        config.recents = {"bbbb", "cccc"};

        ludex::EntryMetadata &metadata = config.MetadataFor("aaaa");
        metadata.playtime = 7265.5;
        metadata.customEmulator = "RetroArch SNES";
        metadata.notes = "Save before the boss";
        metadata.tags = {"rpg", "co-op"};
        return config;
    }
};

TEST_CASE_METHOD(TestSubject, "Configuration survives a save and load", "[config]") {
    LibraryConfig config = MakeConfig();
    config.path = configPath;
    REQUIRE(config.Save());
    CHECK(std::filesystem::is_regular_file(configPath));

    LibraryConfig loaded{};
    REQUIRE(loaded.Load(configPath));

    CHECK(loaded.path == configPath);
    CHECK(loaded.libraryRoots == config.libraryRoots);
    CHECK(loaded.emulators == config.emulators);
    CHECK(loaded.favorites == config.favorites);
    CHECK(loaded.recents == config.recents);
    CHECK(loaded.metadata == config.metadata);
}

TEST_CASE_METHOD(TestSubject, "A missing configuration file yields defaults", "[config]") {
    LibraryConfig config = MakeConfig();
    REQUIRE(config.Load(configPath));

    CHECK(config.path == configPath);
    CHECK(config.libraryRoots.empty());
    CHECK(config.emulators.Profiles().empty());
    CHECK(config.favorites.empty());
    CHECK(config.recents.empty());
    CHECK(config.metadata.empty());
}

TEST_CASE_METHOD(TestSubject, "Configuration files from newer versions are refused", "[config]") {
    dir.WriteText("profile/ludex.toml", fmt::format("ConfigVersion = {}\nLibraryRoots = [\"/games\"]\n",
                                                    kConfigVersion + 1));

    LibraryConfig config = MakeConfig();
    const ConfigLoadResult result = config.Load(configPath);

    CHECK(result.type == ConfigLoadResult::Type::UnsupportedConfigVersion);
    CHECK(config.libraryRoots == MakeConfig().libraryRoots);
}

TEST_CASE_METHOD(TestSubject, "Invalid TOML is reported", "[config]") {
    dir.WriteText("profile/ludex.toml", "LibraryRoots = [\"/games\"\n");

    LibraryConfig config{};
    const ConfigLoadResult result = config.Load(configPath);

    CHECK(result.type == ConfigLoadResult::Type::TOMLParseError);
    CHECK_FALSE(result.string().empty());
}

TEST_CASE_METHOD(TestSubject, "Missing keys fall back to defaults", "[config]") {
    dir.WriteText("profile/ludex.toml", "LibraryRoots = [\"/games\"]\n"
                                        "[Emulators.mGBA]\n"
                                        "Path = \"/usr/bin/mgba\"\n"
                                        "Systems = [\"Game Boy Advance\"]\n");

    LibraryConfig config{};
    REQUIRE(config.Load(configPath));

    CHECK(config.libraryRoots == std::vector<std::filesystem::path>{"/games"});
    const ludex::emu::EmulatorProfile *mgba = config.emulators.Find("mGBA");
    REQUIRE(mgba != nullptr);
    CHECK(mgba->executablePath == "/usr/bin/mgba");
    CHECK(mgba->argsTemplate.empty());
    CHECK(mgba->Supports("game boy advance"));
    CHECK(config.favorites.empty());
}

TEST_CASE("Recently played games are capped and deduplicated", "[config][recents]") {
    LibraryConfig config{};
    for (int i = 0; i < 25; ++i) {
        config.PushRecent(fmt::format("key{}", i));
    }

    REQUIRE(config.recents.size() == kMaxRecents);
    CHECK(config.recents.front() == "key24");
    CHECK(config.recents.back() == "key5");

    config.PushRecent("key10");
    CHECK(config.recents.size() == kMaxRecents);
    CHECK(config.recents.front() == "key10");
    CHECK(std::count(config.recents.begin(), config.recents.end(), "key10") == 1);
}

TEST_CASE("Favorites are toggled", "[config][favorites]") {
    LibraryConfig config{};

    CHECK(config.ToggleFavorite("aaaa"));
    CHECK(config.IsFavorite("aaaa"));
    CHECK_FALSE(config.ToggleFavorite("aaaa"));
    CHECK_FALSE(config.IsFavorite("aaaa"));
    CHECK(config.favorites.empty());
}

TEST_CASE("Library roots are unique", "[config][roots]") {
    LibraryConfig config{};

    CHECK(config.AddRoot("/games"));
    CHECK_FALSE(config.AddRoot("/games/"));
    CHECK_FALSE(config.AddRoot("/games/./snes/.."));
    CHECK_FALSE(config.AddRoot(""));
    CHECK(config.AddRoot("/roms"));
    CHECK(config.libraryRoots.size() == 2);

    CHECK(config.RemoveRoot("/games/"));
    CHECK_FALSE(config.RemoveRoot("/games"));
    CHECK(config.libraryRoots == std::vector<std::filesystem::path>{"/roms"});
}

TEST_CASE("Empty metadata records are pruned", "[config][metadata]") {
    LibraryConfig config{};
    config.MetadataFor("aaaa").notes = "note";
    config.PruneMetadata("aaaa");
    REQUIRE(config.FindMetadata("aaaa") != nullptr);

    config.MetadataFor("aaaa").notes.reset();
    config.PruneMetadata("aaaa");
    CHECK(config.FindMetadata("aaaa") == nullptr);
}

} // namespace library_config
