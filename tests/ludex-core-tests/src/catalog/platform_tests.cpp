#include <catch2/catch_test_macros.hpp>

#include <ludex/catalog/platform.hpp>

namespace platform {

using ludex::Classify;

TEST_CASE("Folder names take precedence over extensions", "[catalog][platform]") {
    CHECK(Classify("/games/ps2/game.iso") == "PlayStation 2");
    CHECK(Classify("/games/ps2/game.nds") == "PlayStation 2");
    CHECK(Classify("/games/SNES/Mario.sfc") == "Super Nintendo");
    CHECK(Classify("/games/Game Boy Advance/sub/dir/Pokemon.zip") == "Game Boy Advance");
}

TEST_CASE("The nearest platform folder wins", "[catalog][platform]") {
    CHECK(Classify("/games/ps2/gba/game.iso") == "Game Boy Advance");
    CHECK(Classify("/games/gba/ps2/game.iso") == "PlayStation 2");
}

TEST_CASE("Folder names match case-insensitively", "[catalog][platform]") {
    CHECK(ludex::PlatformFromFolder("PS2") == "PlayStation 2");
    CHECK(ludex::PlatformFromFolder("Super Nintendo") == "Super Nintendo");
    CHECK(ludex::PlatformFromFolder("MEGA DRIVE") == "Sega Genesis");
    CHECK(ludex::PlatformFromFolder("Roms") == std::nullopt);
}

TEST_CASE("Extensions are used when no folder matches", "[catalog][platform]") {
    CHECK(Classify("/roms/misc/game.sfc") == "Super Nintendo");
    CHECK(Classify("/roms/misc/GAME.GBA") == "Game Boy Advance");
    CHECK(Classify("/roms/misc/game.iso") == "PlayStation 2");
    CHECK(Classify("/roms/misc/game.pkg") == "PlayStation 3");
    CHECK(Classify("/roms/misc/game.exe") == "PC");
    CHECK(Classify("/roms/misc/readme.txt") == std::nullopt);
    CHECK(Classify("/roms/misc/noextension") == std::nullopt);
}

TEST_CASE("The .xiso.iso suffix is checked before plain .iso", "[catalog][platform]") {
    CHECK(Classify("/roms/misc/Halo.xiso.iso") == "Xbox");
    CHECK(Classify("/roms/misc/Halo.XISO.ISO") == "Xbox");
    CHECK(ludex::PlatformFromExtension(".xiso.iso") == "PlayStation 2");
}

TEST_CASE("Platform aliases are normalized", "[catalog][platform]") {
    CHECK(Classify("/roms/misc/Tetris.gbc") == "Game Boy Color");
    CHECK(ludex::NormalizePlatform("Game Boy Color") == "Game Boy");
    CHECK(ludex::NormalizePlatform("Game Boy") == "Game Boy");
    CHECK(ludex::NormalizePlatform("Super Nintendo") == "Super Nintendo");
}

TEST_CASE("Only PC entries run directly", "[catalog][platform]") {
    CHECK(ludex::IsDirectExecution("PC"));
    CHECK_FALSE(ludex::IsDirectExecution("PlayStation 3"));
    CHECK_FALSE(ludex::IsDirectExecution("Super Nintendo"));
}

TEST_CASE("PlayStation 3 folders are nested packages", "[catalog][platform]") {
    const ludex::NestedPackageRule *rule = ludex::FindNestedPackageRule("PlayStation 3");
    REQUIRE(rule != nullptr);
    CHECK(rule->marker == "PS3_GAME");
    CHECK(rule->executable == "PS3_GAME/USRDIR/EBOOT.BIN");

    CHECK(ludex::FindNestedPackageRule("PlayStation 2") == nullptr);
    CHECK(ludex::NestedPackageRules().size() == 1);
}

} // namespace platform
