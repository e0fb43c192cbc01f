#include <catch2/catch_test_macros.hpp>

#include <ludex/catalog/catalog.hpp>

namespace catalog {

using ludex::CleanTitle;

TEST_CASE("Titles are cleaned from file names", "[catalog][title]") {
    CHECK(CleanTitle("Mario.sfc") == "Mario");
    CHECK(CleanTitle("Super Mario World (USA).sfc") == "Super Mario World");
    CHECK(CleanTitle("Chrono Trigger (USA) [!].smc") == "Chrono Trigger");
    CHECK(CleanTitle("Final_Fantasy.VI.sfc") == "Final Fantasy VI");
    CHECK(CleanTitle("Halo.xiso.iso") == "Halo");
    CHECK(CleanTitle("  Spaced  .gba") == "Spaced");
    CHECK(CleanTitle("Unterminated (USA.gba") == "Unterminated (USA");
}

TEST_CASE("Directory names lose their last dotted suffix", "[catalog][title]") {
    CHECK(CleanTitle("Demon's Souls [BLUS30443]") == "Demon's Souls");
    CHECK(CleanTitle("Demon's Souls.BLUS30443") == "Demon's Souls");
    CHECK(CleanTitle("Some.Game.v1") == "Some Game");
}

struct TestSubject {
    ludex::Catalog catalog{};

    static ludex::CatalogEntry MakeEntry(std::string key, std::string platform) {
        return {.key = std::move(key), .title = "Game", .path = "/games/game", .size = 1, .platform = std::move(platform)};
    }
};

TEST_CASE_METHOD(TestSubject, "Catalog entries are unique by key", "[catalog]") {
    CHECK(catalog.Add(MakeEntry("a", "Super Nintendo")));
    CHECK_FALSE(catalog.Add(MakeEntry("a", "Game Boy")));
    CHECK(catalog.Size() == 1);
    REQUIRE(catalog.Find("a") != nullptr);
    CHECK(catalog.Find("a")->platform == "Super Nintendo");
}

TEST_CASE_METHOD(TestSubject, "Catalog groups keys by platform in insertion order", "[catalog]") {
    catalog.Add(MakeEntry("b", "Super Nintendo"));
    catalog.Add(MakeEntry("a", "Super Nintendo"));
    catalog.Add(MakeEntry("c", "Game Boy"));

    REQUIRE(catalog.Platforms().size() == 2);
    CHECK(catalog.Platforms().at("Super Nintendo") == std::vector<ludex::Key>{"b", "a"});

    const auto snes = catalog.EntriesFor("Super Nintendo");
    REQUIRE(snes.size() == 2);
    CHECK(snes[0]->key == "b");
    CHECK(snes[1]->key == "a");

    CHECK(catalog.EntriesFor("PC").empty());

    SECTION("removing the last entry of a platform drops the group") {
        CHECK(catalog.Remove("c"));
        CHECK_FALSE(catalog.Platforms().contains("Game Boy"));
        CHECK_FALSE(catalog.Remove("c"));
    }

    SECTION("clearing empties everything") {
        catalog.Clear();
        CHECK(catalog.Empty());
        CHECK(catalog.Platforms().empty());
    }
}

TEST_CASE("Empty metadata is detected", "[catalog][metadata]") {
    ludex::EntryMetadata metadata{};
    CHECK(metadata.Empty());
    CHECK(metadata.PlaytimeOrZero() == 0.0);

    metadata.tags.push_back("rpg");
    CHECK_FALSE(metadata.Empty());

    metadata = {};
    metadata.playtime = 12.5;
    CHECK(metadata.PlaytimeOrZero() == 12.5);
}

} // namespace catalog
