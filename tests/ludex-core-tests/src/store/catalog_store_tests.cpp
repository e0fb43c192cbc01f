#include <catch2/catch_test_macros.hpp>

#include <ludex/store/catalog_store.hpp>

#include <support/temp_dir.hpp>

#include <fstream>
#include <iterator>

namespace catalog_store {

using namespace ludex::store;

struct TestSubject {
    testutil::TempDir dir{};
    CatalogStore store{dir / "cache/catalog.json"};

    static ludex::Catalog MakeCatalog() {
        ludex::Catalog catalog{};
        catalog.Add({
            .key = "0123456789abcdef0123456789abcdef",
            .title = "Mario",
            .path = "/games/SNES/Mario.sfc",
            .size = 2097152,
            .platform = "Super Nintendo",
            .metadata = {},
        });

        ludex::CatalogEntry zelda{
            .key = "fedcba9876543210fedcba9876543210",
            .title = "Zelda \"Minish Cap\"",
            .path = "/games/GBA/Zelda.gba",
            .size = 16777216,
            .platform = "Game Boy Advance",
            .metadata = {},
        };
        zelda.metadata.playtime = 5400.25;
        zelda.metadata.customEmulator = "[Auto] mGBA";
        zelda.metadata.notes = "Finished the second dungeon";
        zelda.metadata.tags = {"adventure", "handheld"};
        catalog.Add(std::move(zelda));
        return catalog;
    }
};

TEST_CASE_METHOD(TestSubject, "Catalogs survive a save and load", "[store]") {
    const ludex::Catalog catalog = MakeCatalog();
    REQUIRE(store.Save(catalog));
    CHECK(std::filesystem::is_regular_file(store.Path()));

    ludex::Catalog loaded{};
    REQUIRE(store.Load(loaded));

    CHECK(loaded.Entries() == catalog.Entries());
    CHECK(loaded.Platforms() == catalog.Platforms());
}

TEST_CASE_METHOD(TestSubject, "Saving an empty catalog produces a loadable cache", "[store]") {
    REQUIRE(store.Save(ludex::Catalog{}));

    ludex::Catalog loaded = MakeCatalog();
    REQUIRE(store.Load(loaded));
    CHECK(loaded.Empty());
}

TEST_CASE_METHOD(TestSubject, "Saving leaves no temporary file behind", "[store]") {
    REQUIRE(store.Save(MakeCatalog()));
    auto tmpPath = store.Path();
    tmpPath += ".tmp";
    CHECK_FALSE(std::filesystem::exists(tmpPath));
}

TEST_CASE_METHOD(TestSubject, "Sizes and playtimes are written as JSON numbers", "[store]") {
    REQUIRE(store.Save(MakeCatalog()));

    std::ifstream in{store.Path(), std::ios::binary};
    const std::string contents{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

    CHECK(contents.find(R"("size":2097152)") != std::string::npos);
    CHECK(contents.find(R"("playtime":5400.25)") != std::string::npos);
    CHECK(contents.find(R"("tags":["adventure","handheld"])") != std::string::npos);
}

TEST_CASE_METHOD(TestSubject, "Caches written by hand with integer playtimes load", "[store]") {
    dir.WriteText("cache/catalog.json", R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": 0, )"
                                        R"("platform": "Super Nintendo", "hash": "abc", "playtime": 60}})");

    ludex::Catalog loaded{};
    REQUIRE(store.Load(loaded));
    REQUIRE(loaded.Find("abc") != nullptr);
    CHECK(loaded.Find("abc")->size == 0);
    CHECK(loaded.Find("abc")->metadata.playtime == 60.0);
}

TEST_CASE_METHOD(TestSubject, "Loading a missing cache reports NotFound", "[store]") {
    ludex::Catalog loaded = MakeCatalog();
    const CatalogLoadResult result = store.Load(loaded);

    CHECK(result.type == CatalogLoadResult::Type::NotFound);
    CHECK(loaded.Empty());
}

TEST_CASE_METHOD(TestSubject, "Malformed caches are rejected and deleted", "[store]") {
    std::string contents{};

    SECTION("not JSON") {
        contents = "this is not json";
    }
    SECTION("truncated") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc")";
    }
    SECTION("top-level array") {
        contents = R"([{"title": "Mario"}])";
    }
    SECTION("entry is not an object") {
        contents = R"({"abc": "Mario"})";
    }
    SECTION("missing field") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": 1, "platform": "Super Nintendo"}})";
    }
    SECTION("mistyped size") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": "big", )"
                   R"("platform": "Super Nintendo", "hash": "abc"}})";
    }
    SECTION("mistyped title") {
        contents = R"({"abc": {"title": {"text": "Mario"}, "path": "/games/Mario.sfc", "size": 1, )"
                   R"("platform": "Super Nintendo", "hash": "abc"}})";
    }
    SECTION("numeric title") {
        contents = R"({"abc": {"title": 42, "path": "/games/Mario.sfc", "size": 1, )"
                   R"("platform": "Super Nintendo", "hash": "abc"}})";
    }
    SECTION("boolean platform") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": 1, )"
                   R"("platform": true, "hash": "abc"}})";
    }
    SECTION("negative size") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": -1, )"
                   R"("platform": "Super Nintendo", "hash": "abc"}})";
    }
    SECTION("fractional size") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": 1.5, )"
                   R"("platform": "Super Nintendo", "hash": "abc"}})";
    }
    SECTION("mistyped tags") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": 1, )"
                   R"("platform": "Super Nintendo", "hash": "abc", "tags": ["platformer", 3]}})";
    }
    SECTION("mistyped playtime") {
        contents = R"({"abc": {"title": "Mario", "path": "/games/Mario.sfc", "size": 1, )"
                   R"("platform": "Super Nintendo", "hash": "abc", "playtime": "forever"}})";
    }

    dir.WriteText("cache/catalog.json", contents);

    ludex::Catalog loaded = MakeCatalog();
    const CatalogLoadResult result = store.Load(loaded);

    CHECK(result.type == CatalogLoadResult::Type::MalformedCache);
    CHECK(loaded.Empty());
    CHECK_FALSE(std::filesystem::exists(store.Path()));
}

TEST_CASE_METHOD(TestSubject, "Invalidating deletes the cache", "[store]") {
    REQUIRE(store.Save(MakeCatalog()));
    CHECK(store.Invalidate());
    CHECK_FALSE(std::filesystem::exists(store.Path()));
    CHECK_FALSE(store.Invalidate());

    ludex::Catalog loaded{};
    CHECK(store.Load(loaded).type == CatalogLoadResult::Type::NotFound);
}

} // namespace catalog_store
