#include <catch2/catch_test_macros.hpp>

#include <ludex/core/identity.hpp>
#include <ludex/scan/library_scanner.hpp>

#include <support/temp_dir.hpp>

#include <algorithm>
#include <future>

namespace library_scanner {

using namespace ludex::scan;

struct TestSubject {
    testutil::TempDir dir{};

    ScanResult Walk(std::vector<std::filesystem::path> roots) const {
        return LibraryScanner::Walk({.roots = std::move(roots)});
    }

    static const ludex::CatalogEntry *FindByTitle(const ludex::Catalog &catalog, std::string_view title) {
        for (const auto &[key, entry] : catalog.Entries()) {
            if (entry.title == title) {
                return &entry;
            }
        }
        return nullptr;
    }
};

TEST_CASE_METHOD(TestSubject, "Scanning builds catalog entries", "[scan]") {
    const auto mario = dir.MakeFile("SNES/Mario.sfc", 2 * 1024 * 1024);
    dir.MakeFile("SNES/readme.txt", 10);

    const ScanResult result = Walk({dir.Path()});

    REQUIRE(result.catalog.Size() == 1);
    const ludex::CatalogEntry &entry = result.catalog.Entries().begin()->second;
    CHECK(entry.title == "Mario");
    CHECK(entry.platform == "Super Nintendo");
    CHECK(entry.size == 2097152);
    CHECK(entry.path == std::filesystem::canonical(mario));
    CHECK(entry.key == ludex::ComputeKey(mario));
    CHECK(entry.metadata.Empty());
    CHECK(result.unreadableRoots.empty());
    CHECK(result.catalog.Platforms().at("Super Nintendo") == std::vector<ludex::Key>{entry.key});
}

TEST_CASE_METHOD(TestSubject, "Scanning normalizes Game Boy Color to Game Boy", "[scan]") {
    dir.MakeFile("roms/Tetris.gbc", 8);

    const ScanResult result = Walk({dir.Path()});

    REQUIRE(result.catalog.Size() == 1);
    CHECK(result.catalog.Entries().begin()->second.platform == "Game Boy");
}

TEST_CASE_METHOD(TestSubject, "Scanning skips hidden files and directories", "[scan]") {
    dir.MakeFile("SNES/.Hidden.sfc", 8);
    dir.MakeFile(".trash/SNES/Deleted.sfc", 8);
    dir.MakeFile("SNES/Visible.sfc", 8);

    const ScanResult result = Walk({dir.Path()});

    REQUIRE(result.catalog.Size() == 1);
    CHECK(FindByTitle(result.catalog, "Visible") != nullptr);
}

TEST_CASE_METHOD(TestSubject, "Scanning the same game twice produces one entry", "[scan]") {
    dir.MakeFile("SNES/Mario.sfc", 8);

    SECTION("duplicate roots") {
        const ScanResult result = Walk({dir.Path(), dir.Path(), dir / "SNES"});
        CHECK(result.catalog.Size() == 1);
    }

#ifndef _WIN32
    SECTION("symlinked file") {
        std::filesystem::create_directories(dir / "links");
        std::filesystem::create_symlink(dir / "SNES/Mario.sfc", dir / "links/Mario.sfc");
        const ScanResult result = Walk({dir.Path()});
        CHECK(result.catalog.Size() == 1);
    }
#endif
}

TEST_CASE_METHOD(TestSubject, "PlayStation 3 game folders become single entries", "[scan][ps3]") {
    const auto game = dir.MakeDir("PS3/Demon's Souls [BLUS30443]");
    dir.MakeFile("PS3/Demon's Souls [BLUS30443]/PS3_GAME/USRDIR/EBOOT.BIN", 1000);
    dir.MakeFile("PS3/Demon's Souls [BLUS30443]/PS3_GAME/USRDIR/data.iso", 24);

    const ScanResult result = Walk({dir.Path()});

    REQUIRE(result.catalog.Size() == 1);
    const ludex::CatalogEntry &entry = result.catalog.Entries().begin()->second;
    CHECK(entry.title == "Demon's Souls");
    CHECK(entry.platform == "PlayStation 3");
    CHECK(entry.path == std::filesystem::canonical(game));
    CHECK(entry.size == 1024);
}

TEST_CASE_METHOD(TestSubject, "PlayStation 3 folder titles drop the serial suffix", "[scan][ps3]") {
    dir.MakeFile("PS3/Demon's Souls.BLUS30443/PS3_GAME/USRDIR/EBOOT.BIN", 16);

    const ScanResult result = Walk({dir.Path()});

    REQUIRE(result.catalog.Size() == 1);
    CHECK(result.catalog.Entries().begin()->second.title == "Demon's Souls");
}

TEST_CASE_METHOD(TestSubject, "Roots are never game folders themselves", "[scan][ps3]") {
    dir.MakeFile("PS3_GAME/PARAM.SFO", 16);
    dir.MakeFile("Mario.sfc", 8);

    const ScanResult result = Walk({dir.Path()});

    // The root is walked like any other library folder
    REQUIRE(result.catalog.Size() == 1);
    CHECK(result.catalog.Entries().begin()->second.title == "Mario");
    // PS3_GAME, PARAM.SFO, Mario.sfc
    CHECK(result.progress.total == 3);
}

TEST_CASE_METHOD(TestSubject, "Scanning reports consistent progress", "[scan][progress]") {
    dir.MakeFile("SNES/A.sfc", 1);
    dir.MakeFile("SNES/B.sfc", 1);
    dir.MakeFile("GBA/C.gba", 1);
    dir.MakeFile("misc/notes.txt", 1);

    std::vector<ScanProgress> updates{};
    const ScanResult result =
        LibraryScanner::Walk({.roots = {dir.Path()}}, [&](const ScanProgress &progress) { updates.push_back(progress); });

    REQUIRE_FALSE(updates.empty());
    for (size_t i = 0; i < updates.size(); ++i) {
        CHECK(updates[i].processed == i + 1);
        CHECK(updates[i].total == result.progress.total);
    }
    // 3 directories, 4 files
    CHECK(result.progress.total == 7);
    CHECK(result.progress.processed == result.progress.total);
    CHECK(result.catalog.Size() == 3);
}

TEST_CASE_METHOD(TestSubject, "Unreadable roots are reported and skipped", "[scan]") {
    dir.MakeFile("SNES/Mario.sfc", 8);
    const auto missing = dir / "unplugged-drive";

    const ScanResult result = Walk({missing, dir.Path()});

    CHECK(result.catalog.Size() == 1);
    REQUIRE(result.unreadableRoots.size() == 1);
    CHECK(result.unreadableRoots[0] == missing);
}

TEST_CASE_METHOD(TestSubject, "Metadata is merged into scanned entries", "[scan][metadata]") {
    const auto mario = dir.MakeFile("SNES/Mario.sfc", 8);
    const ludex::Key key = ludex::ComputeKey(mario);

    ludex::EntryMetadata metadata{};
    metadata.playtime = 3600.0;
    metadata.tags = {"platformer"};

    const ScanResult result = LibraryScanner::Walk({.roots = {dir.Path()}, .metadata = {{key, metadata}}});

    const ludex::CatalogEntry *entry = result.catalog.Find(key);
    REQUIRE(entry != nullptr);
    CHECK(entry->metadata == metadata);
}

TEST_CASE_METHOD(TestSubject, "Background scans deliver progress then a single completion", "[scan][async]") {
    dir.MakeFile("SNES/Mario.sfc", 8);
    dir.MakeFile("GBA/Zelda.gba", 8);

    LibraryScanner scanner{};
    auto session = scanner.Scan({.roots = {dir.Path()}});
    REQUIRE(session != nullptr);

    std::vector<ScanEvent::Type> types{};
    ScanResult result{};
    ScanEvent event{};
    while (session->Next(event)) {
        types.push_back(event.type);
        if (event.type == ScanEvent::Type::Completed) {
            result = std::get<ScanResult>(std::move(event.value));
        }
    }

    REQUIRE(types.size() >= 2);
    CHECK(types.back() == ScanEvent::Type::Completed);
    CHECK(std::count(types.begin(), types.end(), ScanEvent::Type::Completed) == 1);
    CHECK(session->Finished());
    CHECK_FALSE(session->Next(event));
    CHECK(result.catalog.Size() == 2);
}

TEST_CASE_METHOD(TestSubject, "Only one scan runs at a time", "[scan][async]") {
    dir.MakeFile("SNES/Mario.sfc", 8);

    std::promise<void> release{};
    std::shared_future<void> released = release.get_future().share();
    std::promise<void> started{};
    bool first = true;

    LibraryScanner scanner{};
    auto session = scanner.Scan({
        .roots = {dir.Path()},
        .metadata = {},
        .observer =
            [&, released](const ScanProgress &) {
                if (first) {
                    first = false;
                    started.set_value();
                    released.wait();
                }
            },
    });
    REQUIRE(session != nullptr);

    started.get_future().wait();
    CHECK(scanner.IsScanning());
    CHECK(scanner.Scan({.roots = {dir.Path()}}) == nullptr);
    release.set_value();

    ScanEvent event{};
    while (session->Next(event)) {
    }
    CHECK_FALSE(scanner.IsScanning());

    SECTION("a new scan can start once the previous one completed") {
        auto next = scanner.Scan({.roots = {dir.Path()}});
        REQUIRE(next != nullptr);
        while (next->Next(event)) {
        }
        CHECK(std::get<ScanResult>(event.value).catalog.Size() == 1);
    }
}

TEST_CASE_METHOD(TestSubject, "Entries under unreadable roots are carried over", "[scan]") {
    const ludex::Key keptKey = ludex::ComputeKey(dir.MakeFile("drive/SNES/Mario.sfc", 8));
    const ludex::Key removedKey = ludex::ComputeKey(dir.MakeFile("local/GBA/Zelda.gba", 8));

    const ScanResult previous = Walk({dir / "drive", dir / "local"});
    REQUIRE(previous.catalog.Size() == 2);

    std::filesystem::remove_all(dir / "drive");
    std::filesystem::remove_all(dir / "local/GBA");

    ScanResult result = Walk({dir / "drive", dir / "local"});
    REQUIRE(result.unreadableRoots.size() == 1);
    CHECK(result.catalog.Empty());

    CHECK(CarryOverUnreadableRoots(previous.catalog, result) == 1);
    CHECK(result.catalog.Contains(keptKey));
    CHECK_FALSE(result.catalog.Contains(removedKey));
}

} // namespace library_scanner
