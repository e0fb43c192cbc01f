#include <catch2/catch_test_macros.hpp>

#include <ludex/core/identity.hpp>

#include <support/temp_dir.hpp>

#include <algorithm>
#include <cctype>

namespace identity {

struct TestSubject {
    testutil::TempDir dir{};
};

TEST_CASE("XXH128 hashes are rendered as 32 lower-case hex digits", "[identity][hash]") {
    const std::string_view input = "ludex";
    const auto hash = ludex::CalcHash128(input.data(), input.size());
    const std::string str = ludex::ToString(hash);

    CHECK(str.size() == 32);
    CHECK(std::all_of(str.begin(), str.end(),
                      [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) || (ch >= 'a' && ch <= 'f'); }));
    CHECK(ludex::ToString(ludex::CalcHash128(input.data(), input.size())) == str);
    CHECK(ludex::ToString(ludex::CalcHash128(input.data(), input.size(), 1)) != str);
}

TEST_CASE_METHOD(TestSubject, "Keys are derived from normalized paths", "[identity][key]") {
    const auto file = dir.MakeFile("SNES/Mario.sfc", 16);

    SECTION("computing a key twice yields the same key") {
        CHECK(ludex::ComputeKey(file) == ludex::ComputeKey(file));
    }

    SECTION("redundant path components do not change the key") {
        CHECK(ludex::ComputeKey(dir / "SNES/./../SNES/Mario.sfc") == ludex::ComputeKey(file));
    }

    SECTION("trailing separators on directories do not change the key") {
        const auto snes = dir / "SNES";
        CHECK(ludex::ComputeKey(snes) == ludex::ComputeKey(std::filesystem::path{snes.string() + "/"}));
    }

    SECTION("trailing separators on missing paths do not change the key") {
        const auto missing = dir / "missing/folder";
        CHECK(ludex::ComputeKey(missing) == ludex::ComputeKey(std::filesystem::path{missing.string() + "/"}));
    }

    SECTION("rewriting the file keeps its key") {
        const auto before = ludex::ComputeKey(file);
        dir.MakeFile("SNES/Mario.sfc", 1024);
        CHECK(ludex::ComputeKey(file) == before);
    }

    SECTION("different locations produce different keys") {
        const auto other = dir.MakeFile("SNES/Zelda.sfc", 16);
        CHECK(ludex::ComputeKey(other) != ludex::ComputeKey(file));
    }

    SECTION("keys are 32 hex digits") {
        CHECK(ludex::ComputeKey(file).size() == 32);
    }
}

#ifndef _WIN32
TEST_CASE_METHOD(TestSubject, "Symlinks share the key of their target", "[identity][key]") {
    const auto file = dir.MakeFile("SNES/Mario.sfc", 16);
    const auto link = dir / "link.sfc";
    std::filesystem::create_symlink(file, link);

    CHECK(ludex::NormalizeKeyPath(link) == ludex::NormalizeKeyPath(file));
    CHECK(ludex::ComputeKey(link) == ludex::ComputeKey(file));
}
#endif

} // namespace identity
