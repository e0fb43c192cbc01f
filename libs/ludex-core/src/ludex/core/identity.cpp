#include <ludex/core/identity.hpp>

#include <ludex/util/string_ops.hpp>

#include <fmt/format.h>
#include <xxhash.h>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace ludex {

// Fixed seed; changing it changes every key and orphans all stored metadata
inline constexpr uint64 kKeyHashSeed = 0x4C75646578u;

#if defined(_WIN32) || defined(__APPLE__)
inline constexpr bool kCaseInsensitivePaths = true;
#else
inline constexpr bool kCaseInsensitivePaths = false;
#endif

XXH128Hash CalcHash128(const void *input, size_t len, uint64 seed) {
    const XXH128_hash_t hash = XXH3_128bits_withSeed(input, len, seed);
    XXH128_canonical_t canonicalHash{};
    XXH128_canonicalFromHash(&canonicalHash, hash);

    XXH128Hash out{};
    std::copy_n(canonicalHash.digest, out.size(), out.begin());
    return out;
}

std::string ToString(const XXH128Hash &hash) {
    fmt::memory_buffer buf{};
    auto inserter = std::back_inserter(buf);
    for (uint8 b : hash) {
        fmt::format_to(inserter, "{:02x}", b);
    }
    return fmt::to_string(buf);
}

std::string NormalizeKeyPath(const std::filesystem::path &path) {
    std::error_code error{};
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, error);
    if (error) {
        normalized = std::filesystem::absolute(path, error);
        if (error) {
            normalized = path;
        }
        normalized = normalized.lexically_normal();
    }

    // "/a/b/" and "/a/b" are the same directory
    std::u8string u8 = normalized.generic_u8string();
    while (u8.size() > 1 && u8.back() == u8'/') {
        u8.pop_back();
    }

    std::string out{u8.begin(), u8.end()};
    if constexpr (kCaseInsensitivePaths) {
        out = util::ToLower(out);
    }
    return out;
}

Key ComputeKey(const std::filesystem::path &path) {
    const std::string normalized = NormalizeKeyPath(path);
    return ToString(CalcHash128(normalized.data(), normalized.size(), kKeyHashSeed));
}

} // namespace ludex
