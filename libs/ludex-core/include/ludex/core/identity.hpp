#pragma once

/**
@file
@brief Path-derived catalog identity.

A catalog key is the XXH128 digest of a normalized path. The key identifies *where* a game lives, not what it contains:
rewriting a ROM keeps its key, moving it produces a new one.
*/

#include <ludex/core/types.hpp>

#include <array>
#include <filesystem>
#include <string>

namespace ludex {

/// @brief Canonical representation of an XXH128 hash.
using XXH128Hash = std::array<uint8, 16>;

/// @brief Calculates the XXH128 hash of the input.
/// @param[in] input the input data
/// @param[in] len the length of the input data
/// @param[in] seed the hash seed
/// @return a `XXH128Hash` with the canonical hash of the input
XXH128Hash CalcHash128(const void *input, size_t len, uint64 seed = 0);

/// @brief Converts a `XXH128Hash` into a string.
/// @param[in] hash the hash
/// @return the hash as a 32-character string of lower-case hex digits
std::string ToString(const XXH128Hash &hash);

/// @brief Produces the string that gets hashed into a key.
///
/// The path is made absolute and canonical (symlinks resolved) when it exists, or lexically normalized when it doesn't.
/// Separators are converted to `/`. On hosts with case-insensitive filesystems (Windows, macOS) the result is also
/// lower-cased.
///
/// @param[in] path the path to normalize
/// @return the normalized UTF-8 path string
std::string NormalizeKeyPath(const std::filesystem::path &path);

/// @brief Computes the catalog key of a filesystem path.
/// @param[in] path the path of the game file or directory
/// @return the key, a 32-character hex string
Key ComputeKey(const std::filesystem::path &path);

} // namespace ludex
