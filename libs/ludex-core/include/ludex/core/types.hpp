#pragma once

/**
@file
@brief Core type definitions.

Defines aliases for the fixed-width integer types and the basic catalog vocabulary types.
*/

#include <cstdint>
#include <string>

using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

using sint8 = int8_t;
using sint16 = int16_t;
using sint32 = int32_t;
using sint64 = int64_t;

namespace ludex {

/// @brief A catalog entry key: the 32-character hex digest of a normalized path.
using Key = std::string;

/// @brief A platform label from the closed platform set, e.g. "Super Nintendo".
using Platform = std::string;

} // namespace ludex
