#pragma once

/**
@file
@brief Ludex library version definitions.
*/

#if Ludex_DEV_BUILD
    #define Ludex_FULL_VERSION Ludex_VERSION "-dev"
#else
    #define Ludex_FULL_VERSION Ludex_VERSION
#endif

namespace ludex::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = Ludex_VERSION;

/// @brief The library version string with a `-dev` suffix for development builds.
inline constexpr auto fullstring = Ludex_FULL_VERSION;

inline constexpr auto major = static_cast<unsigned>(Ludex_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(Ludex_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(Ludex_VERSION_PATCH); ///< The library's patch version

} // namespace ludex::version
