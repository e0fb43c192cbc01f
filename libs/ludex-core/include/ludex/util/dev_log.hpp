#pragma once

/**
@file
@brief Grouped development logging.

Every component declares one or more log groups with a compile-time switch and minimum level. Messages below the group
level are compiled out entirely. On top of that, a process-wide runtime threshold filters what actually gets printed,
which lets front ends raise or lower verbosity without rebuilding.

Logs are written to `stderr` so that command output on `stdout` stays clean.

@section Usage

```cpp
namespace grp {
    struct scanner {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Scanner";
    };

    struct scanner_walk : public scanner {
        static constexpr std::string_view name = "Scanner-Walk";
    };
}

devlog::info<grp::scanner>("Scanning {} roots", roots.size());
devlog::warn<grp::scanner_walk>("Skipping unreadable root {}", root);
```

Expensive message arguments should be guarded with `if constexpr (devlog::debug_enabled<grp::scanner>)`.
*/

/**
@namespace devlog
@brief Development logging utilities.
*/

#include <ludex/core/types.hpp>

#include <fmt/format.h>

#include <atomic>
#include <concepts>
#include <cstdio>
#include <string>
#include <string_view>

namespace devlog {

/// @brief Globally enable or disable dev logging.
inline constexpr bool globalEnable = Ludex_ENABLE_DEVLOG;

// -----------------------------------------------------------------------------
// Log levels

/// @brief Log level type.
using Level = uint32;

/// @brief Dev log levels definitions.
namespace level {
    /// @brief Per-item chatter, e.g. every file visited by a scan.
    inline constexpr Level trace = 1;

    /// @brief Details of individual operations, e.g. resolved launch targets.
    inline constexpr Level debug = 2;

    /// @brief Infrequent milestones, e.g. scan completion or catalog persistence.
    inline constexpr Level info = 3;

    /// @brief Recoverable problems, e.g. an unreadable root or a discarded cache.
    inline constexpr Level warn = 4;

    /// @brief Operations that failed outright.
    inline constexpr Level error = 5;

    /// @brief Disables a group.
    inline constexpr Level off = 6;

    template <Level level>
    inline constexpr const char *name = "unk";

    template <>
    inline constexpr const char *name<trace> = "trace";
    template <>
    inline constexpr const char *name<debug> = "debug";
    template <>
    inline constexpr const char *name<info> = "info";
    template <>
    inline constexpr const char *name<warn> = "warn";
    template <>
    inline constexpr const char *name<error> = "error";
} // namespace level

namespace detail {

    inline std::atomic<Level> runtimeLevel{level::info};

    /// @brief Describes a log group with `enabled` and `level` fields.
    template <typename T>
    concept Group = requires() {
        requires std::same_as<std::decay_t<decltype(T::enabled)>, bool>;
        requires std::same_as<std::decay_t<decltype(T::level)>, Level>;
    };

    /// @brief Describes a log group that also has a static `name`.
    template <typename T>
    concept StaticNameGroup = requires() {
        requires Group<T>;
        requires std::same_as<std::decay_t<decltype(T::name)>, std::string_view>;
    };

    template <Level level, detail::Group TGroup>
    inline constexpr bool enabled = globalEnable && TGroup::enabled && level >= TGroup::level;

    template <Level level, StaticNameGroup TGroup, typename... TArgs>
    void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        static_assert(level < level::off);
        if constexpr (enabled<level, TGroup>) {
            if (level < runtimeLevel.load(std::memory_order_relaxed)) {
                return;
            }
            const std::string message = fmt::format(fmt, static_cast<TArgs &&>(args)...);
            fmt::print(stderr, "{:5s} | {:16s} | {}\n", level::name<level>, TGroup::name, message);
        }
    }

} // namespace detail

/// @brief Sets the minimum level printed at runtime. Levels compiled out by a group are never printed.
/// @param[in] minLevel the new minimum level
inline void SetRuntimeLevel(Level minLevel) {
    detail::runtimeLevel.store(minLevel, std::memory_order_relaxed);
}

/// @brief Retrieves the minimum level printed at runtime.
inline Level GetRuntimeLevel() {
    return detail::runtimeLevel.load(std::memory_order_relaxed);
}

template <detail::Group TGroup>
inline constexpr bool trace_enabled = detail::enabled<level::trace, TGroup>;

template <detail::Group TGroup>
inline constexpr bool debug_enabled = detail::enabled<level::debug, TGroup>;

template <detail::Group TGroup>
inline constexpr bool info_enabled = detail::enabled<level::info, TGroup>;

template <detail::StaticNameGroup TGroup, typename... TArgs>
void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::trace, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::StaticNameGroup TGroup, typename... TArgs>
void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::debug, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::StaticNameGroup TGroup, typename... TArgs>
void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::info, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::StaticNameGroup TGroup, typename... TArgs>
void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::warn, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::StaticNameGroup TGroup, typename... TArgs>
void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::error, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

} // namespace devlog
