#include "format.hpp"

#include <fmt/format.h>

#include <array>

namespace app {

std::string FormatSize(uint64 bytes) {
    static constexpr std::array<const char *, 5> kUnits = {"B", "KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

std::string FormatPlaytime(std::optional<double> seconds) {
    if (!seconds || *seconds <= 0.0) {
        return "Never Played";
    }
    const auto total = static_cast<uint64>(*seconds);
    const uint64 hours = total / 3600;
    const uint64 minutes = (total / 60) % 60;
    const uint64 secs = total % 60;
    return fmt::format("{}:{:02d}:{:02d}", hours, minutes, secs);
}

} // namespace app
