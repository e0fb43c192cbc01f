#pragma once

#include <ludex/core/types.hpp>

#include <optional>
#include <string>

namespace app {

// Formats a byte count with binary units, e.g. "2.00 MiB".
std::string FormatSize(uint64 bytes);

// Formats accumulated playtime as H:MM:SS, or "Never Played" if the game has no playtime.
std::string FormatPlaytime(std::optional<double> seconds);

} // namespace app
