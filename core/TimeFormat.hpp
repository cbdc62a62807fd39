#pragma once

#include "GeoTypes.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace visits {

// "2019-04-01 17:03:22 UTC"
std::string formatUtc(Timestamp time);

// "1h2m3s", "45m0s", "12s", "0s"
std::string formatDuration(std::chrono::seconds duration);

// "2019-04-01T17:03:22Z", "2019-04-01T17:03:22.123Z"; fractional seconds are dropped.
std::optional<Timestamp> parseIso8601(const std::string& text);

} // namespace visits
