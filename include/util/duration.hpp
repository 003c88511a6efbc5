#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace wh::util {

// Parses durations such as "24h", "1h30m", "1.5s" or "250ms". Units: ns, us,
// ms, s, m, h. Throws std::invalid_argument on malformed or negative input.
std::chrono::milliseconds parseDuration(std::string_view str);

// Inverse of parseDuration for whole milliseconds, e.g. 5400000ms -> "1h30m".
std::string formatDuration(std::chrono::milliseconds d);

}
