#include "util/duration.hpp"

#include <cctype>
#include <cmath>
#include <string>
#include <stdexcept>
#include <fmt/core.h>

namespace wh::util {

namespace {

// largest duration representable in int64 nanoseconds, about 292 years
constexpr double MAX_NANOS = 9223372036854775807.0;

double unitNanos(const std::string_view unit) {
    if (unit == "ns") return 1.0;
    if (unit == "us") return 1e3;
    if (unit == "ms") return 1e6;
    if (unit == "s") return 1e9;
    if (unit == "m") return 60e9;
    if (unit == "h") return 3600e9;
    return 0.0;
}

[[noreturn]] void invalid(const std::string_view str, const std::string_view why) {
    throw std::invalid_argument(fmt::format("invalid duration \"{}\": {}", str, why));
}

}

std::chrono::milliseconds parseDuration(const std::string_view str) {
    if (str.empty()) invalid(str, "empty");
    if (str == "0") return std::chrono::milliseconds(0);
    if (str.front() == '-' || str.front() == '+') invalid(str, "sign not allowed");

    double totalNanos = 0.0;
    size_t i = 0;

    while (i < str.size()) {
        const size_t numStart = i;
        bool seenDot = false;
        while (i < str.size() && (std::isdigit(static_cast<unsigned char>(str[i])) || (str[i] == '.' && !seenDot))) {
            if (str[i] == '.') seenDot = true;
            ++i;
        }
        const auto number = str.substr(numStart, i - numStart);
        if (number.empty() || number == ".") invalid(str, "expected a number");

        const size_t unitStart = i;
        while (i < str.size() && std::isalpha(static_cast<unsigned char>(str[i]))) ++i;
        const auto unit = str.substr(unitStart, i - unitStart);
        if (unit.empty()) invalid(str, "missing unit");

        const double scale = unitNanos(unit);
        if (scale == 0.0) invalid(str, fmt::format("unknown unit \"{}\"", unit));

        totalNanos += std::stod(std::string(number)) * scale;
        if (totalNanos > MAX_NANOS) invalid(str, "overflows");
    }

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(totalNanos / 1e6)));
}

std::string formatDuration(const std::chrono::milliseconds d) {
    using namespace std::chrono;
    if (d.count() <= 0) return "0s";

    auto rest = d;
    const auto h = duration_cast<hours>(rest);
    rest -= h;
    const auto m = duration_cast<minutes>(rest);
    rest -= m;
    const auto s = duration_cast<seconds>(rest);
    rest -= s;

    std::string out;
    if (h.count()) out += fmt::format("{}h", h.count());
    if (m.count()) out += fmt::format("{}m", m.count());
    if (s.count()) out += fmt::format("{}s", s.count());
    if (rest.count()) out += fmt::format("{}ms", rest.count());
    return out;
}

}
