#include "TimeFormat.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace visits {

std::string formatUtc(Timestamp time) {
    const std::time_t t = static_cast<std::time_t>(toEpochSeconds(time));
    std::stringstream ss;

#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    }
#endif

    ss << " UTC";
    return ss.str();
}

std::string formatDuration(std::chrono::seconds duration) {
    std::stringstream ss;
    auto total = duration.count();
    if (total < 0) {
        ss << '-';
        total = -total;
    }
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;

    if (hours > 0) {
        ss << hours << 'h' << minutes << 'm';
    } else if (minutes > 0) {
        ss << minutes << 'm';
    }
    ss << seconds << 's';
    return ss.str();
}

std::optional<Timestamp> parseIso8601(const std::string& text) {
    std::tm tm_buf{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    // Optional fraction, then 'Z'.
    char c = 0;
    if (ss.get(c) && c == '.') {
        while (ss.get(c) && std::isdigit(static_cast<unsigned char>(c))) {
        }
    }
    if (c != 'Z') {
        return std::nullopt;
    }

#ifdef _WIN32
    const std::time_t t = _mkgmtime(&tm_buf);
#else
    const std::time_t t = timegm(&tm_buf);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return fromEpochSeconds(static_cast<int64_t>(t));
}

} // namespace visits
