#include "Units.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace visits {

namespace {

struct Unit {
    const char* abbrev;
    double perKm;
};

// "m" last so that "km" is not read as metres.
const Unit kUnits[] = {
    {"km", 1.0},
    {"ft", 3280.84},
    {"mi", 0.621371},
    {"m", 1000.0},
};

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

double Units::parseDistanceKm(const std::string& text) {
    std::string dist = trimmed(text);
    std::transform(dist.begin(), dist.end(), dist.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& unit : kUnits) {
        if (!endsWith(dist, unit.abbrev)) {
            continue;
        }
        const std::string count = trimmed(dist.substr(0, dist.size() - std::string(unit.abbrev).size()));
        double value = 0.0;
        size_t consumed = 0;
        try {
            value = std::stod(count, &consumed);
        } catch (const std::exception& e) {
            throw UnitParseError("Error parsing distance \"" + count + "\": " + e.what());
        }
        if (consumed != count.size()) {
            throw UnitParseError("Error parsing distance \"" + count + "\": trailing characters");
        }
        if (!std::isfinite(value) || value <= 0.0) {
            throw UnitParseError("Distance \"" + count + "\" must be a positive number");
        }
        return value / unit.perKm;
    }
    throw UnitParseError("No recognized units in distance \"" + dist + "\"");
}

std::string Units::trimmed(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace visits
