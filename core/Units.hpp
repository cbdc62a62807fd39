#pragma once

#include <string>

namespace visits {

class Units {
public:
    // "50m", "1.5 km", "300ft", "2mi" -> kilometres. Throws UnitParseError.
    static double parseDistanceKm(const std::string& text);

private:
    static std::string trimmed(const std::string& str);
};

} // namespace visits
