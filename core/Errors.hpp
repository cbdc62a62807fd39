#pragma once

#include <stdexcept>
#include <string>

namespace visits {

// Vincenty iteration did not settle (near-antipodal points).
class NoConvergence : public std::runtime_error {
public:
    explicit NoConvergence(const std::string& what) : std::runtime_error(what) {}
};

// Box search would have to cross a pole or the antimeridian.
class TooCloseToPoleOrMeridian : public std::runtime_error {
public:
    explicit TooCloseToPoleOrMeridian(const std::string& what) : std::runtime_error(what) {}
};

class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& what) : std::runtime_error(what) {}
};

class HistoryFormatError : public std::runtime_error {
public:
    explicit HistoryFormatError(const std::string& what) : std::runtime_error(what) {}
};

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace visits
