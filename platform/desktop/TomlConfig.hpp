/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the visit finder
 *
 * Simple line-based parser for the subset of TOML the tool needs. Values read
 * here become defaults that command-line flags may override.
 *
 * Supported Sections:
 * - [search]: target coordinates, threshold, run length, box margin, caching, debug
 * - [index]: spatial index tuning
 *
 * @note Unknown sections and keys are ignored
 * @note The threshold string is kept as written; it is parsed into kilometres later
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <utility>
#include "SearchConfig.hpp"
#include "Errors.hpp"

namespace visits {

/**
 * @brief TOML configuration file reader
 *
 * Example:
 * @code
 * [search]
 * latitude = 36.461755
 * longitude = -116.866612
 * threshold = "50m"
 * min_run_length = 10
 * box_margin = 2.0
 * cache_data = true
 * debug = false
 *
 * [index]
 * node_size = 64
 * @endcode
 */
class TomlConfig {
public:
    /**
     * @brief Load a TOML file on top of an existing configuration
     * @param filename Path to TOML configuration file
     * @param base Values to start from (usually the built-in defaults)
     * @return base with every recognised key from the file applied
     * @throws ConfigError if a value cannot be converted
     * @note A missing file is not an error; base is returned unchanged
     */
    static SearchConfig loadFromFile(const std::string& filename, SearchConfig base = SearchConfig{}) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return base;
        }
        std::cout << "[Config] Loading " << filename << std::endl;
        return parse(file, std::move(base));
    }

    /**
     * @brief Parse TOML text from a stream
     * @param in Stream positioned at the start of the document
     * @param base Values to start from
     * @throws ConfigError on malformed values
     */
    static SearchConfig parse(std::istream& in, SearchConfig base = SearchConfig{}) {
        SearchConfig config = std::move(base);
        std::string currentSection;
        std::string line;
        int lineNumber = 0;

        while (std::getline(in, line)) {
            ++lineNumber;

            // Remove comments and trim whitespace
            size_t commentPos = line.find('#');
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            try {
                if (currentSection == "search") {
                    if (key == "latitude") {
                        config.target.lat = std::stod(value);
                    } else if (key == "longitude") {
                        config.target.lon = std::stod(value);
                    } else if (key == "threshold") {
                        config.threshold = value;
                    } else if (key == "min_run_length") {
                        config.minRunLength = std::stoi(value);
                    } else if (key == "box_margin") {
                        config.boxMargin = std::stod(value);
                    } else if (key == "cache_data") {
                        config.cacheData = parseBool(value);
                    } else if (key == "debug") {
                        config.debug = parseBool(value);
                    }
                } else if (currentSection == "index") {
                    if (key == "node_size") {
                        config.indexNodeSize = static_cast<size_t>(std::stoul(value));
                    }
                }
            } catch (const std::logic_error&) {
                std::ostringstream ss;
                ss << "line " << lineNumber << ": invalid value for " << currentSection << "."
                   << key << ": \"" << value << "\"";
                throw ConfigError(ss.str());
            }
        }

        validate(config);
        return config;
    }

    /**
     * @brief Check ranges of numeric settings
     * @throws ConfigError naming the first offending setting
     */
    static void validate(const SearchConfig& config) {
        if (config.target.lat < -90.0 || config.target.lat > 90.0) {
            throw ConfigError("latitude must be within [-90, 90]");
        }
        if (config.target.lon < -180.0 || config.target.lon > 180.0) {
            throw ConfigError("longitude must be within [-180, 180]");
        }
        if (config.minRunLength < 1) {
            throw ConfigError("min_run_length must be at least 1");
        }
        if (config.boxMargin < 1.0) {
            throw ConfigError("box_margin must be at least 1.0");
        }
        if (config.indexNodeSize < 1) {
            throw ConfigError("node_size must be at least 1");
        }
    }

private:
    static bool parseBool(const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::invalid_argument("not a boolean");
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace visits
