/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the geocircle command-line tool
 *
 * Provides a simple line-based TOML parser for circle settings, output
 * destination, MQTT publishing and the list of input locations.
 *
 * Supported Sections:
 * - [circle]: point count, Earth radius, planar rescaling divisor,
 *   crossing formula, antimeridian mode, concurrency limit
 * - [output]: GeoJSON output path
 * - [mqtt]: broker connection and topic prefix for polygon publishing
 * - [[location]]: one table per circle (id, model, center, radius)
 *
 * @note Only the subset of TOML used by geocircle.toml is understood:
 *       sections, arrays of tables, scalar key = value pairs and # comments
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <cstdint>
#include <vector>
#include "Circle.hpp"

namespace geocircle {

struct MqttSettings {
    bool enabled = false;
    std::string host = "localhost";
    std::uint16_t port = 1883;
    std::string clientId = "geocircle";
    std::string username;
    std::string password;
    std::string topicPrefix = "geocircle";
    int qos = 1;
};

struct GeoCircleConfig {
    CircleSettings circle;
    std::string outputPath = "circles.geojson";
    MqttSettings mqtt;
    std::vector<Location> locations;
};

/**
 * @brief TOML configuration file parser and validator
 *
 * Features:
 * - Section-based configuration parsing
 * - [[location]] arrays of tables appended in file order
 * - Default values for every optional parameter
 *
 * @note Numeric values that fail to parse and unknown model, formula or
 *       antimeridian names raise std::runtime_error naming the key
 */
class TomlConfig {
public:
    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Complete configuration with defaults for missing keys
     * @throws std::runtime_error if file cannot be read or a value cannot be parsed
     */
    static GeoCircleConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);

        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        return parse(file);
    }

    /**
     * @brief Parse TOML content from an input stream
     * @param input Stream positioned at the start of the document
     */
    static GeoCircleConfig parse(std::istream& input) {
        GeoCircleConfig config;

        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;

            // Remove comments outside quoted strings
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            // Array of tables: every [[location]] starts a new entry
            if (line.rfind("[[", 0) == 0) {
                if (line.size() > 4 && line.compare(line.size() - 2, 2, "]]") == 0) {
                    currentSection = line.substr(2, line.length() - 4);
                    trim(currentSection);
                    if (currentSection == "location") {
                        config.locations.emplace_back();
                    } else {
                        std::cerr << "[Config] Warning: unknown table array [[" << currentSection
                                  << "]] on line " << lineNumber << std::endl;
                    }
                }
                continue;
            }

            // Handle section headers
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            // Parse key = value
            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] Warning: ignoring line " << lineNumber << ": " << line << std::endl;
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);

            trim(key);
            trim(value);
            unquote(value);

            if (currentSection == "circle") {
                applyCircleKey(config.circle, key, value);
            } else if (currentSection == "output") {
                if (key == "path") {
                    config.outputPath = value;
                }
            } else if (currentSection == "mqtt") {
                applyMqttKey(config.mqtt, key, value);
            } else if (currentSection == "location" && !config.locations.empty()) {
                applyLocationKey(config.locations.back(), key, value);
            }
        }

        return config;
    }

private:
    static void applyCircleKey(CircleSettings& circle, const std::string& key, const std::string& value) {
        if (key == "point_count") {
            circle.pointCount = toInt(key, value);
        } else if (key == "earth_radius") {
            circle.earthRadius = toDouble(key, value);
        } else if (key == "rescaling_divisor") {
            circle.rescalingDivisor = toDouble(key, value);
        } else if (key == "crossing_formula") {
            circle.crossingFormula = toEnum(key, value, stringToFormula);
        } else if (key == "antimeridian") {
            circle.antimeridian = toEnum(key, value, stringToAntimeridianMode);
        } else if (key == "max_concurrency") {
            circle.maxConcurrency = static_cast<unsigned>(toInt(key, value));
        }
    }

    static void applyMqttKey(MqttSettings& mqtt, const std::string& key, const std::string& value) {
        if (key == "enabled") {
            mqtt.enabled = (value == "true" || value == "1");
        } else if (key == "host") {
            mqtt.host = value;
        } else if (key == "port") {
            mqtt.port = static_cast<std::uint16_t>(toInt(key, value));
        } else if (key == "client_id") {
            mqtt.clientId = value;
        } else if (key == "username") {
            mqtt.username = value;
        } else if (key == "password") {
            mqtt.password = value;
        } else if (key == "topic_prefix") {
            mqtt.topicPrefix = value;
        } else if (key == "qos") {
            mqtt.qos = toInt(key, value);
        }
    }

    // x/y are the planar center and share storage with latitude/longitude
    static void applyLocationKey(Location& location, const std::string& key, const std::string& value) {
        if (key == "id") {
            location.id = value;
        } else if (key == "model") {
            location.model = toEnum(key, value, stringToModel);
        } else if (key == "latitude" || key == "x") {
            location.latitude = toDouble(key, value);
        } else if (key == "longitude" || key == "y") {
            location.longitude = toDouble(key, value);
        } else if (key == "radius") {
            location.radius = toDouble(key, value);
        }
    }

    static int toInt(const std::string& key, const std::string& value) {
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer for '" + key + "': " + value);
        }
    }

    static double toDouble(const std::string& key, const std::string& value) {
        try {
            return std::stod(value);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number for '" + key + "': " + value);
        }
    }

    template <typename Enum>
    static Enum toEnum(const std::string& key, const std::string& value,
                       Enum (*convert)(const std::string&)) {
        try {
            return convert(value);
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("Invalid value for '" + key + "': " + value);
        }
    }

    static void stripComment(std::string& line) {
        bool inQuotes = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                inQuotes = !inQuotes;
            } else if (line[i] == '#' && !inQuotes) {
                line.erase(i);
                return;
            }
        }
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

} // namespace geocircle
