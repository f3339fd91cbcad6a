/**
 * @file CommandLine.hpp
 * @brief Flag parsing for the geocircle command-line tool
 *
 * Flags override the matching configuration file values. A flag that is
 * absent leaves the file value untouched, so every override is held as an
 * optional and applied only when present.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include "Circle.hpp"
#include "TomlConfig.hpp"

namespace geocircle {

struct CliOptions {
    std::string configFile = "geocircle.toml";
    bool configGiven = false;
    std::string locationsFile;
    std::optional<std::string> outputPath;
    std::optional<int> pointCount;
    std::optional<CrossingFormula> formula;
    bool ignoreAntimeridian = false;
    bool publish = false;
    bool help = false;
};

class CommandLine {
public:
    /**
     * @brief Parse argv into options
     * @throws std::invalid_argument on an unknown option, a missing option
     *         value or an unparseable value
     */
    static CliOptions parse(int argc, const char* const argv[]) {
        CliOptions options;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                options.help = true;
            } else if (arg == "--ignore-antimeridian") {
                options.ignoreAntimeridian = true;
            } else if (arg == "--publish") {
                options.publish = true;
            } else if (arg == "--config" || arg == "--locations" || arg == "--output" ||
                       arg == "--point-count" || arg == "--formula") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                applyValue(options, arg, argv[++i]);
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        }

        return options;
    }

    /**
     * @brief Apply the given flags on top of a loaded configuration
     */
    static void apply(const CliOptions& options, GeoCircleConfig& config) {
        if (options.outputPath) config.outputPath = *options.outputPath;
        if (options.pointCount) config.circle.pointCount = *options.pointCount;
        if (options.formula) config.circle.crossingFormula = *options.formula;
        if (options.ignoreAntimeridian) config.circle.antimeridian = AntimeridianMode::Ignore;
        if (options.publish) config.mqtt.enabled = true;
    }

private:
    static void applyValue(CliOptions& options, const std::string& flag, const std::string& value) {
        if (flag == "--config") {
            options.configFile = value;
            options.configGiven = true;
        } else if (flag == "--locations") {
            options.locationsFile = value;
        } else if (flag == "--output") {
            options.outputPath = value;
        } else if (flag == "--point-count") {
            std::size_t consumed = 0;
            int count = 0;
            try {
                count = std::stoi(value, &consumed);
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid value for --point-count: " + value);
            }
            if (consumed != value.size()) {
                throw std::invalid_argument("Invalid value for --point-count: " + value);
            }
            options.pointCount = count;
        } else if (flag == "--formula") {
            options.formula = stringToFormula(value);
        }
    }
};

} // namespace geocircle
