/**
 * @file main_cli.cpp
 * @brief Command-line interface for the geocircle polygon generator
 *
 * Loads circle locations from a TOML configuration (or a JSON locations
 * file), computes each circle's boundary ring with antimeridian handling,
 * and writes the polygons as a GeoJSON FeatureCollection. Optionally
 * publishes each polygon to an MQTT broker.
 *
 * With `--output -` the GeoJSON document is the only thing written to
 * stdout; progress logging moves to stderr.
 *
 * @note Exit status: 0 when every location succeeded, 2 when some failed,
 *       1 on configuration or I/O errors
 */

#include "CirclePipeline.hpp"
#include "GeoJsonAssembler.hpp"
#include "MqttPolygonPublisher.hpp"
#include "PahoMqttClient.hpp"
#include "JsonCodec.hpp"
#include "TomlConfig.hpp"
#include "CommandLine.hpp"
#include "StdoutReservation.hpp"
#include <iostream>
#include <fstream>
#include <memory>
#include <optional>
#include <thread>
#include <chrono>
#include <cstdlib>

using namespace geocircle;

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]        Configuration file (default: geocircle.toml)\n"
              << "  --locations [file]     JSON file with locations (replaces [[location]] tables)\n"
              << "  --output [file]        GeoJSON output file, - for stdout (default: circles.geojson)\n"
              << "  --point-count [n]      Boundary points per circle (default: 120)\n"
              << "  --formula [name]       Crossing latitude formula: interpolated | reference\n"
              << "  --ignore-antimeridian  Hand every ring over as a single batch\n"
              << "  --publish              Publish polygons to the [mqtt] broker\n"
              << "  --help                 Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [circle]\n"
              << "  point_count = 120\n"
              << "  earth_radius = 6371009\n"
              << "\n"
              << "  [[location]]\n"
              << "  id = \"5\"\n"
              << "  latitude = 67.017\n"
              << "  longitude = -178.242\n"
              << "  radius = 450000\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter for Windows
 * @param name Environment variable name
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

/**
 * @brief Apply environment overrides on top of the file configuration
 * @throws std::invalid_argument if a numeric override cannot be parsed
 */
void applyEnvOverrides(GeoCircleConfig& config) {
    std::string pointCount = safeGetEnv("GEOCIRCLE_POINT_COUNT");
    std::string earthRadius = safeGetEnv("GEOCIRCLE_EARTH_RADIUS");
    std::string mqttHost = safeGetEnv("MQTT_HOST");

    if (!pointCount.empty()) config.circle.pointCount = std::stoi(pointCount);
    if (!earthRadius.empty()) config.circle.earthRadius = std::stod(earthRadius);
    if (!mqttHost.empty()) config.mqtt.host = mqttHost;
}

void printSummary(const domain::PipelineResult& result) {
    for (const auto& circle : result.circles) {
        std::cout << "[Pipeline] " << circle.location.id << " ("
                  << modelToString(circle.location.model) << " "
                  << circle.location.latitude << ", " << circle.location.longitude
                  << ", r=" << circle.location.radius << "): "
                  << circle.ring.size() << " points, "
                  << circle.crossings.size() << " crossings, "
                  << batchCount(circle.geometry) << " batches" << std::endl;
    }
}

int publishResult(const MqttSettings& mqtt, const domain::PipelineResult& result) {
    auto mqttClient = std::make_shared<PahoMqttClient>();
    mqttClient->setConnectionCallback([](bool connected, const std::string& reason) {
        std::cout << "[MQTT] " << (connected ? "Connected: " : "Disconnected: ") << reason << std::endl;
    });

    if (!mqttClient->connect(mqtt.host, mqtt.port, mqtt.clientId, mqtt.username, mqtt.password)) {
        std::cerr << "Error: could not start MQTT connection to " << mqtt.host << std::endl;
        return 1;
    }

    adapters::MqttPolygonPublisher publisher(mqttClient, mqtt.topicPrefix, mqtt.qos);
    auto summary = publisher.publish(result);

    // Wait a bit for the connection to come up and the queue to drain
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (mqttClient->pendingCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));

    std::size_t undelivered = mqttClient->pendingCount() + mqttClient->failedCount();
    mqttClient->disconnect();

    if (summary.failed > 0 || undelivered > 0) {
        std::cerr << "Error: " << summary.failed + undelivered << " MQTT messages were not delivered" << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = CommandLine::parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (options.help) {
        printUsage(argv[0]);
        return 0;
    }

    try {
        // Missing default config is fine when locations come from JSON
        GeoCircleConfig config;
        bool configLoaded = false;
        if (options.configGiven || options.locationsFile.empty() || std::ifstream(options.configFile).good()) {
            config = TomlConfig::loadFromFile(options.configFile);
            configLoaded = true;
        }

        applyEnvOverrides(config);

        if (!options.locationsFile.empty()) config.locations = JsonCodec::loadLocations(options.locationsFile);
        CommandLine::apply(options, config);

        std::optional<StdoutReservation> stdoutReservation;
        if (config.outputPath == "-") {
            stdoutReservation.emplace();
        }

        if (configLoaded) {
            std::cout << "[Config] Loaded " << options.configFile << std::endl;
        }

        if (config.locations.empty()) {
            std::cerr << "Error: no locations configured in " << options.configFile << std::endl;
            return 1;
        }

        std::cout << "Computing " << config.locations.size() << " circles with "
                  << config.circle.pointCount << " points (earth radius "
                  << config.circle.earthRadius << ", "
                  << formulaToString(config.circle.crossingFormula) << " crossings, antimeridian "
                  << antimeridianModeToString(config.circle.antimeridian) << ")" << std::endl;

        domain::CirclePipeline pipeline(config.circle);
        auto result = pipeline.run(config.locations);
        printSummary(result);

        adapters::GeoJsonAssembler assembler;
        std::string geojson = assembler.toFeatureCollection(result).dump(2);

        if (stdoutReservation) {
            stdoutReservation->data() << geojson << std::endl;
        } else {
            std::ofstream output(config.outputPath);
            if (!output.is_open()) {
                std::cerr << "Error: could not write " << config.outputPath << std::endl;
                return 1;
            }
            output << geojson << std::endl;
            std::cout << "Wrote " << result.circles.size() << " polygons to " << config.outputPath << std::endl;
        }

        if (config.mqtt.enabled && publishResult(config.mqtt, result) != 0) {
            return 1;
        }

        return result.complete() ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
