#pragma once

#include "Circle.hpp"
#include "CircleError.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace geocircle {

class JsonCodec {
public:
    // Accepts a top-level array or an object with a "locations" array.
    static std::vector<Location> parseLocations(const std::string& json);
    static std::vector<Location> loadLocations(const std::string& filename);

    static nlohmann::json locationToJson(const Location& location);
    static Location jsonToLocation(const nlohmann::json& json);

    static nlohmann::json coordinateToJson(const BoundaryPoint& point);
    static nlohmann::json crossingToJson(const CrossingEvent& crossing);
    static nlohmann::json errorToJson(const LocationError& error);
};

} // namespace geocircle
