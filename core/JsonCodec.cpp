#include "JsonCodec.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace geocircle {

std::vector<Location> JsonCodec::parseLocations(const std::string& json) {
    auto document = nlohmann::json::parse(json);

    const nlohmann::json* entries = &document;
    if (document.is_object() && document.contains("locations")) {
        entries = &document["locations"];
    }

    if (!entries->is_array()) {
        throw std::runtime_error("Location document must be an array or contain a \"locations\" array");
    }

    std::vector<Location> locations;
    for (const auto& entry : *entries) {
        locations.push_back(jsonToLocation(entry));
    }
    return locations;
}

std::vector<Location> JsonCodec::loadLocations(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open locations file: " + filename);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseLocations(content);
}

nlohmann::json JsonCodec::locationToJson(const Location& location) {
    nlohmann::json j;
    j["id"] = location.id;
    j["model"] = modelToString(location.model);
    if (location.model == CoordinateModel::Planar) {
        j["x"] = location.latitude;
        j["y"] = location.longitude;
    } else {
        j["latitude"] = location.latitude;
        j["longitude"] = location.longitude;
    }
    j["radius"] = location.radius;
    return j;
}

Location JsonCodec::jsonToLocation(const nlohmann::json& json) {
    Location location;

    if (json.contains("id")) {
        const auto& id = json["id"];
        location.id = id.is_string() ? id.get<std::string>() : id.dump();
    }

    std::string model = json.value("model", "spherical");
    try {
        location.model = stringToModel(model);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid model for location '" + location.id + "': " + model);
    }
    if (location.model == CoordinateModel::Planar) {
        location.latitude = json.value("x", 0.0);
        location.longitude = json.value("y", 0.0);
    } else {
        location.latitude = json.value("latitude", json.value("lat", 0.0));
        location.longitude = json.value("longitude", json.value("lon", 0.0));
    }

    location.radius = json.value("radius", 0.0);
    return location;
}

nlohmann::json JsonCodec::coordinateToJson(const BoundaryPoint& point) {
    return nlohmann::json::array({point.lon, point.lat});
}

nlohmann::json JsonCodec::crossingToJson(const CrossingEvent& crossing) {
    nlohmann::json j;
    j["index"] = crossing.index;
    j["direction"] = directionToString(crossing.direction);
    j["lat"] = crossing.latitude;
    j["lon"] = crossing.longitude;
    return j;
}

nlohmann::json JsonCodec::errorToJson(const LocationError& error) {
    nlohmann::json j;
    j["id"] = error.locationId;
    j["kind"] = errorKindToString(error.kind);
    j["message"] = error.message;
    return j;
}

} // namespace geocircle
