#include "GeoJsonAssembler.hpp"
#include "../JsonCodec.hpp"

namespace geocircle::adapters {

nlohmann::json GeoJsonAssembler::makeLine(const std::vector<BoundaryPoint>& points) const {
    nlohmann::json coordinates = nlohmann::json::array();
    for (const auto& point : points) {
        coordinates.push_back(JsonCodec::coordinateToJson(point));
    }

    nlohmann::json line;
    line["type"] = "LineString";
    line["coordinates"] = coordinates;
    return line;
}

nlohmann::json GeoJsonAssembler::makeLine(const std::vector<BoundaryPoint>& points,
                                          const nlohmann::json& tail) const {
    nlohmann::json line = makeLine(points);
    for (const auto& coordinate : tail["coordinates"]) {
        line["coordinates"].push_back(coordinate);
    }
    return line;
}

nlohmann::json GeoJsonAssembler::makePolygon(const nlohmann::json& line) const {
    nlohmann::json ring = line["coordinates"];

    // GeoJSON linear rings must end on their first position
    if (!ring.empty() && ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }

    nlohmann::json polygon;
    polygon["type"] = "Polygon";
    polygon["coordinates"] = nlohmann::json::array({ring});
    return polygon;
}

nlohmann::json GeoJsonAssembler::toFeature(const CircleResult& circle) const {
    nlohmann::json crossings = nlohmann::json::array();
    for (const auto& crossing : circle.crossings) {
        crossings.push_back(JsonCodec::crossingToJson(crossing));
    }

    nlohmann::json properties = JsonCodec::locationToJson(circle.location);
    properties["points"] = circle.ring.size();
    properties["batches"] = batchCount(circle.geometry);
    properties["crossings"] = crossings;

    nlohmann::json feature;
    feature["type"] = "Feature";
    feature["id"] = circle.location.id;
    feature["properties"] = properties;
    feature["geometry"] = ports::assemble(*this, circle.geometry);
    return feature;
}

nlohmann::json GeoJsonAssembler::toFeatureCollection(const domain::PipelineResult& result) const {
    nlohmann::json features = nlohmann::json::array();
    for (const auto& circle : result.circles) {
        features.push_back(toFeature(circle));
    }

    nlohmann::json collection;
    collection["type"] = "FeatureCollection";
    collection["features"] = features;

    if (!result.errors.empty()) {
        nlohmann::json errors = nlohmann::json::array();
        for (const auto& error : result.errors) {
            errors.push_back(JsonCodec::errorToJson(error));
        }
        collection["errors"] = errors;
    }

    return collection;
}

} // namespace geocircle::adapters
