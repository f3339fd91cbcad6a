#pragma once

#include "../ports/IPolygonAssembler.hpp"
#include "../domain/CirclePipeline.hpp"
#include <nlohmann/json.hpp>

namespace geocircle::adapters {

// LineString and Polygon geometries as GeoJSON objects, coordinates in [lon, lat] order.
class GeoJsonAssembler : public ports::IPolygonAssembler<nlohmann::json, nlohmann::json> {
public:
    GeoJsonAssembler() = default;
    ~GeoJsonAssembler() override = default;

    nlohmann::json makeLine(const std::vector<BoundaryPoint>& points) const override;
    nlohmann::json makeLine(const std::vector<BoundaryPoint>& points, const nlohmann::json& tail) const override;
    nlohmann::json makePolygon(const nlohmann::json& line) const override;

    nlohmann::json toFeature(const CircleResult& circle) const;
    nlohmann::json toFeatureCollection(const domain::PipelineResult& result) const;
};

} // namespace geocircle::adapters
