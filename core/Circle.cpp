#include "Circle.hpp"
#include <stdexcept>
#include <unordered_map>

namespace geocircle {

std::size_t batchCount(const RingGeometry& geometry) {
    return std::holds_alternative<SingleBatch>(geometry) ? 1 : 4;
}

std::vector<BoundaryPoint> flatten(const RingGeometry& geometry) {
    if (const auto* single = std::get_if<SingleBatch>(&geometry)) {
        return single->batch.points;
    }

    std::vector<BoundaryPoint> points;
    for (const auto& batch : std::get<MultiBatch>(geometry).batches) {
        points.insert(points.end(), batch.points.begin(), batch.points.end());
    }
    return points;
}

std::string modelToString(CoordinateModel model) {
    return model == CoordinateModel::Planar ? "planar" : "spherical";
}

CoordinateModel stringToModel(const std::string& str) {
    static const std::unordered_map<std::string, CoordinateModel> modelMap = {
        {"spherical", CoordinateModel::Spherical},
        {"geographic", CoordinateModel::Spherical},
        {"planar", CoordinateModel::Planar},
        {"flat", CoordinateModel::Planar}
    };

    auto it = modelMap.find(str);
    if (it == modelMap.end()) {
        throw std::invalid_argument("Unknown coordinate model: " + str);
    }
    return it->second;
}

std::string directionToString(CrossingDirection direction) {
    return direction == CrossingDirection::Eastbound ? "eastbound" : "westbound";
}

std::string formulaToString(CrossingFormula formula) {
    return formula == CrossingFormula::Reference ? "reference" : "interpolated";
}

CrossingFormula stringToFormula(const std::string& str) {
    if (str == "reference") return CrossingFormula::Reference;
    if (str == "interpolated") return CrossingFormula::Interpolated;
    throw std::invalid_argument("Unknown crossing formula: " + str);
}

std::string antimeridianModeToString(AntimeridianMode mode) {
    return mode == AntimeridianMode::Ignore ? "ignore" : "split";
}

AntimeridianMode stringToAntimeridianMode(const std::string& str) {
    if (str == "ignore") return AntimeridianMode::Ignore;
    if (str == "split") return AntimeridianMode::Split;
    throw std::invalid_argument("Unknown antimeridian mode: " + str);
}

} // namespace geocircle
