#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace geocircle {

enum class CoordinateModel {
    Spherical,
    Planar
};

enum class CrossingDirection {
    Eastbound,
    Westbound
};

enum class CrossingFormula {
    Interpolated,
    Reference
};

enum class AntimeridianMode {
    Split,
    Ignore
};

// For Planar locations latitude/longitude hold the x/y center.
struct Location {
    std::string id;
    double latitude = 0.0;
    double longitude = 0.0;
    double radius = 0.0;
    CoordinateModel model = CoordinateModel::Spherical;
};

struct BoundaryPoint {
    double sequence = 0.0;
    double lat = 0.0;
    double lon = 0.0;
};

struct CrossingEvent {
    std::size_t index = 0;
    int modifier = 1;
    CrossingDirection direction = CrossingDirection::Westbound;
    double latitude = 0.0;
    double longitude = 180.0;

    double anchor() const { return static_cast<double>(index) - 0.5; }

    // Seam point on the side of the earlier point of the pair.
    BoundaryPoint approachPoint() const { return {anchor() - 0.1, latitude, -longitude}; }

    // Seam point on the side of the later point of the pair.
    BoundaryPoint departurePoint() const { return {anchor() + 0.1, latitude, longitude}; }
};

struct Batch {
    std::vector<BoundaryPoint> points;
};

struct SingleBatch {
    Batch batch;
};

struct MultiBatch {
    std::array<Batch, 4> batches;
};

using RingGeometry = std::variant<SingleBatch, MultiBatch>;

struct CircleSettings {
    int pointCount = 120;
    double earthRadius = 6371009.0;
    double rescalingDivisor = 10000.0;
    CrossingFormula crossingFormula = CrossingFormula::Interpolated;
    AntimeridianMode antimeridian = AntimeridianMode::Split;
    unsigned maxConcurrency = 0;
};

struct CircleResult {
    Location location;
    std::vector<BoundaryPoint> ring;
    std::vector<CrossingEvent> crossings;
    RingGeometry geometry;
};

std::size_t batchCount(const RingGeometry& geometry);
std::vector<BoundaryPoint> flatten(const RingGeometry& geometry);

// The stringTo* parsers throw std::invalid_argument on unknown names
std::string modelToString(CoordinateModel model);
CoordinateModel stringToModel(const std::string& str);

std::string directionToString(CrossingDirection direction);

std::string formulaToString(CrossingFormula formula);
CrossingFormula stringToFormula(const std::string& str);

std::string antimeridianModeToString(AntimeridianMode mode);
AntimeridianMode stringToAntimeridianMode(const std::string& str);

} // namespace geocircle
