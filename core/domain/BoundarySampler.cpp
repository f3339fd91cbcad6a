#include "BoundarySampler.hpp"
#include "../CircleError.hpp"
#include "../Geo.hpp"
#include <cmath>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geocircle::domain {

std::vector<BoundaryPoint> BoundarySampler::sample(double centerLat, double centerLon, double radius,
                                                   double earthRadius, int pointCount) {
    validatePointCount(pointCount);

    if (!std::isfinite(earthRadius) || earthRadius <= 0.0) {
        throw CircleError(ErrorKind::InvalidSettings,
                          "Earth radius must be positive, got " + std::to_string(earthRadius));
    }

    if (!std::isfinite(radius) || radius <= 0.0) {
        throw CircleError(ErrorKind::InvalidRadius,
                          "Radius must be positive, got " + std::to_string(radius));
    }

    double delta = Geo::angularDistance(radius, earthRadius);
    if (delta >= M_PI) {
        throw CircleError(ErrorKind::InvalidRadius,
                          "Radius " + std::to_string(radius) + " reaches past the antipode");
    }

    if (!std::isfinite(centerLat) || !std::isfinite(centerLon) ||
        std::abs(centerLat) > 90.0 || std::abs(centerLon) > 180.0) {
        throw CircleError(ErrorKind::InvalidCenter,
                          "Center (" + std::to_string(centerLat) + ", " +
                          std::to_string(centerLon) + ") is outside the coordinate range");
    }

    // Bearings are undefined at a pole: every boundary point would share one longitude.
    if (std::abs(centerLat) == 90.0) {
        throw CircleError(ErrorKind::InvalidCenter, "Center is at a pole");
    }

    std::vector<BoundaryPoint> points;
    points.reserve(static_cast<std::size_t>(pointCount) + 1);

    for (int i = 0; i <= pointCount; ++i) {
        BoundaryPoint point = Geo::destination(centerLat, centerLon, bearingDegrees(i, pointCount), delta);
        point.sequence = static_cast<double>(i);
        points.push_back(point);
    }

    return points;
}

std::vector<BoundaryPoint> BoundarySampler::samplePlanar(double x, double y, double radius,
                                                         double rescalingDivisor, int pointCount) {
    validatePointCount(pointCount);

    if (!std::isfinite(rescalingDivisor) || rescalingDivisor <= 0.0) {
        throw CircleError(ErrorKind::InvalidSettings,
                          "Rescaling divisor must be positive, got " + std::to_string(rescalingDivisor));
    }

    if (!std::isfinite(radius) || radius <= 0.0) {
        throw CircleError(ErrorKind::InvalidRadius,
                          "Radius must be positive, got " + std::to_string(radius));
    }

    if (!std::isfinite(x) || !std::isfinite(y)) {
        throw CircleError(ErrorKind::InvalidCenter, "Planar center must be finite");
    }

    double centerX = x / rescalingDivisor;
    double centerY = y / rescalingDivisor;
    double scaledRadius = radius / rescalingDivisor;

    std::vector<BoundaryPoint> points;
    points.reserve(static_cast<std::size_t>(pointCount) + 1);

    for (int i = 0; i <= pointCount; ++i) {
        double angle = Geo::toRadians(bearingDegrees(i, pointCount));

        BoundaryPoint point;
        point.sequence = static_cast<double>(i);
        point.lat = centerX + scaledRadius * std::sin(angle);
        point.lon = centerY + scaledRadius * std::cos(angle);
        points.push_back(point);
    }

    return points;
}

double BoundarySampler::bearingDegrees(int index, int pointCount) {
    return std::fmod(360.0 * index / pointCount, 360.0);
}

void BoundarySampler::validatePointCount(int pointCount) {
    if (pointCount < 3) {
        throw CircleError(ErrorKind::InvalidPointCount,
                          "Point count must be at least 3, got " + std::to_string(pointCount));
    }
}

} // namespace geocircle::domain
