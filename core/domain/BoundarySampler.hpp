#pragma once

#include "../Circle.hpp"
#include <vector>

namespace geocircle::domain {

/**
 * @brief Generates the closed boundary ring of a circle
 *
 * Walks the bearing from 0 to 360 degrees in point_count equal steps and
 * emits point_count + 1 points; the last step wraps the bearing back to 0 so
 * the first and last points coincide.
 */
class BoundarySampler {
public:
    /**
     * @brief Sample a circle on the sphere with the great-circle destination formula
     * @param centerLat Center latitude in degrees, [-90, 90], not a pole
     * @param centerLon Center longitude in degrees, [-180, 180]
     * @param radius Circle radius, same unit as earthRadius
     * @param earthRadius Sphere radius
     * @param pointCount Number of distinct boundary points, at least 3
     * @return Closed ring with canonical longitudes in [-180, 180)
     * @throws CircleError InvalidPointCount, InvalidRadius, InvalidCenter or InvalidSettings
     */
    static std::vector<BoundaryPoint> sample(double centerLat, double centerLon, double radius,
                                             double earthRadius, int pointCount);

    /**
     * @brief Sample a circle on the flat plane, scaled down by rescalingDivisor
     *
     * x drives the latitude axis and y the longitude axis of the output so the
     * result can go through the same geometry constructors as spherical rings.
     */
    static std::vector<BoundaryPoint> samplePlanar(double x, double y, double radius,
                                                   double rescalingDivisor, int pointCount);

    static double bearingDegrees(int index, int pointCount);

private:
    static void validatePointCount(int pointCount);
};

} // namespace geocircle::domain
