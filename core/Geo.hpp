#pragma once

#include "Circle.hpp"

namespace geocircle {

class Geo {
public:
    static constexpr double DEFAULT_EARTH_RADIUS_METERS = 6371009.0;

    static double toRadians(double degrees);
    static double toDegrees(double radians);

    // Remainder in [0, modulus) for a positive modulus, whatever the sign of value.
    static double positiveMod(double value, double modulus);

    static double normalizeLongitude(double lonDeg);
    static double shiftLongitude(double lonDeg);
    static bool crossesAntimeridian(double previousLon, double currentLon);

    static double angularDistance(double distance, double sphereRadius);

    static BoundaryPoint destination(double lat, double lon, double bearingDeg, double angularDistance);

    static double distanceMeters(double lat1, double lon1, double lat2, double lon2,
                                 double sphereRadius = DEFAULT_EARTH_RADIUS_METERS);
};

} // namespace geocircle
