#include "Geo.hpp"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geocircle {

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

double Geo::positiveMod(double value, double modulus) {
    double remainder = std::fmod(value, modulus);
    if (remainder < 0) {
        remainder += modulus;
    }
    // -tiny + modulus rounds up to modulus
    if (remainder >= modulus) {
        remainder -= modulus;
    }
    return remainder;
}

double Geo::normalizeLongitude(double lonDeg) {
    return positiveMod(lonDeg + 180.0, 360.0) - 180.0;
}

double Geo::shiftLongitude(double lonDeg) {
    return positiveMod(lonDeg + 360.0, 360.0);
}

bool Geo::crossesAntimeridian(double previousLon, double currentLon) {
    return std::abs(currentLon - previousLon) > 180.0;
}

double Geo::angularDistance(double distance, double sphereRadius) {
    return distance / sphereRadius;
}

BoundaryPoint Geo::destination(double lat, double lon, double bearingDeg, double angularDistance) {
    double bearing = toRadians(bearingDeg);
    double d = angularDistance;

    double lat1 = toRadians(lat);
    double lon1 = toRadians(lon);

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
                            std::cos(lat1) * std::sin(d) * std::cos(bearing));

    double lon2 = lon1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                    std::cos(d) - std::sin(lat1) * std::sin(lat2));

    BoundaryPoint result;
    result.lat = toDegrees(lat2);
    result.lon = normalizeLongitude(toDegrees(lon2));
    return result;
}

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2, double sphereRadius) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return sphereRadius * c;
}

} // namespace geocircle
