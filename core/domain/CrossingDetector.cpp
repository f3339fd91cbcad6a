#include "CrossingDetector.hpp"
#include "../CircleError.hpp"
#include "../Geo.hpp"
#include <string>

namespace geocircle::domain {

CrossingDetector::CrossingDetector(CrossingFormula formula) : formula_(formula) {
}

std::vector<CrossingEvent> CrossingDetector::detect(const std::vector<BoundaryPoint>& points) const {
    std::vector<CrossingEvent> events;
    if (points.size() < 2) {
        return events;
    }

    const BoundaryPoint* previous = &points.front();
    for (std::size_t i = 1; i < points.size(); ++i) {
        const BoundaryPoint& current = points[i];
        if (auto event = examine(*previous, current, i)) {
            events.push_back(*event);
        }
        previous = &current;
    }

    return events;
}

std::optional<CrossingEvent> CrossingDetector::examine(const BoundaryPoint& previous,
                                                       const BoundaryPoint& current,
                                                       std::size_t index) const {
    if (!Geo::crossesAntimeridian(previous.lon, current.lon)) {
        return std::nullopt;
    }

    CrossingEvent event;
    event.index = index;
    event.modifier = current.lon < previous.lon ? -1 : 1;
    event.direction = event.modifier < 0 ? CrossingDirection::Eastbound : CrossingDirection::Westbound;
    event.longitude = event.modifier * 180.0;
    event.latitude = crossingLatitude(previous, current, event.modifier, index);
    return event;
}

double CrossingDetector::crossingLatitude(const BoundaryPoint& previous, const BoundaryPoint& current,
                                          int modifier, std::size_t index) const {
    // Straight line through both points in [0, 360) longitude space, where the seam sits at 180.
    double previousShifted = Geo::shiftLongitude(previous.lon);
    double currentShifted = Geo::shiftLongitude(current.lon);

    double run = currentShifted - previousShifted;
    if (run == 0.0) {
        throw CircleError(ErrorKind::DegenerateCrossing,
                          "Zero longitude delta across the antimeridian at point " + std::to_string(index));
    }

    double gradient = (current.lat - previous.lat) / run;

    if (formula_ == CrossingFormula::Reference) {
        double intercept = current.lat - gradient * current.lon;
        double crossingLongitude = modifier * 180.0;
        return gradient * crossingLongitude * 180.0 + intercept;
    }

    // Default: evaluate the line at the seam so the latitude stays between the
    // two neighbours. Reference reproduces the legacy arithmetic above; see
    // "Crossing latitude formula" in DESIGN.md.
    double intercept = current.lat - gradient * currentShifted;
    return gradient * 180.0 + intercept;
}

} // namespace geocircle::domain
