#include "RingSegmenter.hpp"
#include "../CircleError.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <string>

namespace geocircle::domain {

RingGeometry RingSegmenter::segment(const std::vector<BoundaryPoint>& points,
                                    const std::vector<CrossingEvent>& crossings) const {
    if (crossings.empty()) {
        SingleBatch single;
        single.batch.points = points;
        verify(single.batch, 0);
        return single;
    }

    if (crossings.size() != 2) {
        throw CircleError(ErrorKind::UnsupportedCrossingCount,
                          "Ring crosses the antimeridian " + std::to_string(crossings.size()) +
                          " times, only 0 or 2 crossings can be segmented");
    }

    auto [first, last] = std::minmax_element(crossings.begin(), crossings.end(),
        [](const CrossingEvent& a, const CrossingEvent& b) { return a.index < b.index; });

    double lowerAnchor = first->anchor();
    double upperAnchor = last->anchor();
    double midpoint = static_cast<double>((first->index + last->index) / 2);

    std::vector<BoundaryPoint> augmented = points;
    for (const auto& crossing : crossings) {
        augmented.push_back(crossing.approachPoint());
        augmented.push_back(crossing.departurePoint());
    }
    std::stable_sort(augmented.begin(), augmented.end(),
        [](const BoundaryPoint& a, const BoundaryPoint& b) { return a.sequence < b.sequence; });

    MultiBatch multi;
    for (const auto& point : augmented) {
        std::size_t batchIndex;
        if (point.sequence < lowerAnchor) {
            batchIndex = 0;
        } else if (point.sequence < midpoint) {
            batchIndex = 1;
        } else if (point.sequence < upperAnchor) {
            batchIndex = 2;
        } else {
            batchIndex = 3;
        }
        multi.batches[batchIndex].points.push_back(point);
    }

    for (std::size_t i = 0; i < multi.batches.size(); ++i) {
        verify(multi.batches[i], i);
    }

    return multi;
}

bool RingSegmenter::isNonWrapping(const Batch& batch) {
    for (std::size_t i = 1; i < batch.points.size(); ++i) {
        if (Geo::crossesAntimeridian(batch.points[i - 1].lon, batch.points[i].lon)) {
            return false;
        }
    }
    return true;
}

void RingSegmenter::verify(const Batch& batch, std::size_t batchIndex) {
    if (!isNonWrapping(batch)) {
        throw CircleError(ErrorKind::WrappingBatch,
                          "Batch " + std::to_string(batchIndex) + " wraps across the antimeridian");
    }
}

} // namespace geocircle::domain
