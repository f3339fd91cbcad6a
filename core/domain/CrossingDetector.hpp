#pragma once

#include "../Circle.hpp"
#include <optional>
#include <vector>

namespace geocircle::domain {

class CrossingDetector {
public:
    explicit CrossingDetector(CrossingFormula formula = CrossingFormula::Interpolated);

    // Scans consecutive pairs of a sampled ring; events come out in ring order.
    std::vector<CrossingEvent> detect(const std::vector<BoundaryPoint>& points) const;

    std::optional<CrossingEvent> examine(const BoundaryPoint& previous,
                                         const BoundaryPoint& current,
                                         std::size_t index) const;

    CrossingFormula formula() const { return formula_; }

private:
    double crossingLatitude(const BoundaryPoint& previous, const BoundaryPoint& current,
                            int modifier, std::size_t index) const;

    CrossingFormula formula_;
};

} // namespace geocircle::domain
