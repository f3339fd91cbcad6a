#pragma once

#include "../Circle.hpp"
#include <vector>

namespace geocircle::domain {

/**
 * @brief Splits a sampled ring into batches that never cross the antimeridian
 *
 * A ring without crossings stays one batch. A ring with two crossings is
 * augmented with the synthesized seam points of both events and cut into
 * four batches: before the first crossing, the two halves of the region
 * between the crossings, and the run from the second crossing back to the
 * closing point. Concatenated in order the batches reproduce the full ring.
 *
 * @note Rings crossing the antimeridian any other number of times (a circle
 *       enclosing a pole, or wider than a hemisphere) are rejected.
 */
class RingSegmenter {
public:
    RingGeometry segment(const std::vector<BoundaryPoint>& points,
                         const std::vector<CrossingEvent>& crossings) const;

    static bool isNonWrapping(const Batch& batch);

private:
    static void verify(const Batch& batch, std::size_t batchIndex);
};

} // namespace geocircle::domain
