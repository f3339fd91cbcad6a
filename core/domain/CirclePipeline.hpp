#pragma once

#include "../Circle.hpp"
#include "../CircleError.hpp"
#include "CrossingDetector.hpp"
#include "RingSegmenter.hpp"
#include <vector>

namespace geocircle::domain {

struct PipelineResult {
    std::vector<CircleResult> circles;
    std::vector<LocationError> errors;

    bool complete() const { return errors.empty(); }
};

/**
 * @brief Runs sampler, detector and segmenter for a set of locations
 *
 * Locations are independent: run() computes each on its own task and
 * collects the outcomes in input order. A CircleError raised for one
 * location is recorded in PipelineResult::errors and the others proceed.
 */
class CirclePipeline {
public:
    explicit CirclePipeline(CircleSettings settings = {});

    /**
     * @brief Compute the ring geometry of a single location
     * @throws CircleError when the location or settings are invalid
     */
    CircleResult process(const Location& location) const;

    PipelineResult run(const std::vector<Location>& locations) const;

    const CircleSettings& settings() const { return settings_; }

private:
    CircleSettings settings_;
    CrossingDetector detector_;
    RingSegmenter segmenter_;
};

} // namespace geocircle::domain
