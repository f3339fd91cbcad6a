#include "CirclePipeline.hpp"
#include "BoundarySampler.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <optional>
#include <unordered_set>
#include <utility>

namespace geocircle::domain {

CirclePipeline::CirclePipeline(CircleSettings settings)
    : settings_(settings), detector_(settings.crossingFormula) {
}

CircleResult CirclePipeline::process(const Location& location) const {
    CircleResult result;
    result.location = location;

    if (location.model == CoordinateModel::Planar) {
        result.ring = BoundarySampler::samplePlanar(location.latitude, location.longitude, location.radius,
                                                    settings_.rescalingDivisor, settings_.pointCount);
        result.geometry = SingleBatch{Batch{result.ring}};
        return result;
    }

    result.ring = BoundarySampler::sample(location.latitude, location.longitude, location.radius,
                                          settings_.earthRadius, settings_.pointCount);

    if (settings_.antimeridian == AntimeridianMode::Ignore) {
        result.geometry = SingleBatch{Batch{result.ring}};
        return result;
    }

    result.crossings = detector_.detect(result.ring);
    result.geometry = segmenter_.segment(result.ring, result.crossings);
    return result;
}

PipelineResult CirclePipeline::run(const std::vector<Location>& locations) const {
    struct Outcome {
        std::optional<CircleResult> circle;
        std::optional<LocationError> error;
    };

    std::vector<Outcome> outcomes(locations.size());

    std::unordered_set<std::string> seenIds;
    for (std::size_t i = 0; i < locations.size(); ++i) {
        if (!seenIds.insert(locations[i].id).second) {
            outcomes[i].error = LocationError{locations[i].id, ErrorKind::DuplicateLocation,
                                              "Location id '" + locations[i].id + "' is not unique"};
        }
    }

    std::size_t wave = settings_.maxConcurrency == 0 ? locations.size()
                                                     : static_cast<std::size_t>(settings_.maxConcurrency);

    for (std::size_t start = 0; start < locations.size(); start += wave) {
        std::size_t end = std::min(locations.size(), start + wave);

        std::vector<std::pair<std::size_t, std::future<CircleResult>>> tasks;
        for (std::size_t i = start; i < end; ++i) {
            if (outcomes[i].error) continue;

            const Location& location = locations[i];
            tasks.emplace_back(i, std::async(std::launch::async, [this, &location]() {
                return process(location);
            }));
        }

        for (auto& [index, task] : tasks) {
            try {
                outcomes[index].circle = task.get();
            } catch (const CircleError& e) {
                outcomes[index].error = LocationError{locations[index].id, e.kind(), e.what()};
            }
        }
    }

    PipelineResult result;
    for (auto& outcome : outcomes) {
        if (outcome.circle) {
            result.circles.push_back(std::move(*outcome.circle));
        } else if (outcome.error) {
            std::cerr << "[Pipeline] Location " << outcome.error->locationId << " failed ("
                      << errorKindToString(outcome.error->kind) << "): "
                      << outcome.error->message << std::endl;
            result.errors.push_back(std::move(*outcome.error));
        }
    }

    std::cout << "[Pipeline] Processed " << locations.size() << " locations: "
              << result.circles.size() << " ok, " << result.errors.size() << " failed" << std::endl;

    return result;
}

} // namespace geocircle::domain
