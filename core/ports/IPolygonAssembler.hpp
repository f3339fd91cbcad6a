#pragma once

#include "../Circle.hpp"
#include <variant>
#include <vector>

namespace geocircle::ports {

template<typename Line, typename Polygon>
class IPolygonAssembler {
public:
    virtual ~IPolygonAssembler() = default;

    virtual Line makeLine(const std::vector<BoundaryPoint>& points) const = 0;
    virtual Line makeLine(const std::vector<BoundaryPoint>& points, const Line& tail) const = 0;
    virtual Polygon makePolygon(const Line& line) const = 0;
};

// Joins the batches back to front so the final line runs 0, 1, 2, 3.
template<typename Line, typename Polygon>
Polygon assemble(const IPolygonAssembler<Line, Polygon>& assembler, const RingGeometry& geometry) {
    if (const auto* single = std::get_if<SingleBatch>(&geometry)) {
        return assembler.makePolygon(assembler.makeLine(single->batch.points));
    }

    const auto& batches = std::get<MultiBatch>(geometry).batches;
    Line line = assembler.makeLine(batches.back().points);
    for (auto it = batches.rbegin() + 1; it != batches.rend(); ++it) {
        line = assembler.makeLine(it->points, line);
    }
    return assembler.makePolygon(line);
}

} // namespace geocircle::ports
