#include "CircleError.hpp"
#include <unordered_map>

namespace geocircle {

std::string errorKindToString(ErrorKind kind) {
    static const std::unordered_map<ErrorKind, std::string> kindMap = {
        {ErrorKind::InvalidRadius, "invalid_radius"},
        {ErrorKind::InvalidPointCount, "invalid_point_count"},
        {ErrorKind::InvalidCenter, "invalid_center"},
        {ErrorKind::InvalidSettings, "invalid_settings"},
        {ErrorKind::DegenerateCrossing, "degenerate_crossing"},
        {ErrorKind::UnsupportedCrossingCount, "unsupported_crossing_count"},
        {ErrorKind::WrappingBatch, "wrapping_batch"},
        {ErrorKind::DuplicateLocation, "duplicate_location"}
    };

    auto it = kindMap.find(kind);
    return (it != kindMap.end()) ? it->second : "unknown";
}

} // namespace geocircle
