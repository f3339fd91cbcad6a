#pragma once

#include <stdexcept>
#include <string>

namespace geocircle {

enum class ErrorKind {
    InvalidRadius,
    InvalidPointCount,
    InvalidCenter,
    InvalidSettings,
    DegenerateCrossing,
    UnsupportedCrossingCount,
    WrappingBatch,
    DuplicateLocation
};

/**
 * @brief Input-validation failure raised while computing a single circle
 *
 * Thrown by the sampler, detector and segmenter. The pipeline catches it per
 * Location and records it as a LocationError.
 */
class CircleError : public std::runtime_error {
public:
    CircleError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

struct LocationError {
    std::string locationId;
    ErrorKind kind = ErrorKind::InvalidRadius;
    std::string message;
};

std::string errorKindToString(ErrorKind kind);

} // namespace geocircle
