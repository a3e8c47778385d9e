#include "core/coordinate_normalizer.h"
#include <cmath>

namespace aidcis {
namespace plate {

void CoordinateNormalizer::rotationTerms(double degrees, double& cosine, double& sine) {
    double wrapped = angles::normalizeDegrees(degrees);

    if (std::fmod(wrapped, 90.0) == 0.0) {
        switch (static_cast<int>(wrapped / 90.0)) {
            case 0: cosine = 1.0;  sine = 0.0;  return;
            case 1: cosine = 0.0;  sine = 1.0;  return;
            case 2: cosine = -1.0; sine = 0.0;  return;
            case 3: cosine = 0.0;  sine = -1.0; return;
            default: break;
        }
    }

    double radians = angles::toRadians(wrapped);
    cosine = std::cos(radians);
    sine = std::sin(radians);
}

Point2D CoordinateNormalizer::transformPoint(const Point2D& point,
                                             double rotationDegrees,
                                             bool flipY,
                                             const Point2D& pivot) {
    double dx = point.x - pivot.x;
    double dy = point.y - pivot.y;

    if (flipY) {
        dy = -dy;
    }

    double cosine, sine;
    rotationTerms(rotationDegrees, cosine, sine);

    return Point2D(pivot.x + dx * cosine - dy * sine,
                   pivot.y + dx * sine + dy * cosine);
}

HoleCollection CoordinateNormalizer::normalize(const HoleCollection& collection,
                                               double rotationDegrees,
                                               bool flipY) {
    return normalize(collection, rotationDegrees, flipY, collection.getCenter());
}

HoleCollection CoordinateNormalizer::normalize(const HoleCollection& collection,
                                               double rotationDegrees,
                                               bool flipY,
                                               const Point2D& pivot) {
    HoleCollection result;

    for (const auto& hole : collection.getHoles()) {
        Point2D moved = transformPoint(hole.getCenter(), rotationDegrees, flipY, pivot);
        result.addHole(hole.relocated(hole.getId(), moved.x, moved.y));
    }

    NormalizationState state = collection.getNormalization();
    state.normalized = true;
    state.rotationDegrees = angles::normalizeDegrees(state.rotationDegrees + rotationDegrees);
    state.flippedY = state.flippedY != flipY;
    result.setNormalization(state);

    return result;
}

Point2D CoordinateNormalizer::transformAlongside(const Point2D& point,
                                                 const HoleCollection& collection,
                                                 double rotationDegrees,
                                                 bool flipY) {
    return transformPoint(point, rotationDegrees, flipY, collection.getCenter());
}

HoleCollection CoordinateNormalizer::normalizeOnce(const HoleCollection& collection,
                                                   double rotationDegrees,
                                                   bool flipY,
                                                   bool* applied) {
    if (isNormalized(collection)) {
        if (applied) {
            *applied = false;
        }
        return collection;
    }

    if (applied) {
        *applied = true;
    }
    return normalize(collection, rotationDegrees, flipY);
}

} // namespace plate
} // namespace aidcis
