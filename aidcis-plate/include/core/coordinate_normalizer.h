#ifndef AIDCIS_PLATE_COORDINATE_NORMALIZER_H
#define AIDCIS_PLATE_COORDINATE_NORMALIZER_H

#include "core/hole.h"

namespace aidcis {
namespace plate {

/**
 * Brings CAD coordinates into the single convention used downstream:
 * X right, Y up, angles counter-clockwise from +X.
 *
 * The optional Y flip is applied first, then a counter-clockwise rotation,
 * both about the bounding-box center of the input. normalize() is pure and
 * compounds when called repeatedly with a non-zero rotation; callers that may
 * see an already-normalized collection use normalizeOnce().
 */
class CoordinateNormalizer {
public:
    /**
     * Return a transformed copy of a collection
     * @param collection Input holes (unchanged)
     * @param rotationDegrees Counter-clockwise rotation, negative for clockwise
     * @param flipY Mirror Y about the center before rotating
     * @return New collection, ids and hole state preserved
     */
    static HoleCollection normalize(const HoleCollection& collection,
                                    double rotationDegrees,
                                    bool flipY);

    // Same as above with an explicit pivot instead of the bounding-box center
    static HoleCollection normalize(const HoleCollection& collection,
                                    double rotationDegrees,
                                    bool flipY,
                                    const Point2D& pivot);

    /**
     * Normalize only if the collection has not been normalized before
     * @param applied Set to whether the transform was applied
     */
    static HoleCollection normalizeOnce(const HoleCollection& collection,
                                        double rotationDegrees,
                                        bool flipY,
                                        bool* applied = nullptr);

    static bool isNormalized(const HoleCollection& collection) {
        return collection.getNormalization().normalized;
    }

    // Transform a single point with the same convention
    static Point2D transformPoint(const Point2D& point,
                                  double rotationDegrees,
                                  bool flipY,
                                  const Point2D& pivot);

    /**
     * Map a point drawn beside a collection, such as the plate outline center,
     * exactly as normalize() maps the collection's holes
     * @param collection The collection before normalization
     */
    static Point2D transformAlongside(const Point2D& point,
                                      const HoleCollection& collection,
                                      double rotationDegrees,
                                      bool flipY);

    // Cosine and sine of an angle, exact for multiples of 90 degrees
    static void rotationTerms(double degrees, double& cosine, double& sine);
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_COORDINATE_NORMALIZER_H
