#ifndef AIDCIS_PLATE_GEOMETRY_EXTRACTOR_H
#define AIDCIS_PLATE_GEOMETRY_EXTRACTOR_H

#include "core/hole.h"
#include <string>
#include <vector>

namespace aidcis {
namespace plate {

enum class PrimitiveKind {
    CIRCLE,
    ARC
};

/**
 * A raw circle or arc entity as delivered by the CAD loader.
 * Arc angles are in degrees, counter-clockwise from start to end.
 */
struct CadPrimitive {
    PrimitiveKind kind = PrimitiveKind::CIRCLE;
    double centerX = 0.0;
    double centerY = 0.0;
    double radius = 0.0;
    double startAngle = 0.0;
    double endAngle = 0.0;
    std::string layer;

    static CadPrimitive circle(double cx, double cy, double r, const std::string& layer = "");
    static CadPrimitive arc(double cx, double cy, double r, double startDeg, double endDeg,
                            const std::string& layer = "");
};

/**
 * Tolerances used to turn primitives into holes
 */
struct ExtractionParams {
    double positionTolerance = 0.01;    // Max center offset between merged primitives
    double radiusTolerance = 0.1;       // Max radius difference, also vs. expected radius
    double gapToleranceDegrees = 1.0;   // Uncovered angle still accepted as a closed circle
    double expectedHoleRadius = 8.865;
};

enum class GeometryErrorCode {
    NONE,
    AMBIGUOUS_MATCH,    // More than two hole-radius primitives compete for one hole
    EMPTY_RESULT        // Non-empty input produced no holes
};

enum class SkipReason {
    UNMATCHED_ARC,          // Lone arc that does not close on its own
    INCOMPLETE_COVERAGE,    // Arcs share a center but leave a gap
    AMBIGUOUS_DUPLICATE,    // Lost against a better match at the same center
    RADIUS_MISMATCH         // Not a hole of the expected size (closed ones become rejected circles)
};

std::string skipReasonToString(SkipReason reason);

/**
 * Diagnostic for a primitive that did not become part of a hole
 */
struct SkippedPrimitive {
    size_t index = 0;       // Position in the input sequence
    SkipReason reason = SkipReason::UNMATCHED_ARC;
    std::string message;
};

/**
 * Closed circle that was reconstructed but rejected by the radius filter
 */
struct RejectedCircle {
    double centerX = 0.0;
    double centerY = 0.0;
    double radius = 0.0;
};

/**
 * Result of an extraction run. The collection is best effort even when
 * success is false.
 */
struct ExtractionResult {
    HoleCollection holes;
    bool success = false;
    GeometryErrorCode errorCode = GeometryErrorCode::NONE;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::vector<SkippedPrimitive> skipped;
    std::vector<RejectedCircle> rejectedCircles;

    // Statistics
    size_t primitiveCount = 0;
    size_t circleCount = 0;
    size_t arcCount = 0;
    size_t mergedArcPairs = 0;

    bool hasWarnings() const { return !warnings.empty(); }
    bool hasErrors() const { return !errors.empty(); }
    bool isValid() const { return success && !hasErrors(); }

    // Largest rejected circle, typically the plate outline
    bool getBoundaryCircle(RejectedCircle& circle) const;
};

/**
 * Reconstructs holes from CAD circles and arc pairs.
 *
 * Primitives are grouped by center and radius. A group becomes a hole when
 * its members close a full circle within the gap tolerance and the merged
 * radius matches the expected hole radius.
 */
class GeometryExtractor {
public:
    explicit GeometryExtractor(const ExtractionParams& params = ExtractionParams());

    const ExtractionParams& getParams() const { return m_params; }

    /**
     * Extract holes from a primitive sequence
     * @param primitives Raw CAD entities
     * @return Holes with provisional ids plus diagnostics
     */
    ExtractionResult extract(const std::vector<CadPrimitive>& primitives) const;

    /**
     * Angle in degrees left uncovered by the union of the given primitives.
     * A full circle leaves 0.
     */
    static double uncoveredDegrees(const std::vector<const CadPrimitive*>& members);

private:
    ExtractionParams m_params;

    std::vector<std::vector<size_t>> groupPrimitives(const std::vector<CadPrimitive>& primitives) const;
    bool sameFeature(const CadPrimitive& a, const CadPrimitive& b) const;

    static void addError(ExtractionResult& result, const std::string& error);
    static void addWarning(ExtractionResult& result, const std::string& warning);
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_GEOMETRY_EXTRACTOR_H
