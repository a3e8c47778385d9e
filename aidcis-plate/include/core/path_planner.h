#ifndef AIDCIS_PLATE_PATH_PLANNER_H
#define AIDCIS_PLATE_PATH_PLANNER_H

#include "core/hole.h"
#include <string>
#include <vector>

namespace aidcis {
namespace plate {

/**
 * What planning an empty hole set returns
 */
enum class EmptyInputPolicy {
    ERROR,          // Fail with PathErrorCode::EMPTY_INPUT
    EMPTY_PATH      // Succeed with no steps
};

struct PathPlannerParams {
    bool intervalPairing = false;   // Combine column c with column c + pairInterval
    int pairInterval = 4;           // Column-index difference of a pair
    EmptyInputPolicy emptyInput = EmptyInputPolicy::ERROR;
};

enum class PathErrorCode {
    NONE,
    EMPTY_INPUT,
    UNNUMBERED_INPUT    // A hole has no row/column assignment
};

enum class RowDirection {
    ASCENDING,      // Row 1 first
    DESCENDING      // Highest row first
};

/**
 * One detection unit: a single hole, or two holes serviced together
 */
struct PathStep {
    size_t index = 0;
    std::string holeId;
    std::string pairedHoleId;   // Empty for a singleton

    bool isPair() const { return !pairedHoleId.empty(); }
    std::vector<std::string> holeIds() const;
};

struct PathMetrics {
    size_t unitCount = 0;
    size_t pairCount = 0;
    size_t holeCount = 0;
    int rowChanges = 0;
    double totalDistance = 0.0;     // Sum of moves between consecutive units
    double averageStep = 0.0;
    double maxJump = 0.0;
};

struct PathPlanResult {
    std::vector<PathStep> steps;
    bool success = false;
    PathErrorCode errorCode = PathErrorCode::NONE;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    int sector = NO_SECTOR;         // NO_SECTOR when planned over a whole collection
    RowDirection rowDirection = RowDirection::ASCENDING;
    PathMetrics metrics;

    bool hasWarnings() const { return !warnings.empty(); }
    bool hasErrors() const { return !errors.empty(); }
    bool isValid() const { return success && !hasErrors(); }
};

/**
 * Orders numbered holes into a serpentine sweep.
 *
 * Rows are visited in one direction per planned set, chosen from where the
 * set's centroid lies relative to the overall center: at or above it rows
 * ascend (nearest the center first), below it rows descend. Columns
 * alternate left-to-right and right-to-left on successive rows.
 */
class PathPlanner {
public:
    explicit PathPlanner(const PathPlannerParams& params = PathPlannerParams());

    const PathPlannerParams& getParams() const { return m_params; }

    /**
     * Plan a path over an arbitrary set of holes
     * @param holes Holes with row/column assigned
     * @param overallCenter Center the row direction is judged against
     */
    PathPlanResult plan(const std::vector<Hole>& holes, const Point2D& overallCenter) const;

    // Plan over a whole collection around its own center
    PathPlanResult plan(const HoleCollection& collection) const;

    // Plan over the holes of one sector
    PathPlanResult planSector(const HoleCollection& collection, int sector,
                              const Point2D& overallCenter) const;

    // Plan every sector in index order
    std::vector<PathPlanResult> planSectors(const HoleCollection& collection, int sectorCount,
                                            const Point2D& overallCenter) const;

    static RowDirection chooseRowDirection(const std::vector<Hole>& holes, const Point2D& overallCenter);

    /**
     * Travel statistics of a path; a pair counts at its midpoint
     * @param steps Path to measure
     * @param collection Holes the path refers to
     */
    static PathMetrics computeMetrics(const std::vector<PathStep>& steps, const HoleCollection& collection);

private:
    PathPlannerParams m_params;

    // Units of one row in ascending column order
    std::vector<PathStep> buildRowUnits(const std::vector<const Hole*>& row) const;
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_PATH_PLANNER_H
