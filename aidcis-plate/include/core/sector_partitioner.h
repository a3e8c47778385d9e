#ifndef AIDCIS_PLATE_SECTOR_PARTITIONER_H
#define AIDCIS_PLATE_SECTOR_PARTITIONER_H

#include "core/hole.h"
#include <string>
#include <vector>

namespace aidcis {
namespace plate {

const int MIN_SECTOR_COUNT = 2;
const int MAX_SECTOR_COUNT = 12;

enum class PartitionErrorCode {
    NONE,
    INVALID_SECTOR_COUNT
};

/**
 * Angular extent of one sector: [startAngle, endAngle) in degrees
 */
struct SectorInfo {
    int index = 0;
    double startAngle = 0.0;
    double endAngle = 0.0;
    int holeCount = 0;
};

struct PartitionResult {
    HoleCollection holes;
    bool success = false;
    PartitionErrorCode errorCode = PartitionErrorCode::NONE;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    Point2D center;
    int sectorCount = 0;
    std::vector<SectorInfo> sectors;

    bool hasWarnings() const { return !warnings.empty(); }
    bool hasErrors() const { return !errors.empty(); }
    bool isValid() const { return success && !hasErrors(); }
};

/**
 * Assigns every hole to one of N equal angular sectors around a center.
 *
 * Sector k covers [k*360/N, (k+1)*360/N) measured counter-clockwise from +X.
 * Every call reassigns all holes. A hole exactly at the center has angle 0
 * and lands in sector 0; angles within 1e-9 degrees of a boundary snap to it.
 */
class SectorPartitioner {
public:
    // Partition around the bounding-box center of the collection
    static PartitionResult partition(const HoleCollection& collection, int sectorCount);

    static PartitionResult partition(const HoleCollection& collection,
                                     int sectorCount,
                                     const Point2D& center);

    static bool isValidSectorCount(int sectorCount) {
        return sectorCount >= MIN_SECTOR_COUNT && sectorCount <= MAX_SECTOR_COUNT;
    }

    static double sectorSpan(int sectorCount) {
        return 360.0 / static_cast<double>(sectorCount);
    }

    // Sector index of an angle in degrees (any range)
    static int sectorForAngle(double angleDegrees, int sectorCount);

    static int sectorForPoint(const Point2D& point, const Point2D& center, int sectorCount);

    // Boundaries of all sectors without assigning anything
    static std::vector<SectorInfo> describeSectors(int sectorCount);
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_SECTOR_PARTITIONER_H
