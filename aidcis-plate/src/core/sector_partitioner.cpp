#include "core/sector_partitioner.h"
#include <cmath>

namespace aidcis {
namespace plate {

namespace {
const double BOUNDARY_SNAP_DEGREES = 1e-9;
}

int SectorPartitioner::sectorForAngle(double angleDegrees, int sectorCount) {
    double span = sectorSpan(sectorCount);
    double position = angles::normalizeDegrees(angleDegrees) / span;

    double nearest = std::round(position);
    if (std::fabs(position - nearest) * span < BOUNDARY_SNAP_DEGREES) {
        position = nearest;
    }

    int sector = static_cast<int>(std::floor(position));
    if (sector >= sectorCount) {
        sector = 0;     // 360 wraps to the first boundary
    }
    return sector;
}

int SectorPartitioner::sectorForPoint(const Point2D& point, const Point2D& center, int sectorCount) {
    return sectorForAngle(angles::angleFrom(center, point), sectorCount);
}

std::vector<SectorInfo> SectorPartitioner::describeSectors(int sectorCount) {
    std::vector<SectorInfo> sectors;
    if (!isValidSectorCount(sectorCount)) {
        return sectors;
    }

    double span = sectorSpan(sectorCount);
    for (int k = 0; k < sectorCount; ++k) {
        SectorInfo info;
        info.index = k;
        info.startAngle = k * span;
        info.endAngle = (k + 1) * span;
        sectors.push_back(info);
    }
    return sectors;
}

PartitionResult SectorPartitioner::partition(const HoleCollection& collection, int sectorCount) {
    return partition(collection, sectorCount, collection.getCenter());
}

PartitionResult SectorPartitioner::partition(const HoleCollection& collection,
                                             int sectorCount,
                                             const Point2D& center) {
    PartitionResult result;
    result.center = center;
    result.sectorCount = sectorCount;

    if (!isValidSectorCount(sectorCount)) {
        result.errorCode = PartitionErrorCode::INVALID_SECTOR_COUNT;
        result.errors.push_back("Sector count " + std::to_string(sectorCount) +
                                " is outside [" + std::to_string(MIN_SECTOR_COUNT) + ", " +
                                std::to_string(MAX_SECTOR_COUNT) + "]");
        return result;
    }

    result.sectors = describeSectors(sectorCount);
    result.holes.setNormalization(collection.getNormalization());

    for (const auto& hole : collection.getHoles()) {
        int sector = sectorForPoint(hole.getCenter(), center, sectorCount);

        Hole assigned = hole;
        assigned.setSector(sector);
        result.holes.addHole(assigned);
        result.sectors[sector].holeCount++;
    }

    for (const auto& info : result.sectors) {
        if (info.holeCount == 0 && !collection.empty()) {
            result.warnings.push_back("Sector " + std::to_string(info.index) + " has no holes");
        }
    }

    result.success = true;
    return result;
}

} // namespace plate
} // namespace aidcis
