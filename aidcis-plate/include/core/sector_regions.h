#ifndef AIDCIS_PLATE_SECTOR_REGIONS_H
#define AIDCIS_PLATE_SECTOR_REGIONS_H

#include "core/geometry.h"
#include "core/hole.h"
#include <clipper2/clipper.h>
#include <vector>

namespace aidcis {
namespace plate {

/**
 * Sector wedge clipped to the plate disk
 */
struct SectorRegion {
    int index = 0;
    double startAngle = 0.0;
    double endAngle = 0.0;
    std::vector<Polygon> polygons;   // Usually one, empty if the wedge misses the disk
    double area = 0.0;
};

/**
 * Builds renderable sector areas with Clipper2.
 *
 * Each wedge is a fan from the center out past the disk radius and is
 * intersected with a polygonal approximation of the plate disk.
 */
class SectorRegionBuilder {
public:
    /**
     * @param scaleFactor Integer scaling applied before clipping (1000 = 0.001 units)
     * @param circleSegments Segment count of the disk approximation
     */
    explicit SectorRegionBuilder(int scaleFactor = 1000, int circleSegments = 360);

    /**
     * Build all sector regions
     * @param center Partition center
     * @param diskRadius Plate radius around the center
     * @param sectorCount Number of sectors, 2..12
     * @return One region per sector, empty if the input is invalid
     */
    std::vector<SectorRegion> build(const Point2D& center, double diskRadius, int sectorCount) const;

    // Same, with the plate disk centered away from the partition center
    std::vector<SectorRegion> build(const Point2D& center,
                                    const Point2D& diskCenter,
                                    double diskRadius,
                                    int sectorCount) const;

    // Radius that encloses every hole of the collection, hole radius included
    static double envelopeRadius(const HoleCollection& collection, const Point2D& center);

    // Wedge polygon covering [startAngle, endAngle] out to the given radius
    Polygon wedge(const Point2D& center, double radius, double startAngle, double endAngle) const;

private:
    int m_scaleFactor;
    int m_circleSegments;

    Clipper2Lib::Paths64 toClipper(const Polygon& polygon) const;
    Polygon fromClipper(const Clipper2Lib::Path64& path) const;
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_SECTOR_REGIONS_H
