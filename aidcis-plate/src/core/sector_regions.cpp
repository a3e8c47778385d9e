#include "core/sector_regions.h"
#include "core/sector_partitioner.h"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace aidcis {
namespace plate {

SectorRegionBuilder::SectorRegionBuilder(int scaleFactor, int circleSegments)
    : m_scaleFactor(scaleFactor > 0 ? scaleFactor : 1000),
      m_circleSegments(circleSegments >= 3 ? circleSegments : 360) {}

Clipper2Lib::Paths64 SectorRegionBuilder::toClipper(const Polygon& polygon) const {
    Clipper2Lib::Paths64 paths;
    Clipper2Lib::Path64 path;

    for (const auto& point : polygon.getPoints()) {
        path.push_back(Clipper2Lib::Point64(
            static_cast<int64_t>(std::llround(point.x * m_scaleFactor)),
            static_cast<int64_t>(std::llround(point.y * m_scaleFactor))
        ));
    }

    paths.push_back(path);
    return paths;
}

Polygon SectorRegionBuilder::fromClipper(const Clipper2Lib::Path64& path) const {
    Polygon polygon;
    double scale = 1.0 / static_cast<double>(m_scaleFactor);

    for (const auto& point : path) {
        polygon.addPoint(Point2D(static_cast<double>(point.x) * scale,
                                 static_cast<double>(point.y) * scale));
    }
    return polygon;
}

Polygon SectorRegionBuilder::wedge(const Point2D& center, double radius,
                                   double startAngle, double endAngle) const {
    Polygon polygon;
    polygon.addPoint(center);

    // Overshoot the radius so the chord edges never cut into the disk
    double reach = radius * 1.5;
    double span = endAngle - startAngle;
    int steps = std::max(2, static_cast<int>(std::ceil(span / 5.0)));

    for (int i = 0; i <= steps; ++i) {
        double angle = angles::toRadians(startAngle + span * i / steps);
        polygon.addPoint(Point2D(center.x + reach * std::cos(angle),
                                 center.y + reach * std::sin(angle)));
    }
    return polygon;
}

double SectorRegionBuilder::envelopeRadius(const HoleCollection& collection, const Point2D& center) {
    double radius = 0.0;
    for (const auto& hole : collection.getHoles()) {
        radius = std::max(radius, center.distanceTo(hole.getCenter()) + hole.getRadius());
    }
    return radius;
}

std::vector<SectorRegion> SectorRegionBuilder::build(const Point2D& center,
                                                     double diskRadius,
                                                     int sectorCount) const {
    return build(center, center, diskRadius, sectorCount);
}

std::vector<SectorRegion> SectorRegionBuilder::build(const Point2D& center,
                                                     const Point2D& diskCenter,
                                                     double diskRadius,
                                                     int sectorCount) const {
    std::vector<SectorRegion> regions;
    if (!SectorPartitioner::isValidSectorCount(sectorCount) || diskRadius <= 0.0) {
        return regions;
    }

    Clipper2Lib::Paths64 disk = toClipper(Polygon::circle(diskCenter, diskRadius, m_circleSegments));
    // Wedges must reach the far side of an off-center disk
    double reach = diskRadius + center.distanceTo(diskCenter);
    double areaScale = 1.0 / (static_cast<double>(m_scaleFactor) * m_scaleFactor);

    for (const auto& info : SectorPartitioner::describeSectors(sectorCount)) {
        SectorRegion region;
        region.index = info.index;
        region.startAngle = info.startAngle;
        region.endAngle = info.endAngle;

        Clipper2Lib::Paths64 slice = toClipper(wedge(center, reach, info.startAngle, info.endAngle));
        Clipper2Lib::Paths64 clipped = Clipper2Lib::Intersect(slice, disk, Clipper2Lib::FillRule::NonZero);

        for (const auto& path : clipped) {
            region.polygons.push_back(fromClipper(path));
            region.area += std::fabs(Clipper2Lib::Area(path)) * areaScale;
        }

        regions.push_back(region);
    }

    return regions;
}

} // namespace plate
} // namespace aidcis
