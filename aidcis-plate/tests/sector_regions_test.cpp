#include "core/sector_regions.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <cmath>

using namespace aidcis::plate;

TEST(SectorRegionBuilderTest, RegionsTileTheDisk) {
    SectorRegionBuilder builder;
    const double radius = 500.0;
    const double diskArea = angles::PI * radius * radius;

    for (int n : {2, 3, 4, 6, 12}) {
        std::vector<SectorRegion> regions = builder.build(Point2D(50.0, -20.0), radius, n);
        ASSERT_EQ(regions.size(), static_cast<size_t>(n));

        double total = 0.0;
        for (const auto& region : regions) {
            ASSERT_FALSE(region.polygons.empty()) << "N=" << n << " sector " << region.index;
            EXPECT_NEAR(region.area, diskArea / n, diskArea / n * 0.005);
            total += region.area;
        }
        EXPECT_NEAR(total, diskArea, diskArea * 0.005);
    }
}

TEST(SectorRegionBuilderTest, RegionLiesInItsAngularRange) {
    SectorRegionBuilder builder;
    Point2D center(0.0, 0.0);
    std::vector<SectorRegion> regions = builder.build(center, 100.0, 4);
    ASSERT_EQ(regions.size(), 4u);

    // Second quadrant: x <= 0 and y >= 0 up to clipping precision
    const SectorRegion& second = regions[1];
    EXPECT_DOUBLE_EQ(second.startAngle, 90.0);
    EXPECT_DOUBLE_EQ(second.endAngle, 180.0);
    for (const auto& polygon : second.polygons) {
        for (const auto& point : polygon.getPoints()) {
            EXPECT_LE(point.x, 0.001);
            EXPECT_GE(point.y, -0.001);
            EXPECT_LE(center.distanceTo(point), 100.001);
        }
    }
}

TEST(SectorRegionBuilderTest, OffCenterDiskIsStillCovered) {
    SectorRegionBuilder builder;
    const Point2D center(0.0, 0.0);
    const Point2D diskCenter(40.0, 0.0);
    const double radius = 100.0;
    const double diskArea = angles::PI * radius * radius;

    std::vector<SectorRegion> regions = builder.build(center, diskCenter, radius, 4);
    ASSERT_EQ(regions.size(), 4u);

    double total = 0.0;
    for (const auto& region : regions) {
        for (const auto& polygon : region.polygons) {
            for (const auto& point : polygon.getPoints()) {
                EXPECT_LE(diskCenter.distanceTo(point), radius + 0.01);
            }
        }
        total += region.area;
    }
    EXPECT_NEAR(total, diskArea, diskArea * 0.005);

    // The disk leans toward +X, so the first quadrant outweighs the third
    EXPECT_GT(regions[0].area, regions[2].area);
    EXPECT_NEAR(regions[0].area, regions[3].area, diskArea * 0.005);
}

TEST(SectorRegionBuilderTest, InvalidInputGivesNoRegions) {
    SectorRegionBuilder builder;
    EXPECT_TRUE(builder.build(Point2D(), 100.0, 1).empty());
    EXPECT_TRUE(builder.build(Point2D(), 100.0, 13).empty());
    EXPECT_TRUE(builder.build(Point2D(), 0.0, 4).empty());
}

TEST(SectorRegionBuilderTest, WedgeReachesPastRadius) {
    SectorRegionBuilder builder;
    Polygon wedge = builder.wedge(Point2D(0.0, 0.0), 10.0, 0.0, 90.0);

    ASSERT_GE(wedge.size(), 4u);
    EXPECT_TRUE(wedge.getPoints().front() == Point2D(0.0, 0.0));

    // The fan is symmetric about the bisector of its angular range
    Point2D centroid = wedge.centroid();
    EXPECT_GT(centroid.x, 0.0);
    EXPECT_NEAR(angles::angleFrom(Point2D(0.0, 0.0), centroid), 45.0, 0.5);
}

TEST(SectorRegionBuilderTest, EnvelopeRadiusIncludesHoleRadius) {
    HoleCollection grid = test::makeGrid(3, 3, 100.0, 100.0, 100.0);
    double radius = SectorRegionBuilder::envelopeRadius(grid, Point2D(200.0, 200.0));
    EXPECT_NEAR(radius, 100.0 * std::sqrt(2.0) + test::HOLE_RADIUS, 1e-9);

    EXPECT_DOUBLE_EQ(SectorRegionBuilder::envelopeRadius(HoleCollection(), Point2D()), 0.0);
}
