#include "core/geometry.h"
#include "core/hole.h"
#include <gtest/gtest.h>

using namespace aidcis::plate;

TEST(AnglesTest, NormalizeWrapsIntoHalfOpenRange) {
    EXPECT_DOUBLE_EQ(angles::normalizeDegrees(0.0), 0.0);
    EXPECT_DOUBLE_EQ(angles::normalizeDegrees(360.0), 0.0);
    EXPECT_DOUBLE_EQ(angles::normalizeDegrees(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(angles::normalizeDegrees(725.0), 5.0);

    double tiny = angles::normalizeDegrees(-1e-15);
    EXPECT_GE(tiny, 0.0);
    EXPECT_LT(tiny, 360.0);
}

TEST(AnglesTest, AngleFromUsesCounterClockwiseFromPositiveX) {
    Point2D origin(10.0, 10.0);
    EXPECT_NEAR(angles::angleFrom(origin, Point2D(20.0, 10.0)), 0.0, 1e-12);
    EXPECT_NEAR(angles::angleFrom(origin, Point2D(10.0, 20.0)), 90.0, 1e-12);
    EXPECT_NEAR(angles::angleFrom(origin, Point2D(0.0, 10.0)), 180.0, 1e-12);
    EXPECT_NEAR(angles::angleFrom(origin, Point2D(10.0, 0.0)), 270.0, 1e-12);
    EXPECT_DOUBLE_EQ(angles::angleFrom(origin, origin), 0.0);
}

TEST(AnglesTest, SweepIsCounterClockwise) {
    EXPECT_DOUBLE_EQ(angles::sweep(0.0, 180.0), 180.0);
    EXPECT_DOUBLE_EQ(angles::sweep(180.0, 360.0), 180.0);
    EXPECT_DOUBLE_EQ(angles::sweep(350.0, 10.0), 20.0);
    EXPECT_DOUBLE_EQ(angles::sweep(45.0, 45.0), 360.0);
}

TEST(PolygonTest, SquareCentroidAndBounds) {
    Polygon square;
    square.addPoint(Point2D(0, 0));
    square.addPoint(Point2D(10, 0));
    square.addPoint(Point2D(10, 10));
    square.addPoint(Point2D(0, 10));

    EXPECT_TRUE(square.centroid() == Point2D(5, 5));

    double minX, minY, maxX, maxY;
    square.getBounds(minX, minY, maxX, maxY);
    EXPECT_DOUBLE_EQ(minX, 0.0);
    EXPECT_DOUBLE_EQ(maxY, 10.0);
}

TEST(PolygonTest, CircleApproximatesDisk) {
    Polygon circle = Polygon::circle(Point2D(5, -5), 100.0, 720);
    ASSERT_EQ(circle.size(), 720u);
    EXPECT_NEAR(circle.getPoints().front().distanceTo(Point2D(5, -5)), 100.0, 1e-9);
    EXPECT_NEAR(circle.centroid().x, 5.0, 1e-6);
    EXPECT_NEAR(circle.centroid().y, -5.0, 1e-6);
    EXPECT_TRUE(Polygon::circle(Point2D(), -1.0).empty());
}

TEST(HoleCollectionTest, RejectsDuplicateIds) {
    HoleCollection collection;
    EXPECT_TRUE(collection.addHole(Hole("A", 0, 0, 1)));
    EXPECT_FALSE(collection.addHole(Hole("A", 5, 5, 1)));
    EXPECT_EQ(collection.size(), 1u);
    EXPECT_DOUBLE_EQ(collection.getHole("A")->getCenterX(), 0.0);
    EXPECT_EQ(collection.getHole("B"), nullptr);
}

TEST(HoleCollectionTest, BoundsFollowInsertions) {
    HoleCollection collection;
    double minX, minY, maxX, maxY;
    EXPECT_FALSE(collection.getBounds(minX, minY, maxX, maxY));

    collection.addHole(Hole("A", -10, 5, 1));
    collection.addHole(Hole("B", 30, -15, 1));
    ASSERT_TRUE(collection.getBounds(minX, minY, maxX, maxY));
    EXPECT_DOUBLE_EQ(minX, -10.0);
    EXPECT_DOUBLE_EQ(maxX, 30.0);

    // Cached bounds must be invalidated by a new hole
    collection.addHole(Hole("C", 100, 100, 1));
    ASSERT_TRUE(collection.getBounds(minX, minY, maxX, maxY));
    EXPECT_DOUBLE_EQ(maxX, 100.0);
    EXPECT_DOUBLE_EQ(maxY, 100.0);
    EXPECT_TRUE(collection.getCenter() == Point2D(45.0, 42.5));
}

TEST(HoleCollectionTest, StatisticsAndQueries) {
    HoleCollection collection;
    Hole a("A", 0, 0, 8.8);
    a.setLayer("HOLES");
    Hole b("B", 1, 0, 9.0);
    b.setLayer("HOLES");
    b.setStatus(HoleStatus::TIE_ROD);
    Hole c("C", 2, 0, 8.9);
    c.setSector(2);
    collection.addHole(a);
    collection.addHole(b);
    collection.addHole(c);

    auto counts = collection.getStatusCounts();
    EXPECT_EQ(counts[HoleStatus::PENDING], 2);
    EXPECT_EQ(counts[HoleStatus::TIE_ROD], 1);
    EXPECT_EQ(counts[HoleStatus::QUALIFIED], 0);

    EXPECT_EQ(collection.getHolesByStatus(HoleStatus::TIE_ROD).size(), 1u);
    EXPECT_EQ(collection.getHolesInSector(2).size(), 1u);
    EXPECT_EQ(collection.getHolesInSector(NO_SECTOR).size(), 2u);

    double minR, maxR;
    ASSERT_TRUE(collection.getRadiusRange(minR, maxR));
    EXPECT_DOUBLE_EQ(minR, 8.8);
    EXPECT_DOUBLE_EQ(maxR, 9.0);

    auto layers = collection.getLayerDistribution();
    EXPECT_EQ(layers["HOLES"], 2);
    EXPECT_EQ(layers[""], 1);

    EXPECT_TRUE(collection.setStatus("A", HoleStatus::QUALIFIED));
    EXPECT_FALSE(collection.setStatus("Z", HoleStatus::QUALIFIED));
    EXPECT_EQ(collection.getHole("A")->getStatus(), HoleStatus::QUALIFIED);
}

TEST(HoleStatusTest, TerminalStatesAndNames) {
    EXPECT_FALSE(isTerminalStatus(HoleStatus::PENDING));
    EXPECT_FALSE(isTerminalStatus(HoleStatus::PROCESSING));
    EXPECT_TRUE(isTerminalStatus(HoleStatus::QUALIFIED));
    EXPECT_TRUE(isTerminalStatus(HoleStatus::DEFECTIVE));
    EXPECT_TRUE(isTerminalStatus(HoleStatus::BLIND));
    EXPECT_TRUE(isTerminalStatus(HoleStatus::TIE_ROD));

    HoleStatus parsed = HoleStatus::PENDING;
    EXPECT_TRUE(holeStatusFromString("tie_rod", parsed));
    EXPECT_EQ(parsed, HoleStatus::TIE_ROD);
    EXPECT_FALSE(holeStatusFromString("broken", parsed));
}
