#include "core/coordinate_normalizer.h"
#include "core/sector_partitioner.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <cmath>
#include <random>

using namespace aidcis::plate;

namespace {

// 3x3 grid at 100..300, bounding-box center (200, 200)
HoleCollection makeNineHoles() {
    return test::makeGrid(3, 3, 100.0, 100.0, 100.0);
}

int sectorOf(const PartitionResult& result, int ordinal) {
    const Hole* hole = result.holes.getHole(test::holeId(ordinal));
    return hole ? hole->getSector() : NO_SECTOR;
}

} // anonymous namespace

TEST(SectorPartitionerTest, QuadrantsOfNineHoleGrid) {
    PartitionResult result = SectorPartitioner::partition(makeNineHoles(), 4);

    ASSERT_TRUE(result.isValid());
    EXPECT_TRUE(result.center == Point2D(200.0, 200.0));

    EXPECT_EQ(sectorOf(result, 5), 0);    // the center hole
    EXPECT_EQ(sectorOf(result, 6), 0);    // 0 degrees
    EXPECT_EQ(sectorOf(result, 9), 0);    // 45
    EXPECT_EQ(sectorOf(result, 8), 1);    // 90
    EXPECT_EQ(sectorOf(result, 7), 1);    // 135
    EXPECT_EQ(sectorOf(result, 4), 2);    // 180
    EXPECT_EQ(sectorOf(result, 1), 2);    // 225
    EXPECT_EQ(sectorOf(result, 2), 3);    // 270
    EXPECT_EQ(sectorOf(result, 3), 3);    // 315

    ASSERT_EQ(result.sectors.size(), 4u);
    EXPECT_EQ(result.sectors[0].holeCount, 3);
    EXPECT_EQ(result.sectors[1].holeCount, 2);
    EXPECT_EQ(result.sectors[2].holeCount, 2);
    EXPECT_EQ(result.sectors[3].holeCount, 2);
    EXPECT_DOUBLE_EQ(result.sectors[1].startAngle, 90.0);
    EXPECT_DOUBLE_EQ(result.sectors[1].endAngle, 180.0);
}

TEST(SectorPartitionerTest, QuarterTurnShiftsEverySectorByOne) {
    HoleCollection grid = makeNineHoles();
    PartitionResult before = SectorPartitioner::partition(grid, 4);

    HoleCollection rotated = CoordinateNormalizer::normalize(grid, 90.0, false);
    PartitionResult after = SectorPartitioner::partition(rotated, 4);

    ASSERT_TRUE(after.isValid());
    for (int ordinal = 1; ordinal <= 9; ++ordinal) {
        if (ordinal == 5) {
            EXPECT_EQ(sectorOf(after, ordinal), 0);
            continue;
        }
        EXPECT_EQ(sectorOf(after, ordinal), (sectorOf(before, ordinal) + 1) % 4)
            << "hole " << test::holeId(ordinal);
    }
}

TEST(SectorPartitionerTest, EveryHoleInExactlyOneSector) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coordinate(-1000.0, 1000.0);

    HoleCollection collection;
    for (int i = 0; i < 200; ++i) {
        collection.addHole(Hole(test::holeId(i), coordinate(rng), coordinate(rng), test::HOLE_RADIUS));
    }

    for (int n = MIN_SECTOR_COUNT; n <= MAX_SECTOR_COUNT; ++n) {
        PartitionResult result = SectorPartitioner::partition(collection, n);
        ASSERT_TRUE(result.success) << "N=" << n;
        ASSERT_EQ(result.holes.size(), collection.size());

        int total = 0;
        for (const auto& info : result.sectors) {
            total += info.holeCount;
            EXPECT_EQ(static_cast<size_t>(info.holeCount),
                      result.holes.getHolesInSector(info.index).size());
        }
        EXPECT_EQ(total, static_cast<int>(collection.size()));

        for (const auto& hole : result.holes.getHoles()) {
            EXPECT_GE(hole.getSector(), 0);
            EXPECT_LT(hole.getSector(), n);
        }
    }
}

TEST(SectorPartitionerTest, BoundaryAnglesBelongToTheNextSector) {
    EXPECT_EQ(SectorPartitioner::sectorForAngle(0.0, 4), 0);
    EXPECT_EQ(SectorPartitioner::sectorForAngle(90.0, 4), 1);
    EXPECT_EQ(SectorPartitioner::sectorForAngle(89.999, 4), 0);
    EXPECT_EQ(SectorPartitioner::sectorForAngle(360.0, 4), 0);
    EXPECT_EQ(SectorPartitioner::sectorForAngle(-1.0, 4), 3);
    EXPECT_EQ(SectorPartitioner::sectorForAngle(120.0 - 1e-12, 3), 1);
    EXPECT_EQ(SectorPartitioner::sectorForAngle(360.0 - 1e-12, 6), 0);
}

TEST(SectorPartitionerTest, ExplicitCenterOverridesBoundingBox) {
    HoleCollection grid = makeNineHoles();
    PartitionResult result = SectorPartitioner::partition(grid, 2, Point2D(0.0, 0.0));

    ASSERT_TRUE(result.success);
    // Everything lies in the first quadrant of the origin
    EXPECT_EQ(result.sectors[0].holeCount, 9);
    EXPECT_EQ(result.sectors[1].holeCount, 0);
    EXPECT_TRUE(result.hasWarnings());
}

TEST(SectorPartitionerTest, RepartitionReassignsAllHoles) {
    PartitionResult first = SectorPartitioner::partition(makeNineHoles(), 4);
    PartitionResult second = SectorPartitioner::partition(first.holes, 2);

    ASSERT_TRUE(second.isValid());
    for (const auto& hole : second.holes.getHoles()) {
        EXPECT_LT(hole.getSector(), 2);
    }
}

TEST(SectorPartitionerTest, RejectsInvalidSectorCount) {
    HoleCollection grid = makeNineHoles();

    for (int n : {-1, 0, 1, 13}) {
        PartitionResult result = SectorPartitioner::partition(grid, n);
        EXPECT_FALSE(result.success) << "N=" << n;
        EXPECT_EQ(result.errorCode, PartitionErrorCode::INVALID_SECTOR_COUNT);
        EXPECT_TRUE(result.holes.empty());
    }

    EXPECT_TRUE(SectorPartitioner::describeSectors(1).empty());
    EXPECT_EQ(SectorPartitioner::describeSectors(12).size(), 12u);
}

TEST(SectorPartitionerTest, EmptyCollectionHasNoWarnings) {
    PartitionResult result = SectorPartitioner::partition(HoleCollection(), 4);
    EXPECT_TRUE(result.isValid());
    EXPECT_FALSE(result.hasWarnings());
    EXPECT_EQ(result.sectors.size(), 4u);
}
