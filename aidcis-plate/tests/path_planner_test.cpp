#include "core/path_planner.h"
#include "core/sector_partitioner.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <map>

using namespace aidcis::plate;

namespace {

// Every hole id appears exactly once across all units
void expectCompleteCover(const PathPlanResult& result, const HoleCollection& holes) {
    std::map<std::string, int> visits;
    for (const auto& step : result.steps) {
        for (const auto& id : step.holeIds()) {
            visits[id]++;
        }
    }
    EXPECT_EQ(visits.size(), holes.size());
    for (const auto& hole : holes.getHoles()) {
        EXPECT_EQ(visits[hole.getId()], 1) << hole.getId();
    }
}

std::vector<std::string> flatten(const PathPlanResult& result) {
    std::vector<std::string> ids;
    for (const auto& step : result.steps) {
        ids.push_back(step.holeId);
    }
    return ids;
}

} // anonymous namespace

TEST(PathPlannerTest, SerpentineOverRows) {
    HoleCollection grid = test::makeNumberedGrid(3, 3, 10.0);

    PathPlanner planner;
    PathPlanResult result = planner.plan(grid);

    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.rowDirection, RowDirection::ASCENDING);

    std::vector<std::string> expected = {
        "C001R001", "C002R001", "C003R001",
        "C003R002", "C002R002", "C001R002",
        "C001R003", "C002R003", "C003R003"
    };
    EXPECT_EQ(flatten(result), expected);

    for (size_t i = 0; i < result.steps.size(); ++i) {
        EXPECT_EQ(result.steps[i].index, i);
    }

    EXPECT_EQ(result.metrics.unitCount, 9u);
    EXPECT_EQ(result.metrics.holeCount, 9u);
    EXPECT_EQ(result.metrics.rowChanges, 2);
    EXPECT_DOUBLE_EQ(result.metrics.totalDistance, 80.0);
    EXPECT_DOUBLE_EQ(result.metrics.maxJump, 10.0);
    EXPECT_DOUBLE_EQ(result.metrics.averageStep, 10.0);
}

TEST(PathPlannerTest, SectorBelowCenterDescends) {
    HoleCollection grid = test::makeNumberedGrid(4, 4, 10.0);
    Point2D center = grid.getCenter();

    std::vector<Hole> lower;
    for (const auto& hole : grid.getHoles()) {
        if (hole.getRow() <= 2) {
            lower.push_back(hole);
        }
    }

    PathPlanner planner;
    PathPlanResult result = planner.plan(lower, center);

    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.rowDirection, RowDirection::DESCENDING);
    EXPECT_EQ(result.steps.front().holeId, "C001R002");
    EXPECT_EQ(result.steps[4].holeId, "C004R001");
    EXPECT_EQ(result.steps.back().holeId, "C001R001");
}

TEST(PathPlannerTest, IntervalPairingCombinesColumns) {
    HoleCollection row = test::makeNumberedGrid(1, 10, 10.0);

    PathPlannerParams params;
    params.intervalPairing = true;
    params.pairInterval = 4;
    PathPlanner planner(params);
    PathPlanResult result = planner.plan(row);

    ASSERT_TRUE(result.isValid());
    ASSERT_EQ(result.steps.size(), 6u);
    EXPECT_EQ(result.steps[0].holeId, "C001R001");
    EXPECT_EQ(result.steps[0].pairedHoleId, "C005R001");
    EXPECT_EQ(result.steps[3].holeId, "C004R001");
    EXPECT_EQ(result.steps[3].pairedHoleId, "C008R001");
    EXPECT_FALSE(result.steps[4].isPair());
    EXPECT_EQ(result.steps[4].holeId, "C009R001");
    EXPECT_EQ(result.steps[5].holeId, "C010R001");

    EXPECT_EQ(result.metrics.pairCount, 4u);
    EXPECT_EQ(result.metrics.holeCount, 10u);
    expectCompleteCover(result, row);

    // Pairs advance one pitch at their midpoint; the jump to column 9 is the largest
    EXPECT_DOUBLE_EQ(result.metrics.maxJump, 30.0);
}

TEST(PathPlannerTest, PairingCoversEveryHoleOnAnyGrid) {
    for (int interval = 1; interval <= 5; ++interval) {
        HoleCollection grid = test::makeNumberedGrid(5, 9, 10.0);

        PathPlannerParams params;
        params.intervalPairing = true;
        params.pairInterval = interval;
        PathPlanner planner(params);
        PathPlanResult result = planner.plan(grid);

        ASSERT_TRUE(result.success) << "interval " << interval;
        expectCompleteCover(result, grid);
    }

    HoleCollection evenRow = test::makeNumberedGrid(1, 8, 10.0);
    PathPlannerParams params;
    params.intervalPairing = true;
    params.pairInterval = 2;
    PathPlanResult result = PathPlanner(params).plan(evenRow);
    EXPECT_EQ(result.metrics.pairCount, 4u);
    EXPECT_EQ(result.steps.size(), 4u);
}

TEST(PathPlannerTest, EveryHoleVisitedOnceAcrossSectors) {
    HoleCollection grid = test::makeNumberedGrid(8, 8, 25.0);
    PartitionResult partition = SectorPartitioner::partition(grid, 6);
    ASSERT_TRUE(partition.success);

    PathPlanner planner;
    std::vector<PathPlanResult> plans = planner.planSectors(partition.holes, 6, partition.center);
    ASSERT_EQ(plans.size(), 6u);

    std::map<std::string, int> visits;
    for (size_t s = 0; s < plans.size(); ++s) {
        EXPECT_EQ(plans[s].sector, static_cast<int>(s));
        ASSERT_TRUE(plans[s].success);
        for (const auto& step : plans[s].steps) {
            const Hole* hole = partition.holes.getHole(step.holeId);
            ASSERT_NE(hole, nullptr);
            EXPECT_EQ(hole->getSector(), static_cast<int>(s));
            visits[step.holeId]++;
        }
    }
    EXPECT_EQ(visits.size(), grid.size());
    for (const auto& entry : visits) {
        EXPECT_EQ(entry.second, 1);
    }
}

TEST(PathPlannerTest, EmptyInputFollowsPolicy) {
    PathPlanner strict;
    PathPlanResult failed = strict.plan(std::vector<Hole>(), Point2D());
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.errorCode, PathErrorCode::EMPTY_INPUT);

    PathPlannerParams params;
    params.emptyInput = EmptyInputPolicy::EMPTY_PATH;
    PathPlanner lenient(params);
    PathPlanResult empty = lenient.plan(std::vector<Hole>(), Point2D());
    EXPECT_TRUE(empty.success);
    EXPECT_TRUE(empty.steps.empty());
    EXPECT_EQ(empty.metrics.unitCount, 0u);
}

TEST(PathPlannerTest, UnnumberedHolesAreRejected) {
    PathPlanner planner;
    PathPlanResult result = planner.plan(test::makeGrid(2, 2, 10.0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, PathErrorCode::UNNUMBERED_INPUT);
    EXPECT_TRUE(result.steps.empty());
}

TEST(PathPlannerTest, MetricsSkipUnknownIds) {
    HoleCollection grid = test::makeNumberedGrid(1, 2, 10.0);

    std::vector<PathStep> steps(3);
    steps[0].holeId = "C001R001";
    steps[1].holeId = "nowhere";
    steps[2].holeId = "C002R001";

    PathMetrics metrics = PathPlanner::computeMetrics(steps, grid);
    EXPECT_EQ(metrics.unitCount, 3u);
    EXPECT_EQ(metrics.holeCount, 2u);
    EXPECT_DOUBLE_EQ(metrics.totalDistance, 10.0);
}
