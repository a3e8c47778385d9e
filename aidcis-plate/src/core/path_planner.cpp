#include "core/path_planner.h"
#include <algorithm>
#include <map>

namespace aidcis {
namespace plate {

std::vector<std::string> PathStep::holeIds() const {
    std::vector<std::string> ids(1, holeId);
    if (isPair()) {
        ids.push_back(pairedHoleId);
    }
    return ids;
}

PathPlanner::PathPlanner(const PathPlannerParams& params)
    : m_params(params) {}

RowDirection PathPlanner::chooseRowDirection(const std::vector<Hole>& holes, const Point2D& overallCenter) {
    if (holes.empty()) {
        return RowDirection::ASCENDING;
    }

    double sumY = 0.0;
    for (const auto& hole : holes) {
        sumY += hole.getCenterY();
    }
    double centroidY = sumY / static_cast<double>(holes.size());

    return centroidY >= overallCenter.y ? RowDirection::ASCENDING : RowDirection::DESCENDING;
}

std::vector<PathStep> PathPlanner::buildRowUnits(const std::vector<const Hole*>& row) const {
    std::vector<PathStep> units;

    if (!m_params.intervalPairing || m_params.pairInterval <= 0) {
        for (const Hole* hole : row) {
            PathStep step;
            step.holeId = hole->getId();
            units.push_back(step);
        }
        return units;
    }

    // Row is sorted by column; each hole is consumed exactly once
    std::vector<bool> used(row.size(), false);
    for (size_t i = 0; i < row.size(); ++i) {
        if (used[i]) {
            continue;
        }
        used[i] = true;

        PathStep step;
        step.holeId = row[i]->getId();

        int partner = row[i]->getColumn() + m_params.pairInterval;
        for (size_t j = i + 1; j < row.size() && row[j]->getColumn() <= partner; ++j) {
            if (!used[j] && row[j]->getColumn() == partner) {
                step.pairedHoleId = row[j]->getId();
                used[j] = true;
                break;
            }
        }
        units.push_back(step);
    }
    return units;
}

PathPlanResult PathPlanner::plan(const std::vector<Hole>& holes, const Point2D& overallCenter) const {
    PathPlanResult result;

    if (holes.empty()) {
        if (m_params.emptyInput == EmptyInputPolicy::EMPTY_PATH) {
            result.success = true;
            result.warnings.push_back("No holes to plan");
        } else {
            result.errorCode = PathErrorCode::EMPTY_INPUT;
            result.errors.push_back("Cannot plan a path over an empty hole set");
        }
        return result;
    }

    for (const auto& hole : holes) {
        if (!hole.isNumbered()) {
            result.errorCode = PathErrorCode::UNNUMBERED_INPUT;
            result.errors.push_back("Hole " + hole.getId() + " has no row/column assignment");
            return result;
        }
    }

    // row -> holes, each row sorted by column
    std::map<int, std::vector<const Hole*>> rows;
    for (const auto& hole : holes) {
        rows[hole.getRow()].push_back(&hole);
    }
    for (auto& entry : rows) {
        std::stable_sort(entry.second.begin(), entry.second.end(), [](const Hole* a, const Hole* b) {
            return a->getColumn() < b->getColumn();
        });
    }

    result.rowDirection = chooseRowDirection(holes, overallCenter);

    std::vector<int> rowOrder;
    for (const auto& entry : rows) {
        rowOrder.push_back(entry.first);
    }
    if (result.rowDirection == RowDirection::DESCENDING) {
        std::reverse(rowOrder.begin(), rowOrder.end());
    }

    for (size_t pass = 0; pass < rowOrder.size(); ++pass) {
        std::vector<PathStep> units = buildRowUnits(rows[rowOrder[pass]]);
        if (pass % 2 == 1) {
            std::reverse(units.begin(), units.end());
        }
        for (auto& unit : units) {
            unit.index = result.steps.size();
            result.steps.push_back(unit);
        }
    }

    HoleCollection lookup;
    for (const auto& hole : holes) {
        if (!lookup.addHole(hole)) {
            result.warnings.push_back("Duplicate hole id " + hole.getId() + " in path input");
        }
    }
    result.metrics = computeMetrics(result.steps, lookup);
    result.success = true;
    return result;
}

PathPlanResult PathPlanner::plan(const HoleCollection& collection) const {
    return plan(collection.getHoles(), collection.getCenter());
}

PathPlanResult PathPlanner::planSector(const HoleCollection& collection, int sector,
                                       const Point2D& overallCenter) const {
    std::vector<Hole> holes;
    for (const Hole* hole : collection.getHolesInSector(sector)) {
        holes.push_back(*hole);
    }

    PathPlanResult result = plan(holes, overallCenter);
    result.sector = sector;
    return result;
}

std::vector<PathPlanResult> PathPlanner::planSectors(const HoleCollection& collection, int sectorCount,
                                                     const Point2D& overallCenter) const {
    std::vector<PathPlanResult> results;
    for (int sector = 0; sector < sectorCount; ++sector) {
        results.push_back(planSector(collection, sector, overallCenter));
    }
    return results;
}

PathMetrics PathPlanner::computeMetrics(const std::vector<PathStep>& steps, const HoleCollection& collection) {
    PathMetrics metrics;
    metrics.unitCount = steps.size();

    bool havePrevious = false;
    Point2D previous;
    int previousRow = 0;
    size_t moves = 0;

    for (const auto& step : steps) {
        const Hole* first = collection.getHole(step.holeId);
        if (!first) {
            continue;
        }

        Point2D position = first->getCenter();
        metrics.holeCount++;

        if (step.isPair()) {
            metrics.pairCount++;
            const Hole* second = collection.getHole(step.pairedHoleId);
            if (second) {
                position = (position + second->getCenter()) * 0.5;
                metrics.holeCount++;
            }
        }

        if (havePrevious) {
            double distance = previous.distanceTo(position);
            metrics.totalDistance += distance;
            metrics.maxJump = std::max(metrics.maxJump, distance);
            moves++;

            if (first->getRow() != previousRow) {
                metrics.rowChanges++;
            }
        }

        previous = position;
        previousRow = first->getRow();
        havePrevious = true;
    }

    metrics.averageStep = moves > 0 ? metrics.totalDistance / static_cast<double>(moves) : 0.0;
    return metrics;
}

} // namespace plate
} // namespace aidcis
