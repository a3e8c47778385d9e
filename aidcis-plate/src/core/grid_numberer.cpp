#include "core/grid_numberer.h"
#include <algorithm>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace aidcis {
namespace plate {

GridNumberer::GridNumberer(const NumberingParams& params)
    : m_params(params) {}

std::string GridNumberer::formatId(int column, int row) {
    std::ostringstream oss;
    oss << "C" << std::setw(3) << std::setfill('0') << column
        << "R" << std::setw(3) << std::setfill('0') << row;
    return oss.str();
}

double GridNumberer::minimumSpacing(const HoleCollection& collection) {
    const auto& holes = collection.getHoles();
    if (holes.size() < 2) {
        return 0.0;
    }

    std::vector<Point2D> points;
    points.reserve(holes.size());
    for (const auto& hole : holes) {
        points.push_back(hole.getCenter());
    }
    std::sort(points.begin(), points.end(), [](const Point2D& a, const Point2D& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });

    // Sweep in x order, stopping once the x gap alone exceeds the best distance
    double best = std::numeric_limits<double>::max();
    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = i + 1; j < points.size(); ++j) {
            if (points[j].x - points[i].x >= best) {
                break;
            }
            best = std::min(best, points[i].distanceTo(points[j]));
        }
    }
    return best;
}

std::vector<GridCluster> GridNumberer::clusterValues(std::vector<double> values, double tolerance) {
    std::vector<GridCluster> clusters;
    if (values.empty()) {
        return clusters;
    }

    std::sort(values.begin(), values.end());

    GridCluster current;
    current.minValue = current.maxValue = values[0];
    double sum = values[0];
    current.memberCount = 1;

    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] - current.maxValue > tolerance) {
            current.centroid = sum / current.memberCount;
            clusters.push_back(current);

            current = GridCluster();
            current.minValue = values[i];
            sum = 0.0;
        }
        current.maxValue = values[i];
        sum += values[i];
        current.memberCount++;
    }
    current.centroid = sum / current.memberCount;
    clusters.push_back(current);

    return clusters;
}

int GridNumberer::clusterIndex(const std::vector<GridCluster>& clusters, double value) {
    // Clusters are disjoint and ascending: first cluster whose max is >= value
    auto it = std::lower_bound(clusters.begin(), clusters.end(), value,
        [](const GridCluster& cluster, double v) { return cluster.maxValue < v; });

    if (it == clusters.end() || value < it->minValue) {
        return 0;
    }
    return static_cast<int>(it - clusters.begin()) + 1;
}

NumberingResult GridNumberer::number(const HoleCollection& collection) const {
    NumberingResult result;
    result.holes.setNormalization(collection.getNormalization());

    if (collection.empty()) {
        result.warnings.push_back("No holes to number");
        result.success = true;
        return result;
    }

    double tolerance = m_params.clusterTolerance;
    if (tolerance <= 0.0) {
        tolerance = minimumSpacing(collection) / 2.0;
    }
    result.toleranceUsed = tolerance;

    std::vector<double> xs;
    std::vector<double> ys;
    for (const auto& hole : collection.getHoles()) {
        xs.push_back(hole.getCenterX());
        ys.push_back(hole.getCenterY());
    }

    result.columns = clusterValues(xs, tolerance);
    result.rows = clusterValues(ys, tolerance);

    if (result.rows.empty() || result.columns.empty()) {
        result.errorCode = NumberingErrorCode::DEGENERATE_GRID;
        result.errors.push_back("Clustering produced no rows or no columns");
        return result;
    }

    std::map<std::pair<int, int>, std::string> occupied;   // (row, column) -> first id

    for (const auto& hole : collection.getHoles()) {
        int row = clusterIndex(result.rows, hole.getCenterY());
        int column = clusterIndex(result.columns, hole.getCenterX());

        if (row == 0 || column == 0) {
            result.errorCode = NumberingErrorCode::DEGENERATE_GRID;
            result.errors.push_back("Hole " + hole.getId() + " fell outside every cluster");
            return result;
        }

        std::string id = formatId(column, row);
        auto cell = std::make_pair(row, column);
        auto existing = occupied.find(cell);

        if (existing != occupied.end()) {
            // Keep ids unique; the collision itself is the reported failure
            int suffix = 2;
            std::string candidate;
            do {
                candidate = id + "-" + std::to_string(suffix++);
            } while (result.holes.contains(candidate));

            result.errorCode = NumberingErrorCode::DUPLICATE_CELL;
            result.errors.push_back("Holes " + existing->second + " and " + hole.getId() +
                                    " share cell " + id);
            id = candidate;
        } else {
            occupied[cell] = hole.getId();
        }

        Hole numbered = hole.relocated(id, hole.getCenterX(), hole.getCenterY());
        numbered.setGridPosition(row, column);
        result.holes.addHole(numbered);
    }

    result.success = result.errorCode == NumberingErrorCode::NONE;
    return result;
}

} // namespace plate
} // namespace aidcis
