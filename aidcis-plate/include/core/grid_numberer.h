#ifndef AIDCIS_PLATE_GRID_NUMBERER_H
#define AIDCIS_PLATE_GRID_NUMBERER_H

#include "core/hole.h"
#include <string>
#include <vector>

namespace aidcis {
namespace plate {

struct NumberingParams {
    // Gap that separates two row (or column) clusters; 0 = half the minimum
    // center-to-center spacing of the collection
    double clusterTolerance = 0.0;
};

enum class NumberingErrorCode {
    NONE,
    DEGENERATE_GRID,    // No row or column cluster from non-empty input
    DUPLICATE_CELL      // Two holes share one row/column cell
};

/**
 * One 1-D cluster of coordinates
 */
struct GridCluster {
    double minValue = 0.0;
    double maxValue = 0.0;
    double centroid = 0.0;
    int memberCount = 0;
};

struct NumberingResult {
    HoleCollection holes;
    bool success = false;
    NumberingErrorCode errorCode = NumberingErrorCode::NONE;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    double toleranceUsed = 0.0;
    std::vector<GridCluster> rows;      // rows[0] is row 1 (smallest y)
    std::vector<GridCluster> columns;   // columns[0] is column 1 (smallest x)

    bool hasWarnings() const { return !warnings.empty(); }
    bool hasErrors() const { return !errors.empty(); }
    bool isValid() const { return success && !hasErrors(); }
};

/**
 * Assigns row/column indices and canonical ids ("C{col:03}R{row:03}").
 *
 * Rows cluster center Y, columns cluster center X. Row 1 is the smallest Y
 * cluster and column 1 the smallest X cluster, in the already normalized
 * frame. Numbering an already numbered collection yields the same ids.
 */
class GridNumberer {
public:
    explicit GridNumberer(const NumberingParams& params = NumberingParams());

    NumberingResult number(const HoleCollection& collection) const;

    static std::string formatId(int column, int row);

    // Smallest center-to-center distance, 0 for fewer than two holes
    static double minimumSpacing(const HoleCollection& collection);

    /**
     * Greedy 1-D clustering of sorted values
     * @param values Values in any order
     * @param tolerance A gap strictly larger than this starts a new cluster
     * @return Clusters in ascending order
     */
    static std::vector<GridCluster> clusterValues(std::vector<double> values, double tolerance);

    // 1-based index of the cluster containing value, 0 if none
    static int clusterIndex(const std::vector<GridCluster>& clusters, double value);

private:
    NumberingParams m_params;
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_GRID_NUMBERER_H
