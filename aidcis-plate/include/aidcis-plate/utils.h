#ifndef AIDCIS_PLATE_UTILS_H
#define AIDCIS_PLATE_UTILS_H

#include <string>
#include <vector>
#include "core/hole.h"
#include "core/path_planner.h"
#include "core/sector_progress_tracker.h"
#include "core/sector_regions.h"

namespace aidcis {
namespace plate {

class Utils {
public:
    // Save the hole table (id, position, grid cell, sector, status) to a CSV file
    static bool saveHolesToCSV(const HoleCollection& holes, const std::string& filename);

    // Save planned steps of every sector to a CSV file
    static bool savePathToCSV(const std::vector<PathPlanResult>& plans, const std::string& filename);

    // Generate an SVG showing sector regions, holes colored by sector and the snake path
    static bool generateVisualization(const HoleCollection& holes,
                                      const std::vector<SectorRegion>& regions,
                                      const std::vector<PathPlanResult>& plans,
                                      const std::string& outputFile);

    // One-line summary of a progress snapshot
    static std::string formatProgress(const SectorProgress& progress);

    // Fill color used for a sector
    static std::string sectorColor(int sector);

    // Format a number with a specific precision
    static std::string formatNumber(double value, int precision = 4);

    // Generate a filename with a different extension
    static std::string replaceExtension(const std::string& path, const std::string& newExtension);
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_UTILS_H
