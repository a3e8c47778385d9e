#include "aidcis-plate/utils.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace aidcis {
namespace plate {

bool Utils::saveHolesToCSV(const HoleCollection& holes, const std::string& filename) {
    std::ofstream outFile(filename);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    outFile << "# Plate holes" << std::endl;
    outFile << "id,center_x,center_y,radius,row,column,sector,status,layer" << std::endl;

    for (const auto& hole : holes.getHoles()) {
        outFile << hole.getId() << ","
                << formatNumber(hole.getCenterX()) << ","
                << formatNumber(hole.getCenterY()) << ","
                << formatNumber(hole.getRadius()) << ","
                << hole.getRow() << ","
                << hole.getColumn() << ","
                << hole.getSector() << ","
                << holeStatusToString(hole.getStatus()) << ","
                << hole.getLayer() << std::endl;
    }

    return outFile.good();
}

bool Utils::savePathToCSV(const std::vector<PathPlanResult>& plans, const std::string& filename) {
    std::ofstream outFile(filename);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    outFile << "# Snake path" << std::endl;
    outFile << "# Format: sector,step,hole_id,paired_hole_id" << std::endl;

    for (const auto& plan : plans) {
        outFile << "# Sector " << plan.sector << " (" << plan.steps.size() << " steps)" << std::endl;
        for (const auto& step : plan.steps) {
            outFile << plan.sector << "," << step.index << "," << step.holeId << ","
                    << step.pairedHoleId << std::endl;
        }
    }

    return outFile.good();
}

bool Utils::generateVisualization(const HoleCollection& holes,
                                  const std::vector<SectorRegion>& regions,
                                  const std::vector<PathPlanResult>& plans,
                                  const std::string& outputFile) {
    double minX, minY, maxX, maxY;
    if (!holes.getBounds(minX, minY, maxX, maxY)) {
        std::cerr << "Error: Nothing to visualize, the hole collection is empty." << std::endl;
        return false;
    }

    // Regions may reach past the hole bounds
    for (const auto& region : regions) {
        for (const auto& polygon : region.polygons) {
            double pMinX, pMinY, pMaxX, pMaxY;
            polygon.getBounds(pMinX, pMinY, pMaxX, pMaxY);
            minX = std::min(minX, pMinX);
            minY = std::min(minY, pMinY);
            maxX = std::max(maxX, pMaxX);
            maxY = std::max(maxY, pMaxY);
        }
    }

    double margin = std::max(maxX - minX, maxY - minY) * 0.05 + 10.0;
    double width = maxX - minX + 2 * margin;
    double height = maxY - minY + 2 * margin;

    std::ofstream vizFile(outputFile);
    if (!vizFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << outputFile << std::endl;
        return false;
    }

    vizFile << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>" << std::endl;
    vizFile << "<svg width=\"" << width << "mm\" height=\"" << height
            << "mm\" viewBox=\"" << minX - margin << " " << -(maxY + margin) << " "
            << width << " " << height
            << "\" xmlns=\"http://www.w3.org/2000/svg\">" << std::endl;
    vizFile << "  <title>AIDCIS Plate Inspection Layout</title>" << std::endl;

    // Plate coordinates are Y-up, SVG is Y-down
    vizFile << "  <g transform=\"scale(1,-1)\">" << std::endl;

    vizFile << "  <!-- Sector regions -->" << std::endl;
    for (const auto& region : regions) {
        for (const auto& polygon : region.polygons) {
            vizFile << "    <polygon points=\"";
            for (const auto& point : polygon.getPoints()) {
                vizFile << point.x << "," << point.y << " ";
            }
            vizFile << "\" fill=\"" << sectorColor(region.index)
                    << "\" fill-opacity=\"0.15\" stroke=\"#888888\" stroke-width=\"1\" />" << std::endl;
        }
    }

    vizFile << "  <!-- Snake path -->" << std::endl;
    for (const auto& plan : plans) {
        if (plan.steps.empty()) continue;

        vizFile << "    <polyline points=\"";
        for (const auto& step : plan.steps) {
            const Hole* hole = holes.getHole(step.holeId);
            if (!hole) continue;

            Point2D position = hole->getCenter();
            const Hole* paired = step.isPair() ? holes.getHole(step.pairedHoleId) : nullptr;
            if (paired) {
                position = (position + paired->getCenter()) * 0.5;
            }
            vizFile << position.x << "," << position.y << " ";
        }
        vizFile << "\" fill=\"none\" stroke=\"#333333\" stroke-width=\"1.5\" />" << std::endl;
    }

    vizFile << "  <!-- Holes -->" << std::endl;
    for (const auto& hole : holes.getHoles()) {
        vizFile << "    <circle cx=\"" << hole.getCenterX() << "\" cy=\"" << hole.getCenterY()
                << "\" r=\"" << hole.getRadius() << "\" fill=\"" << sectorColor(hole.getSector())
                << "\" stroke=\"black\" stroke-width=\"0.5\"><title>" << hole.getId()
                << "</title></circle>" << std::endl;
    }

    vizFile << "  </g>" << std::endl;

    // Labels stay outside the flipped group so the text reads upright
    vizFile << "  <!-- Sector labels -->" << std::endl;
    for (const auto& region : regions) {
        if (region.polygons.empty()) continue;

        Point2D label = region.polygons.front().centroid();
        vizFile << "  <text x=\"" << label.x << "\" y=\"" << -label.y
                << "\" text-anchor=\"middle\" font-size=\"" << formatNumber(margin * 0.5, 2)
                << "\" fill=\"#444444\">S" << region.index << "</text>" << std::endl;
    }

    vizFile << "</svg>" << std::endl;

    return vizFile.good();
}

std::string Utils::formatProgress(const SectorProgress& progress) {
    std::stringstream ss;
    if (progress.sector == GLOBAL_PROGRESS) {
        ss << "Total    ";
    } else {
        ss << "Sector " << std::setw(2) << progress.sector;
    }
    ss << ": " << progress.completed << "/" << progress.total
       << " (" << formatNumber(progress.progressPercent, 1) << "%)"
       << ", qualified " << progress.qualified
       << ", defective " << progress.defective
       << ", blind " << progress.blind
       << ", tie-rod " << progress.tieRod
       << ", rate " << formatNumber(progress.qualificationRate, 1) << "%";
    return ss.str();
}

std::string Utils::sectorColor(int sector) {
    static const char* palette[] = {
        "#e6194b", "#3cb44b", "#4363d8", "#f58231", "#911eb4", "#46f0f0",
        "#f032e6", "#bcf60c", "#008080", "#9a6324", "#800000", "#000075"
    };
    if (sector < 0) {
        return "#cccccc";
    }
    return palette[sector % 12];
}

std::string Utils::formatNumber(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Utils::replaceExtension(const std::string& path, const std::string& newExtension) {
    size_t pos = path.find_last_of('.');
    if (pos == std::string::npos) {
        return path + "." + newExtension;
    }
    return path.substr(0, pos + 1) + newExtension;
}

} // namespace plate
} // namespace aidcis
