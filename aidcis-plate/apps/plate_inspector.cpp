#include "aidcis-plate/config.h"
#include "aidcis-plate/utils.h"
#include "core/coordinate_normalizer.h"
#include "core/dxf_reader.h"
#include "core/geometry_extractor.h"
#include "core/grid_numberer.h"
#include "core/inspection_simulator.h"
#include "core/path_planner.h"
#include "core/sector_partitioner.h"
#include "core/sector_progress_tracker.h"
#include "core/sector_regions.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace aidcis::plate;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <dxf_file> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>         Load settings from a configuration file" << std::endl;
    std::cout << "  --sectors <n>           Number of sectors, 2 to 12 (default: 4)" << std::endl;
    std::cout << "  --rotate <degrees>      Counter-clockwise pre-rotation (default: 0)" << std::endl;
    std::cout << "  --flip-y                Mirror Y before rotating" << std::endl;
    std::cout << "  --pairing <interval>    Pair columns c and c+interval into one step" << std::endl;
    std::cout << "  --csv <file>            Write the hole table (default: input.csv)" << std::endl;
    std::cout << "  --path-csv <file>       Write the snake path (default: input.path.csv)" << std::endl;
    std::cout << "  --visualize <file>      Create visualization SVG (default: input.viz.svg)" << std::endl;
    std::cout << "  --simulate              Run a simulated inspection over the path" << std::endl;
}

void printMessages(const std::vector<std::string>& warnings, const std::vector<std::string>& errors) {
    for (const auto& warning : warnings) {
        std::cout << "  Warning: " << warning << std::endl;
    }
    for (const auto& error : errors) {
        std::cerr << "  Error: " << error << std::endl;
    }
}

int runInspector(int argc, char* argv[]) {
    std::string dxfFile = argv[1];
    std::string csvFile = Utils::replaceExtension(dxfFile, "csv");
    std::string pathCsvFile = Utils::replaceExtension(dxfFile, "path.csv");
    std::string visualizeFile = Utils::replaceExtension(dxfFile, "viz.svg");
    bool simulate = false;

    PlateConfig config;

    // The config file is applied first so command-line options override it
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            std::string configFile = argv[++i];
            if (!config.loadFromFile(configFile)) {
                std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
                return 1;
            }
            std::cout << "Configuration loaded from: " << configFile << std::endl;
        }
    }

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            ++i;
        }
        else if (arg == "--sectors" && i + 1 < argc) {
            config.setSectorCount(std::stoi(argv[++i]));
        }
        else if (arg == "--rotate" && i + 1 < argc) {
            config.setRotationDegrees(std::stod(argv[++i]));
        }
        else if (arg == "--flip-y") {
            config.setFlipY(true);
        }
        else if (arg == "--pairing" && i + 1 < argc) {
            config.setIntervalPairing(true);
            config.setPairInterval(std::stoi(argv[++i]));
        }
        else if (arg == "--csv" && i + 1 < argc) {
            csvFile = argv[++i];
        }
        else if (arg == "--path-csv" && i + 1 < argc) {
            pathCsvFile = argv[++i];
        }
        else if (arg == "--visualize" && i + 1 < argc) {
            visualizeFile = argv[++i];
        }
        else if (arg == "--simulate") {
            simulate = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Read CAD primitives
    std::cout << "Reading DXF file: " << dxfFile << std::endl;
    DxfReader reader;
    if (!reader.loadFromFile(dxfFile)) {
        std::cerr << "Error: " << reader.getLastError() << std::endl;
        return 1;
    }
    std::cout << "  Primitives: " << reader.getPrimitives().size() << std::endl;
    for (const auto& layer : reader.getLayerCounts()) {
        std::cout << "    Layer " << (layer.first.empty() ? "(none)" : layer.first)
                  << ": " << layer.second << std::endl;
    }
    for (const auto& ignored : reader.getIgnoredEntities()) {
        std::cout << "    Ignored " << ignored.first << ": " << ignored.second << std::endl;
    }

    // Reconstruct holes
    GeometryExtractor extractor(config.getExtractionParams());
    ExtractionResult extraction = extractor.extract(reader.getPrimitives());

    std::cout << "\nHole extraction:" << std::endl;
    std::cout << "  Circles: " << extraction.circleCount << ", arcs: " << extraction.arcCount
              << ", merged arc pairs: " << extraction.mergedArcPairs << std::endl;
    std::cout << "  Holes: " << extraction.holes.size() << ", skipped primitives: "
              << extraction.skipped.size() << std::endl;
    printMessages(extraction.warnings, extraction.errors);

    if (extraction.holes.empty()) {
        std::cerr << "Error: No holes found, nothing to inspect." << std::endl;
        return 1;
    }
    if (!extraction.success) {
        std::cout << "  Continuing with the best-effort hole set." << std::endl;
    }

    // One coordinate convention for everything downstream
    HoleCollection normalized = CoordinateNormalizer::normalizeOnce(
        extraction.holes, config.getRotationDegrees(), config.getFlipY());

    // Canonical ids
    GridNumberer numberer(config.getNumberingParams());
    NumberingResult numbering = numberer.number(normalized);

    std::cout << "\nGrid numbering:" << std::endl;
    std::cout << "  Rows: " << numbering.rows.size() << ", columns: " << numbering.columns.size()
              << ", cluster tolerance: " << Utils::formatNumber(numbering.toleranceUsed, 3) << std::endl;
    printMessages(numbering.warnings, numbering.errors);

    if (!numbering.success) {
        std::cerr << "Error: Grid numbering failed." << std::endl;
        return 1;
    }

    // Sectors
    Point2D center = config.getUseCustomCenter() ? config.getCustomCenter()
                                                 : numbering.holes.getCenter();
    PartitionResult partition = SectorPartitioner::partition(numbering.holes, config.getSectorCount(), center);

    std::cout << "\nSector partition around (" << Utils::formatNumber(center.x, 2) << ", "
              << Utils::formatNumber(center.y, 2) << "):" << std::endl;
    printMessages(partition.warnings, partition.errors);

    if (!partition.success) {
        std::cerr << "Error: Sector partition failed." << std::endl;
        return 1;
    }
    for (const auto& sector : partition.sectors) {
        std::cout << "  Sector " << sector.index << " [" << Utils::formatNumber(sector.startAngle, 1)
                  << ", " << Utils::formatNumber(sector.endAngle, 1) << "): "
                  << sector.holeCount << " holes" << std::endl;
    }

    // Snake paths
    PathPlanner planner(config.getPathPlannerParams());
    std::vector<PathPlanResult> plans = planner.planSectors(partition.holes, partition.sectorCount, center);

    std::cout << "\nSnake path:" << std::endl;
    std::vector<PathStep> fullPath;
    for (const auto& plan : plans) {
        std::cout << "  Sector " << plan.sector << ": " << plan.steps.size() << " steps ("
                  << plan.metrics.pairCount << " pairs), travel "
                  << Utils::formatNumber(plan.metrics.totalDistance, 1) << ", max jump "
                  << Utils::formatNumber(plan.metrics.maxJump, 1) << std::endl;
        printMessages(plan.warnings, plan.errors);

        for (const auto& step : plan.steps) {
            fullPath.push_back(step);
            fullPath.back().index = fullPath.size() - 1;
        }
    }

    // Progress
    SectorProgressTracker tracker(partition.holes, partition.sectorCount, config.getFlushInterval());
    HoleCollection finalHoles = partition.holes;

    if (simulate) {
        SimulationParams simulationParams = config.getSimulationParams();
        std::cout << "\nSimulating inspection of " << fullPath.size() << " steps (seed "
                  << simulationParams.seed << ", nominal "
                  << simulationParams.stepInterval.count() << " ms per step)" << std::endl;

        InspectionSimulator simulator(partition.holes, fullPath, tracker, simulationParams);
        simulator.runToCompletion();
        finalHoles = simulator.getCollection();

        if (simulator.getRejectedEvents() > 0) {
            std::cout << "  Warning: " << simulator.getRejectedEvents()
                      << " status changes were rejected" << std::endl;
        }
    }

    std::cout << "\nProgress:" << std::endl;
    for (const auto& progress : tracker.allSnapshots()) {
        std::cout << "  " << Utils::formatProgress(progress) << std::endl;
    }
    std::cout << "  " << Utils::formatProgress(tracker.snapshot()) << std::endl;

    // Exports
    std::cout << "\nSaving hole table to: " << csvFile << std::endl;
    if (Utils::saveHolesToCSV(finalHoles, csvFile)) {
        std::cout << "CSV file created successfully." << std::endl;
    }

    std::cout << "Saving snake path to: " << pathCsvFile << std::endl;
    if (Utils::savePathToCSV(plans, pathCsvFile)) {
        std::cout << "Path file created successfully." << std::endl;
    }

    // The outline was drawn in CAD coordinates and moves with the holes
    RejectedCircle boundary;
    Point2D diskCenter = center;
    double diskRadius = 0.0;
    if (extraction.getBoundaryCircle(boundary)) {
        diskCenter = CoordinateNormalizer::transformAlongside(
            Point2D(boundary.centerX, boundary.centerY), extraction.holes,
            config.getRotationDegrees(), config.getFlipY());
        diskRadius = boundary.radius;
    } else {
        diskRadius = SectorRegionBuilder::envelopeRadius(finalHoles, center);
    }

    SectorRegionBuilder regionBuilder;
    std::vector<SectorRegion> regions = regionBuilder.build(center, diskCenter, diskRadius,
                                                            partition.sectorCount);

    std::cout << "Generating visualization: " << visualizeFile << std::endl;
    if (Utils::generateVisualization(finalHoles, regions, plans, visualizeFile)) {
        std::cout << "Visualization created successfully." << std::endl;
    }

    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        return runInspector(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid numeric option (" << e.what() << ")" << std::endl;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: Numeric option out of range (" << e.what() << ")" << std::endl;
    }
    return 1;
}
