#ifndef AIDCIS_PLATE_CONFIG_H
#define AIDCIS_PLATE_CONFIG_H

#include "core/geometry_extractor.h"
#include "core/grid_numberer.h"
#include "core/inspection_simulator.h"
#include "core/path_planner.h"
#include <chrono>
#include <string>

namespace aidcis {
namespace plate {

/**
 * Configuration of an inspection session, stored as an INI file
 */
class PlateConfig {
public:
    PlateConfig();
    ~PlateConfig();

    /**
     * Initialize with default values
     */
    void setDefaults();

    /**
     * Load configuration from file
     * @param filename Path to the config file
     * @return True if loaded successfully
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Save configuration to file
     * @param filename Path where to save the config
     * @return True if saved successfully
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * Check if this is the first run (no config file exists)
     * @param filename Path to the config file
     * @return True if the config file doesn't exist
     */
    static bool isFirstRun(const std::string& filename);

    // Parameter structs handed to the engine components
    ExtractionParams getExtractionParams() const;
    NumberingParams getNumberingParams() const;
    PathPlannerParams getPathPlannerParams() const;
    SimulationParams getSimulationParams() const;

    // [extraction]
    double getPositionTolerance() const { return m_positionTolerance; }
    void setPositionTolerance(double tolerance) { m_positionTolerance = tolerance; }

    double getRadiusTolerance() const { return m_radiusTolerance; }
    void setRadiusTolerance(double tolerance) { m_radiusTolerance = tolerance; }

    double getGapToleranceDegrees() const { return m_gapToleranceDegrees; }
    void setGapToleranceDegrees(double degrees) { m_gapToleranceDegrees = degrees; }

    double getExpectedHoleRadius() const { return m_expectedHoleRadius; }
    void setExpectedHoleRadius(double radius) { m_expectedHoleRadius = radius; }

    // [normalization]
    double getRotationDegrees() const { return m_rotationDegrees; }
    void setRotationDegrees(double degrees) { m_rotationDegrees = degrees; }

    bool getFlipY() const { return m_flipY; }
    void setFlipY(bool flip) { m_flipY = flip; }

    // [grid]
    double getClusterTolerance() const { return m_clusterTolerance; }
    void setClusterTolerance(double tolerance) { m_clusterTolerance = tolerance; }

    // [sectors]
    int getSectorCount() const { return m_sectorCount; }
    void setSectorCount(int count) { m_sectorCount = count; }

    bool getUseCustomCenter() const { return m_useCustomCenter; }
    void setUseCustomCenter(bool use) { m_useCustomCenter = use; }

    Point2D getCustomCenter() const { return Point2D(m_centerX, m_centerY); }
    void setCustomCenter(const Point2D& center) { m_centerX = center.x; m_centerY = center.y; }

    // [path]
    bool getIntervalPairing() const { return m_intervalPairing; }
    void setIntervalPairing(bool enabled) { m_intervalPairing = enabled; }

    int getPairInterval() const { return m_pairInterval; }
    void setPairInterval(int interval) { m_pairInterval = interval; }

    EmptyInputPolicy getEmptyInputPolicy() const { return m_emptyInput; }
    void setEmptyInputPolicy(EmptyInputPolicy policy) { m_emptyInput = policy; }
    std::string getEmptyInputString() const;
    void setEmptyInputFromString(const std::string& policy);

    // [progress]
    int getFlushIntervalMs() const { return m_flushIntervalMs; }
    void setFlushIntervalMs(int ms) { m_flushIntervalMs = ms; }
    std::chrono::milliseconds getFlushInterval() const { return std::chrono::milliseconds(m_flushIntervalMs); }

    // [simulation]
    int getStepIntervalMs() const { return m_stepIntervalMs; }
    void setStepIntervalMs(int ms) { m_stepIntervalMs = ms; }

    double getDefectRate() const { return m_defectRate; }
    void setDefectRate(double rate) { m_defectRate = rate; }

    double getBlindRate() const { return m_blindRate; }
    void setBlindRate(double rate) { m_blindRate = rate; }

    unsigned int getSeed() const { return m_seed; }
    void setSeed(unsigned int seed) { m_seed = seed; }

private:
    // Extraction tolerances
    double m_positionTolerance;     // Center match between primitives
    double m_radiusTolerance;       // Radius match, also vs. expected radius
    double m_gapToleranceDegrees;   // Accepted uncovered angle of an arc pair
    double m_expectedHoleRadius;    // Nominal hole radius

    // Coordinate normalization
    double m_rotationDegrees;       // Counter-clockwise pre-rotation
    bool m_flipY;                   // Mirror Y before rotating

    // Grid numbering
    double m_clusterTolerance;      // 0 = automatic

    // Sector partitioning
    int m_sectorCount;
    bool m_useCustomCenter;
    double m_centerX;
    double m_centerY;

    // Path planning
    bool m_intervalPairing;
    int m_pairInterval;
    EmptyInputPolicy m_emptyInput;

    // Progress tracking
    int m_flushIntervalMs;

    // Simulation
    int m_stepIntervalMs;
    double m_defectRate;
    double m_blindRate;
    unsigned int m_seed;

    // Helper methods for parsing
    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    bool applyValue(const std::string& section, const std::string& key, const std::string& value);
    static bool parseBool(const std::string& value);
    static std::string trim(const std::string& str);
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_CONFIG_H
