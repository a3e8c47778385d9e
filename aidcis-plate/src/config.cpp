#include "aidcis-plate/config.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace aidcis {
namespace plate {

PlateConfig::PlateConfig() {
    setDefaults();
}

PlateConfig::~PlateConfig() = default;

void PlateConfig::setDefaults() {
    // Extraction
    m_positionTolerance = 0.01;
    m_radiusTolerance = 0.1;
    m_gapToleranceDegrees = 1.0;
    m_expectedHoleRadius = 8.865;

    // Normalization
    m_rotationDegrees = 0.0;
    m_flipY = false;

    // Grid
    m_clusterTolerance = 0.0;

    // Sectors
    m_sectorCount = 4;
    m_useCustomCenter = false;
    m_centerX = 0.0;
    m_centerY = 0.0;

    // Path
    m_intervalPairing = false;
    m_pairInterval = 4;
    m_emptyInput = EmptyInputPolicy::ERROR;

    // Progress
    m_flushIntervalMs = 1000;

    // Simulation
    m_stepIntervalMs = 9500;
    m_defectRate = 0.05;
    m_blindRate = 0.0;
    m_seed = 42;
}

bool PlateConfig::isFirstRun(const std::string& filename) {
    std::ifstream file(filename);
    return !file.good();
}

bool PlateConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    std::string line;
    std::string section;
    int lineNumber = 0;

    // First set defaults, then override with values from file
    setDefaults();

    while (std::getline(file, line)) {
        lineNumber++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        std::string key, value;
        if (!parseLine(line, key, value)) {
            continue;
        }

        try {
            if (!applyValue(section, key, value)) {
                std::cerr << "Warning: Unknown setting '" << key << "' in [" << section
                          << "] at " << filename << ":" << lineNumber << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid value '" << value << "' for " << key << " at "
                      << filename << ":" << lineNumber << " (" << e.what() << ")" << std::endl;
            return false;
        }
    }

    return true;
}

bool PlateConfig::applyValue(const std::string& section, const std::string& key, const std::string& value) {
    if (section == "extraction") {
        if (key == "position_tolerance") m_positionTolerance = std::stod(value);
        else if (key == "radius_tolerance") m_radiusTolerance = std::stod(value);
        else if (key == "gap_tolerance_deg") m_gapToleranceDegrees = std::stod(value);
        else if (key == "expected_hole_radius") m_expectedHoleRadius = std::stod(value);
        else return false;
    }
    else if (section == "normalization") {
        if (key == "rotation_degrees") m_rotationDegrees = std::stod(value);
        else if (key == "flip_y") m_flipY = parseBool(value);
        else return false;
    }
    else if (section == "grid") {
        if (key == "cluster_tolerance") m_clusterTolerance = std::stod(value);
        else return false;
    }
    else if (section == "sectors") {
        if (key == "count") m_sectorCount = std::stoi(value);
        else if (key == "use_custom_center") m_useCustomCenter = parseBool(value);
        else if (key == "center_x") m_centerX = std::stod(value);
        else if (key == "center_y") m_centerY = std::stod(value);
        else return false;
    }
    else if (section == "path") {
        if (key == "interval_pairing") m_intervalPairing = parseBool(value);
        else if (key == "pair_interval") m_pairInterval = std::stoi(value);
        else if (key == "empty_input") setEmptyInputFromString(value);
        else return false;
    }
    else if (section == "progress") {
        if (key == "flush_interval_ms") m_flushIntervalMs = std::stoi(value);
        else return false;
    }
    else if (section == "simulation") {
        if (key == "step_interval_ms") m_stepIntervalMs = std::stoi(value);
        else if (key == "defect_rate") m_defectRate = std::stod(value);
        else if (key == "blind_rate") m_blindRate = std::stod(value);
        else if (key == "seed") m_seed = static_cast<unsigned int>(std::stoul(value));
        else return false;
    }
    else {
        return false;
    }
    return true;
}

bool PlateConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    // Enough digits for every double to read back unchanged
    file << std::setprecision(std::numeric_limits<double>::max_digits10);

    file << "# AIDCIS Plate Inspection Configuration File" << std::endl;
    file << "# Automatically generated" << std::endl << std::endl;

    file << "[extraction]" << std::endl;
    file << "position_tolerance=" << m_positionTolerance << std::endl;
    file << "radius_tolerance=" << m_radiusTolerance << std::endl;
    file << "gap_tolerance_deg=" << m_gapToleranceDegrees << std::endl;
    file << "expected_hole_radius=" << m_expectedHoleRadius << std::endl << std::endl;

    file << "[normalization]" << std::endl;
    file << "rotation_degrees=" << m_rotationDegrees << std::endl;
    file << "flip_y=" << (m_flipY ? "true" : "false") << std::endl << std::endl;

    file << "[grid]" << std::endl;
    file << "cluster_tolerance=" << m_clusterTolerance << std::endl << std::endl;

    file << "[sectors]" << std::endl;
    file << "count=" << m_sectorCount << std::endl;
    file << "use_custom_center=" << (m_useCustomCenter ? "true" : "false") << std::endl;
    file << "center_x=" << m_centerX << std::endl;
    file << "center_y=" << m_centerY << std::endl << std::endl;

    file << "[path]" << std::endl;
    file << "interval_pairing=" << (m_intervalPairing ? "true" : "false") << std::endl;
    file << "pair_interval=" << m_pairInterval << std::endl;
    file << "empty_input=" << getEmptyInputString() << std::endl << std::endl;

    file << "[progress]" << std::endl;
    file << "flush_interval_ms=" << m_flushIntervalMs << std::endl << std::endl;

    file << "[simulation]" << std::endl;
    file << "step_interval_ms=" << m_stepIntervalMs << std::endl;
    file << "defect_rate=" << m_defectRate << std::endl;
    file << "blind_rate=" << m_blindRate << std::endl;
    file << "seed=" << m_seed << std::endl;

    return file.good();
}

ExtractionParams PlateConfig::getExtractionParams() const {
    ExtractionParams params;
    params.positionTolerance = m_positionTolerance;
    params.radiusTolerance = m_radiusTolerance;
    params.gapToleranceDegrees = m_gapToleranceDegrees;
    params.expectedHoleRadius = m_expectedHoleRadius;
    return params;
}

NumberingParams PlateConfig::getNumberingParams() const {
    NumberingParams params;
    params.clusterTolerance = m_clusterTolerance;
    return params;
}

PathPlannerParams PlateConfig::getPathPlannerParams() const {
    PathPlannerParams params;
    params.intervalPairing = m_intervalPairing;
    params.pairInterval = m_pairInterval;
    params.emptyInput = m_emptyInput;
    return params;
}

SimulationParams PlateConfig::getSimulationParams() const {
    SimulationParams params;
    params.stepInterval = std::chrono::milliseconds(m_stepIntervalMs);
    params.defectRate = m_defectRate;
    params.blindRate = m_blindRate;
    params.seed = m_seed;
    return params;
}

std::string PlateConfig::getEmptyInputString() const {
    return (m_emptyInput == EmptyInputPolicy::ERROR) ? "error" : "empty";
}

void PlateConfig::setEmptyInputFromString(const std::string& policy) {
    if (policy == "empty" || policy == "empty_path") {
        m_emptyInput = EmptyInputPolicy::EMPTY_PATH;
    } else {
        m_emptyInput = EmptyInputPolicy::ERROR;
    }
}

bool PlateConfig::parseLine(const std::string& line, std::string& key, std::string& value) const {
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }

    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));

    return !key.empty();
}

bool PlateConfig::parseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

std::string PlateConfig::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace plate
} // namespace aidcis
