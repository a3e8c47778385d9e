#include "aidcis-plate/config.h"
#include <iostream>
#include <sstream>
#include <string>

using namespace aidcis::plate;

// Helper function to get numeric input with validation
template<typename T>
T getNumericInput(const std::string& prompt, T defaultValue, T minValue, T maxValue) {
    while (true) {
        std::cout << prompt << " [" << defaultValue << "]: ";

        std::string line;
        if (!std::getline(std::cin, line) || line.empty()) {
            return defaultValue;
        }

        std::istringstream iss(line);
        T value;
        if (iss >> value) {
            if (value >= minValue && value <= maxValue) {
                return value;
            }
            std::cout << "Error: Value must be between " << minValue << " and " << maxValue << std::endl;
        } else {
            std::cout << "Error: Invalid input. Please enter a number." << std::endl;
        }
    }
}

// Helper function to get yes/no input
bool getYesNoInput(const std::string& prompt, bool defaultValue) {
    std::string input;
    std::string defaultStr = defaultValue ? "Y/n" : "y/N";

    std::cout << prompt << " [" << defaultStr << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return (input[0] == 'Y' || input[0] == 'y');
}

// Helper function to get string input with default value
std::string getStringInput(const std::string& prompt, const std::string& defaultValue) {
    std::string input;

    std::cout << prompt << " [" << defaultValue << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return input;
}

void runConfigWizard(PlateConfig& config) {
    std::cout << "\n====================================" << std::endl;
    std::cout << "AIDCIS Plate Configuration Wizard" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "This wizard will help you set up a plate inspection configuration." << std::endl;
    std::cout << "Press Enter to accept default values shown in brackets." << std::endl;
    std::cout << "------------------------------------" << std::endl;

    std::cout << "\n--- Hole Extraction ---" << std::endl;
    config.setExpectedHoleRadius(getNumericInput<double>("Expected hole radius",
                                                         config.getExpectedHoleRadius(), 0.01, 1000.0));
    config.setRadiusTolerance(getNumericInput<double>("Radius tolerance",
                                                      config.getRadiusTolerance(), 0.0, 100.0));
    config.setPositionTolerance(getNumericInput<double>("Center position tolerance",
                                                        config.getPositionTolerance(), 0.0, 100.0));
    config.setGapToleranceDegrees(getNumericInput<double>("Arc gap tolerance (degrees)",
                                                          config.getGapToleranceDegrees(), 0.0, 90.0));

    std::cout << "\n--- Coordinates ---" << std::endl;
    config.setRotationDegrees(getNumericInput<double>("Pre-rotation, counter-clockwise (degrees)",
                                                      config.getRotationDegrees(), -360.0, 360.0));
    config.setFlipY(getYesNoInput("Mirror the Y axis?", config.getFlipY()));
    config.setClusterTolerance(getNumericInput<double>("Row/column cluster tolerance (0 = automatic)",
                                                       config.getClusterTolerance(), 0.0, 1000.0));

    std::cout << "\n--- Sectors ---" << std::endl;
    config.setSectorCount(getNumericInput<int>("Number of sectors",
                                               config.getSectorCount(), 2, 12));
    config.setUseCustomCenter(getYesNoInput("Use a fixed sector center?", config.getUseCustomCenter()));
    if (config.getUseCustomCenter()) {
        Point2D center = config.getCustomCenter();
        center.x = getNumericInput<double>("Center X", center.x, -1e6, 1e6);
        center.y = getNumericInput<double>("Center Y", center.y, -1e6, 1e6);
        config.setCustomCenter(center);
    }

    std::cout << "\n--- Snake Path ---" << std::endl;
    config.setIntervalPairing(getYesNoInput("Pair holes by column interval?", config.getIntervalPairing()));
    if (config.getIntervalPairing()) {
        config.setPairInterval(getNumericInput<int>("Column interval", config.getPairInterval(), 1, 100));
    }
    config.setEmptyInputFromString(getStringInput("Empty sector handling (error/empty)",
                                                  config.getEmptyInputString()));

    std::cout << "\n--- Progress and Simulation ---" << std::endl;
    config.setFlushIntervalMs(getNumericInput<int>("Progress flush interval (ms)",
                                                   config.getFlushIntervalMs(), 0, 60000));
    config.setStepIntervalMs(getNumericInput<int>("Simulated step interval (ms)",
                                                  config.getStepIntervalMs(), 0, 600000));
    config.setDefectRate(getNumericInput<double>("Simulated defect rate",
                                                 config.getDefectRate(), 0.0, 1.0));
    config.setBlindRate(getNumericInput<double>("Simulated blind-hole rate",
                                                config.getBlindRate(), 0.0, 1.0));

    std::cout << "\nConfiguration complete!" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configFile = "aidcis-plate.cfg";

    if (argc > 1) {
        configFile = argv[1];
    }

    PlateConfig config;

    // Check if this is the first run
    bool firstRun = PlateConfig::isFirstRun(configFile);

    if (firstRun) {
        std::cout << "No configuration file found. Starting setup wizard..." << std::endl;
        runConfigWizard(config);

        if (config.saveToFile(configFile)) {
            std::cout << "Configuration saved to: " << configFile << std::endl;
        } else {
            std::cerr << "Error: Failed to save configuration." << std::endl;
            return 1;
        }
    } else {
        if (!config.loadFromFile(configFile)) {
            std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
            return 1;
        }

        std::cout << "Configuration loaded from: " << configFile << std::endl;

        if (getYesNoInput("Would you like to modify the configuration?", false)) {
            runConfigWizard(config);

            if (config.saveToFile(configFile)) {
                std::cout << "Configuration updated and saved to: " << configFile << std::endl;
            } else {
                std::cerr << "Error: Failed to save configuration." << std::endl;
                return 1;
            }
        }
    }

    // Display the current configuration
    std::cout << "\n====================================" << std::endl;
    std::cout << "Current Configuration" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "Extraction:" << std::endl;
    std::cout << "  Hole Radius: " << config.getExpectedHoleRadius()
              << " +/- " << config.getRadiusTolerance() << std::endl;
    std::cout << "  Position Tolerance: " << config.getPositionTolerance() << std::endl;
    std::cout << "  Arc Gap Tolerance: " << config.getGapToleranceDegrees() << " deg" << std::endl;
    std::cout << "Coordinates:" << std::endl;
    std::cout << "  Rotation: " << config.getRotationDegrees() << " deg"
              << (config.getFlipY() ? ", Y mirrored" : "") << std::endl;
    std::cout << "Sectors:" << std::endl;
    std::cout << "  Count: " << config.getSectorCount() << std::endl;
    if (config.getUseCustomCenter()) {
        std::cout << "  Center: (" << config.getCustomCenter().x << ", "
                  << config.getCustomCenter().y << ")" << std::endl;
    }
    std::cout << "Snake Path:" << std::endl;
    std::cout << "  Pairing: " << (config.getIntervalPairing()
                                   ? "every " + std::to_string(config.getPairInterval()) + " columns"
                                   : std::string("off")) << std::endl;
    std::cout << "  Empty Sectors: " << config.getEmptyInputString() << std::endl;
    std::cout << "Progress:" << std::endl;
    std::cout << "  Flush Interval: " << config.getFlushIntervalMs() << " ms" << std::endl;

    return 0;
}
