#ifndef AIDCIS_PLATE_INSPECTION_SIMULATOR_H
#define AIDCIS_PLATE_INSPECTION_SIMULATOR_H

#include "core/hole.h"
#include "core/path_planner.h"
#include "core/sector_progress_tracker.h"
#include <chrono>
#include <random>
#include <vector>

namespace aidcis {
namespace plate {

struct SimulationParams {
    std::chrono::milliseconds stepInterval = std::chrono::milliseconds(9500);  // Advisory pacing for the caller
    double defectRate = 0.05;       // Probability of DEFECTIVE per hole
    double blindRate = 0.0;         // Probability of BLIND per hole
    unsigned int seed = 42;
};

/**
 * Single-writer driver that walks a planned path and feeds the tracker.
 *
 * Each step takes two advance() calls: the first marks its holes
 * PROCESSING, the second gives them a final status. Holes that already hold
 * a terminal status are left alone. Timing belongs to the caller.
 */
class InspectionSimulator {
public:
    InspectionSimulator(const HoleCollection& collection,
                        const std::vector<PathStep>& steps,
                        SectorProgressTracker& tracker,
                        const SimulationParams& params = SimulationParams());

    /**
     * Move the simulation forward by one phase
     * @return False once every step is finished
     */
    bool advance();

    // Advance until finished and flush the tracker
    void runToCompletion();

    bool isFinished() const { return m_nextStep >= m_steps.size(); }
    size_t getCurrentStep() const { return m_nextStep; }
    size_t getStepCount() const { return m_steps.size(); }

    // Collection with every status change applied so far
    const HoleCollection& getCollection() const { return m_collection; }

    // Status changes the tracker refused (hole unknown to it)
    size_t getRejectedEvents() const { return m_rejectedEvents; }

    const SimulationParams& getParams() const { return m_params; }

private:
    HoleCollection m_collection;
    std::vector<PathStep> m_steps;
    SectorProgressTracker& m_tracker;
    SimulationParams m_params;

    size_t m_nextStep = 0;
    bool m_stepStarted = false;
    size_t m_rejectedEvents = 0;

    std::mt19937 m_random;
    std::uniform_real_distribution<double> m_distribution;

    void changeStatus(const std::string& holeId, HoleStatus newStatus);
    HoleStatus drawOutcome();
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_INSPECTION_SIMULATOR_H
