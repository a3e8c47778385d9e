#include "core/inspection_simulator.h"

namespace aidcis {
namespace plate {

InspectionSimulator::InspectionSimulator(const HoleCollection& collection,
                                         const std::vector<PathStep>& steps,
                                         SectorProgressTracker& tracker,
                                         const SimulationParams& params)
    : m_collection(collection),
      m_steps(steps),
      m_tracker(tracker),
      m_params(params),
      m_random(params.seed),
      m_distribution(0.0, 1.0) {}

void InspectionSimulator::changeStatus(const std::string& holeId, HoleStatus newStatus) {
    const Hole* hole = m_collection.getHole(holeId);
    if (!hole) {
        m_rejectedEvents++;
        return;
    }

    HoleStatus oldStatus = hole->getStatus();
    m_collection.setStatus(holeId, newStatus);

    if (!m_tracker.onStatusChange(holeId, oldStatus, newStatus)) {
        m_rejectedEvents++;
    }
}

HoleStatus InspectionSimulator::drawOutcome() {
    double draw = m_distribution(m_random);
    if (draw < m_params.defectRate) {
        return HoleStatus::DEFECTIVE;
    }
    if (draw < m_params.defectRate + m_params.blindRate) {
        return HoleStatus::BLIND;
    }
    return HoleStatus::QUALIFIED;
}

bool InspectionSimulator::advance() {
    if (isFinished()) {
        return false;
    }

    const PathStep& step = m_steps[m_nextStep];

    if (!m_stepStarted) {
        for (const auto& id : step.holeIds()) {
            const Hole* hole = m_collection.getHole(id);
            if (hole && isTerminalStatus(hole->getStatus())) {
                continue;
            }
            changeStatus(id, HoleStatus::PROCESSING);
        }
        m_stepStarted = true;
        return true;
    }

    for (const auto& id : step.holeIds()) {
        const Hole* hole = m_collection.getHole(id);
        if (hole && hole->getStatus() == HoleStatus::PROCESSING) {
            changeStatus(id, drawOutcome());
        }
    }

    m_stepStarted = false;
    m_nextStep++;

    if (isFinished()) {
        m_tracker.flush();
    }
    return true;
}

void InspectionSimulator::runToCompletion() {
    while (advance()) {
    }
    m_tracker.flush();
}

} // namespace plate
} // namespace aidcis
