#include "core/sector_progress_tracker.h"
#include <atomic>

namespace aidcis {
namespace plate {

int SectorProgress::count(HoleStatus status) const {
    switch (status) {
        case HoleStatus::PENDING:    return pending;
        case HoleStatus::PROCESSING: return processing;
        case HoleStatus::QUALIFIED:  return qualified;
        case HoleStatus::DEFECTIVE:  return defective;
        case HoleStatus::BLIND:      return blind;
        case HoleStatus::TIE_ROD:    return tieRod;
    }
    return 0;
}

void SectorProgress::adjust(HoleStatus status, int delta) {
    switch (status) {
        case HoleStatus::PENDING:    pending += delta; break;
        case HoleStatus::PROCESSING: processing += delta; break;
        case HoleStatus::QUALIFIED:  qualified += delta; break;
        case HoleStatus::DEFECTIVE:  defective += delta; break;
        case HoleStatus::BLIND:      blind += delta; break;
        case HoleStatus::TIE_ROD:    tieRod += delta; break;
    }
}

void SectorProgress::refreshDerived() {
    completed = qualified + defective + blind + tieRod;
    progressPercent = total > 0 ? 100.0 * completed / total : 0.0;
    qualificationRate = completed > 0 ? 100.0 * qualified / completed : 0.0;
}

bool SectorProgress::isConsistent() const {
    return total == pending + processing + qualified + defective + blind + tieRod;
}

SectorProgressTracker::SectorProgressTracker(const HoleCollection& collection,
                                             int sectorCount,
                                             std::chrono::milliseconds flushInterval)
    : m_flushInterval(flushInterval.count() > 0 ? flushInterval : std::chrono::milliseconds(0)) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    resetLocked(collection, sectorCount);
    publishLocked(Clock::now());
}

void SectorProgressTracker::resetLocked(const HoleCollection& collection, int sectorCount) {
    m_holes.clear();
    m_working = State();
    m_working.sectors.resize(sectorCount > 0 ? sectorCount : 0);

    for (size_t i = 0; i < m_working.sectors.size(); ++i) {
        m_working.sectors[i].sector = static_cast<int>(i);
    }

    for (const auto& hole : collection.getHoles()) {
        TrackedHole tracked;
        tracked.sector = hole.getSector();
        tracked.status = hole.getStatus();
        m_holes[hole.getId()] = tracked;

        m_working.global.total++;
        m_working.global.adjust(tracked.status, 1);

        if (tracked.sector >= 0 && tracked.sector < static_cast<int>(m_working.sectors.size())) {
            SectorProgress& sector = m_working.sectors[tracked.sector];
            sector.total++;
            sector.adjust(tracked.status, 1);
        }
    }

    for (auto& sector : m_working.sectors) {
        sector.refreshDerived();
    }
    m_working.global.refreshDerived();
    m_pendingEvents = 0;
}

void SectorProgressTracker::publishLocked(Clock::time_point now) {
    m_working.version++;
    std::shared_ptr<const State> next = std::make_shared<State>(m_working);
    std::atomic_store(&m_published, next);
    m_pendingEvents = 0;
    m_lastFlush = now;
}

std::shared_ptr<const SectorProgressTracker::State> SectorProgressTracker::current() const {
    return std::atomic_load(&m_published);
}

bool SectorProgressTracker::onStatusChange(const std::string& holeId,
                                           HoleStatus oldStatus,
                                           HoleStatus newStatus) {
    std::lock_guard<std::mutex> lock(m_writeMutex);

    auto it = m_holes.find(holeId);
    if (it == m_holes.end()) {
        return false;
    }

    // The tracked status is authoritative; an event built on a stale
    // oldStatus is dropped so no bucket is decremented for a hole not in it
    HoleStatus previous = it->second.status;
    if (oldStatus != previous) {
        return false;
    }

    if (previous != newStatus) {
        it->second.status = newStatus;

        m_working.global.adjust(previous, -1);
        m_working.global.adjust(newStatus, 1);
        m_working.global.refreshDerived();

        int sector = it->second.sector;
        if (sector >= 0 && sector < static_cast<int>(m_working.sectors.size())) {
            SectorProgress& progress = m_working.sectors[sector];
            progress.adjust(previous, -1);
            progress.adjust(newStatus, 1);
            progress.refreshDerived();
        }
        m_pendingEvents++;
    }

    Clock::time_point now = Clock::now();
    if (m_pendingEvents > 0 && now - m_lastFlush >= m_flushInterval) {
        publishLocked(now);
    }
    return true;
}

SectorProgress SectorProgressTracker::snapshot() const {
    return current()->global;
}

SectorProgress SectorProgressTracker::snapshot(int sector) const {
    if (sector == GLOBAL_PROGRESS) {
        return snapshot();
    }

    std::shared_ptr<const State> state = current();
    if (sector < 0 || sector >= static_cast<int>(state->sectors.size())) {
        SectorProgress empty;
        empty.sector = sector;
        return empty;
    }
    return state->sectors[sector];
}

std::vector<SectorProgress> SectorProgressTracker::allSnapshots() const {
    return current()->sectors;
}

void SectorProgressTracker::flush() {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    publishLocked(Clock::now());
}

bool SectorProgressTracker::flushIfDue() {
    return flushIfDue(Clock::now());
}

bool SectorProgressTracker::flushIfDue(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_pendingEvents == 0 || now - m_lastFlush < m_flushInterval) {
        return false;
    }
    publishLocked(now);
    return true;
}

size_t SectorProgressTracker::pendingEventCount() const {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_pendingEvents;
}

uint64_t SectorProgressTracker::getVersion() const {
    return current()->version;
}

void SectorProgressTracker::rebuild(const HoleCollection& collection, int sectorCount) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    uint64_t version = m_working.version;
    resetLocked(collection, sectorCount);
    m_working.version = version;
    publishLocked(Clock::now());
}

int SectorProgressTracker::getSectorCount() const {
    return static_cast<int>(current()->sectors.size());
}

bool SectorProgressTracker::getStatus(const std::string& holeId, HoleStatus& status) const {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    auto it = m_holes.find(holeId);
    if (it == m_holes.end()) {
        return false;
    }
    status = it->second.status;
    return true;
}

std::vector<SectorProgress> SectorProgressTracker::computeProgress(const HoleCollection& collection,
                                                                   int sectorCount) {
    std::vector<SectorProgress> progress(sectorCount > 0 ? sectorCount : 0);
    SectorProgress global;

    for (size_t i = 0; i < progress.size(); ++i) {
        progress[i].sector = static_cast<int>(i);
    }

    for (const auto& hole : collection.getHoles()) {
        global.total++;
        global.adjust(hole.getStatus(), 1);

        int sector = hole.getSector();
        if (sector >= 0 && sector < static_cast<int>(progress.size())) {
            progress[sector].total++;
            progress[sector].adjust(hole.getStatus(), 1);
        }
    }

    for (auto& sector : progress) {
        sector.refreshDerived();
    }
    global.refreshDerived();
    progress.push_back(global);
    return progress;
}

} // namespace plate
} // namespace aidcis
