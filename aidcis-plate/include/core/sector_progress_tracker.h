#ifndef AIDCIS_PLATE_SECTOR_PROGRESS_TRACKER_H
#define AIDCIS_PLATE_SECTOR_PROGRESS_TRACKER_H

#include "core/hole.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace aidcis {
namespace plate {

// Sector index used for the aggregate over all sectors
const int GLOBAL_PROGRESS = -1;

/**
 * Status counters of one sector or of the whole plate
 */
struct SectorProgress {
    int sector = GLOBAL_PROGRESS;
    int total = 0;
    int pending = 0;
    int processing = 0;
    int qualified = 0;
    int defective = 0;
    int blind = 0;
    int tieRod = 0;

    // Derived, kept in step with the counters by refreshDerived()
    int completed = 0;
    double progressPercent = 0.0;       // completed / total * 100
    double qualificationRate = 0.0;     // qualified / completed * 100

    int count(HoleStatus status) const;
    void adjust(HoleStatus status, int delta);
    void refreshDerived();

    // total == pending + processing + qualified + defective + blind + tieRod
    bool isConsistent() const;
};

/**
 * Live per-sector and global progress fed by status-change events.
 *
 * Writers are serialized by a mutex and update a working copy. Readers get
 * the last published copy without locking; publishing swaps in a complete
 * immutable state, so a reader never sees half an update. With a flush
 * interval of zero every event is published immediately.
 *
 * Publishing happens only inside onStatusChange(), flush() and flushIfDue().
 * snapshot() never publishes, so events buffered after the last writer call
 * stay invisible until someone flushes. A poller that may outlive the writer
 * calls flushIfDue() before taking its snapshots.
 */
class SectorProgressTracker {
public:
    typedef std::chrono::steady_clock Clock;

    /**
     * @param collection Partitioned holes, their current status is the baseline
     * @param sectorCount Number of sectors the holes were partitioned into
     * @param flushInterval Publishing cadence for buffered events
     */
    SectorProgressTracker(const HoleCollection& collection,
                          int sectorCount,
                          std::chrono::milliseconds flushInterval = std::chrono::milliseconds(1000));

    /**
     * Record a status change of one hole. Re-inspection (a finished hole going
     * back to PENDING or PROCESSING) is an ordinary change.
     * @return False if the hole is unknown to the tracker, or if oldStatus is
     *         not the status the tracker holds for it; the event is dropped
     */
    bool onStatusChange(const std::string& holeId, HoleStatus oldStatus, HoleStatus newStatus);

    // Global aggregate as of the last flush
    SectorProgress snapshot() const;

    // One sector as of the last flush; zeroed counters for an unknown sector
    SectorProgress snapshot(int sector) const;

    std::vector<SectorProgress> allSnapshots() const;

    // Publish buffered events now
    void flush();

    // Publish if the flush interval has elapsed since the last publish
    bool flushIfDue();
    bool flushIfDue(Clock::time_point now);

    // Events applied to the working state but not yet visible to readers
    size_t pendingEventCount() const;

    // Number of publishes so far, starting at 1 for the baseline
    uint64_t getVersion() const;

    // Reset counters from a (re-)partitioned collection and publish them
    void rebuild(const HoleCollection& collection, int sectorCount);

    int getSectorCount() const;
    std::chrono::milliseconds getFlushInterval() const { return m_flushInterval; }

    // Tracked status of a hole, false if unknown
    bool getStatus(const std::string& holeId, HoleStatus& status) const;

    /**
     * Reduce a collection to per-sector progress without any tracker state
     * @return sectorCount entries followed by the global aggregate
     */
    static std::vector<SectorProgress> computeProgress(const HoleCollection& collection, int sectorCount);

private:
    struct State {
        std::vector<SectorProgress> sectors;
        SectorProgress global;
        uint64_t version = 0;
    };

    struct TrackedHole {
        int sector = NO_SECTOR;
        HoleStatus status = HoleStatus::PENDING;
    };

    mutable std::mutex m_writeMutex;
    std::unordered_map<std::string, TrackedHole> m_holes;
    State m_working;
    size_t m_pendingEvents = 0;
    Clock::time_point m_lastFlush;
    std::chrono::milliseconds m_flushInterval;
    std::shared_ptr<const State> m_published;

    void resetLocked(const HoleCollection& collection, int sectorCount);
    void publishLocked(Clock::time_point now);
    std::shared_ptr<const State> current() const;
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_SECTOR_PROGRESS_TRACKER_H
