#ifndef AIDCIS_PLATE_HOLE_H
#define AIDCIS_PLATE_HOLE_H

#include "core/geometry.h"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace aidcis {
namespace plate {

/**
 * Inspection state of a single hole
 */
enum class HoleStatus {
    PENDING,        // Not yet inspected (initial state)
    PROCESSING,     // Probe is currently servicing the hole
    QUALIFIED,      // Inspected, within tolerance
    DEFECTIVE,      // Inspected, out of tolerance
    BLIND,          // Blind hole, not inspectable
    TIE_ROD         // Tie-rod hole, not inspected
};

const int HOLE_STATUS_COUNT = 6;

// Terminal states only change on an explicit re-detection
bool isTerminalStatus(HoleStatus status);
std::string holeStatusToString(HoleStatus status);
bool holeStatusFromString(const std::string& text, HoleStatus& status);

// Sector membership of a hole that has not been partitioned yet
const int NO_SECTOR = -1;

/**
 * A reconstructed circular feature of the plate.
 *
 * Center and radius are fixed at construction; status, sector and the
 * grid assignment are mutable.
 */
class Hole {
public:
    Hole() = default;
    Hole(const std::string& id, double centerX, double centerY, double radius)
        : m_id(id), m_centerX(centerX), m_centerY(centerY), m_radius(radius) {}

    const std::string& getId() const { return m_id; }
    double getCenterX() const { return m_centerX; }
    double getCenterY() const { return m_centerY; }
    Point2D getCenter() const { return Point2D(m_centerX, m_centerY); }
    double getRadius() const { return m_radius; }

    int getRow() const { return m_row; }
    int getColumn() const { return m_column; }
    bool isNumbered() const { return m_row > 0 && m_column > 0; }
    void setGridPosition(int row, int column) { m_row = row; m_column = column; }

    HoleStatus getStatus() const { return m_status; }
    void setStatus(HoleStatus status) { m_status = status; }

    int getSector() const { return m_sector; }
    void setSector(int sector) { m_sector = sector; }

    const std::string& getLayer() const { return m_layer; }
    void setLayer(const std::string& layer) { m_layer = layer; }

    // Copy of this hole with a new identity and position; state is carried over
    Hole relocated(const std::string& id, double centerX, double centerY) const;

private:
    std::string m_id;
    double m_centerX = 0.0;
    double m_centerY = 0.0;
    double m_radius = 0.0;
    int m_row = 0;                  // 1-based, 0 = not numbered
    int m_column = 0;               // 1-based, 0 = not numbered
    HoleStatus m_status = HoleStatus::PENDING;
    int m_sector = NO_SECTOR;
    std::string m_layer;
};

/**
 * Coordinate transform already baked into a collection's coordinates
 */
struct NormalizationState {
    bool normalized = false;
    double rotationDegrees = 0.0;
    bool flippedY = false;
};

/**
 * Keyed set of holes. Lookups go through the id index; iteration follows
 * insertion order so every stage is deterministic.
 */
class HoleCollection {
public:
    HoleCollection() = default;

    /**
     * Add a hole to the collection
     * @param hole Hole to add
     * @return False if a hole with the same id already exists
     */
    bool addHole(const Hole& hole);

    const Hole* getHole(const std::string& id) const;
    bool contains(const std::string& id) const;

    const std::vector<Hole>& getHoles() const { return m_holes; }
    size_t size() const { return m_holes.size(); }
    bool empty() const { return m_holes.empty(); }

    // Mutators for the state that may change during a session
    bool setStatus(const std::string& id, HoleStatus status);
    bool setSector(const std::string& id, int sector);

    /**
     * Get the bounding box of all hole centers (cached)
     * @return False if the collection is empty
     */
    bool getBounds(double& minX, double& minY, double& maxX, double& maxY) const;

    // Center of the bounding box, (0,0) when empty
    Point2D getCenter() const;

    // Smallest and largest radius, false when empty
    bool getRadiusRange(double& minRadius, double& maxRadius) const;

    std::map<HoleStatus, int> getStatusCounts() const;
    std::vector<const Hole*> getHolesByStatus(HoleStatus status) const;
    std::vector<const Hole*> getHolesInSector(int sector) const;
    std::map<std::string, int> getLayerDistribution() const;

    const NormalizationState& getNormalization() const { return m_normalization; }
    void setNormalization(const NormalizationState& state) { m_normalization = state; }

private:
    std::vector<Hole> m_holes;
    std::unordered_map<std::string, size_t> m_index;
    NormalizationState m_normalization;

    mutable bool m_boundsValid = false;
    mutable double m_minX = 0.0;
    mutable double m_minY = 0.0;
    mutable double m_maxX = 0.0;
    mutable double m_maxY = 0.0;

    void updateBounds() const;
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_HOLE_H
