#include "core/hole.h"
#include <algorithm>
#include <limits>

namespace aidcis {
namespace plate {

bool isTerminalStatus(HoleStatus status) {
    return status == HoleStatus::QUALIFIED || status == HoleStatus::DEFECTIVE ||
           status == HoleStatus::BLIND || status == HoleStatus::TIE_ROD;
}

std::string holeStatusToString(HoleStatus status) {
    switch (status) {
        case HoleStatus::PENDING:    return "pending";
        case HoleStatus::PROCESSING: return "processing";
        case HoleStatus::QUALIFIED:  return "qualified";
        case HoleStatus::DEFECTIVE:  return "defective";
        case HoleStatus::BLIND:      return "blind";
        case HoleStatus::TIE_ROD:    return "tie_rod";
    }
    return "unknown";
}

bool holeStatusFromString(const std::string& text, HoleStatus& status) {
    static const HoleStatus all[] = {
        HoleStatus::PENDING, HoleStatus::PROCESSING, HoleStatus::QUALIFIED,
        HoleStatus::DEFECTIVE, HoleStatus::BLIND, HoleStatus::TIE_ROD
    };
    for (HoleStatus candidate : all) {
        if (holeStatusToString(candidate) == text) {
            status = candidate;
            return true;
        }
    }
    return false;
}

Hole Hole::relocated(const std::string& id, double centerX, double centerY) const {
    Hole copy(id, centerX, centerY, m_radius);
    copy.m_row = m_row;
    copy.m_column = m_column;
    copy.m_status = m_status;
    copy.m_sector = m_sector;
    copy.m_layer = m_layer;
    return copy;
}

bool HoleCollection::addHole(const Hole& hole) {
    if (m_index.count(hole.getId()) > 0) {
        return false;
    }

    m_index[hole.getId()] = m_holes.size();
    m_holes.push_back(hole);
    m_boundsValid = false;
    return true;
}

const Hole* HoleCollection::getHole(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_holes[it->second];
}

bool HoleCollection::contains(const std::string& id) const {
    return m_index.count(id) > 0;
}

bool HoleCollection::setStatus(const std::string& id, HoleStatus status) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return false;
    }
    m_holes[it->second].setStatus(status);
    return true;
}

bool HoleCollection::setSector(const std::string& id, int sector) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return false;
    }
    m_holes[it->second].setSector(sector);
    return true;
}

void HoleCollection::updateBounds() const {
    m_minX = std::numeric_limits<double>::max();
    m_minY = std::numeric_limits<double>::max();
    m_maxX = std::numeric_limits<double>::lowest();
    m_maxY = std::numeric_limits<double>::lowest();

    for (const auto& hole : m_holes) {
        m_minX = std::min(m_minX, hole.getCenterX());
        m_minY = std::min(m_minY, hole.getCenterY());
        m_maxX = std::max(m_maxX, hole.getCenterX());
        m_maxY = std::max(m_maxY, hole.getCenterY());
    }

    m_boundsValid = true;
}

bool HoleCollection::getBounds(double& minX, double& minY, double& maxX, double& maxY) const {
    if (m_holes.empty()) {
        minX = minY = maxX = maxY = 0.0;
        return false;
    }

    if (!m_boundsValid) {
        updateBounds();
    }

    minX = m_minX;
    minY = m_minY;
    maxX = m_maxX;
    maxY = m_maxY;
    return true;
}

Point2D HoleCollection::getCenter() const {
    double minX, minY, maxX, maxY;
    if (!getBounds(minX, minY, maxX, maxY)) {
        return Point2D();
    }
    return Point2D((minX + maxX) / 2.0, (minY + maxY) / 2.0);
}

bool HoleCollection::getRadiusRange(double& minRadius, double& maxRadius) const {
    if (m_holes.empty()) {
        minRadius = maxRadius = 0.0;
        return false;
    }

    minRadius = maxRadius = m_holes[0].getRadius();
    for (const auto& hole : m_holes) {
        minRadius = std::min(minRadius, hole.getRadius());
        maxRadius = std::max(maxRadius, hole.getRadius());
    }
    return true;
}

std::map<HoleStatus, int> HoleCollection::getStatusCounts() const {
    std::map<HoleStatus, int> counts = {
        {HoleStatus::PENDING, 0}, {HoleStatus::PROCESSING, 0},
        {HoleStatus::QUALIFIED, 0}, {HoleStatus::DEFECTIVE, 0},
        {HoleStatus::BLIND, 0}, {HoleStatus::TIE_ROD, 0}
    };

    for (const auto& hole : m_holes) {
        counts[hole.getStatus()]++;
    }
    return counts;
}

std::vector<const Hole*> HoleCollection::getHolesByStatus(HoleStatus status) const {
    std::vector<const Hole*> result;
    for (const auto& hole : m_holes) {
        if (hole.getStatus() == status) {
            result.push_back(&hole);
        }
    }
    return result;
}

std::vector<const Hole*> HoleCollection::getHolesInSector(int sector) const {
    std::vector<const Hole*> result;
    for (const auto& hole : m_holes) {
        if (hole.getSector() == sector) {
            result.push_back(&hole);
        }
    }
    return result;
}

std::map<std::string, int> HoleCollection::getLayerDistribution() const {
    std::map<std::string, int> layers;
    for (const auto& hole : m_holes) {
        layers[hole.getLayer()]++;
    }
    return layers;
}

} // namespace plate
} // namespace aidcis
