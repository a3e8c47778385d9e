#include "core/geometry.h"
#include <algorithm>

namespace aidcis {
namespace plate {

namespace angles {

double normalizeDegrees(double degrees) {
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    // fmod of a tiny negative value can round back up to exactly 360
    if (wrapped >= 360.0) {
        wrapped -= 360.0;
    }
    return wrapped;
}

double angleFrom(const Point2D& origin, const Point2D& point) {
    double dx = point.x - origin.x;
    double dy = point.y - origin.y;
    if (dx == 0.0 && dy == 0.0) {
        return 0.0;
    }
    return normalizeDegrees(toDegrees(std::atan2(dy, dx)));
}

double sweep(double startDegrees, double endDegrees) {
    double start = normalizeDegrees(startDegrees);
    double end = normalizeDegrees(endDegrees);
    double span = end - start;
    if (span <= 0.0) {
        span += 360.0;
    }
    return span;
}

} // namespace angles

Point2D Polygon::centroid() const {
    if (m_points.empty()) {
        return Point2D();
    }

    double signedArea = 0.0;
    double cx = 0.0;
    double cy = 0.0;
    size_t j = m_points.size() - 1;

    for (size_t i = 0; i < m_points.size(); i++) {
        double cross = m_points[j].x * m_points[i].y - m_points[i].x * m_points[j].y;
        signedArea += cross;
        cx += (m_points[j].x + m_points[i].x) * cross;
        cy += (m_points[j].y + m_points[i].y) * cross;
        j = i;
    }

    if (std::fabs(signedArea) < 1e-12) {
        Point2D sum;
        for (const auto& point : m_points) {
            sum = sum + point;
        }
        return sum * (1.0 / static_cast<double>(m_points.size()));
    }

    signedArea *= 0.5;
    return Point2D(cx / (6.0 * signedArea), cy / (6.0 * signedArea));
}

void Polygon::getBounds(double& minX, double& minY, double& maxX, double& maxY) const {
    if (m_points.empty()) {
        minX = minY = maxX = maxY = 0.0;
        return;
    }

    minX = maxX = m_points[0].x;
    minY = maxY = m_points[0].y;

    for (const auto& point : m_points) {
        minX = std::min(minX, point.x);
        minY = std::min(minY, point.y);
        maxX = std::max(maxX, point.x);
        maxY = std::max(maxY, point.y);
    }
}

Polygon Polygon::circle(const Point2D& center, double radius, int segments) {
    Polygon polygon;
    if (radius <= 0.0 || segments < 3) {
        return polygon;
    }

    for (int i = 0; i < segments; ++i) {
        double angle = 2.0 * angles::PI * i / segments;
        polygon.addPoint(Point2D(center.x + radius * std::cos(angle),
                                 center.y + radius * std::sin(angle)));
    }
    return polygon;
}

} // namespace plate
} // namespace aidcis
