#ifndef AIDCIS_PLATE_GEOMETRY_H
#define AIDCIS_PLATE_GEOMETRY_H

#include <vector>
#include <cmath>

namespace aidcis {
namespace plate {

/**
 * Represents a 2D point with x and y coordinates
 */
struct Point2D {
    double x;
    double y;

    Point2D(double _x = 0, double _y = 0) : x(_x), y(_y) {}

    // Calculate distance to another point
    double distanceTo(const Point2D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx*dx + dy*dy);
    }

    Point2D operator+(const Point2D& other) const {
        return Point2D(x + other.x, y + other.y);
    }

    Point2D operator-(const Point2D& other) const {
        return Point2D(x - other.x, y - other.y);
    }

    Point2D operator*(double scalar) const {
        return Point2D(x * scalar, y * scalar);
    }

    bool operator==(const Point2D& other) const {
        const double epsilon = 1e-6;
        return std::fabs(x - other.x) < epsilon && std::fabs(y - other.y) < epsilon;
    }
};

/**
 * Angular helpers. All angles are in degrees, measured counter-clockwise
 * from +X with Y pointing up.
 */
namespace angles {

constexpr double PI = 3.14159265358979323846;

inline double toRadians(double degrees) { return degrees * PI / 180.0; }
inline double toDegrees(double radians) { return radians * 180.0 / PI; }

// Wrap any angle into [0, 360)
double normalizeDegrees(double degrees);

// Angle of `point` as seen from `origin`, in [0, 360)
double angleFrom(const Point2D& origin, const Point2D& point);

// Counter-clockwise sweep from start to end, in (0, 360]
double sweep(double startDegrees, double endDegrees);

} // namespace angles

/**
 * Represents a closed polygon for area operations
 */
class Polygon {
public:
    Polygon() = default;
    explicit Polygon(const std::vector<Point2D>& points) : m_points(points) {}

    void addPoint(const Point2D& point) {
        m_points.push_back(point);
    }

    const std::vector<Point2D>& getPoints() const {
        return m_points;
    }

    size_t size() const {
        return m_points.size();
    }

    bool empty() const {
        return m_points.empty();
    }

    // Area-weighted centroid; falls back to the vertex mean for degenerate polygons
    Point2D centroid() const;

    // Get the bounding box
    void getBounds(double& minX, double& minY, double& maxX, double& maxY) const;

    // Regular polygon approximating a circle, counter-clockwise
    static Polygon circle(const Point2D& center, double radius, int segments = 180);

private:
    std::vector<Point2D> m_points;
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_GEOMETRY_H
