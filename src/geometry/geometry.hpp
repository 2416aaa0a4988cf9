#pragma once

#include <cstddef>

#include "../core/types.hpp"

namespace calmpath::geometry {

constexpr double kDegreeToRadian = 0.017453292519943295; // PI / 180
constexpr double kEarthRadiusInMeters = 6371000.0;

struct Point2D {
    double x = 0.0;
    double y = 0.0;
    Point2D() = default;
    Point2D(double x_val, double y_val) : x(x_val), y(y_val) {}
};

// Equirectangular projection around a fixed origin, in meters. Only
// accurate for a few kilometers around the origin.
class LocalProjection {
public:
    explicit LocalProjection(const Point& origin);

    [[nodiscard]] Point2D to_local(const Point& point) const;
    [[nodiscard]] Point to_point(const Point2D& local) const;

private:
    Point origin_;
    double cos_lat_;
};

/**
 * Great-circle distance between two points using the haversine formula
 *
 * @return distance in meters
 */
double distance_between_points(const Point& a, const Point& b);

/**
 * Ray-casting test. Points on the ring boundary count as inside.
 * Rings with fewer than three vertices contain nothing.
 */
bool point_in_polygon(const Point& point, const Polygon& ring);

bool bbox_intersects(const BoundingBox& a, const BoundingBox& b);

/**
 * True when the closed segments p1-p2 and q1-q2 share at least one point
 * (touching and collinear overlap included).
 */
bool segments_intersect(const Point& p1, const Point& p2, const Point& q1, const Point& q2);

/**
 * True when the segment a-b crosses or touches the ring boundary, or lies
 * inside the ring.
 */
bool segment_intersects_polygon(const Point& a, const Point& b, const Polygon& ring);

/**
 * Regular num_points-gon approximating a circle of radius_m meters.
 * Uses a local meter-to-degree conversion; fine for radii up to a few
 * hundred meters away from the poles.
 *
 * @throws std::invalid_argument if num_points < 3 or radius_m is not positive
 */
Polygon circle_approx(const Point& center, double radius_m, int num_points);

BoundingBox bounds_of(const Polygon& ring);
BoundingBox bounds_of_segment(const Point& a, const Point& b);

// Grows every side of the box by the given distance.
BoundingBox expanded_by_meters(const BoundingBox& bounds, double meters);

// Distance in meters from the point to the nearest point of the box; 0 when inside.
double distance_outside(const BoundingBox& bounds, const Point& point);

// Drops a duplicated closing vertex so the ring closes implicitly.
void normalize_ring(Polygon& ring);

} // namespace calmpath::geometry
