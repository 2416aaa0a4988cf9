#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace calmpath::geometry {

namespace {

// Tolerance for the collinearity test, in squared degrees.
constexpr double kCollinearEpsilon = 1e-14;

double orientation(const Point& a, const Point& b, const Point& c) {
    return (b.lon - a.lon) * (c.lat - a.lat) - (b.lat - a.lat) * (c.lon - a.lon);
}

int orientation_sign(const Point& a, const Point& b, const Point& c) {
    const double value = orientation(a, b, c);
    if (std::abs(value) <= kCollinearEpsilon) {
        return 0;
    }
    return value > 0.0 ? 1 : -1;
}

// c is known to be collinear with a-b.
bool within_segment_box(const Point& a, const Point& b, const Point& c) {
    return c.lon >= std::min(a.lon, b.lon) - kCollinearEpsilon &&
           c.lon <= std::max(a.lon, b.lon) + kCollinearEpsilon &&
           c.lat >= std::min(a.lat, b.lat) - kCollinearEpsilon &&
           c.lat <= std::max(a.lat, b.lat) + kCollinearEpsilon;
}

bool on_segment(const Point& a, const Point& b, const Point& c) {
    return orientation_sign(a, b, c) == 0 && within_segment_box(a, b, c);
}

double meters_per_degree_lat() {
    return kEarthRadiusInMeters * kDegreeToRadian;
}

double meters_per_degree_lon(double latitude) {
    return kEarthRadiusInMeters * kDegreeToRadian * std::cos(latitude * kDegreeToRadian);
}

} // namespace

LocalProjection::LocalProjection(const Point& origin)
    : origin_(origin)
    , cos_lat_(std::cos(origin.lat * kDegreeToRadian)) {}

Point2D LocalProjection::to_local(const Point& point) const {
    const double x = kEarthRadiusInMeters * (point.lon - origin_.lon) * kDegreeToRadian * cos_lat_;
    const double y = kEarthRadiusInMeters * (point.lat - origin_.lat) * kDegreeToRadian;
    return Point2D{x, y};
}

Point LocalProjection::to_point(const Point2D& local) const {
    const double lat = origin_.lat + local.y / (kEarthRadiusInMeters * kDegreeToRadian);
    const double lon = origin_.lon + local.x / (kEarthRadiusInMeters * cos_lat_ * kDegreeToRadian);
    return Point(lat, lon);
}

double distance_between_points(const Point& a, const Point& b) {
    const double lat1 = a.lat * kDegreeToRadian;
    const double lon1 = a.lon * kDegreeToRadian;
    const double lat2 = b.lat * kDegreeToRadian;
    const double lon2 = b.lon * kDegreeToRadian;

    const double dlat = lat2 - lat1;
    const double dlon = lon2 - lon1;

    const double half_chord = std::sin(dlat / 2.0) * std::sin(dlat / 2.0) +
                              std::cos(lat1) * std::cos(lat2) *
                              std::sin(dlon / 2.0) * std::sin(dlon / 2.0);
    const double central_angle = 2.0 * std::atan2(std::sqrt(half_chord), std::sqrt(1.0 - half_chord));
    return kEarthRadiusInMeters * central_angle;
}

bool point_in_polygon(const Point& point, const Polygon& ring) {
    const std::size_t count = ring.size();
    if (count < 3) {
        return false;
    }

    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        if (on_segment(ring[j], ring[i], point)) {
            return true;
        }
    }

    bool inside = false;
    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        const Point& pi = ring[i];
        const Point& pj = ring[j];
        if ((pi.lat > point.lat) != (pj.lat > point.lat)) {
            const double crossing_lon = (pj.lon - pi.lon) * (point.lat - pi.lat) / (pj.lat - pi.lat) + pi.lon;
            if (point.lon < crossing_lon) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool bbox_intersects(const BoundingBox& a, const BoundingBox& b) {
    return a.intersects(b);
}

bool segments_intersect(const Point& p1, const Point& p2, const Point& q1, const Point& q2) {
    const int o1 = orientation_sign(p1, p2, q1);
    const int o2 = orientation_sign(p1, p2, q2);
    const int o3 = orientation_sign(q1, q2, p1);
    const int o4 = orientation_sign(q1, q2, p2);

    if (o1 != o2 && o3 != o4) {
        return true;
    }

    if (o1 == 0 && within_segment_box(p1, p2, q1)) return true;
    if (o2 == 0 && within_segment_box(p1, p2, q2)) return true;
    if (o3 == 0 && within_segment_box(q1, q2, p1)) return true;
    if (o4 == 0 && within_segment_box(q1, q2, p2)) return true;

    return false;
}

bool segment_intersects_polygon(const Point& a, const Point& b, const Polygon& ring) {
    const std::size_t count = ring.size();
    if (count < 3) {
        return false;
    }

    if (!bounds_of_segment(a, b).intersects(bounds_of(ring))) {
        return false;
    }

    if (point_in_polygon(a, ring) || point_in_polygon(b, ring)) {
        return true;
    }

    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        if (segments_intersect(a, b, ring[j], ring[i])) {
            return true;
        }
    }
    return false;
}

Polygon circle_approx(const Point& center, double radius_m, int num_points) {
    if (num_points < 3) {
        throw std::invalid_argument("circle_approx needs at least 3 points, got " + std::to_string(num_points));
    }
    if (!(radius_m > 0.0)) {
        throw std::invalid_argument("circle_approx needs a positive radius");
    }

    const double radius_lat = radius_m / meters_per_degree_lat();
    const double radius_lon = radius_m / meters_per_degree_lon(center.lat);

    Polygon ring;
    ring.reserve(static_cast<std::size_t>(num_points));
    for (int i = 0; i < num_points; ++i) {
        const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(num_points);
        ring.emplace_back(center.lat + radius_lat * std::sin(angle),
                          center.lon + radius_lon * std::cos(angle));
    }
    return ring;
}

BoundingBox bounds_of(const Polygon& ring) {
    if (ring.empty()) {
        return BoundingBox();
    }
    BoundingBox bounds = BoundingBox::around(ring.front());
    for (const auto& vertex : ring) {
        bounds.expand(vertex);
    }
    return bounds;
}

BoundingBox bounds_of_segment(const Point& a, const Point& b) {
    BoundingBox bounds = BoundingBox::around(a);
    bounds.expand(b);
    return bounds;
}

BoundingBox expanded_by_meters(const BoundingBox& bounds, double meters) {
    const double dlat = meters / meters_per_degree_lat();
    const double reference_lat = std::max(std::abs(bounds.min_lat), std::abs(bounds.max_lat));
    const double dlon = meters / std::max(meters_per_degree_lon(std::min(reference_lat, 89.0)), 1.0);
    return BoundingBox(std::max(bounds.min_lat - dlat, -90.0),
                       std::max(bounds.min_lon - dlon, -180.0),
                       std::min(bounds.max_lat + dlat, 90.0),
                       std::min(bounds.max_lon + dlon, 180.0));
}

double distance_outside(const BoundingBox& bounds, const Point& point) {
    if (bounds.contains(point)) {
        return 0.0;
    }
    const Point nearest(std::clamp(point.lat, bounds.min_lat, bounds.max_lat),
                        std::clamp(point.lon, bounds.min_lon, bounds.max_lon));
    return distance_between_points(point, nearest);
}

void normalize_ring(Polygon& ring) {
    while (ring.size() > 1 && ring.front() == ring.back()) {
        ring.pop_back();
    }
}

} // namespace calmpath::geometry
