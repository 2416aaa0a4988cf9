#pragma once

#include <algorithm>
#include <cmath>

#include "point.hpp"

namespace calmpath {

// Axis-aligned latitude/longitude rectangle.
struct BoundingBox {
    double min_lat;
    double min_lon;
    double max_lat;
    double max_lon;

    BoundingBox()
        : min_lat(0.0)
        , min_lon(0.0)
        , max_lat(0.0)
        , max_lon(0.0) {}

    BoundingBox(double min_lat_in, double min_lon_in, double max_lat_in, double max_lon_in)
        : min_lat(min_lat_in)
        , min_lon(min_lon_in)
        , max_lat(max_lat_in)
        , max_lon(max_lon_in) {}

    static BoundingBox around(const Point& point) {
        return BoundingBox(point.lat, point.lon, point.lat, point.lon);
    }

    [[nodiscard]] bool is_valid() const {
        return std::isfinite(min_lat) && std::isfinite(min_lon) &&
               std::isfinite(max_lat) && std::isfinite(max_lon) &&
               min_lat <= max_lat && min_lon <= max_lon;
    }

    [[nodiscard]] bool intersects(const BoundingBox& other) const {
        return !(max_lon < other.min_lon || min_lon > other.max_lon ||
                 max_lat < other.min_lat || min_lat > other.max_lat);
    }

    [[nodiscard]] bool contains(const Point& point) const {
        return point.lat >= min_lat && point.lat <= max_lat &&
               point.lon >= min_lon && point.lon <= max_lon;
    }

    [[nodiscard]] Point center() const {
        return Point((min_lat + max_lat) * 0.5, (min_lon + max_lon) * 0.5);
    }

    void expand(const BoundingBox& other) {
        min_lat = std::min(min_lat, other.min_lat);
        min_lon = std::min(min_lon, other.min_lon);
        max_lat = std::max(max_lat, other.max_lat);
        max_lon = std::max(max_lon, other.max_lon);
    }

    void expand(const Point& point) {
        min_lat = std::min(min_lat, point.lat);
        min_lon = std::min(min_lon, point.lon);
        max_lat = std::max(max_lat, point.lat);
        max_lon = std::max(max_lon, point.lon);
    }
};

} // namespace calmpath
