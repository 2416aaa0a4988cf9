#pragma once

#include <cmath>

namespace calmpath {

// Geographic position in degrees.
struct Point {
    double lat;
    double lon;
    Point() : lat(0.0), lon(0.0) {}
    Point(double latitude, double longitude) : lat(latitude), lon(longitude) {}

    [[nodiscard]] bool is_valid() const {
        return std::isfinite(lat) && std::isfinite(lon) &&
               lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
    }

    // Comparison operator
    bool operator==(const Point& other) const {
        return std::abs(lat - other.lat) < 1e-9 && std::abs(lon - other.lon) < 1e-9;
    }
};

} // namespace calmpath
