#include "street_source.hpp"

#include <algorithm>
#include <utility>

namespace calmpath {

InMemoryStreetSource::InMemoryStreetSource(std::vector<RawSegment> segments)
    : segments_(std::move(segments)) {}

std::vector<RawSegment> InMemoryStreetSource::segments_in(const BoundingBox& bounds) const {
    std::vector<RawSegment> results;
    for (const auto& segment : segments_) {
        const bool touches = std::any_of(segment.points.begin(), segment.points.end(),
                                         [&bounds](const Point& point) { return bounds.contains(point); });
        if (touches) {
            results.push_back(segment);
        }
    }
    return results;
}

} // namespace calmpath
