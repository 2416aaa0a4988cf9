#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../include/bounding_box.hpp"
#include "../include/point.hpp"

namespace calmpath {

// One walkable polyline as delivered by a street data provider.
struct RawSegment {
    std::vector<Point> points;
    std::string name;
};

class StreetSource {
public:
    virtual ~StreetSource() = default;

    // Segments with at least one vertex inside the box. May return more;
    // StreetGraph clips again.
    virtual std::vector<RawSegment> segments_in(const BoundingBox& bounds) const = 0;
};

using StreetSourcePtr = std::shared_ptr<const StreetSource>;

// Street source over segments already held in memory.
class InMemoryStreetSource final : public StreetSource {
public:
    InMemoryStreetSource() = default;
    explicit InMemoryStreetSource(std::vector<RawSegment> segments);

    std::vector<RawSegment> segments_in(const BoundingBox& bounds) const override;

    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }

private:
    std::vector<RawSegment> segments_;
};

} // namespace calmpath
