#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../include/bounding_box.hpp"
#include "../include/point.hpp"
#include "street_source.hpp"

namespace calmpath {

using NodeId = std::size_t;
using EdgeId = std::size_t;

struct StreetNode {
    NodeId id;
    Point location;
};

// Stored with from < to; traversable both ways.
struct StreetEdge {
    EdgeId id;
    NodeId from;
    NodeId to;
    double length_m;
    std::string street_name;
};

struct Neighbor {
    EdgeId edge_id;
    NodeId other_node;
    double length_m;
};

struct GraphBuildOptions {
    // How far outside the requested box a start or end point may lie.
    double range_tolerance_m = 250.0;
    // Vertex merge grid, in degrees.
    double merge_precision_deg = 1e-7;
};

/**
 * Walkable street network for one bounding box. Immutable after
 * construction; node and edge ids depend only on the input geometry,
 * not on segment order.
 */
class StreetGraph {
public:
    /**
     * @throws NoGraphDataError if no segment piece survives clipping
     * @throws InvalidRequestError if the box is malformed
     */
    StreetGraph(const std::vector<RawSegment>& segments, const BoundingBox& bounds,
                const GraphBuildOptions& options = {});

    static StreetGraph build(const StreetSource& source, const BoundingBox& bounds,
                             const GraphBuildOptions& options = {});

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }

    const StreetNode& node(NodeId id) const;
    const StreetEdge& edge(EdgeId id) const;
    const std::vector<StreetNode>& nodes() const noexcept { return nodes_; }
    const std::vector<StreetEdge>& edges() const noexcept { return edges_; }

    // Incident edges of a node, sorted by the id of the node at the other end.
    const std::vector<Neighbor>& neighbors(NodeId id) const;

    // Edge joining two nodes, if any.
    [[nodiscard]] bool find_edge(NodeId a, NodeId b, EdgeId& edge_id) const;

    // Closest node by planar distance; ties go to the lowest id.
    [[nodiscard]] NodeId node_nearest(const Point& point) const;

    // @throws PointOutOfRangeError if the point is invalid or too far outside the covered box
    void check_in_range(const Point& point) const;

    [[nodiscard]] const BoundingBox& bounds() const noexcept { return bounds_; }

    [[nodiscard]] Point edge_midpoint(EdgeId id) const;
    [[nodiscard]] BoundingBox edge_bounds(EdgeId id) const;

private:
    BoundingBox bounds_;
    GraphBuildOptions options_;
    std::vector<StreetNode> nodes_;
    std::vector<StreetEdge> edges_;
    std::vector<std::vector<Neighbor>> adjacency_;
};

} // namespace calmpath
