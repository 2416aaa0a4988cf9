#include "street_graph.hpp"

#include "../core/errors.hpp"
#include "../geometry/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace calmpath {

namespace {

using VertexKey = std::pair<std::int64_t, std::int64_t>;

struct Piece {
    VertexKey a;
    VertexKey b;
    const std::string* name;
};

VertexKey quantize(const Point& point, double precision) {
    return VertexKey{static_cast<std::int64_t>(std::llround(point.lat / precision)),
                     static_cast<std::int64_t>(std::llround(point.lon / precision))};
}

// Duplicate pieces have identical merged geometry; keep a stable name.
bool prefer_name(const std::string& candidate, const std::string& current) {
    if (current.empty()) {
        return !candidate.empty();
    }
    return !candidate.empty() && candidate < current;
}

std::string describe(const Point& point) {
    std::ostringstream out;
    out.precision(7);
    out << std::fixed << "(" << point.lat << ", " << point.lon << ")";
    return out.str();
}

} // namespace

StreetGraph::StreetGraph(const std::vector<RawSegment>& segments, const BoundingBox& bounds,
                         const GraphBuildOptions& options)
    : bounds_(bounds)
    , options_(options) {
    if (!bounds_.is_valid()) {
        throw InvalidRequestError("Bounding box is malformed");
    }
    if (!(options_.merge_precision_deg > 0.0)) {
        throw std::invalid_argument("StreetGraph: merge precision must be positive");
    }

    // Clip at vertex level: a piece survives when either end is inside the box.
    std::vector<Piece> pieces;
    std::vector<VertexKey> keys;
    for (const auto& segment : segments) {
        for (std::size_t i = 1; i < segment.points.size(); ++i) {
            const Point& a = segment.points[i - 1];
            const Point& b = segment.points[i];
            if (!a.is_valid() || !b.is_valid()) {
                continue;
            }
            if (!bounds_.contains(a) && !bounds_.contains(b)) {
                continue;
            }
            const VertexKey key_a = quantize(a, options_.merge_precision_deg);
            const VertexKey key_b = quantize(b, options_.merge_precision_deg);
            if (key_a == key_b) {
                continue;
            }
            pieces.push_back(Piece{key_a, key_b, &segment.name});
            keys.push_back(key_a);
            keys.push_back(key_b);
        }
    }

    if (pieces.empty()) {
        throw NoGraphDataError("no map data for area");
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    nodes_.reserve(keys.size());
    for (const auto& key : keys) {
        const Point location(static_cast<double>(key.first) * options_.merge_precision_deg,
                             static_cast<double>(key.second) * options_.merge_precision_deg);
        nodes_.push_back(StreetNode{nodes_.size(), location});
    }

    auto node_of = [&keys](const VertexKey& key) {
        return static_cast<NodeId>(std::lower_bound(keys.begin(), keys.end(), key) - keys.begin());
    };

    std::map<std::pair<NodeId, NodeId>, const std::string*> unique_pieces;
    for (const auto& piece : pieces) {
        NodeId from = node_of(piece.a);
        NodeId to = node_of(piece.b);
        if (from > to) {
            std::swap(from, to);
        }
        auto [it, inserted] = unique_pieces.emplace(std::make_pair(from, to), piece.name);
        if (!inserted && prefer_name(*piece.name, *it->second)) {
            it->second = piece.name;
        }
    }

    edges_.reserve(unique_pieces.size());
    adjacency_.resize(nodes_.size());
    for (const auto& [ends, name] : unique_pieces) {
        const EdgeId id = edges_.size();
        const double length = geometry::distance_between_points(nodes_[ends.first].location,
                                                                nodes_[ends.second].location);
        edges_.push_back(StreetEdge{id, ends.first, ends.second, length, *name});
        adjacency_[ends.first].push_back(Neighbor{id, ends.second, length});
        adjacency_[ends.second].push_back(Neighbor{id, ends.first, length});
    }

    for (auto& list : adjacency_) {
        std::sort(list.begin(), list.end(), [](const Neighbor& lhs, const Neighbor& rhs) {
            return lhs.other_node < rhs.other_node;
        });
    }
}

StreetGraph StreetGraph::build(const StreetSource& source, const BoundingBox& bounds,
                               const GraphBuildOptions& options) {
    if (!bounds.is_valid()) {
        throw InvalidRequestError("Bounding box is malformed");
    }
    return StreetGraph(source.segments_in(bounds), bounds, options);
}

const StreetNode& StreetGraph::node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("StreetGraph: node id " + std::to_string(id) + " out of range");
    }
    return nodes_[id];
}

const StreetEdge& StreetGraph::edge(EdgeId id) const {
    if (id >= edges_.size()) {
        throw std::out_of_range("StreetGraph: edge id " + std::to_string(id) + " out of range");
    }
    return edges_[id];
}

const std::vector<Neighbor>& StreetGraph::neighbors(NodeId id) const {
    if (id >= adjacency_.size()) {
        throw std::out_of_range("StreetGraph: node id " + std::to_string(id) + " out of range");
    }
    return adjacency_[id];
}

bool StreetGraph::find_edge(NodeId a, NodeId b, EdgeId& edge_id) const {
    if (a >= adjacency_.size()) {
        return false;
    }
    const auto& list = adjacency_[a];
    const auto it = std::lower_bound(list.begin(), list.end(), b, [](const Neighbor& neighbor, NodeId other) {
        return neighbor.other_node < other;
    });
    if (it == list.end() || it->other_node != b) {
        return false;
    }
    edge_id = it->edge_id;
    return true;
}

NodeId StreetGraph::node_nearest(const Point& point) const {
    const geometry::LocalProjection projection(point);
    NodeId best = 0;
    double best_distance = std::numeric_limits<double>::max();
    for (const auto& candidate : nodes_) {
        const auto local = projection.to_local(candidate.location);
        const double distance = local.x * local.x + local.y * local.y;
        if (distance < best_distance) {
            best_distance = distance;
            best = candidate.id;
        }
    }
    return best;
}

void StreetGraph::check_in_range(const Point& point) const {
    if (!point.is_valid()) {
        throw PointOutOfRangeError("Point " + describe(point) + " is not a valid coordinate");
    }
    const double outside = geometry::distance_outside(bounds_, point);
    if (outside > options_.range_tolerance_m) {
        throw PointOutOfRangeError("Point " + describe(point) + " lies " +
                                   std::to_string(static_cast<long long>(std::lround(outside))) +
                                   " m outside the covered area");
    }
}

Point StreetGraph::edge_midpoint(EdgeId id) const {
    const auto& e = edge(id);
    const Point& a = nodes_[e.from].location;
    const Point& b = nodes_[e.to].location;
    return Point((a.lat + b.lat) * 0.5, (a.lon + b.lon) * 0.5);
}

BoundingBox StreetGraph::edge_bounds(EdgeId id) const {
    const auto& e = edge(id);
    return geometry::bounds_of_segment(nodes_[e.from].location, nodes_[e.to].location);
}

} // namespace calmpath
