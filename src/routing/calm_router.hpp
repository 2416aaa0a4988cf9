#pragma once

#include <cstddef>
#include <limits>
#include <stop_token>
#include <vector>

#include "../core/types.hpp"
#include "../graph/street_graph.hpp"
#include "../overlay/overlay_aggregator.hpp"

namespace calmpath {

struct RouterConfig {
    // Lower bound of an edge cost, as a share of its length.
    double epsilon = 1e-3;
    // Absolute lower bound, in meters, so zero-length edges still cost something.
    double min_edge_cost = 1e-6;
    // Relative cost difference under which two labels count as tied.
    double tie_tolerance = 1e-9;
};

// Best known way to reach a node
struct Search_Label {
    static constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

    double cost = std::numeric_limits<double>::max();
    std::size_t hops = 0;
    NodeId parent = kNoNode;
    EdgeId parent_edge = 0;
    bool settled = false;
};

struct Frontier_Elm {
    NodeId node_id;
    double cost;
    std::size_t hops;

    Frontier_Elm(NodeId n_id, double c, std::size_t h)
        : node_id(n_id), cost(c), hops(h) {}
};

// Min-heap on (cost, hops, node id)
struct comparator_frontier {
    bool operator()(const Frontier_Elm& a, const Frontier_Elm& b) const {
        if (a.cost != b.cost) {
            return a.cost > b.cost;
        }
        if (a.hops != b.hops) {
            return a.hops > b.hops;
        }
        return a.node_id > b.node_id;
    }
};

/**
 * Weighted Dijkstra over a street graph and a request overlay.
 *
 * cost(E) = length(E) * (1 + sum of weight[layer] * penalty[E][layer]),
 * never below max(length(E) * epsilon, min_edge_cost).
 *
 * Ties within tie_tolerance prefer fewer hops, then the lexicographically
 * smaller node id sequence.
 */
class CalmRouter {
public:
    explicit CalmRouter(RouterConfig config = {});

    [[nodiscard]] double edge_cost(const StreetGraph& graph, const EdgeOverlay& overlay,
                                   const RouteWeights& weights, EdgeId edge) const;

    /**
     * @return path, node ids, distance, cost and per-layer averages; the
     *         duration, calm score and warnings are left for summarize_route()
     * @throws NoRouteFoundError if end is unreachable from start
     * @throws CancelledError if a stop is requested during the search
     */
    RouteResult find_route(const StreetGraph& graph, const EdgeOverlay& overlay, const RouteWeights& weights,
                           NodeId start, NodeId end, std::stop_token stop = {}) const;

    [[nodiscard]] const RouterConfig& config() const noexcept { return config_; }

private:
    // True when reaching `node` through `via` at `cost` beats the current label.
    bool improves(const std::vector<Search_Label>& labels, NodeId node, NodeId via,
                  double cost, std::size_t hops) const;

    static std::vector<NodeId> path_to(const std::vector<Search_Label>& labels, NodeId node);

    RouteResult build_result(const StreetGraph& graph, const EdgeOverlay& overlay,
                             const std::vector<Search_Label>& labels, const std::vector<double>& costs,
                             NodeId end) const;

    RouterConfig config_;
};

} // namespace calmpath
