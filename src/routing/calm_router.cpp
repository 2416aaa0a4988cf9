#include "calm_router.hpp"

#include "../core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <stdexcept>

namespace calmpath {

CalmRouter::CalmRouter(RouterConfig config)
    : config_(config) {
    if (!(config_.epsilon > 0.0) || !(config_.min_edge_cost > 0.0) || !(config_.tie_tolerance >= 0.0)) {
        throw std::invalid_argument("CalmRouter: epsilon and minimum edge cost must be positive");
    }
}

double CalmRouter::edge_cost(const StreetGraph& graph, const EdgeOverlay& overlay,
                             const RouteWeights& weights, EdgeId edge) const {
    const double length = graph.edge(edge).length_m;

    double factor = 1.0;
    for (LayerType layer : kAllLayerTypes) {
        if (weights.is_active(layer)) {
            factor += weights.get(layer) * overlay.penalty(edge, layer);
        }
    }

    const double floor = std::max(length * config_.epsilon, config_.min_edge_cost);
    return std::max(length * factor, floor);
}

std::vector<NodeId> CalmRouter::path_to(const std::vector<Search_Label>& labels, NodeId node) {
    std::vector<NodeId> path;
    for (NodeId current = node; current != Search_Label::kNoNode; current = labels[current].parent) {
        path.push_back(current);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

bool CalmRouter::improves(const std::vector<Search_Label>& labels, NodeId node, NodeId via,
                          double cost, std::size_t hops) const {
    const auto& current = labels[node];
    if (current.parent == Search_Label::kNoNode) {
        return true;
    }

    const double tolerance = config_.tie_tolerance * std::max(std::abs(cost), std::abs(current.cost));
    if (cost < current.cost - tolerance) {
        return true;
    }
    if (cost > current.cost + tolerance) {
        return false;
    }

    // tied on cost
    if (hops != current.hops) {
        return hops < current.hops;
    }
    if (via == current.parent) {
        return false;
    }
    return path_to(labels, via) < path_to(labels, current.parent);
}

RouteResult CalmRouter::find_route(const StreetGraph& graph, const EdgeOverlay& overlay, const RouteWeights& weights,
                                   NodeId start, NodeId end, std::stop_token stop) const {
    if (overlay.edge_count() != graph.edge_count()) {
        throw std::invalid_argument("CalmRouter: overlay does not belong to this graph");
    }
    if (start >= graph.node_count() || end >= graph.node_count()) {
        throw std::out_of_range("CalmRouter: start or end node out of range");
    }

    std::vector<double> costs(graph.edge_count());
    for (EdgeId edge = 0; edge < graph.edge_count(); ++edge) {
        costs[edge] = edge_cost(graph, overlay, weights, edge);
    }

    std::vector<Search_Label> labels(graph.node_count());
    labels[start].cost = 0.0;

    // queue of nodes to search
    std::priority_queue<Frontier_Elm, std::vector<Frontier_Elm>, comparator_frontier> wave_front;
    wave_front.emplace(start, 0.0, 0);

    while (!wave_front.empty()) {
        if (stop.stop_requested()) {
            throw CancelledError("Route request cancelled during search");
        }

        const Frontier_Elm current_elm = wave_front.top();
        wave_front.pop();

        auto& current = labels[current_elm.node_id];
        if (current.settled) {
            continue;
        }
        current.settled = true;

        if (current_elm.node_id == end) {
            return build_result(graph, overlay, labels, costs, end);
        }

        for (const auto& neighbor : graph.neighbors(current_elm.node_id)) {
            // popped before, its label is final
            if (labels[neighbor.other_node].settled) {
                continue;
            }

            const double next_cost = current.cost + costs[neighbor.edge_id];
            const std::size_t next_hops = current.hops + 1;
            if (!improves(labels, neighbor.other_node, current_elm.node_id, next_cost, next_hops)) {
                continue;
            }

            auto& next = labels[neighbor.other_node];
            next.cost = next_cost;
            next.hops = next_hops;
            next.parent = current_elm.node_id;
            next.parent_edge = neighbor.edge_id;
            wave_front.emplace(neighbor.other_node, next_cost, next_hops);
        }
    }

    throw NoRouteFoundError("No walkable connection between node " + std::to_string(start) +
                            " and node " + std::to_string(end));
}

RouteResult CalmRouter::build_result(const StreetGraph& graph, const EdgeOverlay& overlay,
                                     const std::vector<Search_Label>& labels, const std::vector<double>& costs,
                                     NodeId end) const {
    RouteResult result;
    result.node_ids = path_to(labels, end);
    result.hop_count = result.node_ids.size() - 1;

    result.path.reserve(result.node_ids.size());
    for (NodeId node : result.node_ids) {
        result.path.push_back(graph.node(node).location);
    }

    for (std::size_t i = 1; i < result.node_ids.size(); ++i) {
        result.edge_ids.push_back(labels[result.node_ids[i]].parent_edge);
    }

    PerLayer<double> weighted_exposure{};
    PerLayer<bool> touched{};
    for (EdgeId edge : result.edge_ids) {
        const double length = graph.edge(edge).length_m;
        result.distance_m += length;
        result.cost += costs[edge];
        for (LayerType layer : kAllLayerTypes) {
            result.penalty_load[layer_index(layer)] += overlay.penalty(edge, layer) * length;
            if (overlay.covered(edge, layer)) {
                touched[layer_index(layer)] = true;
                weighted_exposure[layer_index(layer)] += overlay.exposure(edge, layer) * length;
            }
        }
    }

    if (result.distance_m > 0.0) {
        for (LayerType layer : kAllLayerTypes) {
            if (touched[layer_index(layer)]) {
                result.average_metric[layer_index(layer)] = weighted_exposure[layer_index(layer)] / result.distance_m;
            }
        }
    }
    return result;
}

} // namespace calmpath
