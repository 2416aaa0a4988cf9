#include "calm_router.hpp"

#include "../core/errors.hpp"
#include "../geometry/geometry.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace calmpath {

namespace calm_router_tests {

constexpr PerLayer<bool> kAllLayers{true, true, true, true};
const BoundingBox kBox(55.74, 37.60, 55.76, 37.62);

bool near(double a, double b, double tolerance) {
    return std::abs(a - b) <= tolerance;
}

LayerPolygon make_box(LayerType layer, double min_lat, double min_lon, double max_lat, double max_lon) {
    LayerPolygon polygon;
    polygon.id = "box";
    polygon.layer = layer;
    polygon.ring = Polygon{Point(min_lat, min_lon), Point(min_lat, max_lon),
                           Point(max_lat, max_lon), Point(max_lat, min_lon)};
    return polygon;
}

EdgeOverlay overlay_for(const StreetGraph& graph, std::vector<LayerPolygon> polygons) {
    const StoreLayerSource source(std::make_shared<const LayerStore>(std::move(polygons)));
    OverlayConfig config;
    config.parallel = false;
    return OverlayAggregator(config).aggregate(graph, source, kAllLayers);
}

RouteWeights noise_weight(double weight) {
    RouteWeights weights;
    weights.set(LayerType::kNoise, weight);
    return weights;
}

// Short loud street north and a longer quiet detour east.
//
//   (55.752, 37.610) ---------- (55.752, 37.613)
//          |                           |
//   (55.750, 37.610) ---------- (55.750, 37.613)
//
// Start is the south-west corner, end the north-west corner.
std::vector<RawSegment> loud_or_detour() {
    return {
        RawSegment{{Point(55.750, 37.610), Point(55.752, 37.610)}, "Loud Ave"},
        RawSegment{{Point(55.750, 37.610), Point(55.750, 37.613), Point(55.752, 37.613), Point(55.752, 37.610)},
                   "Quiet Ln"},
    };
}

// Covers the middle of Loud Ave only, so the street counts as crossing it.
LayerPolygon loud_polygon() {
    auto polygon = make_box(LayerType::kNoise, 55.7505, 37.6095, 55.7515, 37.6105);
    polygon.metrics.noise_db = 90.0;
    return polygon;
}

bool test_single_street_under_noise_costs_380() {
    // 200 m due north
    const double dlat = 200.0 / (geometry::kEarthRadiusInMeters * geometry::kDegreeToRadian);
    const StreetGraph graph({RawSegment{{Point(55.750, 37.610), Point(55.750 + dlat, 37.610)}, "Single"}}, kBox);
    auto noise = make_box(LayerType::kNoise, 55.749, 37.609, 55.753, 37.611);
    noise.metrics.noise_db = 90.0;

    const auto overlay = overlay_for(graph, {noise});
    const auto route = CalmRouter().find_route(graph, overlay, noise_weight(1.0), 0, 1);
    if (!near(route.cost, 380.0, 0.1) || !near(route.distance_m, 200.0, 0.1)) {
        std::cerr << "cost=" << route.cost << " distance=" << route.distance_m << std::endl;
        return false;
    }
    return route.average_metric[layer_index(LayerType::kNoise)].has_value() &&
           near(*route.average_metric[layer_index(LayerType::kNoise)], 90.0, 1e-9);
}

bool test_zero_weights_match_plain_shortest() {
    const StreetGraph graph(loud_or_detour(), kBox);
    const CalmRouter router;
    const NodeId start = graph.node_nearest(Point(55.750, 37.610));
    const NodeId end = graph.node_nearest(Point(55.752, 37.610));

    const auto plain = router.find_route(graph, EdgeOverlay(graph.edge_count()), RouteWeights{}, start, end);
    const auto zero = router.find_route(graph, overlay_for(graph, {loud_polygon()}), RouteWeights{}, start, end);
    return plain.node_ids == zero.node_ids && zero.hop_count == 1 && near(plain.cost, plain.distance_m, 1e-9);
}

bool test_noise_weight_takes_detour() {
    const StreetGraph graph(loud_or_detour(), kBox);
    const NodeId start = graph.node_nearest(Point(55.750, 37.610));
    const NodeId end = graph.node_nearest(Point(55.752, 37.610));
    const auto overlay = overlay_for(graph, {loud_polygon()});

    const auto shortest = CalmRouter().find_route(graph, overlay, RouteWeights{}, start, end);
    // 222 m * (1 + 10 * 0.9 * 0.25) is longer than the 598 m detour
    const auto calm = CalmRouter().find_route(graph, overlay, noise_weight(10.0), start, end);
    if (calm.hop_count != 3 || calm.distance_m <= shortest.distance_m) {
        std::cerr << "calm hops=" << calm.hop_count << std::endl;
        return false;
    }
    // Quiet Ln never touches the noise polygon
    return !calm.average_metric[layer_index(LayerType::kNoise)].has_value() &&
           shortest.average_metric[layer_index(LayerType::kNoise)].has_value();
}

bool test_cost_never_below_floor() {
    const StreetGraph graph(loud_or_detour(), kBox);
    auto light = make_box(LayerType::kLight, 55.749, 37.609, 55.753, 37.614);
    light.metrics.light_lux = 200.0;
    const auto overlay = overlay_for(graph, {light});

    RouteWeights weights;
    weights.set(LayerType::kLight, 50.0);
    const CalmRouter router;
    for (EdgeId edge = 0; edge < graph.edge_count(); ++edge) {
        const double length = graph.edge(edge).length_m;
        const double cost = router.edge_cost(graph, overlay, weights, edge);
        if (cost < length * router.config().epsilon || !near(cost, length * 1e-3, 1e-12)) {
            return false;
        }
    }
    return true;
}

bool test_equal_cost_prefers_fewer_hops() {
    // direct piece and a two-piece line along the same meridian
    const StreetGraph graph({RawSegment{{Point(55.750, 37.610), Point(55.751, 37.610), Point(55.752, 37.610)}, "Steps"},
                             RawSegment{{Point(55.750, 37.610), Point(55.752, 37.610)}, "Direct"}},
                            kBox);
    const auto route = CalmRouter().find_route(graph, EdgeOverlay(graph.edge_count()), RouteWeights{}, 0, 2);
    return route.hop_count == 1 && route.node_ids == std::vector<NodeId>{0, 2};
}

bool test_equal_cost_prefers_smaller_node_sequence() {
    // diamond: west (id 1) and east (id 2) branches of equal length
    const StreetGraph graph({RawSegment{{Point(55.750, 37.610), Point(55.751, 37.611), Point(55.752, 37.610)}, "East"},
                             RawSegment{{Point(55.750, 37.610), Point(55.751, 37.609), Point(55.752, 37.610)}, "West"}},
                            kBox);
    const auto route = CalmRouter().find_route(graph, EdgeOverlay(graph.edge_count()), RouteWeights{}, 0, 3);
    return route.node_ids == std::vector<NodeId>{0, 1, 3};
}

bool test_disconnected_components() {
    const StreetGraph graph({RawSegment{{Point(55.750, 37.610), Point(55.751, 37.610)}, "A"},
                             RawSegment{{Point(55.755, 37.615), Point(55.756, 37.615)}, "B"}},
                            kBox);
    try {
        CalmRouter().find_route(graph, EdgeOverlay(graph.edge_count()), RouteWeights{}, 0, 3);
    } catch (const NoRouteFoundError& ex) {
        return ex.kind() == EngineError::ErrorKind::NoRouteFound;
    }
    return false;
}

bool test_start_equals_end() {
    const StreetGraph graph(loud_or_detour(), kBox);
    const auto route = CalmRouter().find_route(graph, EdgeOverlay(graph.edge_count()), noise_weight(1.0), 2, 2);
    return route.path.size() == 1 && route.node_ids == std::vector<NodeId>{2} && route.hop_count == 0 &&
           route.distance_m == 0.0 && route.cost == 0.0 && route.edge_ids.empty();
}

bool test_stop_request_cancels() {
    const StreetGraph graph(loud_or_detour(), kBox);
    std::stop_source stop;
    stop.request_stop();
    try {
        CalmRouter().find_route(graph, EdgeOverlay(graph.edge_count()), RouteWeights{}, 0, 3, stop.get_token());
    } catch (const CancelledError&) {
        return true;
    }
    return false;
}

bool test_mismatched_overlay_rejected() {
    const StreetGraph graph(loud_or_detour(), kBox);
    try {
        CalmRouter().find_route(graph, EdgeOverlay(1), RouteWeights{}, 0, 1);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"single_street_under_noise_costs_380", &test_single_street_under_noise_costs_380},
        {"zero_weights_match_plain_shortest", &test_zero_weights_match_plain_shortest},
        {"noise_weight_takes_detour", &test_noise_weight_takes_detour},
        {"cost_never_below_floor", &test_cost_never_below_floor},
        {"equal_cost_prefers_fewer_hops", &test_equal_cost_prefers_fewer_hops},
        {"equal_cost_prefers_smaller_node_sequence", &test_equal_cost_prefers_smaller_node_sequence},
        {"disconnected_components", &test_disconnected_components},
        {"start_equals_end", &test_start_equals_end},
        {"stop_request_cancels", &test_stop_request_cancels},
        {"mismatched_overlay_rejected", &test_mismatched_overlay_rejected},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        try {
            if (!fn()) {
                std::cerr << "Test failed: " << name << std::endl;
                all_passed = false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Test threw: " << name << ": " << ex.what() << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace calm_router_tests

} // namespace calmpath

int main() {
    if (calmpath::calm_router_tests::run_all_tests()) {
        std::cout << "All CalmRouter tests passed" << std::endl;
        return 0;
    }

    std::cerr << "CalmRouter tests failed" << std::endl;
    return 1;
}
