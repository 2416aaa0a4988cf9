#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/types.hpp"
#include "../graph/street_graph.hpp"
#include "../graph/street_source.hpp"
#include "../layers/layer_source.hpp"
#include "../overlay/overlay_aggregator.hpp"
#include "../routing/calm_router.hpp"
#include "../routing/route_summary.hpp"
#include "graph_cache.hpp"

namespace calmpath {

struct RouteRequest {
    Point start;
    Point end;
    BoundingBox bounds;
    RouteWeights weights;
};

struct EngineConfig {
    GraphBuildOptions graph;
    OverlayConfig overlay;
    RouterConfig router;
    SummaryConfig summary;
    // Layers aggregated for reporting even when their weight is zero.
    PerLayer<bool> report_layers{true, true, true, true};
    // 0 disables graph caching.
    std::size_t graph_cache_capacity = 8;
    double graph_cache_quantization_deg = 1e-6;
};

enum class RequestState {
    Init,
    GraphReady,
    Aggregated,
    Searched,
    Succeeded,
    Failed
};

const char* request_state_name(RequestState state);

/**
 * Entry point of the routing engine. One instance serves any number of
 * concurrent requests; each request runs
 * Init -> GraphReady -> Aggregated -> Searched -> Succeeded | Failed.
 */
class CalmEngine {
public:
    CalmEngine(StreetSourcePtr streets, LayerSourcePtr layers, EngineConfig config = {},
               LogCallback log_callback = nullptr);

    CalmEngine(const CalmEngine&) = delete;
    CalmEngine& operator=(const CalmEngine&) = delete;

    /**
     * @throws InvalidRequestError malformed box or weights
     * @throws NoGraphDataError no streets in the box
     * @throws PointOutOfRangeError start or end outside the covered area
     * @throws NoRouteFoundError start and end not connected
     * @throws CancelledError stop requested through the token
     */
    RouteResult compute_calm_route(const RouteRequest& request, std::stop_token stop = {});

    RouteResult compute_calm_route(const Point& start, const Point& end, const BoundingBox& bounds,
                                   const RouteWeights& weights, std::stop_token stop = {});

    // Graph for the box, from the cache when possible.
    std::shared_ptr<const StreetGraph> graph_for(const BoundingBox& bounds);

    [[nodiscard]] const GraphCache& graph_cache() const noexcept { return cache_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void transition(std::uint64_t request_id, RequestState& state, RequestState next, const std::string& detail);
    static void check_stop(const std::stop_token& stop, const char* stage);

    StreetSourcePtr streets_;
    LayerSourcePtr layers_;
    EngineConfig config_;
    Logger logger_;
    OverlayAggregator aggregator_;
    CalmRouter router_;
    GraphCache cache_;
    std::atomic<std::uint64_t> next_request_id_{1};
};

} // namespace calmpath
