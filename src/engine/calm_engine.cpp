#include "calm_engine.hpp"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace calmpath {

const char* request_state_name(RequestState state) {
    switch (state) {
        case RequestState::Init:
            return "Init";
        case RequestState::GraphReady:
            return "GraphReady";
        case RequestState::Aggregated:
            return "Aggregated";
        case RequestState::Searched:
            return "Searched";
        case RequestState::Succeeded:
            return "Succeeded";
        case RequestState::Failed:
            return "Failed";
    }
    return "Unknown";
}

CalmEngine::CalmEngine(StreetSourcePtr streets, LayerSourcePtr layers, EngineConfig config,
                       LogCallback log_callback)
    : streets_(std::move(streets))
    , layers_(std::move(layers))
    , config_(config)
    , logger_("CalmEngine", log_callback)
    , aggregator_(config_.overlay, log_callback)
    , router_(config_.router)
    , cache_(config_.graph_cache_capacity, config_.graph_cache_quantization_deg) {
    if (!streets_ || !layers_) {
        throw std::invalid_argument("CalmEngine requires a street source and a layer source");
    }
}

void CalmEngine::transition(std::uint64_t request_id, RequestState& state, RequestState next,
                            const std::string& detail) {
    std::ostringstream message;
    message << "request " << request_id << ": " << request_state_name(state) << " -> " << request_state_name(next);
    if (!detail.empty()) {
        message << " (" << detail << ")";
    }
    state = next;
    if (next == RequestState::Failed) {
        logger_.error(message.str());
    } else {
        logger_.info(message.str());
    }
}

void CalmEngine::check_stop(const std::stop_token& stop, const char* stage) {
    if (stop.stop_requested()) {
        throw CancelledError(std::string("Route request cancelled ") + stage);
    }
}

std::shared_ptr<const StreetGraph> CalmEngine::graph_for(const BoundingBox& bounds) {
    if (auto cached = cache_.lookup(bounds)) {
        return cached;
    }
    auto graph = std::make_shared<const StreetGraph>(StreetGraph::build(*streets_, bounds, config_.graph));
    cache_.store(bounds, graph);
    return graph;
}

RouteResult CalmEngine::compute_calm_route(const Point& start, const Point& end, const BoundingBox& bounds,
                                           const RouteWeights& weights, std::stop_token stop) {
    return compute_calm_route(RouteRequest{start, end, bounds, weights}, std::move(stop));
}

RouteResult CalmEngine::compute_calm_route(const RouteRequest& request, std::stop_token stop) {
    const std::uint64_t request_id = next_request_id_.fetch_add(1);
    RequestState state = RequestState::Init;

    try {
        if (!request.bounds.is_valid()) {
            throw InvalidRequestError("Bounding box is malformed");
        }
        if (!request.weights.is_valid()) {
            throw InvalidRequestError("Route weights must be finite and non-negative");
        }
        if (!request.start.is_valid() || !request.end.is_valid()) {
            throw PointOutOfRangeError("Start or end is not a valid coordinate");
        }
        check_stop(stop, "before graph construction");

        const auto graph = graph_for(request.bounds);
        graph->check_in_range(request.start);
        graph->check_in_range(request.end);
        const NodeId start = graph->node_nearest(request.start);
        const NodeId end = graph->node_nearest(request.end);
        transition(request_id, state, RequestState::GraphReady,
                   std::to_string(graph->node_count()) + " nodes, " + std::to_string(graph->edge_count()) + " edges");

        PerLayer<bool> layers = config_.report_layers;
        for (LayerType layer : kAllLayerTypes) {
            if (request.weights.is_active(layer)) {
                layers[layer_index(layer)] = true;
            }
        }
        const EdgeOverlay overlay = aggregator_.aggregate(*graph, *layers_, layers, stop);
        transition(request_id, state, RequestState::Aggregated, "");

        check_stop(stop, "before search");
        RouteResult result = router_.find_route(*graph, overlay, request.weights, start, end, stop);
        transition(request_id, state, RequestState::Searched,
                   std::to_string(result.hop_count) + " hops, cost " + std::to_string(result.cost));

        summarize_route(result, *graph, overlay, config_.summary);
        transition(request_id, state, RequestState::Succeeded,
                   std::to_string(static_cast<long long>(result.distance_m)) + " m, calm score " +
                       std::to_string(result.calm_score));
        return result;
    } catch (const EngineError& ex) {
        transition(request_id, state, RequestState::Failed,
                   std::string(error_kind_name(ex.kind())) + ": " + ex.what());
        throw;
    } catch (const std::exception& ex) {
        transition(request_id, state, RequestState::Failed, std::string("unexpected: ") + ex.what());
        throw;
    }
}

} // namespace calmpath
