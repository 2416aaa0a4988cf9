#include "overlay_aggregator.hpp"

#include "../core/errors.hpp"
#include "../geometry/geometry.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <execution>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace calmpath {

// ==================== EdgeOverlay ====================

EdgeOverlay::EdgeOverlay(std::size_t edge_count)
    : penalties_(edge_count, PerLayer<double>{})
    , weighted_values_(edge_count, PerLayer<double>{})
    , coverage_(edge_count, PerLayer<double>{}) {}

double EdgeOverlay::penalty(EdgeId edge, LayerType layer) const {
    return penalties_.at(edge)[layer_index(layer)];
}

double EdgeOverlay::exposure(EdgeId edge, LayerType layer) const {
    const double fraction = coverage_.at(edge)[layer_index(layer)];
    if (fraction <= 0.0) {
        return 0.0;
    }
    return weighted_values_[edge][layer_index(layer)] / fraction;
}

double EdgeOverlay::coverage(EdgeId edge, LayerType layer) const {
    return coverage_.at(edge)[layer_index(layer)];
}

bool EdgeOverlay::covered(EdgeId edge, LayerType layer) const {
    return coverage_.at(edge)[layer_index(layer)] > 0.0;
}

void EdgeOverlay::add(EdgeId edge, LayerType layer, double penalty, double raw_value, double fraction) {
    penalties_.at(edge)[layer_index(layer)] += penalty;
    weighted_values_.at(edge)[layer_index(layer)] += raw_value * fraction;
    coverage_.at(edge)[layer_index(layer)] += fraction;
}

// ==================== OverlayAggregator ====================

OverlayAggregator::OverlayAggregator(OverlayConfig config, LogCallback log_callback)
    : config_(config)
    , logger_("OverlayAggregator", std::move(log_callback)) {
    if (!(config_.noise_ceiling_db > 0.0) || !(config_.crowd_ceiling > 0.0) || !(config_.light_ceiling_lux > 0.0)) {
        throw std::invalid_argument("OverlayAggregator: metric ceilings must be positive");
    }
    if (!(config_.partial_overlap_fraction >= 0.0) || config_.partial_overlap_fraction > 0.5) {
        throw std::invalid_argument("OverlayAggregator: partial overlap fraction must lie in [0, 0.5]");
    }
}

double OverlayAggregator::overlap_fraction(const Point& a, const Point& b, const Polygon& ring) const {
    const bool a_inside = geometry::point_in_polygon(a, ring);
    const bool b_inside = geometry::point_in_polygon(b, ring);
    if (a_inside && b_inside) {
        return 1.0;
    }
    if (a_inside || b_inside) {
        return 0.5;
    }
    if (geometry::segment_intersects_polygon(a, b, ring)) {
        return config_.partial_overlap_fraction;
    }
    return 0.0;
}

bool OverlayAggregator::raw_metric(LayerType layer, const LayerMetrics& metrics, double& value) {
    switch (layer) {
        case LayerType::kNoise:
            if (!metrics.noise_db) return false;
            value = *metrics.noise_db;
            return true;
        case LayerType::kCrowd:
            if (!metrics.crowd_level) return false;
            value = static_cast<double>(*metrics.crowd_level);
            return true;
        case LayerType::kLight:
            if (!metrics.light_lux) return false;
            value = *metrics.light_lux;
            return true;
        case LayerType::kPuddles:
            if (!metrics.puddles) return false;
            value = *metrics.puddles ? 1.0 : 0.0;
            return true;
    }
    return false;
}

double OverlayAggregator::normalized_metric(LayerType layer, const LayerMetrics& metrics) const {
    double raw = 0.0;
    if (!raw_metric(layer, metrics, raw)) {
        return 0.0;
    }
    switch (layer) {
        case LayerType::kNoise:
            return raw / config_.noise_ceiling_db;
        case LayerType::kCrowd:
            return raw / config_.crowd_ceiling;
        case LayerType::kLight:
            // lit streets lower the cost
            return -(raw / config_.light_ceiling_lux);
        case LayerType::kPuddles:
            return raw;
    }
    return 0.0;
}

void OverlayAggregator::aggregate_edge(const StreetGraph& graph, const LayerSource& source,
                                       const PerLayer<bool>& layers, EdgeId edge, EdgeOverlay& overlay) const {
    const auto& street_edge = graph.edge(edge);
    const Point& a = graph.node(street_edge.from).location;
    const Point& b = graph.node(street_edge.to).location;
    const BoundingBox edge_bounds = geometry::bounds_of_segment(a, b);

    for (LayerType layer : kAllLayerTypes) {
        if (!layers[layer_index(layer)]) {
            continue;
        }
        for (const auto& polygon : source.query(layer, edge_bounds)) {
            double raw = 0.0;
            if (!raw_metric(layer, polygon.metrics, raw)) {
                continue;
            }
            const double fraction = overlap_fraction(a, b, polygon.ring);
            if (fraction <= 0.0) {
                continue;
            }
            overlay.add(edge, layer, normalized_metric(layer, polygon.metrics) * fraction, raw, fraction);
        }
    }
}

EdgeOverlay OverlayAggregator::aggregate(const StreetGraph& graph, const LayerSource& source,
                                         const PerLayer<bool>& layers, std::stop_token stop) const {
    EdgeOverlay overlay(graph.edge_count());

    std::vector<EdgeId> edges(graph.edge_count());
    std::iota(edges.begin(), edges.end(), EdgeId{0});

    std::atomic<bool> cancelled{false};
    std::atomic<bool> failed{false};
    std::mutex failure_mutex;
    std::exception_ptr failure;

    auto process = [&](EdgeId edge) {
        if (cancelled.load(std::memory_order_relaxed) || failed.load(std::memory_order_relaxed)) {
            return;
        }
        if (stop.stop_requested()) {
            cancelled = true;
            return;
        }
        // an exception escaping a parallel algorithm would terminate the process
        try {
            aggregate_edge(graph, source, layers, edge, overlay);
        } catch (...) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!failure) {
                failure = std::current_exception();
            }
            failed = true;
        }
    };

    if (config_.parallel) {
        std::for_each(std::execution::par, edges.begin(), edges.end(), process);
    } else {
        std::for_each(edges.begin(), edges.end(), process);
    }

    if (failure) {
        logger_.error("Layer query failed during aggregation");
        std::rethrow_exception(failure);
    }
    if (cancelled || stop.stop_requested()) {
        throw CancelledError("Route request cancelled during overlay aggregation");
    }
    return overlay;
}

} // namespace calmpath
