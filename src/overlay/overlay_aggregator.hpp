#pragma once

#include <cstddef>
#include <stop_token>
#include <vector>

#include "../core/logging.hpp"
#include "../core/types.hpp"
#include "../graph/street_graph.hpp"
#include "../layers/layer_source.hpp"

namespace calmpath {

struct OverlayConfig {
    // Values at which a metric reaches a penalty of 1.0.
    double noise_ceiling_db = 100.0;
    double crowd_ceiling = 5.0;
    double light_ceiling_lux = 200.0;
    // Weight of a polygon that the edge only crosses, with neither end inside.
    double partial_overlap_fraction = 0.25;
    bool parallel = true;
};

// Request-scoped penalties and exposures, one slot per edge of a graph.
// The graph itself is never written to.
class EdgeOverlay {
public:
    EdgeOverlay() = default;
    explicit EdgeOverlay(std::size_t edge_count);

    [[nodiscard]] std::size_t edge_count() const noexcept { return penalties_.size(); }

    // Sum over all touching polygons.
    [[nodiscard]] double penalty(EdgeId edge, LayerType layer) const;
    // Raw metric of the touching polygons, averaged by overlap fraction; 0 when uncovered.
    [[nodiscard]] double exposure(EdgeId edge, LayerType layer) const;
    // Summed overlap fraction of the touching polygons.
    [[nodiscard]] double coverage(EdgeId edge, LayerType layer) const;
    // True when at least one polygon with a metric for this layer touched the edge.
    [[nodiscard]] bool covered(EdgeId edge, LayerType layer) const;

    void add(EdgeId edge, LayerType layer, double penalty, double raw_value, double fraction);

private:
    std::vector<PerLayer<double>> penalties_;
    std::vector<PerLayer<double>> weighted_values_;
    std::vector<PerLayer<double>> coverage_;
};

/**
 * Joins graph edges against layer polygons. Every edge queries the layer
 * source with its own bounding box only; there is no state shared between
 * edges, so edges are processed in parallel.
 */
class OverlayAggregator {
public:
    explicit OverlayAggregator(OverlayConfig config = {}, LogCallback log_callback = nullptr);

    /**
     * @param layers which layer types to aggregate (weighted or report-only)
     * @throws CancelledError when a stop is requested between edges
     * @throws whatever the layer source throws, after all workers stop
     */
    EdgeOverlay aggregate(const StreetGraph& graph, const LayerSource& source,
                          const PerLayer<bool>& layers, std::stop_token stop = {}) const;

    // Share of the edge a polygon counts for: 1, 0.5, partial_overlap_fraction or 0.
    [[nodiscard]] double overlap_fraction(const Point& a, const Point& b, const Polygon& ring) const;

    // Penalty contribution of a polygon for a fully covered edge; empty metric gives 0.
    [[nodiscard]] double normalized_metric(LayerType layer, const LayerMetrics& metrics) const;

    [[nodiscard]] static bool raw_metric(LayerType layer, const LayerMetrics& metrics, double& value);

    [[nodiscard]] const OverlayConfig& config() const noexcept { return config_; }

private:
    void aggregate_edge(const StreetGraph& graph, const LayerSource& source, const PerLayer<bool>& layers,
                        EdgeId edge, EdgeOverlay& overlay) const;

    OverlayConfig config_;
    Logger logger_;
};

} // namespace calmpath
