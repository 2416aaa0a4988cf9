#pragma once

#include <cstddef>

#include "../core/types.hpp"
#include "../graph/street_graph.hpp"
#include "../overlay/overlay_aggregator.hpp"

namespace calmpath {

// Edge exposures past these values produce a route warning.
struct AvoidThresholds {
    double max_noise_db = 75.0;
    double max_crowd_level = 4.0;
    double min_light_lux = 50.0;
    bool avoid_puddles = true;
};

struct SummaryConfig {
    double walking_speed_m_per_min = 80.0;
    AvoidThresholds thresholds;
    std::size_t max_warnings = 5;
    // Averages assumed for layers that never touched the route.
    double baseline_noise_db = 40.0;
    double baseline_crowd_level = 1.0;
};

int estimate_duration_min(double distance_m, double walking_speed_m_per_min);

// 0..10, one decimal; higher is calmer.
double calm_score(const RouteResult& route, const SummaryConfig& config);

std::vector<RouteWarning> collect_warnings(const RouteResult& route, const StreetGraph& graph,
                                           const EdgeOverlay& overlay, const SummaryConfig& config);

// Fills duration_min, calm_score and warnings of a found route.
void summarize_route(RouteResult& route, const StreetGraph& graph, const EdgeOverlay& overlay,
                     const SummaryConfig& config);

} // namespace calmpath
