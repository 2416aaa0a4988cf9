#include "route_summary.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace calmpath {

namespace {

double round_to_tenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

std::string warning_message(LayerType layer, double value, const std::string& street_name) {
    std::ostringstream out;
    out.precision(1);
    out << std::fixed;
    switch (layer) {
        case LayerType::kNoise:
            out << "Loud section (" << value << " dB)";
            break;
        case LayerType::kCrowd:
            out << "Crowded section (level " << value << ")";
            break;
        case LayerType::kLight:
            out << "Poorly lit section (" << value << " lux)";
            break;
        case LayerType::kPuddles:
            out << "Puddles reported";
            break;
    }
    if (!street_name.empty()) {
        out << " on " << street_name;
    }
    return out.str();
}

bool exceeds(LayerType layer, double value, const AvoidThresholds& thresholds) {
    switch (layer) {
        case LayerType::kNoise:
            return value > thresholds.max_noise_db;
        case LayerType::kCrowd:
            return value > thresholds.max_crowd_level;
        case LayerType::kLight:
            return value < thresholds.min_light_lux;
        case LayerType::kPuddles:
            return thresholds.avoid_puddles && value > 0.0;
    }
    return false;
}

} // namespace

int estimate_duration_min(double distance_m, double walking_speed_m_per_min) {
    if (!(walking_speed_m_per_min > 0.0)) {
        throw std::invalid_argument("Walking speed must be positive");
    }
    const int minutes = static_cast<int>(std::floor(distance_m / walking_speed_m_per_min));
    return std::max(1, minutes);
}

double calm_score(const RouteResult& route, const SummaryConfig& config) {
    const double avg_noise = route.average_metric[layer_index(LayerType::kNoise)].value_or(config.baseline_noise_db);
    const double avg_crowd =
        route.average_metric[layer_index(LayerType::kCrowd)].value_or(config.baseline_crowd_level);

    const double noise_score = std::clamp(10.0 - (avg_noise - 40.0) / 5.0, 0.0, 10.0);
    const double crowd_score = std::clamp(10.0 - (avg_crowd - 1.0) * 2.5, 0.0, 10.0);
    return round_to_tenth(noise_score * 0.6 + crowd_score * 0.4);
}

std::vector<RouteWarning> collect_warnings(const RouteResult& route, const StreetGraph& graph,
                                           const EdgeOverlay& overlay, const SummaryConfig& config) {
    std::vector<RouteWarning> warnings;
    for (EdgeId edge : route.edge_ids) {
        for (LayerType layer : kAllLayerTypes) {
            if (warnings.size() >= config.max_warnings) {
                return warnings;
            }
            if (!overlay.covered(edge, layer)) {
                continue;
            }
            const double value = overlay.exposure(edge, layer);
            if (!exceeds(layer, value, config.thresholds)) {
                continue;
            }
            const auto& street_name = graph.edge(edge).street_name;
            warnings.push_back(RouteWarning{graph.edge_midpoint(edge), layer, value, street_name,
                                            warning_message(layer, value, street_name)});
        }
    }
    return warnings;
}

void summarize_route(RouteResult& route, const StreetGraph& graph, const EdgeOverlay& overlay,
                     const SummaryConfig& config) {
    route.duration_min = route.path.empty() ? 0 : estimate_duration_min(route.distance_m, config.walking_speed_m_per_min);
    route.calm_score = calm_score(route, config);
    route.warnings = collect_warnings(route, graph, overlay, config);
}

} // namespace calmpath
