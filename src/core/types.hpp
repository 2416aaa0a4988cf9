#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../include/bounding_box.hpp"
#include "../include/point.hpp"

namespace calmpath {

// Ring of vertices; the closing edge from back() to front() is implicit.
using Polygon = std::vector<Point>;

enum class LayerType : std::size_t {
    kNoise = 0,
    kCrowd,
    kLight,
    kPuddles,
};

constexpr std::size_t kLayerTypeCount = 4;

constexpr std::array<LayerType, kLayerTypeCount> kAllLayerTypes = {
    LayerType::kNoise, LayerType::kCrowd, LayerType::kLight, LayerType::kPuddles};

constexpr std::size_t layer_index(LayerType type) {
    return static_cast<std::size_t>(type);
}

const char* layer_type_name(LayerType type);
std::optional<LayerType> parse_layer_type(std::string_view name);

struct LayerMetrics {
    std::optional<double> noise_db;
    std::optional<int> crowd_level;  // 0..5
    std::optional<double> light_lux;
    std::optional<bool> puddles;
};

struct LayerPolygon {
    std::string id;
    LayerType layer = LayerType::kNoise;
    Polygon ring;
    LayerMetrics metrics;
    std::string street_name;
    BoundingBox bounds{};
};

// Per-layer array, indexed with layer_index().
template <typename T>
using PerLayer = std::array<T, kLayerTypeCount>;

struct RouteWeights {
    PerLayer<double> values{};

    [[nodiscard]] double get(LayerType type) const { return values[layer_index(type)]; }
    void set(LayerType type, double weight) { values[layer_index(type)] = weight; }
    [[nodiscard]] bool is_active(LayerType type) const { return get(type) > 0.0; }
    [[nodiscard]] bool is_valid() const;
};

struct RouteWarning {
    Point location;
    LayerType layer = LayerType::kNoise;
    double value = 0.0;
    std::string street_name;
    std::string message;
};

struct RouteResult {
    std::vector<Point> path;
    std::vector<std::size_t> node_ids;
    std::vector<std::size_t> edge_ids;
    std::size_t hop_count = 0;
    double distance_m = 0.0;
    double cost = 0.0;
    // Length-weighted mean of the raw metric along the path; empty when no
    // polygon of that layer touched the route.
    PerLayer<std::optional<double>> average_metric{};
    // Sum of penalty * length over the path edges, in meters.
    PerLayer<double> penalty_load{};
    int duration_min = 0;
    double calm_score = 0.0;
    std::vector<RouteWarning> warnings;
};

} // namespace calmpath
