#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "core/types.hpp"
#include "include/bounding_box.hpp"
#include "include/point.hpp"

namespace calmpath::cli {

struct CliConfig {
  std::filesystem::path osm_input;
  std::optional<Point> start;
  std::optional<Point> end;
  std::optional<BoundingBox> bounds;
  RouteWeights weights;
  // Margin around start and end when no --bbox is given.
  double auto_bbox_margin_m = 500.0;
  std::optional<int> hour;
  std::uint64_t seed = 42;
  std::filesystem::path render_output;
  bool quiet = false;
};

// "lat,lon"
std::optional<Point> parse_point(std::string_view text);
// "min_lat,min_lon,max_lat,max_lon"
std::optional<BoundingBox> parse_bbox(std::string_view text);
// "noise=1,crowd=0.5" ; unnamed layers keep their current weight
bool parse_weights(std::string_view text, RouteWeights& weights);

int run_calm_route(const CliConfig& config);

}  // namespace calmpath::cli
