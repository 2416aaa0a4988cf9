#include "calm_route/cli.hpp"

#include "core/errors.hpp"
#include "engine/calm_engine.hpp"
#include "geometry/geometry.hpp"
#include "layers/layer_source.hpp"
#include "osm/osm_street_source.hpp"
#include "rendering/route_renderer.hpp"

#include <charconv>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace calmpath::cli {
namespace {

std::vector<std::string_view> split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  std::size_t begin = 0;
  while (true) {
    const std::size_t end = text.find(separator, begin);
    parts.push_back(text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin));
    if (end == std::string_view::npos) {
      break;
    }
    begin = end + 1;
  }
  return parts;
}

std::optional<double> parse_double(std::string_view text) {
  while (!text.empty() && text.front() == ' ') {
    text.remove_prefix(1);
  }
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

LogCallback console_logger(bool quiet) {
  return [quiet](const std::string& message, bool is_error) {
    if (is_error) {
      std::cerr << "[calm_route] " << message << std::endl;
    } else if (!quiet) {
      std::cout << "[calm_route] " << message << std::endl;
    }
  };
}

LayerSourcePtr build_layer_source(const CliConfig& config, const OsmStreetSource& streets,
                                  const BoundingBox& bounds, const LogCallback& log) {
  SyntheticLayerSource::Options synthetic_options;
  synthetic_options.seed = config.seed;
  LayerSourcePtr synthetic = std::make_shared<const SyntheticLayerSource>(synthetic_options);

  if (config.hour) {
    synthetic = std::make_shared<const RushHourCrowdSource>(synthetic, *config.hour);
  }

  // lit places from the extract; synthetic light when the area has none.
  // Decided once for the whole area so every street reads the same source.
  auto places = std::make_shared<const PlaceBufferLayerSource>(streets.lit_places(),
                                                               PlaceBufferLayerSource::Options{});
  const FallbackLayerSource light(places, synthetic, log);

  auto composite = std::make_shared<CompositeLayerSource>();
  composite->set(LayerType::kLight, light.resolve(LayerType::kLight, bounds)).set_default(synthetic);
  return composite;
}

void print_route(const RouteResult& route) {
  std::cout << std::fixed << std::setprecision(1);
  std::cout << "Distance:   " << route.distance_m << " m\n"
            << "Duration:   " << route.duration_min << " min\n"
            << "Calm score: " << route.calm_score << " / 10\n"
            << "Cost:       " << route.cost << "\n";

  for (LayerType layer : kAllLayerTypes) {
    const auto& average = route.average_metric[layer_index(layer)];
    std::cout << "  " << std::left << std::setw(8) << layer_type_name(layer) << std::right;
    if (average) {
      std::cout << *average << "\n";
    } else {
      std::cout << "-\n";
    }
  }

  if (!route.warnings.empty()) {
    std::cout << "Warnings:\n";
    for (const auto& warning : route.warnings) {
      std::cout << "  " << warning.message << "\n";
    }
  }

  std::cout << std::setprecision(6) << "Path (" << route.path.size() << " points):\n";
  for (const auto& point : route.path) {
    std::cout << "  " << point.lat << "," << point.lon << "\n";
  }
  std::cout.flush();
}

}  // namespace

std::optional<Point> parse_point(std::string_view text) {
  const auto parts = split(text, ',');
  if (parts.size() != 2) {
    return std::nullopt;
  }
  const auto lat = parse_double(parts[0]);
  const auto lon = parse_double(parts[1]);
  if (!lat || !lon) {
    return std::nullopt;
  }
  return Point(*lat, *lon);
}

std::optional<BoundingBox> parse_bbox(std::string_view text) {
  const auto parts = split(text, ',');
  if (parts.size() != 4) {
    return std::nullopt;
  }
  double values[4];
  for (std::size_t i = 0; i < 4; ++i) {
    const auto value = parse_double(parts[i]);
    if (!value) {
      return std::nullopt;
    }
    values[i] = *value;
  }
  return BoundingBox(values[0], values[1], values[2], values[3]);
}

bool parse_weights(std::string_view text, RouteWeights& weights) {
  RouteWeights parsed = weights;
  for (const auto part : split(text, ',')) {
    const std::size_t equals = part.find('=');
    if (equals == std::string_view::npos) {
      return false;
    }
    const auto layer = parse_layer_type(part.substr(0, equals));
    const auto value = parse_double(part.substr(equals + 1));
    if (!layer || !value || *value < 0.0) {
      return false;
    }
    parsed.set(*layer, *value);
  }
  weights = parsed;
  return true;
}

int run_calm_route(const CliConfig& config) {
  if (config.osm_input.empty()) {
    std::cerr << "[calm_route] Missing --osm argument" << std::endl;
    return 1;
  }
  if (!config.start || !config.end) {
    std::cerr << "[calm_route] Both --start and --end are required" << std::endl;
    return 1;
  }

  const LogCallback log = console_logger(config.quiet);

  auto streets = std::make_shared<OsmStreetSource>(log);
  if (!streets->load(config.osm_input)) {
    return 1;
  }

  BoundingBox bounds;
  if (config.bounds) {
    bounds = *config.bounds;
  } else {
    bounds = BoundingBox::around(*config.start);
    bounds.expand(*config.end);
    bounds = geometry::expanded_by_meters(bounds, config.auto_bbox_margin_m);
  }

  const LayerSourcePtr layers = build_layer_source(config, *streets, bounds, log);
  CalmEngine engine(streets, layers, EngineConfig{}, log);

  try {
    const RouteResult route = engine.compute_calm_route(*config.start, *config.end, bounds, config.weights);
    print_route(route);

    if (!config.render_output.empty()) {
      std::vector<LayerPolygon> polygons;
      for (LayerType layer : kAllLayerTypes) {
        if (config.weights.is_active(layer)) {
          const auto found = layers->query(layer, bounds);
          polygons.insert(polygons.end(), found.begin(), found.end());
        }
      }
      if (!render_route_png(config.render_output, *engine.graph_for(bounds), polygons, route, RenderOptions{},
                            log)) {
        return 1;
      }
    }
    return 0;
  } catch (const EngineError& ex) {
    std::cerr << "[calm_route] " << error_kind_name(ex.kind()) << ": " << ex.what() << std::endl;
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "[calm_route] Routing failed: " << ex.what() << std::endl;
    return 1;
  }
}

}  // namespace calmpath::cli
