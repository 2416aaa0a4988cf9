#include "layer_source.hpp"

#include "../geometry/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <random>
#include <stdexcept>
#include <utility>

namespace calmpath {

namespace {

std::uint64_t mix_bits(std::uint64_t value) {
    value += 0x9e3779b97f4a7c15ULL;
    value = (value ^ (value >> 30)) * 0xbf58476d1ce4e5b9ULL;
    value = (value ^ (value >> 27)) * 0x94d049bb133111ebULL;
    return value ^ (value >> 31);
}

std::uint64_t cell_seed(std::uint64_t seed, LayerType layer, std::int64_t row, std::int64_t col) {
    std::uint64_t hash = mix_bits(seed);
    hash = mix_bits(hash ^ static_cast<std::uint64_t>(layer_index(layer)));
    hash = mix_bits(hash ^ static_cast<std::uint64_t>(row));
    hash = mix_bits(hash ^ static_cast<std::uint64_t>(col));
    return hash;
}

// Rough planar distance in km, 1 degree ~ 111 km.
double km_between(const Point& a, const Point& b) {
    const double dlat = a.lat - b.lat;
    const double dlon = a.lon - b.lon;
    return std::sqrt(dlat * dlat + dlon * dlon) * 111.0;
}

} // namespace

// ==================== StoreLayerSource ====================

StoreLayerSource::StoreLayerSource(const LayerStoreHandle& handle)
    : handle_(&handle) {}

StoreLayerSource::StoreLayerSource(std::shared_ptr<const LayerStore> store)
    : pinned_(std::move(store)) {
    if (!pinned_) {
        throw std::invalid_argument("StoreLayerSource requires a store");
    }
}

std::vector<LayerPolygon> StoreLayerSource::query(LayerType layer, const BoundingBox& bounds) const {
    if (pinned_) {
        return pinned_->query(layer, bounds);
    }
    const auto snapshot = handle_->snapshot();
    return snapshot->query(layer, bounds);
}

// ==================== SyntheticLayerSource ====================

SyntheticLayerSource::SyntheticLayerSource()
    : SyntheticLayerSource(Options()) {}

SyntheticLayerSource::SyntheticLayerSource(const Options& options)
    : options_(options) {
    if (!(options_.cell_size_deg > 0.0) || options_.polygons_per_cell < 0 ||
        options_.min_half_size_deg <= 0.0 || options_.max_half_size_deg < options_.min_half_size_deg) {
        throw std::invalid_argument("SyntheticLayerSource: inconsistent options");
    }
}

std::vector<LayerPolygon> SyntheticLayerSource::query(LayerType layer, const BoundingBox& bounds) const {
    std::vector<LayerPolygon> results;
    if (!bounds.is_valid()) {
        return results;
    }

    // Polygons centered in a neighboring cell can still reach into the box.
    const double margin = options_.max_half_size_deg;
    const auto row_begin = static_cast<std::int64_t>(std::floor((bounds.min_lat - margin) / options_.cell_size_deg));
    const auto row_end = static_cast<std::int64_t>(std::floor((bounds.max_lat + margin) / options_.cell_size_deg));
    const auto col_begin = static_cast<std::int64_t>(std::floor((bounds.min_lon - margin) / options_.cell_size_deg));
    const auto col_end = static_cast<std::int64_t>(std::floor((bounds.max_lon + margin) / options_.cell_size_deg));

    const auto cell_count = static_cast<std::size_t>(row_end - row_begin + 1) *
                            static_cast<std::size_t>(col_end - col_begin + 1);
    if (cell_count > options_.max_cells_per_query) {
        throw std::invalid_argument("SyntheticLayerSource: query covers " + std::to_string(cell_count) +
                                    " cells, limit is " + std::to_string(options_.max_cells_per_query));
    }

    std::vector<LayerPolygon> cell_polygons;
    for (std::int64_t row = row_begin; row <= row_end; ++row) {
        for (std::int64_t col = col_begin; col <= col_end; ++col) {
            cell_polygons.clear();
            generate_cell(layer, row, col, cell_polygons);
            for (auto& polygon : cell_polygons) {
                if (polygon.bounds.intersects(bounds)) {
                    results.push_back(std::move(polygon));
                }
            }
        }
    }
    return results;
}

void SyntheticLayerSource::generate_cell(LayerType layer, std::int64_t row, std::int64_t col,
                                         std::vector<LayerPolygon>& out) const {
    std::mt19937_64 rng(cell_seed(options_.seed, layer, row, col));
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> half_size(options_.min_half_size_deg, options_.max_half_size_deg);

    for (int i = 0; i < options_.polygons_per_cell; ++i) {
        const double center_lat = (static_cast<double>(row) + unit(rng)) * options_.cell_size_deg;
        const double center_lon = (static_cast<double>(col) + unit(rng)) * options_.cell_size_deg;
        const double size = half_size(rng);

        const Point center(center_lat, center_lon);
        const double dist_from_center = km_between(center, options_.center);

        double noise_db = 0.0;
        int crowd_level = 0;
        // central streets are louder and busier
        if (dist_from_center < 1.0) {
            noise_db = 70.0 + unit(rng) * 15.0;
            crowd_level = 3 + static_cast<int>(rng() % 3);
        } else if (dist_from_center < 2.0) {
            noise_db = 60.0 + unit(rng) * 15.0;
            crowd_level = 2 + static_cast<int>(rng() % 3);
        } else {
            noise_db = 50.0 + unit(rng) * 15.0;
            crowd_level = 1 + static_cast<int>(rng() % 3);
        }
        const double light_lux = 50.0 + static_cast<double>(rng() % 151);
        const bool puddles = unit(rng) < options_.puddle_probability;

        LayerPolygon polygon;
        polygon.id = std::string("synthetic_") + layer_type_name(layer) + "_" + std::to_string(row) + "_" +
                     std::to_string(col) + "_" + std::to_string(i);
        polygon.layer = layer;
        polygon.ring = Polygon{Point(center_lat - size, center_lon - size),
                               Point(center_lat - size, center_lon + size),
                               Point(center_lat + size, center_lon + size),
                               Point(center_lat + size, center_lon - size)};
        polygon.metrics.noise_db = std::round(noise_db * 10.0) / 10.0;
        polygon.metrics.crowd_level = crowd_level;
        polygon.metrics.light_lux = light_lux;
        polygon.metrics.puddles = puddles;
        polygon.bounds = geometry::bounds_of(polygon.ring);
        out.push_back(std::move(polygon));
    }
}

// ==================== PlaceBufferLayerSource ====================

namespace {

std::vector<LayerPolygon> buffer_places(const std::vector<PlaceBufferLayerSource::Place>& places,
                                        const PlaceBufferLayerSource::Options& options) {
    std::vector<LayerPolygon> polygons;
    polygons.reserve(places.size());
    for (const auto& place : places) {
        if (!place.location.is_valid()) {
            continue;
        }
        LayerPolygon polygon;
        polygon.id = std::string(layer_type_name(options.layer)) + "_place_" + place.id;
        polygon.layer = options.layer;
        polygon.ring = geometry::circle_approx(place.location, options.radius_m, options.num_points);
        polygon.metrics = options.metrics;
        polygon.street_name = place.name;
        polygons.push_back(std::move(polygon));
    }
    return polygons;
}

} // namespace

PlaceBufferLayerSource::PlaceBufferLayerSource(const std::vector<Place>& places, const Options& options)
    : options_(options)
    , store_(buffer_places(places, options)) {}

std::vector<LayerPolygon> PlaceBufferLayerSource::query(LayerType layer, const BoundingBox& bounds) const {
    if (layer != options_.layer) {
        return {};
    }
    return store_.query(layer, bounds);
}

// ==================== FallbackLayerSource ====================

FallbackLayerSource::FallbackLayerSource(LayerSourcePtr primary, LayerSourcePtr fallback, LogCallback log_callback)
    : primary_(std::move(primary))
    , fallback_(std::move(fallback))
    , logger_("FallbackLayerSource", std::move(log_callback)) {
    if (!primary_ || !fallback_) {
        throw std::invalid_argument("FallbackLayerSource requires both a primary and a fallback source");
    }
}

bool FallbackLayerSource::query_primary(LayerType layer, const BoundingBox& bounds,
                                        std::vector<LayerPolygon>& results) const {
    try {
        results = primary_->query(layer, bounds);
    } catch (const std::exception& ex) {
        if (!primary_failing_.exchange(true)) {
            logger_.error(std::string("Primary source failed for layer ") + layer_type_name(layer) +
                          ", using fallback: " + ex.what());
        }
        return false;
    }
    if (primary_failing_.exchange(false)) {
        logger_.info(std::string("Primary source answering again for layer ") + layer_type_name(layer));
    }
    return true;
}

std::vector<LayerPolygon> FallbackLayerSource::query(LayerType layer, const BoundingBox& bounds) const {
    std::vector<LayerPolygon> results;
    if (query_primary(layer, bounds, results) && !results.empty()) {
        return results;
    }
    return fallback_->query(layer, bounds);
}

LayerSourcePtr FallbackLayerSource::resolve(LayerType layer, const BoundingBox& bounds) const {
    std::vector<LayerPolygon> results;
    if (query_primary(layer, bounds, results) && !results.empty()) {
        return primary_;
    }
    return fallback_;
}

// ==================== RushHourCrowdSource ====================

RushHourCrowdSource::RushHourCrowdSource(LayerSourcePtr inner, int hour_of_day)
    : inner_(std::move(inner))
    , rush_hour_(is_rush_hour(hour_of_day)) {
    if (!inner_) {
        throw std::invalid_argument("RushHourCrowdSource requires an inner source");
    }
}

bool RushHourCrowdSource::is_rush_hour(int hour_of_day) {
    switch (hour_of_day) {
        case 8:
        case 9:
        case 17:
        case 18:
        case 19:
            return true;
        default:
            return false;
    }
}

std::vector<LayerPolygon> RushHourCrowdSource::query(LayerType layer, const BoundingBox& bounds) const {
    auto results = inner_->query(layer, bounds);
    if (!rush_hour_ || layer != LayerType::kCrowd) {
        return results;
    }
    for (auto& polygon : results) {
        if (polygon.metrics.crowd_level) {
            polygon.metrics.crowd_level = std::min(5, *polygon.metrics.crowd_level + 1);
        }
    }
    return results;
}

// ==================== CompositeLayerSource ====================

CompositeLayerSource& CompositeLayerSource::set(LayerType layer, LayerSourcePtr source) {
    sources_[layer_index(layer)] = std::move(source);
    return *this;
}

CompositeLayerSource& CompositeLayerSource::set_default(LayerSourcePtr source) {
    for (auto& slot : sources_) {
        if (!slot) {
            slot = source;
        }
    }
    return *this;
}

std::vector<LayerPolygon> CompositeLayerSource::query(LayerType layer, const BoundingBox& bounds) const {
    const auto& source = sources_[layer_index(layer)];
    if (!source) {
        return {};
    }
    return source->query(layer, bounds);
}

} // namespace calmpath
