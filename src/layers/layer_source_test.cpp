#include "layer_source.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace calmpath {

namespace layer_source_tests {

LayerPolygon make_square(const std::string& id, LayerType layer, double lat, double lon, double half) {
    LayerPolygon polygon;
    polygon.id = id;
    polygon.layer = layer;
    polygon.ring = Polygon{Point(lat - half, lon - half), Point(lat - half, lon + half),
                           Point(lat + half, lon + half), Point(lat + half, lon - half)};
    return polygon;
}

class ThrowingSource final : public LayerSource {
public:
    std::vector<LayerPolygon> query(LayerType, const BoundingBox&) const override {
        throw std::runtime_error("upstream unavailable");
    }
};

class EmptySource final : public LayerSource {
public:
    std::vector<LayerPolygon> query(LayerType, const BoundingBox&) const override {
        return {};
    }
};

bool test_store_source_follows_handle() {
    LayerStoreHandle handle;
    StoreLayerSource following(handle);
    StoreLayerSource pinned(handle.snapshot());

    handle.replace(std::make_shared<const LayerStore>(
        std::vector<LayerPolygon>{make_square("fresh", LayerType::kNoise, 0.0, 0.0, 0.1)}));

    const BoundingBox box(-1, -1, 1, 1);
    return following.query(LayerType::kNoise, box).size() == 1 && pinned.query(LayerType::kNoise, box).empty();
}

bool test_synthetic_is_deterministic_across_boxes() {
    SyntheticLayerSource source;
    const BoundingBox wide(55.74, 37.60, 55.77, 37.63);
    const auto all = source.query(LayerType::kNoise, wide);
    if (all.empty()) {
        std::cerr << "Synthetic source produced nothing" << std::endl;
        return false;
    }

    // A narrow query around one polygon must see the identical polygon.
    const auto& sample = all[all.size() / 2];
    const auto narrow = source.query(LayerType::kNoise, sample.bounds);
    for (const auto& polygon : narrow) {
        if (polygon.id == sample.id) {
            return polygon.metrics.noise_db == sample.metrics.noise_db &&
                   polygon.ring.size() == 4 && polygon.ring[0] == sample.ring[0];
        }
    }
    std::cerr << "Polygon " << sample.id << " missing from narrow query" << std::endl;
    return false;
}

bool test_synthetic_metrics_in_range() {
    SyntheticLayerSource source;
    const auto polygons = source.query(LayerType::kCrowd, BoundingBox(55.70, 37.55, 55.80, 37.70));
    for (const auto& polygon : polygons) {
        const double noise = *polygon.metrics.noise_db;
        const int crowd = *polygon.metrics.crowd_level;
        const double lux = *polygon.metrics.light_lux;
        if (noise < 50.0 || noise > 85.0 || crowd < 1 || crowd > 5 || lux < 50.0 || lux > 200.0) {
            std::cerr << "Out of range metrics in " << polygon.id << std::endl;
            return false;
        }
    }
    return !polygons.empty();
}

bool test_synthetic_rejects_huge_query() {
    SyntheticLayerSource source;
    try {
        source.query(LayerType::kNoise, BoundingBox(-10, -10, 10, 10));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool test_place_buffer_serves_only_its_layer() {
    PlaceBufferLayerSource::Options options;
    options.layer = LayerType::kLight;
    options.radius_m = 100.0;
    PlaceBufferLayerSource source({{"42", "Mall", Point(55.75, 37.61)}}, options);

    const BoundingBox box(55.74, 37.60, 55.76, 37.62);
    const auto light = source.query(LayerType::kLight, box);
    if (light.size() != 1 || light.front().id != "light_place_42" || light.front().street_name != "Mall") {
        return false;
    }
    if (light.front().ring.size() != 16 || *light.front().metrics.light_lux != 180.0) {
        return false;
    }
    return source.query(LayerType::kNoise, box).empty() &&
           source.query(LayerType::kLight, BoundingBox(0, 0, 1, 1)).empty();
}

bool test_fallback_on_throw_and_empty() {
    auto backup = std::make_shared<const StoreLayerSource>(std::make_shared<const LayerStore>(
        std::vector<LayerPolygon>{make_square("backup", LayerType::kNoise, 0.0, 0.0, 0.1)}));

    int errors_logged = 0;
    auto count_errors = [&errors_logged](const std::string&, bool is_error) {
        if (is_error) {
            ++errors_logged;
        }
    };

    const BoundingBox box(-1, -1, 1, 1);
    FallbackLayerSource after_throw(std::make_shared<const ThrowingSource>(), backup, count_errors);
    FallbackLayerSource after_empty(std::make_shared<const EmptySource>(), backup, count_errors);

    const auto a = after_throw.query(LayerType::kNoise, box);
    const auto b = after_empty.query(LayerType::kNoise, box);
    return a.size() == 1 && a.front().id == "backup" && b.size() == 1 && errors_logged == 1;
}

bool test_fallback_resolves_once_per_area() {
    PlaceBufferLayerSource::Options options;
    auto places = std::make_shared<const PlaceBufferLayerSource>(
        std::vector<PlaceBufferLayerSource::Place>{{"7", "Mall", Point(55.75, 37.61)}}, options);
    auto synthetic = std::make_shared<const SyntheticLayerSource>();
    const FallbackLayerSource light(places, synthetic);

    // a mall somewhere in the area decides for every street in it
    const LayerSourcePtr near_mall = light.resolve(LayerType::kLight, BoundingBox(55.74, 37.60, 55.76, 37.62));
    const LayerSourcePtr elsewhere = light.resolve(LayerType::kLight, BoundingBox(55.70, 37.50, 55.71, 37.51));
    if (near_mall != places || elsewhere != synthetic) {
        return false;
    }
    // a street far from the mall inside the same area gets no synthetic light
    return near_mall->query(LayerType::kLight, BoundingBox(55.758, 37.618, 55.759, 37.619)).empty();
}

bool test_failing_primary_logged_once_per_outage() {
    auto backup = std::make_shared<const StoreLayerSource>(std::make_shared<const LayerStore>(
        std::vector<LayerPolygon>{make_square("backup", LayerType::kNoise, 0.0, 0.0, 0.1)}));

    int errors_logged = 0;
    FallbackLayerSource source(std::make_shared<const ThrowingSource>(), backup,
                               [&errors_logged](const std::string&, bool is_error) {
                                   if (is_error) {
                                       ++errors_logged;
                                   }
                               });
    const BoundingBox box(-1, -1, 1, 1);
    for (int i = 0; i < 50; ++i) {
        if (source.query(LayerType::kNoise, box).size() != 1) {
            return false;
        }
    }
    return errors_logged == 1 && source.resolve(LayerType::kNoise, box) == backup && errors_logged == 1;
}

bool test_rush_hour_caps_crowd() {
    auto low = make_square("low", LayerType::kCrowd, 0.0, 0.0, 0.1);
    low.metrics.crowd_level = 2;
    auto high = make_square("high", LayerType::kCrowd, 0.0, 0.0, 0.1);
    high.metrics.crowd_level = 5;
    auto inner = std::make_shared<const StoreLayerSource>(
        std::make_shared<const LayerStore>(std::vector<LayerPolygon>{low, high}));

    RushHourCrowdSource evening(inner, 18);
    RushHourCrowdSource night(inner, 2);

    const BoundingBox box(-1, -1, 1, 1);
    for (const auto& polygon : evening.query(LayerType::kCrowd, box)) {
        const int expected = polygon.id == "low" ? 3 : 5;
        if (*polygon.metrics.crowd_level != expected) {
            std::cerr << polygon.id << " crowd " << *polygon.metrics.crowd_level << std::endl;
            return false;
        }
    }
    for (const auto& polygon : night.query(LayerType::kCrowd, box)) {
        if (polygon.id == "low" && *polygon.metrics.crowd_level != 2) {
            return false;
        }
    }
    return RushHourCrowdSource::is_rush_hour(8) && !RushHourCrowdSource::is_rush_hour(12);
}

bool test_composite_dispatch() {
    auto noise = std::make_shared<const StoreLayerSource>(std::make_shared<const LayerStore>(
        std::vector<LayerPolygon>{make_square("n", LayerType::kNoise, 0.0, 0.0, 0.1)}));
    auto light = std::make_shared<const StoreLayerSource>(std::make_shared<const LayerStore>(
        std::vector<LayerPolygon>{make_square("l", LayerType::kLight, 0.0, 0.0, 0.1)}));

    CompositeLayerSource composite;
    composite.set(LayerType::kLight, light);

    const BoundingBox box(-1, -1, 1, 1);
    if (!composite.query(LayerType::kNoise, box).empty()) {
        return false;
    }
    composite.set_default(noise);
    return composite.query(LayerType::kNoise, box).size() == 1 &&
           composite.query(LayerType::kLight, box).front().id == "l";
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"store_source_follows_handle", &test_store_source_follows_handle},
        {"synthetic_is_deterministic_across_boxes", &test_synthetic_is_deterministic_across_boxes},
        {"synthetic_metrics_in_range", &test_synthetic_metrics_in_range},
        {"synthetic_rejects_huge_query", &test_synthetic_rejects_huge_query},
        {"place_buffer_serves_only_its_layer", &test_place_buffer_serves_only_its_layer},
        {"fallback_on_throw_and_empty", &test_fallback_on_throw_and_empty},
        {"fallback_resolves_once_per_area", &test_fallback_resolves_once_per_area},
        {"failing_primary_logged_once_per_outage", &test_failing_primary_logged_once_per_outage},
        {"rush_hour_caps_crowd", &test_rush_hour_caps_crowd},
        {"composite_dispatch", &test_composite_dispatch},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace layer_source_tests

} // namespace calmpath

int main() {
    if (calmpath::layer_source_tests::run_all_tests()) {
        std::cout << "All LayerSource tests passed" << std::endl;
        return 0;
    }

    std::cerr << "LayerSource tests failed" << std::endl;
    return 1;
}
