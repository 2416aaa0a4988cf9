#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../core/logging.hpp"
#include "../core/types.hpp"
#include "layer_store.hpp"

namespace calmpath {

// Anything that can answer "which polygons of this layer touch this box".
// Implementations must be safe to query from several threads at once.
class LayerSource {
public:
    virtual ~LayerSource() = default;

    virtual std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const = 0;
};

using LayerSourcePtr = std::shared_ptr<const LayerSource>;

// Serves polygons from a LayerStore. Built from a handle it follows store
// refreshes (each query sees one whole store); built from a store pointer it
// stays pinned to that snapshot.
class StoreLayerSource final : public LayerSource {
public:
    explicit StoreLayerSource(const LayerStoreHandle& handle);
    explicit StoreLayerSource(std::shared_ptr<const LayerStore> store);

    std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const override;

private:
    const LayerStoreHandle* handle_ = nullptr;
    std::shared_ptr<const LayerStore> pinned_;
};

// Deterministic stand-in data: the plane is tiled into cells and every cell
// gets the same square polygons and metrics on every call, whatever the
// query box. Noise and crowd grow towards the configured center.
class SyntheticLayerSource final : public LayerSource {
public:
    struct Options {
        Point center{55.7558, 37.6173};
        double cell_size_deg = 0.005;
        int polygons_per_cell = 2;
        double min_half_size_deg = 0.0004;
        double max_half_size_deg = 0.0006;
        double puddle_probability = 0.3;
        std::uint64_t seed = 42;
        std::size_t max_cells_per_query = 20000;
    };

    SyntheticLayerSource();
    explicit SyntheticLayerSource(const Options& options);

    std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const override;

private:
    void generate_cell(LayerType layer, std::int64_t row, std::int64_t col,
                       std::vector<LayerPolygon>& out) const;

    Options options_;
};

// Turns point places (e.g. lit shopping centers) into circular polygons of
// one layer. Queries for any other layer return nothing.
class PlaceBufferLayerSource final : public LayerSource {
public:
    struct Place {
        std::string id;
        std::string name;
        Point location;
    };

    struct Options {
        LayerType layer = LayerType::kLight;
        double radius_m = 100.0;
        int num_points = 16;
        LayerMetrics metrics{65.0, 4, 180.0, false};
    };

    PlaceBufferLayerSource(const std::vector<Place>& places, const Options& options);

    std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const override;

    [[nodiscard]] std::size_t size() const { return store_.size(); }

private:
    Options options_;
    LayerStore store_;
};

// Asks the primary source first; when it throws or has nothing for the box,
// answers from the fallback instead. A failing primary is logged once per
// outage, not once per query.
class FallbackLayerSource final : public LayerSource {
public:
    FallbackLayerSource(LayerSourcePtr primary, LayerSourcePtr fallback, LogCallback log_callback = nullptr);

    std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const override;

    // Makes the choice once for a whole request area: the primary when it has
    // polygons anywhere in the box, the fallback otherwise.
    [[nodiscard]] LayerSourcePtr resolve(LayerType layer, const BoundingBox& bounds) const;

private:
    // Primary's answer, or false when it threw.
    bool query_primary(LayerType layer, const BoundingBox& bounds, std::vector<LayerPolygon>& results) const;

    LayerSourcePtr primary_;
    LayerSourcePtr fallback_;
    Logger logger_;
    mutable std::atomic<bool> primary_failing_{false};
};

// Raises crowd levels by one (capped at 5) during rush hours.
class RushHourCrowdSource final : public LayerSource {
public:
    RushHourCrowdSource(LayerSourcePtr inner, int hour_of_day);

    std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const override;

    static bool is_rush_hour(int hour_of_day);

private:
    LayerSourcePtr inner_;
    bool rush_hour_;
};

// Routes every layer type to the source registered for it.
class CompositeLayerSource final : public LayerSource {
public:
    CompositeLayerSource() = default;

    CompositeLayerSource& set(LayerType layer, LayerSourcePtr source);
    // Registers the same source for every layer type not yet set.
    CompositeLayerSource& set_default(LayerSourcePtr source);

    std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const override;

private:
    PerLayer<LayerSourcePtr> sources_{};
};

} // namespace calmpath
