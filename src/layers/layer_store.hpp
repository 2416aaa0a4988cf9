#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "../core/types.hpp"
#include "../spatial_hash/packed_rtree.hpp"

namespace calmpath {

// Immutable per-layer polygon index. Safe for any number of concurrent
// readers; refresh by building a new store and swapping it in through
// LayerStoreHandle.
class LayerStore {
public:
    LayerStore() = default;
    explicit LayerStore(std::vector<LayerPolygon> polygons);

    // All polygons of the layer whose bounding box intersects the query box.
    std::vector<LayerPolygon> query(LayerType layer, const BoundingBox& bounds) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t size(LayerType layer) const;
    // Polygons rejected at construction (fewer than three distinct vertices).
    [[nodiscard]] std::size_t dropped_count() const noexcept { return dropped_; }

private:
    struct LayerIndex {
        std::vector<LayerPolygon> polygons;
        PackedRTree<std::size_t> tree;
    };

    PerLayer<LayerIndex> layers_;
    std::size_t dropped_ = 0;
};

// Shared owner of the current LayerStore. Readers take a snapshot and keep
// it for the whole request; replace() swaps the entire store at once.
class LayerStoreHandle {
public:
    LayerStoreHandle();
    explicit LayerStoreHandle(std::shared_ptr<const LayerStore> initial);

    LayerStoreHandle(const LayerStoreHandle&) = delete;
    LayerStoreHandle& operator=(const LayerStoreHandle&) = delete;

    [[nodiscard]] std::shared_ptr<const LayerStore> snapshot() const;
    void replace(std::shared_ptr<const LayerStore> next);
    [[nodiscard]] std::uint64_t generation() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const LayerStore> current_;
    std::uint64_t generation_ = 0;
};

} // namespace calmpath
