#include "layer_store.hpp"

#include "../geometry/geometry.hpp"

#include <stdexcept>
#include <utility>

namespace calmpath {

LayerStore::LayerStore(std::vector<LayerPolygon> polygons) {
    PerLayer<std::vector<std::pair<std::size_t, BoundingBox>>> entries;

    for (auto& polygon : polygons) {
        geometry::normalize_ring(polygon.ring);
        if (polygon.ring.size() < 3) {
            ++dropped_;
            continue;
        }
        polygon.bounds = geometry::bounds_of(polygon.ring);

        auto& index = layers_[layer_index(polygon.layer)];
        entries[layer_index(polygon.layer)].emplace_back(index.polygons.size(), polygon.bounds);
        index.polygons.push_back(std::move(polygon));
    }

    for (LayerType layer : kAllLayerTypes) {
        layers_[layer_index(layer)].tree = PackedRTree<std::size_t>(std::move(entries[layer_index(layer)]));
    }
}

std::vector<LayerPolygon> LayerStore::query(LayerType layer, const BoundingBox& bounds) const {
    const auto& index = layers_[layer_index(layer)];
    std::vector<LayerPolygon> results;
    for (std::size_t slot : index.tree.query(bounds)) {
        results.push_back(index.polygons[slot]);
    }
    return results;
}

std::size_t LayerStore::size() const {
    std::size_t total = 0;
    for (const auto& index : layers_) {
        total += index.polygons.size();
    }
    return total;
}

std::size_t LayerStore::size(LayerType layer) const {
    return layers_[layer_index(layer)].polygons.size();
}

LayerStoreHandle::LayerStoreHandle()
    : current_(std::make_shared<const LayerStore>()) {}

LayerStoreHandle::LayerStoreHandle(std::shared_ptr<const LayerStore> initial)
    : current_(std::move(initial)) {
    if (!current_) {
        throw std::invalid_argument("LayerStoreHandle requires a store");
    }
}

std::shared_ptr<const LayerStore> LayerStoreHandle::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void LayerStoreHandle::replace(std::shared_ptr<const LayerStore> next) {
    if (!next) {
        throw std::invalid_argument("LayerStoreHandle::replace requires a store");
    }
    std::shared_ptr<const LayerStore> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(current_, std::move(next));
        ++generation_;
    }
    // previous is released outside the lock; readers still holding it keep it alive
}

std::uint64_t LayerStoreHandle::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace calmpath
