#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "../graph/street_graph.hpp"

namespace calmpath {

/**
 * LRU cache of built street graphs keyed by the quantized request box.
 * Graphs are immutable and handed out as shared pointers, so an entry can
 * be evicted while a request still uses it.
 */
class GraphCache {
public:
    GraphCache(std::size_t capacity, double quantization = 1e-6)
        : capacity_(capacity)
        , quantization_(quantization) {}

    [[nodiscard]] bool enabled() const noexcept { return capacity_ > 0; }

    std::shared_ptr<const StreetGraph> lookup(const BoundingBox& bounds) {
        if (!enabled()) {
            return nullptr;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = map_.find(make_key(bounds));
        if (it == map_.end()) {
            ++misses_;
            return nullptr;
        }

        entries_.splice(entries_.begin(), entries_, it->second);
        ++hits_;
        return entries_.front().graph;
    }

    void store(const BoundingBox& bounds, std::shared_ptr<const StreetGraph> graph) {
        if (!enabled() || !graph) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const CacheKey key = make_key(bounds);
        const auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->graph = std::move(graph);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        if (map_.size() == capacity_) {
            auto tail = std::prev(entries_.end());
            map_.erase(tail->key);
            entries_.pop_back();
        }

        entries_.push_front(Entry{key, std::move(graph)});
        map_[key] = entries_.begin();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        map_.clear();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    [[nodiscard]] std::size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    [[nodiscard]] std::size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    struct CacheKey {
        std::int64_t min_lat;
        std::int64_t min_lon;
        std::int64_t max_lat;
        std::int64_t max_lon;

        bool operator==(const CacheKey& other) const {
            return min_lat == other.min_lat && min_lon == other.min_lon &&
                   max_lat == other.max_lat && max_lon == other.max_lon;
        }
    };

    struct Entry {
        CacheKey key;
        std::shared_ptr<const StreetGraph> graph;
    };

    struct CacheKeyHasher {
        std::size_t operator()(const CacheKey& key) const noexcept {
            std::size_t hash = std::hash<std::int64_t>{}(key.min_lat);
            hash ^= std::hash<std::int64_t>{}(key.min_lon) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
            hash ^= std::hash<std::int64_t>{}(key.max_lat) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
            hash ^= std::hash<std::int64_t>{}(key.max_lon) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
            return hash;
        }
    };

    using CacheList = std::list<Entry>;
    using CacheMap = std::unordered_map<CacheKey, CacheList::iterator, CacheKeyHasher>;

    CacheKey make_key(const BoundingBox& bounds) const {
        return CacheKey{quantize(bounds.min_lat), quantize(bounds.min_lon),
                        quantize(bounds.max_lat), quantize(bounds.max_lon)};
    }

    std::int64_t quantize(double value) const {
        return static_cast<std::int64_t>(std::llround(value / quantization_));
    }

    std::size_t capacity_ = 0;
    double quantization_ = 1e-6;
    mutable std::mutex mutex_;
    CacheList entries_;
    CacheMap map_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace calmpath
