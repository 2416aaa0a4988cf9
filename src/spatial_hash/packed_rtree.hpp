#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include "../include/bounding_box.hpp"

namespace calmpath {

// Sort-tile packed R-tree. Built once from all entries and never modified
// afterwards, so concurrent queries need no locking.
template <typename T>
class PackedRTree {
public:
    PackedRTree() = default;
    explicit PackedRTree(std::vector<std::pair<T, BoundingBox>> entries);

    std::vector<T> query(const BoundingBox& bounds) const;
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] std::size_t depth() const;
    [[nodiscard]] BoundingBox bounds() const;

    // Validation method to check tree structure
    bool validate_structure() const;

private:
    struct Item {
        T data;
        BoundingBox bounds;

        Item(const T& value, const BoundingBox& box)
            : data(value)
            , bounds(box) {}
    };

    struct Node {
        BoundingBox bounds;
        std::vector<Item> items;
        std::vector<std::unique_ptr<Node>> children;
        bool is_leaf;

        explicit Node(bool leaf)
            : bounds()
            , items()
            , children()
            , is_leaf(leaf) {}

        void update_bounds() {
            bool first = true;
            auto grow = [this, &first](const BoundingBox& box) {
                if (first) {
                    bounds = box;
                    first = false;
                } else {
                    bounds.expand(box);
                }
            };
            for (const auto& item : items) {
                grow(item.bounds);
            }
            for (const auto& child : children) {
                grow(child->bounds);
            }
        }
    };

    using NodePtr = std::unique_ptr<Node>;

    static constexpr std::size_t kMaxItems = 16;

    template <typename Container, typename Projection>
    static void sort_by_best_axis(Container& container, Projection projection);

    [[nodiscard]] static std::vector<std::size_t> calculate_group_sizes(std::size_t total);
    [[nodiscard]] static std::vector<NodePtr> build_leaf_level(std::vector<Item>&& items);
    [[nodiscard]] static std::vector<NodePtr> build_parent_level(std::vector<NodePtr>&& children);

    void query_recursive(const Node* node, const BoundingBox& bounds, std::vector<T>& results) const;
    bool validate_recursive(const Node* node, std::size_t level, std::size_t leaf_level) const;

    NodePtr root_;
    std::size_t size_ = 0;
};

template <typename T>
PackedRTree<T>::PackedRTree(std::vector<std::pair<T, BoundingBox>> entries)
    : size_(entries.size()) {
    if (entries.empty()) {
        return;
    }

    std::vector<Item> items;
    items.reserve(entries.size());
    for (auto& entry : entries) {
        items.emplace_back(entry.first, entry.second);
    }

    auto level = build_leaf_level(std::move(items));
    // Keep packing until a single root remains.
    while (level.size() > 1) {
        level = build_parent_level(std::move(level));
    }
    root_ = std::move(level.front());
}

template <typename T>
std::vector<T> PackedRTree<T>::query(const BoundingBox& bounds) const {
    std::vector<T> results;
    if (!root_ || !bounds.is_valid()) {
        return results;
    }
    query_recursive(root_.get(), bounds, results);
    return results;
}

template <typename T>
std::size_t PackedRTree<T>::depth() const {
    std::size_t levels = 0;
    const Node* node = root_.get();
    while (node) {
        ++levels;
        node = node->is_leaf || node->children.empty() ? nullptr : node->children.front().get();
    }
    return levels;
}

template <typename T>
BoundingBox PackedRTree<T>::bounds() const {
    return root_ ? root_->bounds : BoundingBox();
}

template <typename T>
bool PackedRTree<T>::validate_structure() const {
    if (!root_) {
        return size_ == 0;
    }
    return validate_recursive(root_.get(), 1, depth());
}

template <typename T>
template <typename Container, typename Projection>
void PackedRTree<T>::sort_by_best_axis(Container& container, Projection projection) {
    if (container.size() < 2) {
        return;
    }

    double min_lon = std::numeric_limits<double>::max();
    double max_lon = std::numeric_limits<double>::lowest();
    double min_lat = std::numeric_limits<double>::max();
    double max_lat = std::numeric_limits<double>::lowest();

    for (const auto& element : container) {
        const auto center = projection(element).center();
        min_lon = std::min(min_lon, center.lon);
        max_lon = std::max(max_lon, center.lon);
        min_lat = std::min(min_lat, center.lat);
        max_lat = std::max(max_lat, center.lat);
    }

    if (max_lon - min_lon >= max_lat - min_lat) {
        std::stable_sort(container.begin(), container.end(), [&projection](const auto& lhs, const auto& rhs) {
            return projection(lhs).center().lon < projection(rhs).center().lon;
        });
    } else {
        std::stable_sort(container.begin(), container.end(), [&projection](const auto& lhs, const auto& rhs) {
            return projection(lhs).center().lat < projection(rhs).center().lat;
        });
    }
}

template <typename T>
std::vector<std::size_t> PackedRTree<T>::calculate_group_sizes(std::size_t total) {
    if (total == 0) {
        return {};
    }

    if (total <= kMaxItems) {
        return {total};
    }

    const std::size_t group_count = (total + kMaxItems - 1) / kMaxItems;
    std::vector<std::size_t> sizes(group_count, total / group_count);
    const std::size_t remainder = total % group_count;
    for (std::size_t i = 0; i < remainder; ++i) {
        ++sizes[i];
    }
    return sizes;
}

template <typename T>
std::vector<typename PackedRTree<T>::NodePtr> PackedRTree<T>::build_leaf_level(std::vector<Item>&& items) {
    std::vector<NodePtr> leaves;
    sort_by_best_axis(items, [](const Item& item) { return item.bounds; });

    const auto group_sizes = calculate_group_sizes(items.size());
    leaves.reserve(group_sizes.size());

    std::size_t offset = 0;
    for (const std::size_t group_size : group_sizes) {
        auto node = std::make_unique<Node>(true);
        node->items.reserve(group_size);
        for (std::size_t i = 0; i < group_size; ++i) {
            node->items.push_back(std::move(items[offset++]));
        }
        node->update_bounds();
        leaves.push_back(std::move(node));
    }

    return leaves;
}

template <typename T>
std::vector<typename PackedRTree<T>::NodePtr> PackedRTree<T>::build_parent_level(std::vector<NodePtr>&& children) {
    std::vector<NodePtr> parents;
    sort_by_best_axis(children, [](const NodePtr& node) { return node->bounds; });

    const auto group_sizes = calculate_group_sizes(children.size());
    parents.reserve(group_sizes.size());

    std::size_t offset = 0;
    for (const std::size_t group_size : group_sizes) {
        auto parent = std::make_unique<Node>(false);
        parent->children.reserve(group_size);
        for (std::size_t i = 0; i < group_size; ++i) {
            parent->children.push_back(std::move(children[offset++]));
        }
        parent->update_bounds();
        parents.push_back(std::move(parent));
    }

    return parents;
}

template <typename T>
void PackedRTree<T>::query_recursive(const Node* node, const BoundingBox& bounds, std::vector<T>& results) const {
    if (!node->bounds.intersects(bounds)) {
        return;
    }

    if (node->is_leaf) {
        for (const auto& item : node->items) {
            if (item.bounds.intersects(bounds)) {
                results.push_back(item.data);
            }
        }
        return;
    }

    for (const auto& child : node->children) {
        query_recursive(child.get(), bounds, results);
    }
}

template <typename T>
bool PackedRTree<T>::validate_recursive(const Node* node, std::size_t level, std::size_t leaf_level) const {
    if (node->is_leaf) {
        if (level != leaf_level || node->items.empty()) {
            return false;
        }
        for (const auto& item : node->items) {
            const BoundingBox& b = item.bounds;
            if (b.min_lat < node->bounds.min_lat || b.max_lat > node->bounds.max_lat ||
                b.min_lon < node->bounds.min_lon || b.max_lon > node->bounds.max_lon) {
                return false;
            }
        }
        return true;
    }

    if (node->children.empty() || node->children.size() > kMaxItems) {
        return false;
    }
    for (const auto& child : node->children) {
        const BoundingBox& b = child->bounds;
        if (b.min_lat < node->bounds.min_lat || b.max_lat > node->bounds.max_lat ||
            b.min_lon < node->bounds.min_lon || b.max_lon > node->bounds.max_lon) {
            return false;
        }
        if (!validate_recursive(child.get(), level + 1, leaf_level)) {
            return false;
        }
    }
    return true;
}

} // namespace calmpath
