#ifndef TILEMOSAIC_SPATIAL_INDEX_H
#define TILEMOSAIC_SPATIAL_INDEX_H
#pragma once

#include "tilemosaic/common.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <vector>

namespace tilemosaic {

// Static bounding volume hierarchy over fixed-point boxes. Built once, then
// queried read-only from any number of threads.
class BoxIndex {
public:
    struct Entry {
        FixedBox box;
        std::size_t id = 0;
    };

    void build(std::vector<Entry> entries) {
        _entries = std::move(entries);
        _nodes.clear();
        if (_entries.empty()) {
            return;
        }
        _nodes.reserve(_entries.size() * 2);
        std::vector<std::size_t> order(_entries.size());
        std::iota(order.begin(), order.end(), 0);
        build_rec(order.data(), order.size());
    }

    // Ids of every entry whose box intersects `box`, ascending.
    std::vector<std::size_t> query(const FixedBox &box) const {
        std::vector<std::size_t> ids;
        if (!_nodes.empty()) {
            query_rec(box, 0, ids);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

private:
    struct Node {
        FixedBox bounds;
        std::size_t left = 0;
        std::size_t right = 0;
        std::size_t entry = 0;
        bool leaf = false;
    };

    static std::int64_t center_of(const FixedBox &box, int axis) {
        if (axis == 0) {
            return static_cast<std::int64_t>(box.min_lon) + box.max_lon;
        }
        return static_cast<std::int64_t>(box.min_lat) + box.max_lat;
    }

    std::size_t build_rec(std::size_t *order, std::size_t n) {
        if (n == 1) {
            Node node;
            node.bounds = _entries[order[0]].box;
            node.entry = order[0];
            node.leaf = true;
            _nodes.push_back(node);
            return _nodes.size() - 1;
        }

        FixedBox total = _entries[order[0]].box;
        for (std::size_t i = 1; i < n; ++i) {
            total = total.merge(_entries[order[i]].box);
        }

        const std::int64_t lon_extent = static_cast<std::int64_t>(total.max_lon) - total.min_lon;
        const std::int64_t lat_extent = static_cast<std::int64_t>(total.max_lat) - total.min_lat;
        const int axis = lon_extent >= lat_extent ? 0 : 1;

        const std::size_t mid = n / 2;
        std::nth_element(order, order + mid, order + n, [&](std::size_t a, std::size_t b) {
            return center_of(_entries[a].box, axis) < center_of(_entries[b].box, axis);
        });

        _nodes.push_back({});
        const std::size_t self = _nodes.size() - 1;
        const std::size_t left = build_rec(order, mid);
        const std::size_t right = build_rec(order + mid, n - mid);

        _nodes[self].bounds = total;
        _nodes[self].left = left;
        _nodes[self].right = right;
        return self;
    }

    void query_rec(const FixedBox &box, std::size_t index, std::vector<std::size_t> &out) const {
        const Node &node = _nodes[index];
        if (!node.bounds.intersects(box)) {
            return;
        }
        if (node.leaf) {
            out.push_back(_entries[node.entry].id);
            return;
        }
        query_rec(box, node.left, out);
        query_rec(box, node.right, out);
    }

    std::vector<Entry> _entries;
    std::vector<Node> _nodes;
};

}  // namespace tilemosaic

#endif // TILEMOSAIC_SPATIAL_INDEX_H
