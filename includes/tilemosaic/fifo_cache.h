#ifndef TILEMOSAIC_FIFO_CACHE_H
#define TILEMOSAIC_FIFO_CACHE_H
#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace tilemosaic {

// Bounded map that evicts the oldest inserted key once full. Lookups do not
// refresh an entry's position.
template <typename K, typename V>
class FifoCache {
public:
    explicit FifoCache(std::size_t capacity) : _capacity(capacity == 0 ? 1 : capacity) {}

    FifoCache(const FifoCache &) = delete;
    FifoCache &operator=(const FifoCache &) = delete;

    std::optional<V> get(const K &key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        const auto it = _entries.find(key);
        if (it == _entries.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Returns the cached value, or inserts the one built by `factory`.
    // `factory` runs under the cache lock and must be cheap.
    template <typename Factory>
    V getOrInsert(const K &key, Factory &&factory) {
        std::lock_guard<std::mutex> lock(_mutex);
        const auto it = _entries.find(key);
        if (it != _entries.end()) {
            return it->second;
        }
        while (_entries.size() >= _capacity && !_order.empty()) {
            _entries.erase(_order.front());
            _order.pop_front();
        }
        V value = factory();
        _entries.emplace(key, value);
        _order.push_back(key);
        return value;
    }

    bool erase(const K &key) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_entries.erase(key) == 0) {
            return false;
        }
        _order.erase(std::remove(_order.begin(), _order.end(), key), _order.end());
        return true;
    }

    // Erases `key` only while it still maps to `expected`.
    bool erase(const K &key, const V &expected) {
        std::lock_guard<std::mutex> lock(_mutex);
        const auto it = _entries.find(key);
        if (it == _entries.end() || !(it->second == expected)) {
            return false;
        }
        _entries.erase(it);
        _order.erase(std::remove(_order.begin(), _order.end(), key), _order.end());
        return true;
    }

    bool contains(const K &key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.count(key) > 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    std::size_t capacity() const { return _capacity; }

private:
    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::unordered_map<K, V> _entries;
    std::deque<K> _order;
};

}  // namespace tilemosaic

#endif // TILEMOSAIC_FIFO_CACHE_H
