#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

// A fixed-capacity map which evicts the least recently used entry when full.
// get() and set() count as a use; has() does not. Iteration runs from least to most recently used.
template <typename K, typename V>
class LruCache {
    using Entry = std::pair<K, V>;
    using EntryList = std::list<Entry>;

    EntryList entries_; // front is least recently used
    std::unordered_map<K, typename EntryList::iterator> index_;
    size_t max_size_;

    void promote(typename EntryList::iterator it) { entries_.splice(entries_.end(), entries_, it); }
    void evict_to(size_t size) {
        while (entries_.size() > size) {
            index_.erase(entries_.front().first);
            entries_.pop_front();
        }
    }

public:
    explicit LruCache(size_t max_size) : max_size_(std::max<size_t>(1, max_size)) {}

    [[nodiscard]] std::optional<V> get(const K &key) {
        auto it = index_.find(key);
        if (it == index_.end())
            return std::nullopt;
        promote(it->second);
        return it->second->second;
    }

    [[nodiscard]] bool has(const K &key) const { return index_.find(key) != index_.end(); }

    void set(const K &key, V value) {
        if (auto it = index_.find(key); it != index_.end()) {
            it->second->second = std::move(value);
            promote(it->second);
            return;
        }
        entries_.emplace_back(key, std::move(value));
        index_.emplace(key, std::prev(entries_.end()));
        evict_to(max_size_);
    }

    // Returns true if the key was present.
    bool remove(const K &key) {
        auto it = index_.find(key);
        if (it == index_.end())
            return false;
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    void set_max_size(size_t max_size) {
        max_size_ = std::max<size_t>(1, max_size);
        evict_to(max_size_);
    }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] size_t max_size() const noexcept { return max_size_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] auto begin() const { return entries_.cbegin(); }
    [[nodiscard]] auto end() const { return entries_.cend(); }
};
