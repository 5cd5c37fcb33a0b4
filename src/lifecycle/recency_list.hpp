// File: src/lifecycle/recency_list.hpp
#pragma once

#include <unordered_map>
#include <list>
#include <iterator>
#include <vector>
#include <optional>

namespace lrec {

/// Recency-ordered membership list
///
/// Holds unique keys ordered from most recently promoted (front) to least
/// recently promoted (back). Touch, Remove and Contains are O(1).
/// Not thread-safe: each list is written by one frame phase at a time.
///
/// @tparam Key Key type (must be hashable)
template<typename Key>
class RecencyList {
public:
    using const_iterator = typename std::list<Key>::const_iterator;
    using const_reverse_iterator = typename std::list<Key>::const_reverse_iterator;

    /// Insert key at the front, or move it there if already present
    /// @param key Key to touch
    /// @return true if the key was newly inserted
    bool Touch(const Key& key) {
        auto map_it = map_.find(key);
        if (map_it != map_.end()) {
            items_.splice(items_.begin(), items_, map_it->second);
            return false;
        }

        items_.push_front(key);
        map_[key] = items_.begin();
        return true;
    }

    /// Insert key at the back (least recent position) if not present
    /// Used to rebuild an order from oldest to newest without reversal.
    /// @return true if the key was newly inserted
    bool Append(const Key& key) {
        if (map_.count(key) > 0) {
            return false;
        }
        items_.push_back(key);
        map_[key] = std::prev(items_.end());
        return true;
    }

    /// Remove key
    /// @return true if removed, false if not found
    bool Remove(const Key& key) {
        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return false;
        }

        items_.erase(map_it->second);
        map_.erase(map_it);
        return true;
    }

    bool Contains(const Key& key) const {
        return map_.find(key) != map_.end();
    }

    size_t Size() const { return items_.size(); }

    bool Empty() const { return items_.empty(); }

    /// Most recently promoted key
    std::optional<Key> Front() const {
        if (items_.empty()) {
            return std::nullopt;
        }
        return items_.front();
    }

    /// Least recently promoted key
    std::optional<Key> Back() const {
        if (items_.empty()) {
            return std::nullopt;
        }
        return items_.back();
    }

    /// Position of key counted from the front, or nullopt if absent
    std::optional<size_t> IndexOf(const Key& key) const {
        if (!Contains(key)) {
            return std::nullopt;
        }
        size_t index = 0;
        for (const auto& item : items_) {
            if (item == key) {
                return index;
            }
            ++index;
        }
        return std::nullopt;
    }

    void Clear() {
        items_.clear();
        map_.clear();
    }

    /// Snapshot from front (most recent) to back (least recent)
    std::vector<Key> ToVector() const {
        return std::vector<Key>(items_.begin(), items_.end());
    }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    /// Iterate from the tail (least recent) toward the head
    const_reverse_iterator rbegin() const { return items_.rbegin(); }
    const_reverse_iterator rend() const { return items_.rend(); }

private:
    /// Front = most recently promoted, Back = least recently promoted
    std::list<Key> items_;

    /// Key to list position for O(1) splice and erase
    std::unordered_map<Key, typename std::list<Key>::iterator> map_;
};

} // namespace lrec
