#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata {

// Insertion-ordered map. Re-assigning an existing key keeps its position,
// so merged dependency tables list packages in the order they were declared.
template<typename K, typename V, typename Hash = std::hash<K>>
class IndexMap {
public:
    using value_type = std::pair<K, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    IndexMap() = default;
    IndexMap(std::initializer_list<value_type> init) {
        for (const auto& kv : init) insert_or_assign(kv.first, kv.second);
    }

    void insert_or_assign(K key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::move(key), std::move(value));
    }

    // Returns false (and leaves the map untouched) if the key exists
    bool insert(K key, V value) {
        if (index_.count(key)) return false;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::move(key), std::move(value));
        return true;
    }

    // Later entries of `other` overwrite ours
    void extend(const IndexMap& other) {
        for (const auto& kv : other.entries_) insert_or_assign(kv.first, kv.second);
    }

    bool erase(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        size_t pos = it->second;
        index_.erase(it);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
        for (auto& slot : index_) {
            if (slot.second > pos) --slot.second;
        }
        return true;
    }

    const V* find(const K& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    V* find_mut(const K& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    bool contains(const K& key) const { return index_.count(key) != 0; }
    const V& at(const K& key) const { return entries_.at(index_.at(key)).second; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); index_.clear(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const IndexMap& o) const { return entries_ == o.entries_; }
    bool operator!=(const IndexMap& o) const { return !(*this == o); }

private:
    std::vector<value_type> entries_;
    std::unordered_map<K, size_t, Hash> index_;
};

} // namespace strata
