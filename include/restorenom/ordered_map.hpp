#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace restorenom {

// String-keyed map that iterates in first-insertion order.
// insert() keeps the first value for a key; insert_or_assign() replaces the
// value in place without moving the key.
template<typename V>
class OrderedMap {
public:
    using value_type = std::pair<std::string, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<value_type> entries) {
        for (const auto& e : entries) insert(e.first, e.second);
    }

    // Returns false (and leaves the map untouched) if the key already exists
    bool insert(std::string key, V value) {
        if (index_.count(key)) return false;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::move(key), std::move(value));
        return true;
    }

    void insert_or_assign(std::string key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return;
        }
        insert(std::move(key), std::move(value));
    }

    // nullptr if not found
    const V* find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    std::optional<V> try_get(const std::string& key) const {
        if (const V* v = find(key)) return *v;
        return std::nullopt;
    }

    bool contains(const std::string& key) const { return index_.count(key) != 0; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const value_type& at(std::size_t pos) const { return entries_.at(pos); }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.first);
        return out;
    }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Order-sensitive
    bool operator==(const OrderedMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const OrderedMap& other) const { return !(*this == other); }

private:
    std::vector<value_type> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

using PropertyBag = OrderedMap<std::string>;

} // namespace restorenom
