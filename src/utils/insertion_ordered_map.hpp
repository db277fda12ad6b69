// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.


#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace hopgraph::utils {

/**
 * Associative container which iterates its entries in the order the keys were
 * first inserted. Lookups are linear, so it is meant for the small maps built
 * by query literals.
 */
template <class TKey, class TValue>
class InsertionOrderedMap final {
 public:
  using key_type = TKey;
  using mapped_type = TValue;
  using value_type = std::pair<TKey, TValue>;
  using iterator = typename std::vector<value_type>::iterator;
  using const_iterator = typename std::vector<value_type>::const_iterator;
  using size_type = std::size_t;

  InsertionOrderedMap() = default;

  /// Duplicate keys keep their first value, like std::map.
  InsertionOrderedMap(std::initializer_list<value_type> entries) {
    entries_.reserve(entries.size());
    for (const auto &entry : entries) emplace(entry.first, entry.second);
  }

  /// Appends a new entry unless `key` is already present, in which case the
  /// existing entry is returned and nothing is constructed.
  template <class TKeyArg, class... TArgs>
  std::pair<iterator, bool> emplace(TKeyArg &&key, TArgs &&...args) {
    if (auto found = find(key); found != entries_.end()) return {found, false};
    entries_.emplace_back(std::piecewise_construct, std::forward_as_tuple(std::forward<TKeyArg>(key)),
                          std::forward_as_tuple(std::forward<TArgs>(args)...));
    return {std::prev(entries_.end()), true};
  }

  template <class TKeyLike>
  iterator find(const TKeyLike &key) {
    return std::find_if(entries_.begin(), entries_.end(), [&key](const auto &entry) { return entry.first == key; });
  }

  template <class TKeyLike>
  const_iterator find(const TKeyLike &key) const {
    return std::find_if(entries_.begin(), entries_.end(), [&key](const auto &entry) { return entry.first == key; });
  }

  template <class TKeyLike>
  bool contains(const TKeyLike &key) const {
    return find(key) != entries_.end();
  }

  template <class TKeyLike>
  TValue &at(const TKeyLike &key) {
    auto found = find(key);
    if (found == entries_.end()) throw std::out_of_range("InsertionOrderedMap::at");
    return found->second;
  }

  template <class TKeyLike>
  const TValue &at(const TKeyLike &key) const {
    auto found = find(key);
    if (found == entries_.end()) throw std::out_of_range("InsertionOrderedMap::at");
    return found->second;
  }

  size_type size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  iterator begin() { return entries_.begin(); }
  iterator end() { return entries_.end(); }
  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::vector<value_type> entries_;
};

}  // namespace hopgraph::utils
