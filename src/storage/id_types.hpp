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

#include <cstdint>
#include <functional>
#include <type_traits>

namespace hopgraph::storage {

#define STORAGE_DEFINE_ID_TYPE(name)                                                                          \
  class name final {                                                                                          \
   private:                                                                                                   \
    explicit name(uint64_t id) : id_(id) {}                                                                   \
                                                                                                              \
   public:                                                                                                    \
    name() = default;                                                                                         \
                                                                                                              \
    static name FromUint(uint64_t id) { return name{id}; }                                                    \
    static name FromInt(int64_t id) { return name{static_cast<uint64_t>(id)}; }                               \
    uint64_t AsUint() const { return id_; }                                                                   \
    int64_t AsInt() const { return static_cast<int64_t>(id_); }                                               \
                                                                                                              \
   private:                                                                                                   \
    uint64_t id_{0};                                                                                          \
  };                                                                                                          \
  static_assert(std::is_trivially_copyable_v<name>, "storage::" #name " must be trivially copyable!");        \
  inline bool operator==(const name &first, const name &second) { return first.AsUint() == second.AsUint(); } \
  inline bool operator!=(const name &first, const name &second) { return first.AsUint() != second.AsUint(); } \
  inline bool operator<(const name &first, const name &second) { return first.AsUint() < second.AsUint(); }   \
  inline bool operator>(const name &first, const name &second) { return first.AsUint() > second.AsUint(); }   \
  inline bool operator<=(const name &first, const name &second) { return first.AsUint() <= second.AsUint(); } \
  inline bool operator>=(const name &first, const name &second) { return first.AsUint() >= second.AsUint(); }

STORAGE_DEFINE_ID_TYPE(Gid);
STORAGE_DEFINE_ID_TYPE(PropertyId);
STORAGE_DEFINE_ID_TYPE(EdgeTypeId);

#undef STORAGE_DEFINE_ID_TYPE

}  // namespace hopgraph::storage

namespace std {

template <>
struct hash<hopgraph::storage::Gid> {
  size_t operator()(const hopgraph::storage::Gid &id) const noexcept { return id.AsUint(); }
};

template <>
struct hash<hopgraph::storage::PropertyId> {
  size_t operator()(const hopgraph::storage::PropertyId &id) const noexcept { return id.AsUint(); }
};

template <>
struct hash<hopgraph::storage::EdgeTypeId> {
  size_t operator()(const hopgraph::storage::EdgeTypeId &id) const noexcept { return id.AsUint(); }
};

}  // namespace std
