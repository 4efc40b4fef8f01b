#pragma once

#include <stategen/schema/beacon_state.hpp>
#include <stategen/schema/primitives.hpp>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stategen::state {

/// Bounded LRU map from block root to state.
///
/// Values move in on `put` and copy out on `get`; callers never hold a
/// reference into the cache, so mutating a returned state cannot corrupt a
/// cached one. Losing an entry is always safe: it can be rebuilt by replay.
class hot_state_cache final {
 public:
  explicit hot_state_cache(std::size_t capacity);

  hot_state_cache(const hot_state_cache&) = delete;
  hot_state_cache& operator=(const hot_state_cache&) = delete;

  bool has(const stategen::schema::hash32_t& root) const;

  /// Owned copy of the cached state; marks the entry most recently used.
  std::optional<stategen::schema::beacon_state_t> get(
      const stategen::schema::hash32_t& root);

  /// Insert or replace; evicts the least recently used entry when full.
  void put(const stategen::schema::hash32_t& root,
           stategen::schema::beacon_state_t state);

  /// Drop the given roots; unknown roots are ignored.
  void clear(const std::vector<stategen::schema::hash32_t>& roots);

  /// Drop every entry whose state slot is below `slot`. Returns the number
  /// of entries removed.
  std::size_t remove_below(stategen::schema::slot_t slot);

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

 private:
  using entry_t = std::pair<stategen::schema::hash32_t,
                            stategen::schema::beacon_state_t>;
  using list_iterator_t = std::list<entry_t>::iterator;

  mutable std::mutex mutex_;
  std::list<entry_t> entries_;
  std::unordered_map<stategen::schema::hash32_t,
                     list_iterator_t,
                     stategen::schema::hash32_hasher>
      index_;
  std::size_t capacity_;
};

}  // namespace stategen::state
