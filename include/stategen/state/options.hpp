#pragma once

#include <stategen/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stategen::state {

/// Tuning of the state generation service.
struct options final {
  /// Full hot states are written on slots divisible by this value.
  uint64_t slots_per_epoch{32};
  /// Spacing of archived points in the cold region.
  uint64_t slots_per_archived_point{2048};
  /// Number of states kept in the hot state cache.
  std::size_t hot_state_cache_size{16};
};

/// Reject configurations the hot/cold scheme cannot work with. On failure
/// `error` names the offending setting.
bool validate(const options& opts, std::string& error);

stategen::schema::epoch_t epoch_of(const options& opts,
                                   stategen::schema::slot_t slot);
bool is_epoch_start(const options& opts, stategen::schema::slot_t slot);
uint64_t archive_index_of(const options& opts, stategen::schema::slot_t slot);

/// Archived point slots in `[from, to)`, ascending.
std::vector<stategen::schema::slot_t> archived_slots_in(
    const options& opts,
    stategen::schema::slot_t from,
    stategen::schema::slot_t to);

}  // namespace stategen::state
