#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/beacon_block.hpp>
#include <stategen/schema/beacon_state.hpp>
#include <stategen/schema/primitives.hpp>
#include <stategen/schema/split_info.hpp>
#include <stategen/state/backend.hpp>
#include <stategen/state/block_store.hpp>
#include <stategen/state/checkpoint_index.hpp>
#include <stategen/state/hot_state_cache.hpp>
#include <stategen/state/options.hpp>
#include <stategen/state/replay.hpp>
#include <stategen/state/split_tracker.hpp>
#include <optional>
#include <vector>

namespace stategen::state {

/// Serves the finalized region and moves finalized history into it.
///
/// Cold storage keeps a full state every `slots_per_archived_point` slots, a
/// summary per canonical root and an index of canonical blocks by slot.
/// Anything else is rebuilt by replaying canonical blocks from the closest
/// archived point.
class cold_state_manager final {
 public:
  cold_state_manager(const options& opts,
                     encoder_t& encoder,
                     storage_t& storage,
                     checkpoint_index& index,
                     hot_state_cache& cache,
                     block_store& blocks,
                     const replay_engine& replay,
                     split_tracker& split);

  /// Always records the summary. The canonical block index and archived
  /// points are only written for states whose latest block is an ancestor of
  /// the split root.
  common::result<void> save_cold_state(
      const stategen::schema::hash32_t& root,
      const stategen::schema::beacon_state_t& state);

  common::result<stategen::schema::beacon_state_t> load_cold_state_by_slot(
      stategen::schema::slot_t slot) const;

  common::result<stategen::schema::beacon_state_t> load_cold_state_by_root(
      const stategen::schema::hash32_t& root) const;

  common::result<bool> has_cold_summary(
      const stategen::schema::hash32_t& root) const;

  /// Move everything below `target.slot` from the hot region into the cold
  /// region and advance the split to `target`. All store writes land in a
  /// single batch; on failure neither storage nor memory changes. Targets at
  /// or below the current split are ignored.
  ///
  /// Callers must exclude concurrent saves and loads.
  common::result<void> migrate(const stategen::schema::split_info_t& target);

 private:
  /// Archived point with the highest slot at or below `slot`.
  common::result<std::optional<stategen::schema::beacon_state_t>>
  last_archived_state(stategen::schema::slot_t slot) const;

  /// Canonical block with the highest slot at or below `slot`.
  common::result<std::optional<block_pointer>> last_canonical_block(
      stategen::schema::slot_t slot) const;

  /// True when `state` is the canonical state at its slot: its latest block
  /// lies on the chain ending at the split root and no canonical block
  /// follows it before `state.slot`.
  common::result<bool> is_canonical(
      const stategen::schema::beacon_state_t& state) const;

  /// Full state the migration starts replaying from.
  common::result<stategen::schema::beacon_state_t> migration_start(
      const stategen::schema::split_info_t& current) const;

  const options& options_;
  encoder_t& encoder_;
  storage_t& storage_;
  checkpoint_index& index_;
  hot_state_cache& cache_;
  block_store& blocks_;
  const replay_engine& replay_;
  split_tracker& split_;
};

}  // namespace stategen::state
