#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/beacon_state.hpp>
#include <stategen/schema/primitives.hpp>
#include <stategen/schema/split_info.hpp>
#include <stategen/state/checkpoint_index.hpp>
#include <stategen/state/cold_state_manager.hpp>
#include <stategen/state/hot_state_cache.hpp>
#include <stategen/state/hot_state_manager.hpp>
#include <stategen/state/split_tracker.hpp>
#include <shared_mutex>

namespace stategen::state {

/// Entry point of state generation. Routes every request to the hot or the
/// cold region according to the split.
///
/// Saves and loads may run concurrently with each other; `migrate_to_cold`
/// waits for them and blocks new ones until the split has moved.
class state_gen final {
 public:
  /// Loads the persisted split and the hot summaries. A store that cannot be
  /// read at startup is fatal.
  state_gen(hot_state_manager& hot,
            cold_state_manager& cold,
            split_tracker& split,
            checkpoint_index& index,
            hot_state_cache& cache);

  state_gen(const state_gen&) = delete;
  state_gen& operator=(const state_gen&) = delete;

  common::result<void> save_state(
      const stategen::schema::hash32_t& root,
      const stategen::schema::beacon_state_t& state);

  common::result<stategen::schema::beacon_state_t> state_by_root(
      const stategen::schema::hash32_t& root);

  common::result<stategen::schema::beacon_state_t> state_by_slot(
      stategen::schema::slot_t slot);

  common::result<void> migrate_to_cold(stategen::schema::slot_t slot,
                                       const stategen::schema::hash32_t& root);

  stategen::schema::split_info_t split() const;

  common::result<bool> has_state(const stategen::schema::hash32_t& root) const;

 private:
  hot_state_manager& hot_;
  cold_state_manager& cold_;
  split_tracker& split_;
  checkpoint_index& index_;
  hot_state_cache& cache_;
  mutable std::shared_mutex migration_mutex_;
};

}  // namespace stategen::state
