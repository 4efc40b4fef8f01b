#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/beacon_state.hpp>
#include <stategen/schema/primitives.hpp>
#include <stategen/state/block_store.hpp>
#include <stategen/state/checkpoint_index.hpp>
#include <stategen/state/hot_state_cache.hpp>
#include <stategen/state/options.hpp>
#include <stategen/state/replay.hpp>
#include <optional>
#include <vector>

namespace stategen::state {

/// Serves the unfinalized region. Full states are written on epoch start
/// slots only; every other root gets a summary and is rebuilt by replaying
/// from the nearest full ancestor.
class hot_state_manager final {
 public:
  hot_state_manager(const options& opts,
                    checkpoint_index& index,
                    hot_state_cache& cache,
                    block_store& blocks,
                    const replay_engine& replay);

  /// Saving a root that is already cached is a no-op.
  common::result<void> save_hot_state(
      const stategen::schema::hash32_t& root,
      const stategen::schema::beacon_state_t& state);

  common::result<stategen::schema::beacon_state_t> load_hot_state_by_root(
      const stategen::schema::hash32_t& root);

  common::result<stategen::schema::beacon_state_t> load_hot_state_by_slot(
      stategen::schema::slot_t slot);

  /// Full state with the highest slot at or below `slot`; `no_valid_ancestor`
  /// when there is none or when it is ambiguous.
  common::result<stategen::schema::beacon_state_t> last_saved_state(
      stategen::schema::slot_t slot) const;

 private:
  /// Walk parent links from `root` to the closest root holding a full state.
  /// Fills `blocks` with the blocks to replay on top of it, oldest first.
  common::result<stategen::schema::beacon_state_t> nearest_full_ancestor(
      const stategen::schema::state_summary_t& summary,
      std::vector<stategen::schema::beacon_block_t>& blocks) const;

  const options& options_;
  checkpoint_index& index_;
  hot_state_cache& cache_;
  block_store& blocks_;
  const replay_engine& replay_;
};

}  // namespace stategen::state
