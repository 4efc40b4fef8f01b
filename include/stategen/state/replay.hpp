#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/beacon_block.hpp>
#include <stategen/schema/beacon_state.hpp>
#include <stategen/state/transition.hpp>
#include <vector>

namespace stategen::state {

/// Rebuilds a state by applying an ordered block list to an ancestor state.
///
/// The block list is validated in full before the first transition runs, so a
/// discontinuous chain never produces a partially advanced state. The engine
/// holds no mutable state of its own.
class replay_engine final {
 public:
  explicit replay_engine(transition_function_t transition);

  /// Apply `blocks` (strictly increasing slots, each the child of the
  /// previous one, the first the child of `start`) and advance empty slots up
  /// to `target_slot`.
  ///
  /// Fails with `discontinuous_chain` when the list does not descend from
  /// `start` or `target_slot` lies below the last block; transition failures
  /// are returned unchanged.
  common::result<stategen::schema::beacon_state_t> replay_blocks(
      const stategen::schema::beacon_state_t& start,
      const std::vector<stategen::schema::beacon_block_t>& blocks,
      stategen::schema::slot_t target_slot) const;

 private:
  common::result<void> check_chain(
      const stategen::schema::beacon_state_t& start,
      const std::vector<stategen::schema::beacon_block_t>& blocks,
      stategen::schema::slot_t target_slot) const;

  transition_function_t transition_;
};

}  // namespace stategen::state
