#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/beacon_state.hpp>
#include <stategen/schema/primitives.hpp>
#include <stategen/schema/state_summary.hpp>
#include <stategen/state/backend.hpp>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace stategen::state {

/// Hot region bookkeeping: a summary for every saved root and a full state
/// for the roots saved on epoch boundaries.
///
/// Summaries are mirrored in memory (loaded once by `load`) so the common
/// "is this root known" question never touches the store. Full states are
/// only ever read from the store.
class checkpoint_index final {
 public:
  checkpoint_index(encoder_t& encoder, storage_t& storage);

  checkpoint_index(const checkpoint_index&) = delete;
  checkpoint_index& operator=(const checkpoint_index&) = delete;

  /// Populate the in-memory mirror from the persisted summaries.
  common::result<void> load();

  common::result<void> save_summary(
      const stategen::schema::state_summary_t& summary);
  std::optional<stategen::schema::state_summary_t> summary(
      const stategen::schema::hash32_t& root) const;
  bool has_summary(const stategen::schema::hash32_t& root) const;

  /// Summaries with `slot < slot`, in no particular order.
  std::vector<stategen::schema::state_summary_t> summaries_below(
      stategen::schema::slot_t slot) const;

  /// Drop roots from the mirror after their keys were deleted in a batch.
  void forget(const std::vector<stategen::schema::hash32_t>& roots);

  /// Persist a full state plus its slot index entry in one write.
  common::result<void> save_boundary_state(
      const stategen::schema::hash32_t& root,
      const stategen::schema::beacon_state_t& state);
  common::result<bool> has_boundary_state(
      const stategen::schema::hash32_t& root) const;
  common::result<std::optional<stategen::schema::beacon_state_t>>
  boundary_state(const stategen::schema::hash32_t& root) const;

  /// The full state with the highest slot at or below `slot`. Several full
  /// states at that slot fail with `no_valid_ancestor`.
  common::result<std::optional<stategen::schema::beacon_state_t>>
  last_boundary_state(stategen::schema::slot_t slot) const;

  /// Slot and root of every full state with `slot < slot`.
  common::result<std::vector<stategen::schema::state_summary_t>>
  boundary_states_below(stategen::schema::slot_t slot) const;

  /// Stage writes persisting a full state; used by migration batches.
  void stage_boundary_state(const stategen::schema::hash32_t& root,
                            const stategen::schema::beacon_state_t& state,
                            stategen::storage::write_batch_t& batch) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<stategen::schema::hash32_t,
                     stategen::schema::state_summary_t,
                     stategen::schema::hash32_hasher>
      summaries_;
};

}  // namespace stategen::state
