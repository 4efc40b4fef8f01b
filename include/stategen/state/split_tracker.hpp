#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/split_info.hpp>
#include <stategen/state/backend.hpp>
#include <shared_mutex>

namespace stategen::state {

/// Owns the hot/cold boundary. The persisted record is only ever written as
/// part of a migration batch; `advance` updates the in-memory copy once that
/// batch is committed.
class split_tracker final {
 public:
  split_tracker(encoder_t& encoder, storage_t& storage);

  split_tracker(const split_tracker&) = delete;
  split_tracker& operator=(const split_tracker&) = delete;

  /// Read the persisted split; a fresh store starts at slot 0 with a zero
  /// root.
  common::result<void> load();

  stategen::schema::split_info_t get() const;

  /// Move the split forward. Returns false and leaves it untouched when
  /// `info.slot` is lower than the current split.
  bool advance(const stategen::schema::split_info_t& info);

  stategen::storage::batch_entry make_batch_entry(
      const stategen::schema::split_info_t& info) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  mutable std::shared_mutex mutex_;
  stategen::schema::split_info_t split_;
};

}  // namespace stategen::state
