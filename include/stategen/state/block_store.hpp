#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/beacon_block.hpp>
#include <stategen/schema/primitives.hpp>
#include <stategen/state/backend.hpp>
#include <optional>
#include <vector>

namespace stategen::state {

/// Root and slot of a stored block.
struct block_pointer final {
  stategen::schema::slot_t slot{};
  stategen::schema::hash32_t root{};
};

/// Block provider backed by the node's key-value store. Blocks are indexed
/// by root and by (slot, root) so that range and "latest at or below" lookups
/// are single seeks.
class block_store final {
 public:
  block_store(encoder_t& encoder, storage_t& storage);

  /// Persist a block and return its root. Saving the same block twice is a
  /// no-op overwrite.
  common::result<stategen::schema::hash32_t> save_block(
      const stategen::schema::beacon_block_t& block);

  common::result<std::optional<stategen::schema::beacon_block_t>> block(
      const stategen::schema::hash32_t& root) const;

  /// Blocks of the chain ending at `end_root` whose slots lie in
  /// [start_slot, end_slot], in increasing slot order. The walk follows
  /// parent links backwards and stops below `start_slot` or at genesis. An
  /// unknown end root or a missing parent fails with `unknown_root`.
  common::result<std::vector<stategen::schema::beacon_block_t>>
  blocks_in_range(stategen::schema::slot_t start_slot,
                  stategen::schema::slot_t end_slot,
                  const stategen::schema::hash32_t& end_root) const;

  /// The block with the highest slot at or below `slot`. Several blocks at
  /// that slot (a fork) fail with `no_valid_ancestor`.
  common::result<std::optional<block_pointer>> last_saved_block(
      stategen::schema::slot_t slot) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace stategen::state
