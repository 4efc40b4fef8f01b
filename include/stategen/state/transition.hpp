#pragma once

#include <stategen/common/result.hpp>
#include <stategen/schema/beacon_block.hpp>
#include <stategen/schema/beacon_state.hpp>
#include <stategen/schema/primitives.hpp>
#include <functional>

namespace stategen::state {

/// Applies one block to a state positioned at the block's slot. Must be pure:
/// the same inputs always produce the same output. Malformed input fails with
/// `invalid_transition`.
using transition_function_t =
    std::function<common::result<stategen::schema::beacon_state_t>(
        stategen::schema::beacon_state_t state,
        const stategen::schema::beacon_block_t& block)>;

/// Reward credited to a block proposer by `apply_block`.
inline constexpr stategen::schema::gwei_t kProposerReward = 32;

/// BLAKE3 over the SCALE encoding of the block.
stategen::schema::hash32_t block_root(
    const stategen::schema::beacon_block_t& block);

/// Empty transition: moves the slot counter forward and nothing else.
common::result<stategen::schema::beacon_state_t> process_slots(
    stategen::schema::beacon_state_t state,
    stategen::schema::slot_t slot);

/// Default block transition used by the node.
common::result<stategen::schema::beacon_state_t> apply_block(
    stategen::schema::beacon_state_t state,
    const stategen::schema::beacon_block_t& block);

struct genesis final {
  stategen::schema::beacon_block_t block;
  stategen::schema::hash32_t root;
  stategen::schema::beacon_state_t state;
};

/// Genesis block (slot 0, zero parent) and the matching slot 0 state.
genesis make_genesis(uint64_t validator_count,
                     stategen::schema::gwei_t initial_balance,
                     uint64_t genesis_time);

}  // namespace stategen::state
