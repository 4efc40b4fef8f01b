#include <spdlog/fmt/fmt.h>
#include <stategen/blake3/hash.hpp>
#include <stategen/state/backend.hpp>
#include <stategen/state/transition.hpp>

using namespace stategen::schema;

namespace stategen::state {

namespace {

hash32_t fold_accumulator(const hash32_t& accumulator,
                          const hash32_t& root,
                          const slot_t slot) {
  return stategen::blake3::hasher{}
      .update(make_bytes_view(accumulator))
      .update(make_bytes_view(root))
      .update(slot)
      .finalize();
}

}  // namespace

hash32_t block_root(const beacon_block_t& block) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(block);
  return stategen::blake3::hash(make_bytes_view(encoded));
}

common::result<beacon_state_t> process_slots(beacon_state_t state,
                                             const slot_t slot) {
  if (slot < state.slot) {
    return make_state_error(
        state_error_code::invalid_transition, slot, state.latest_block_root,
        fmt::format("cannot process slots backwards from {}", state.slot));
  }
  state.slot = slot;
  return state;
}

common::result<beacon_state_t> apply_block(beacon_state_t state,
                                           const beacon_block_t& block) {
  auto root = block_root(block);
  if (block.slot != state.slot) {
    return make_state_error(
        state_error_code::invalid_transition, block.slot, root,
        fmt::format("block slot does not match state slot {}", state.slot));
  }
  if (block.parent_root != state.latest_block_root) {
    return make_state_error(state_error_code::invalid_transition, block.slot,
                            root, "parent root does not match latest block");
  }
  if (block.proposer_index >= state.balances.size()) {
    return make_state_error(
        state_error_code::invalid_transition, block.slot, root,
        fmt::format("proposer index {} out of range", block.proposer_index));
  }

  state.balances[block.proposer_index] += kProposerReward;
  state.accumulator = fold_accumulator(state.accumulator, root, block.slot);
  state.latest_block_root = root;
  state.latest_block_slot = block.slot;
  ++state.block_count;
  return state;
}

genesis make_genesis(const uint64_t validator_count,
                     const gwei_t initial_balance,
                     const uint64_t genesis_time) {
  auto result = genesis{};
  result.block.slot = 0;
  result.block.parent_root = make_zero_hash();
  result.root = block_root(result.block);

  result.state.slot = 0;
  result.state.genesis_time = genesis_time;
  result.state.latest_block_root = result.root;
  result.state.latest_block_slot = 0;
  result.state.balances.assign(validator_count, initial_balance);
  return result;
}

}  // namespace stategen::state
