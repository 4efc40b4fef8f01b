#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stategen/common/critical.hpp>
#include <stategen/state/replay.hpp>
#include <utility>

using namespace stategen::schema;

namespace stategen::state {

replay_engine::replay_engine(transition_function_t transition)
    : transition_{std::move(transition)} {
  if (!transition_) {
    stategen::common::critical("replay engine requires a transition function");
  }
}

common::result<void> replay_engine::check_chain(
    const beacon_state_t& start,
    const std::vector<beacon_block_t>& blocks,
    const slot_t target_slot) const {
  auto previous_root = start.latest_block_root;
  auto previous_slot = start.slot;
  for (const auto& block : blocks) {
    auto root = block_root(block);
    if (block.slot <= previous_slot) {
      return make_state_error(
          state_error_code::discontinuous_chain, block.slot, root,
          fmt::format("block slot not above previous slot {}", previous_slot));
    }
    if (block.parent_root != previous_root) {
      return make_state_error(
          state_error_code::discontinuous_chain, block.slot, root,
          fmt::format("parent {} is not the previous block {}",
                      short_hex(block.parent_root), short_hex(previous_root)));
    }
    previous_root = root;
    previous_slot = block.slot;
  }
  if (target_slot < previous_slot) {
    return make_state_error(
        state_error_code::discontinuous_chain, target_slot, previous_root,
        fmt::format("target slot below replayed slot {}", previous_slot));
  }
  return common::success();
}

common::result<beacon_state_t> replay_engine::replay_blocks(
    const beacon_state_t& start,
    const std::vector<beacon_block_t>& blocks,
    const slot_t target_slot) const {
  auto checked = check_chain(start, blocks, target_slot);
  if (!checked) {
    spdlog::warn("Refusing replay from slot {}: {}", start.slot,
                 describe(checked.error()));
    return checked.error();
  }

  auto state = start;
  for (const auto& block : blocks) {
    auto advanced = process_slots(std::move(state), block.slot);
    if (!advanced) {
      return advanced.error();
    }
    auto applied = transition_(std::move(advanced.value()), block);
    if (!applied) {
      spdlog::warn("Transition failed during replay: {}",
                   describe(applied.error()));
      return applied.error();
    }
    state = std::move(applied.value());
  }

  auto finished = process_slots(std::move(state), target_slot);
  if (!finished) {
    return finished.error();
  }
  spdlog::debug("Replayed {} block(s) from slot {} to slot {}", blocks.size(),
                start.slot, target_slot);
  return finished;
}

}  // namespace stategen::state
