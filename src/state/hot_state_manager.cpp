#include <spdlog/spdlog.h>
#include <stategen/state/hot_state_manager.hpp>
#include <stategen/state/transition.hpp>
#include <algorithm>

using namespace stategen::schema;

namespace stategen::state {

hot_state_manager::hot_state_manager(const options& opts,
                                     checkpoint_index& index,
                                     hot_state_cache& cache,
                                     block_store& blocks,
                                     const replay_engine& replay)
    : options_{opts},
      index_{index},
      cache_{cache},
      blocks_{blocks},
      replay_{replay} {}

common::result<void> hot_state_manager::save_hot_state(
    const hash32_t& root,
    const beacon_state_t& state) {
  if (cache_.has(root)) {
    spdlog::debug("Hot state slot={} root={} already cached", state.slot,
                  short_hex(root));
    return common::success();
  }

  if (is_epoch_start(options_, state.slot)) {
    auto saved = index_.save_boundary_state(root, state);
    if (!saved) {
      return saved.error();
    }
    spdlog::info("Saved full state on epoch boundary epoch={} slot={} root={}",
                 epoch_of(options_, state.slot), state.slot, short_hex(root));
  }

  auto summarized =
      index_.save_summary(state_summary_t{.slot = state.slot, .root = root});
  if (!summarized) {
    return summarized.error();
  }
  cache_.put(root, state);
  return common::success();
}

common::result<beacon_state_t> hot_state_manager::nearest_full_ancestor(
    const state_summary_t& summary,
    std::vector<beacon_block_t>& blocks) const {
  auto cursor = summary.root;
  while (true) {
    auto full = index_.boundary_state(cursor);
    if (!full) {
      return full.error();
    }
    // A full state is only usable if it precedes every collected block.
    if (full.value() &&
        (blocks.empty() || full.value()->slot < blocks.back().slot)) {
      std::ranges::reverse(blocks);
      return std::move(*full.value());
    }

    auto block = blocks_.block(cursor);
    if (!block) {
      return block.error();
    }
    if (!block.value()) {
      return make_state_error(state_error_code::no_valid_ancestor,
                              summary.slot, summary.root,
                              "ancestor block missing before a full state");
    }
    auto parent = block.value()->parent_root;
    blocks.push_back(std::move(*block.value()));
    if (parent == make_zero_hash()) {
      return make_state_error(state_error_code::no_valid_ancestor,
                              summary.slot, summary.root,
                              "reached genesis without a full state");
    }
    cursor = parent;
  }
}

common::result<beacon_state_t> hot_state_manager::load_hot_state_by_root(
    const hash32_t& root) {
  if (auto cached = cache_.get(root)) {
    return std::move(*cached);
  }

  auto summary = index_.summary(root);
  if (!summary) {
    return make_state_error(state_error_code::unknown_checkpoint, 0, root,
                            "no hot state summary for root");
  }

  auto blocks = std::vector<beacon_block_t>{};
  auto start = nearest_full_ancestor(*summary, blocks);
  if (!start) {
    return start.error();
  }

  auto state = beacon_state_t{};
  if (blocks.empty() && start.value().slot == summary->slot) {
    state = std::move(start.value());
  } else {
    spdlog::debug("Replaying {} block(s) from slot={} for root={} slot={}",
                  blocks.size(), start.value().slot, short_hex(root),
                  summary->slot);
    auto replayed = replay_.replay_blocks(start.value(), blocks, summary->slot);
    if (!replayed) {
      return replayed.error();
    }
    state = std::move(replayed.value());
  }

  cache_.put(root, state);
  return state;
}

common::result<beacon_state_t> hot_state_manager::last_saved_state(
    const slot_t slot) const {
  auto last = index_.last_boundary_state(slot);
  if (!last) {
    return last.error();
  }
  if (!last.value()) {
    return make_state_error(state_error_code::no_valid_ancestor, slot,
                            make_zero_hash(),
                            "no full hot state at or below slot");
  }
  return std::move(*last.value());
}

common::result<beacon_state_t> hot_state_manager::load_hot_state_by_slot(
    const slot_t slot) {
  auto start = last_saved_state(slot);
  if (!start) {
    return start.error();
  }

  auto last_block = blocks_.last_saved_block(slot);
  if (!last_block) {
    return last_block.error();
  }

  auto blocks = std::vector<beacon_block_t>{};
  if (last_block.value() && last_block.value()->slot > start.value().slot) {
    auto range = blocks_.blocks_in_range(start.value().slot + 1,
                                         last_block.value()->slot,
                                         last_block.value()->root);
    if (!range) {
      return range.error();
    }
    blocks = std::move(range.value());
  }
  return replay_.replay_blocks(start.value(), blocks, slot);
}

}  // namespace stategen::state
