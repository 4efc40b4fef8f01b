#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stategen/common/critical.hpp>
#include <stategen/schema/key/state_keys.hpp>
#include <stategen/state/cold_state_manager.hpp>
#include <stategen/state/transition.hpp>
#include <algorithm>
#include <map>
#include <unordered_set>

using namespace stategen::schema;

namespace stategen::state {

cold_state_manager::cold_state_manager(const options& opts,
                                       encoder_t& encoder,
                                       storage_t& storage,
                                       checkpoint_index& index,
                                       hot_state_cache& cache,
                                       block_store& blocks,
                                       const replay_engine& replay,
                                       split_tracker& split)
    : options_{opts},
      encoder_{encoder},
      storage_{storage},
      index_{index},
      cache_{cache},
      blocks_{blocks},
      replay_{replay},
      split_{split} {}

common::result<void> cold_state_manager::save_cold_state(
    const hash32_t& root,
    const beacon_state_t& state) {
  auto canonical = is_canonical(state);
  if (!canonical) {
    return canonical.error();
  }

  auto batch = stategen::storage::write_batch_t{};
  batch.push_back(
      {key::make_cold_summary_key(root),
       encoder_.encode(state_summary_t{.slot = state.slot, .root = root})});
  if (!canonical.value()) {
    spdlog::debug("Cold state slot={} root={} is not on the canonical chain, "
                  "saving summary only",
                  state.slot, short_hex(root));
    return storage_.write(batch);
  }

  batch.push_back({key::make_cold_block_slot_key(state.latest_block_slot,
                                                 state.latest_block_root),
                   encoder_.encode(state.latest_block_root)});
  if (state.slot % options_.slots_per_archived_point == 0) {
    batch.push_back({key::make_cold_archive_key(
                         archive_index_of(options_, state.slot)),
                     encoder_.encode(state)});
    spdlog::info("Saved archived point slot={} root={}", state.slot,
                 short_hex(root));
  }
  return storage_.write(batch);
}

common::result<bool> cold_state_manager::is_canonical(
    const beacon_state_t& state) const {
  auto split = split_.get();
  if (split.root == make_zero_hash() || state.latest_block_slot > split.slot) {
    return false;
  }

  auto chain = blocks_.blocks_in_range(state.latest_block_slot, split.slot,
                                       split.root);
  if (!chain) {
    if (chain.error().code != state_error_code::unknown_root) {
      return chain.error();
    }
    spdlog::debug("Cannot walk canonical chain below split: {}",
                  describe(chain.error()));
    return false;
  }

  const auto& blocks = chain.value();
  if (blocks.empty() || blocks.front().slot != state.latest_block_slot ||
      block_root(blocks.front()) != state.latest_block_root) {
    return false;
  }
  // The next canonical block must come after the state's slot.
  return blocks.size() == 1 || blocks[1].slot > state.slot;
}

common::result<std::optional<beacon_state_t>>
cold_state_manager::last_archived_state(const slot_t slot) const {
  auto prefix = key::make_prefix(key::kColdArchivePrefix);
  auto upper = key::make_cold_archive_key(archive_index_of(options_, slot));
  auto last = storage_.last_by_prefix(make_bytes_view(prefix),
                                      make_bytes_view(upper));
  if (!last) {
    return last.error();
  }
  if (!last.value()) {
    return std::optional<beacon_state_t>{};
  }
  auto index = key::parse_index_key(key::kColdArchivePrefix,
                                    make_bytes_view(last.value()->first));
  auto decoded = encoder_.try_decode<beacon_state_t>(
      make_bytes_view(last.value()->second));
  if (!index || !decoded) {
    return make_state_error(state_error_code::store_io, slot, make_zero_hash(),
                            "undecodable archived state");
  }
  if (archive_index_of(options_, decoded->slot) != *index) {
    return make_state_error(
        state_error_code::store_io, slot, make_zero_hash(),
        fmt::format("archived point {} holds a state at slot {}", *index,
                    decoded->slot));
  }
  return decoded;
}

common::result<std::optional<block_pointer>>
cold_state_manager::last_canonical_block(const slot_t slot) const {
  auto prefix = key::make_prefix(key::kColdBlockSlotPrefix);
  auto upper = key::make_slot_upper_bound(key::kColdBlockSlotPrefix, slot);
  auto last = storage_.last_by_prefix(make_bytes_view(prefix),
                                      make_bytes_view(upper));
  if (!last) {
    return last.error();
  }
  if (!last.value()) {
    return std::optional<block_pointer>{};
  }
  auto parsed = key::parse_slot_root_key(
      key::kColdBlockSlotPrefix, make_bytes_view(last.value()->first));
  if (!parsed) {
    return make_state_error(state_error_code::store_io, slot, make_zero_hash(),
                            "malformed canonical block key");
  }
  return std::optional<block_pointer>{
      block_pointer{.slot = parsed->first, .root = parsed->second}};
}

common::result<beacon_state_t> cold_state_manager::load_cold_state_by_slot(
    const slot_t slot) const {
  auto archived = last_archived_state(slot);
  if (!archived) {
    return archived.error();
  }
  if (!archived.value()) {
    return make_state_error(state_error_code::unknown_slot, slot,
                            make_zero_hash(),
                            "no archived point at or below slot");
  }
  const auto& start = *archived.value();

  auto last_block = last_canonical_block(slot);
  if (!last_block) {
    return last_block.error();
  }

  auto blocks = std::vector<beacon_block_t>{};
  if (last_block.value() && last_block.value()->slot > start.slot) {
    auto range = blocks_.blocks_in_range(
        start.slot + 1, last_block.value()->slot, last_block.value()->root);
    if (!range) {
      return range.error();
    }
    blocks = std::move(range.value());
  }
  spdlog::debug("Rebuilding cold state slot={} from archived point slot={}",
                slot, start.slot);
  return replay_.replay_blocks(start, blocks, slot);
}

common::result<beacon_state_t> cold_state_manager::load_cold_state_by_root(
    const hash32_t& root) const {
  auto key = key::make_cold_summary_key(root);
  auto summary = storage_.get<state_summary_t>(encoder_, make_bytes_view(key));
  if (!summary) {
    return summary.error();
  }
  if (!summary.value()) {
    return make_state_error(state_error_code::unknown_checkpoint, 0, root,
                            "no cold state summary for root");
  }
  const auto slot = summary.value()->slot;

  // Follow the root's own ancestry back to an archived point on it, stepping
  // to earlier archived points while the root branched off before them.
  auto upper = slot;
  while (true) {
    auto archived = last_archived_state(upper);
    if (!archived) {
      return archived.error();
    }
    if (!archived.value()) {
      if (upper == slot) {
        return make_state_error(state_error_code::unknown_slot, slot, root,
                                "no archived point at or below slot");
      }
      return make_state_error(state_error_code::discontinuous_chain, slot,
                              root, "root descends from no archived point");
    }
    const auto& start = *archived.value();

    auto blocks = std::vector<beacon_block_t>{};
    auto descends = root == start.latest_block_root;
    if (!descends) {
      auto range = blocks_.blocks_in_range(start.slot + 1, slot, root);
      if (!range) {
        return range.error();
      }
      descends = !range.value().empty() &&
                 range.value().front().parent_root == start.latest_block_root;
      blocks = std::move(range.value());
    }
    if (descends) {
      spdlog::debug("Rebuilding cold state root={} from archived point slot={}",
                    short_hex(root), start.slot);
      return replay_.replay_blocks(start, blocks, slot);
    }
    if (start.slot == 0) {
      return make_state_error(state_error_code::discontinuous_chain, slot,
                              root, "root descends from no archived point");
    }
    upper = start.slot - 1;
  }
}

common::result<bool> cold_state_manager::has_cold_summary(
    const hash32_t& root) const {
  auto key = key::make_cold_summary_key(root);
  return storage_.contains(make_bytes_view(key));
}

common::result<beacon_state_t> cold_state_manager::migration_start(
    const split_info_t& current) const {
  if (current.root == make_zero_hash()) {
    auto last = index_.last_boundary_state(current.slot);
    if (!last) {
      return last.error();
    }
    if (!last.value()) {
      return make_state_error(state_error_code::no_valid_ancestor,
                              current.slot, current.root,
                              "no full hot state to migrate from");
    }
    return std::move(*last.value());
  }

  auto anchor = index_.boundary_state(current.root);
  if (!anchor) {
    return anchor.error();
  }
  if (!anchor.value()) {
    return make_state_error(state_error_code::no_valid_ancestor, current.slot,
                            current.root, "split root has no full hot state");
  }
  return std::move(*anchor.value());
}

common::result<void> cold_state_manager::migrate(const split_info_t& target) {
  auto current = split_.get();
  if (target.slot <= current.slot) {
    spdlog::debug("Ignoring migration to slot={}, split already at slot={}",
                  target.slot, current.slot);
    return common::success();
  }

  auto start = migration_start(current);
  if (!start) {
    return start.error();
  }

  auto anchor_block = blocks_.block(target.root);
  if (!anchor_block) {
    return anchor_block.error();
  }
  if (!anchor_block.value()) {
    return make_state_error(state_error_code::unknown_root, target.slot,
                            target.root, "split root block is not stored");
  }
  auto anchor_block_slot = anchor_block.value()->slot;
  if (anchor_block_slot > target.slot) {
    return make_state_error(
        state_error_code::discontinuous_chain, target.slot, target.root,
        fmt::format("split root block is at slot {}", anchor_block_slot));
  }
  auto anchor_summary = index_.summary(target.root);
  auto anchor_slot =
      anchor_summary ? anchor_summary->slot : anchor_block_slot;

  // Canonical chain from the start state up to the new split root.
  auto chain = std::vector<beacon_block_t>{};
  if (anchor_block_slot > start.value().slot) {
    auto range = blocks_.blocks_in_range(start.value().slot + 1,
                                         anchor_block_slot, target.root);
    if (!range) {
      return range.error();
    }
    chain = std::move(range.value());
  } else if (target.root != start.value().latest_block_root) {
    return make_state_error(state_error_code::discontinuous_chain, target.slot,
                            target.root,
                            "split root does not descend from current split");
  }

  auto archive_slots = archived_slots_in(options_, current.slot, target.slot);

  auto anchored = index_.has_boundary_state(target.root);
  if (!anchored) {
    return anchored.error();
  }

  auto targets = archive_slots;
  if (!anchored.value()) {
    targets.push_back(anchor_slot);
  }
  std::ranges::sort(targets);
  targets.erase(std::unique(std::begin(targets), std::end(targets)),
                std::end(targets));

  // Replay forward once, stopping at every slot that needs a full state.
  auto rebuilt = std::map<slot_t, beacon_state_t>{};
  auto cursor = start.value();
  auto next_block = std::size_t{0};
  for (const auto slot : targets) {
    auto segment = std::vector<beacon_block_t>{};
    while (next_block < chain.size() && chain[next_block].slot <= slot) {
      segment.push_back(chain[next_block++]);
    }
    auto replayed = replay_.replay_blocks(cursor, segment, slot);
    if (!replayed) {
      return replayed.error();
    }
    cursor = replayed.value();
    rebuilt.emplace(slot, std::move(replayed.value()));
  }

  auto batch = stategen::storage::write_batch_t{};
  for (const auto slot : archive_slots) {
    batch.push_back({key::make_cold_archive_key(archive_index_of(options_, slot)),
                     encoder_.encode(rebuilt.at(slot))});
  }

  auto canonical = std::unordered_set<hash32_t, hash32_hasher>{};
  auto add_canonical = [&](const slot_t slot, const hash32_t& root) {
    canonical.insert(root);
    batch.push_back(
        {key::make_cold_block_slot_key(slot, root), encoder_.encode(root)});
  };
  add_canonical(start.value().latest_block_slot,
                start.value().latest_block_root);
  for (const auto& block : chain) {
    add_canonical(block.slot, block_root(block));
  }

  if (!anchored.value()) {
    index_.stage_boundary_state(target.root, rebuilt.at(anchor_slot), batch);
  }

  auto forgotten = std::vector<hash32_t>{};
  auto pruned = std::size_t{0};
  for (const auto& summary : index_.summaries_below(target.slot)) {
    batch.push_back({key::make_hot_summary_key(summary.root), std::nullopt});
    if (canonical.contains(summary.root)) {
      batch.push_back(
          {key::make_cold_summary_key(summary.root), encoder_.encode(summary)});
    } else {
      ++pruned;
    }
    forgotten.push_back(summary.root);
  }

  auto full_states = index_.boundary_states_below(target.slot);
  if (!full_states) {
    return full_states.error();
  }
  for (const auto& full : full_states.value()) {
    if (full.root == target.root) {
      continue;
    }
    batch.push_back({key::make_hot_state_key(full.root), std::nullopt});
    batch.push_back(
        {key::make_hot_state_slot_key(full.slot, full.root), std::nullopt});
  }

  batch.push_back(split_.make_batch_entry(target));

  auto written = storage_.write(batch);
  if (!written) {
    spdlog::error("Migration to slot={} failed, nothing was changed: {}",
                  target.slot, describe(written.error()));
    return written.error();
  }

  index_.forget(forgotten);
  auto evicted = cache_.remove_below(target.slot);
  if (!split_.advance(target)) {
    stategen::common::critical(
        fmt::format("split moved past slot={} during migration", target.slot));
  }
  spdlog::info(
      "Migrated to cold storage split slot={} root={} archived={} "
      "summaries={} pruned={} evicted={}",
      target.slot, short_hex(target.root), archive_slots.size(),
      forgotten.size() - pruned, pruned, evicted);
  return common::success();
}

}  // namespace stategen::state
