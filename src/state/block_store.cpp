#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stategen/schema/key/builder.hpp>
#include <stategen/schema/key/state_keys.hpp>
#include <stategen/state/block_store.hpp>
#include <stategen/state/transition.hpp>
#include <algorithm>

using namespace stategen::schema;

namespace stategen::state {

block_store::block_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

common::result<hash32_t> block_store::save_block(const beacon_block_t& block) {
  auto root = block_root(block);
  auto batch = stategen::storage::write_batch_t{};
  batch.push_back({key::make_block_key(root), encoder_.encode(block)});
  batch.push_back({key::make_block_slot_key(block.slot, root),
                   encoder_.encode(root)});
  auto written = storage_.write(batch);
  if (!written) {
    return written.error();
  }
  spdlog::debug("Saved block slot={} root={}", block.slot, short_hex(root));
  return root;
}

common::result<std::optional<beacon_block_t>> block_store::block(
    const hash32_t& root) const {
  auto key = key::make_block_key(root);
  return storage_.get<beacon_block_t>(encoder_, make_bytes_view(key));
}

common::result<std::vector<beacon_block_t>> block_store::blocks_in_range(
    const slot_t start_slot,
    const slot_t end_slot,
    const hash32_t& end_root) const {
  auto blocks = std::vector<beacon_block_t>{};
  auto cursor = end_root;
  auto first = true;
  while (true) {
    auto loaded = block(cursor);
    if (!loaded) {
      return loaded.error();
    }
    if (!loaded.value()) {
      return make_state_error(
          state_error_code::unknown_root, end_slot, cursor,
          first ? "end block is not stored" : "missing parent inside range");
    }
    first = false;

    auto current = std::move(*loaded.value());
    if (current.slot < start_slot) {
      break;
    }
    auto parent = current.parent_root;
    auto at_start = current.slot == start_slot;
    if (current.slot <= end_slot) {
      blocks.push_back(std::move(current));
    }
    if (at_start || parent == make_zero_hash()) {
      break;
    }
    cursor = parent;
  }
  std::ranges::reverse(blocks);
  return blocks;
}

common::result<std::optional<block_pointer>> block_store::last_saved_block(
    const slot_t slot) const {
  auto prefix = key::make_prefix(key::kBlockSlotPrefix);
  auto upper = key::make_slot_upper_bound(key::kBlockSlotPrefix, slot);
  auto last = storage_.last_by_prefix(make_bytes_view(prefix),
                                      make_bytes_view(upper));
  if (!last) {
    return last.error();
  }
  if (!last.value()) {
    return std::optional<block_pointer>{};
  }
  auto parsed = key::parse_slot_root_key(
      key::kBlockSlotPrefix, make_bytes_view(last.value()->first));
  if (!parsed) {
    return make_state_error(state_error_code::store_io, slot,
                            make_zero_hash(), "malformed block slot key");
  }

  auto same_slot = key::builder{}
                       .write(key::kBlockSlotPrefix)
                       .write_big_endian(parsed->first)
                       .data;
  auto candidates = storage_.list_by_prefix(make_bytes_view(same_slot));
  if (!candidates) {
    return candidates.error();
  }
  if (candidates.value().size() != 1) {
    return make_state_error(
        state_error_code::no_valid_ancestor, parsed->first, parsed->second,
        fmt::format("{} blocks at highest slot, expected exactly one",
                    candidates.value().size()));
  }
  return std::optional<block_pointer>{
      block_pointer{.slot = parsed->first, .root = parsed->second}};
}

}  // namespace stategen::state
