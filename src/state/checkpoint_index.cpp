#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stategen/schema/key/builder.hpp>
#include <stategen/schema/key/state_keys.hpp>
#include <stategen/state/checkpoint_index.hpp>
#include <mutex>

using namespace stategen::schema;

namespace stategen::state {

checkpoint_index::checkpoint_index(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

common::result<void> checkpoint_index::load() {
  auto prefix = key::make_prefix(key::kHotSummaryPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  if (!rows) {
    return rows.error();
  }

  auto loaded = decltype(summaries_){};
  for (const auto& [raw_key, raw_value] : rows.value()) {
    auto decoded =
        encoder_.try_decode<state_summary_t>(make_bytes_view(raw_value));
    if (!decoded) {
      return make_state_error(state_error_code::store_io, 0, make_zero_hash(),
                              "undecodable hot state summary");
    }
    loaded.emplace(decoded->root, *decoded);
  }

  auto lock = std::unique_lock{mutex_};
  summaries_ = std::move(loaded);
  spdlog::info("Loaded {} hot state summaries", summaries_.size());
  return common::success();
}

common::result<void> checkpoint_index::save_summary(
    const state_summary_t& summary) {
  auto key = key::make_hot_summary_key(summary.root);
  auto written = storage_.put(encoder_, make_bytes_view(key), summary);
  if (!written) {
    return written.error();
  }
  auto lock = std::unique_lock{mutex_};
  summaries_.insert_or_assign(summary.root, summary);
  return common::success();
}

std::optional<state_summary_t> checkpoint_index::summary(
    const hash32_t& root) const {
  auto lock = std::shared_lock{mutex_};
  auto found = summaries_.find(root);
  if (found == std::end(summaries_)) {
    return std::nullopt;
  }
  return found->second;
}

bool checkpoint_index::has_summary(const hash32_t& root) const {
  auto lock = std::shared_lock{mutex_};
  return summaries_.contains(root);
}

std::vector<state_summary_t> checkpoint_index::summaries_below(
    const slot_t slot) const {
  auto lock = std::shared_lock{mutex_};
  auto below = std::vector<state_summary_t>{};
  for (const auto& [root, summary] : summaries_) {
    if (summary.slot < slot) {
      below.push_back(summary);
    }
  }
  return below;
}

void checkpoint_index::forget(const std::vector<hash32_t>& roots) {
  auto lock = std::unique_lock{mutex_};
  for (const auto& root : roots) {
    summaries_.erase(root);
  }
}

void checkpoint_index::stage_boundary_state(
    const hash32_t& root,
    const beacon_state_t& state,
    stategen::storage::write_batch_t& batch) const {
  batch.push_back({key::make_hot_state_key(root), encoder_.encode(state)});
  batch.push_back({key::make_hot_state_slot_key(state.slot, root),
                   encoder_.encode(root)});
}

common::result<void> checkpoint_index::save_boundary_state(
    const hash32_t& root,
    const beacon_state_t& state) {
  auto batch = stategen::storage::write_batch_t{};
  stage_boundary_state(root, state, batch);
  return storage_.write(batch);
}

common::result<bool> checkpoint_index::has_boundary_state(
    const hash32_t& root) const {
  auto key = key::make_hot_state_key(root);
  return storage_.contains(make_bytes_view(key));
}

common::result<std::optional<beacon_state_t>> checkpoint_index::boundary_state(
    const hash32_t& root) const {
  auto key = key::make_hot_state_key(root);
  return storage_.get<beacon_state_t>(encoder_, make_bytes_view(key));
}

common::result<std::optional<beacon_state_t>>
checkpoint_index::last_boundary_state(const slot_t slot) const {
  auto prefix = key::make_prefix(key::kHotStateSlotPrefix);
  auto upper = key::make_slot_upper_bound(key::kHotStateSlotPrefix, slot);
  auto last = storage_.last_by_prefix(make_bytes_view(prefix),
                                      make_bytes_view(upper));
  if (!last) {
    return last.error();
  }
  if (!last.value()) {
    return std::optional<beacon_state_t>{};
  }
  auto parsed = key::parse_slot_root_key(
      key::kHotStateSlotPrefix, make_bytes_view(last.value()->first));
  if (!parsed) {
    return make_state_error(state_error_code::store_io, slot, make_zero_hash(),
                            "malformed hot state slot key");
  }

  auto same_slot = key::builder{}
                       .write(key::kHotStateSlotPrefix)
                       .write_big_endian(parsed->first)
                       .data;
  auto candidates = storage_.list_by_prefix(make_bytes_view(same_slot));
  if (!candidates) {
    return candidates.error();
  }
  if (candidates.value().size() != 1) {
    return make_state_error(
        state_error_code::no_valid_ancestor, parsed->first, parsed->second,
        fmt::format("{} full states at highest slot, expected exactly one",
                    candidates.value().size()));
  }

  auto state = boundary_state(parsed->second);
  if (!state) {
    return state.error();
  }
  if (!state.value()) {
    return make_state_error(state_error_code::store_io, parsed->first,
                            parsed->second,
                            "slot index points at a missing full state");
  }
  return state;
}

common::result<std::vector<state_summary_t>>
checkpoint_index::boundary_states_below(const slot_t slot) const {
  auto prefix = key::make_prefix(key::kHotStateSlotPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  if (!rows) {
    return rows.error();
  }
  auto below = std::vector<state_summary_t>{};
  for (const auto& [raw_key, raw_value] : rows.value()) {
    auto parsed = key::parse_slot_root_key(key::kHotStateSlotPrefix,
                                           make_bytes_view(raw_key));
    if (!parsed) {
      return make_state_error(state_error_code::store_io, slot,
                              make_zero_hash(), "malformed hot state slot key");
    }
    if (parsed->first >= slot) {
      break;
    }
    below.push_back(
        state_summary_t{.slot = parsed->first, .root = parsed->second});
  }
  return below;
}

}  // namespace stategen::state
