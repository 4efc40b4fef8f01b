#include <spdlog/spdlog.h>
#include <stategen/schema/key/state_keys.hpp>
#include <stategen/state/split_tracker.hpp>
#include <mutex>

using namespace stategen::schema;

namespace stategen::state {

split_tracker::split_tracker(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

common::result<void> split_tracker::load() {
  auto key = key::make_split_key();
  auto stored = storage_.get<split_info_t>(encoder_, make_bytes_view(key));
  if (!stored) {
    return stored.error();
  }
  auto lock = std::unique_lock{mutex_};
  split_ = stored.value().value_or(split_info_t{});
  spdlog::info("Hot/cold split at slot={} root={}", split_.slot,
               short_hex(split_.root));
  return common::success();
}

split_info_t split_tracker::get() const {
  auto lock = std::shared_lock{mutex_};
  return split_;
}

bool split_tracker::advance(const split_info_t& info) {
  auto lock = std::unique_lock{mutex_};
  if (info.slot < split_.slot) {
    spdlog::warn("Refusing to move split backwards from slot={} to slot={}",
                 split_.slot, info.slot);
    return false;
  }
  split_ = info;
  return true;
}

stategen::storage::batch_entry split_tracker::make_batch_entry(
    const split_info_t& info) const {
  return {key::make_split_key(), encoder_.encode(info)};
}

}  // namespace stategen::state
