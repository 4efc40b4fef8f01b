#include <spdlog/spdlog.h>
#include <stategen/common/critical.hpp>
#include <stategen/state/state_gen.hpp>
#include <mutex>

using namespace stategen::schema;

namespace stategen::state {

state_gen::state_gen(hot_state_manager& hot,
                     cold_state_manager& cold,
                     split_tracker& split,
                     checkpoint_index& index,
                     hot_state_cache& cache)
    : hot_{hot}, cold_{cold}, split_{split}, index_{index}, cache_{cache} {
  auto lock = std::unique_lock{migration_mutex_};
  auto split_loaded = split_.load();
  if (!split_loaded) {
    stategen::common::critical(describe(split_loaded.error()));
  }
  auto index_loaded = index_.load();
  if (!index_loaded) {
    stategen::common::critical(describe(index_loaded.error()));
  }
}

common::result<void> state_gen::save_state(const hash32_t& root,
                                           const beacon_state_t& state) {
  auto lock = std::shared_lock{migration_mutex_};
  if (state.slot < split_.get().slot) {
    return cold_.save_cold_state(root, state);
  }
  return hot_.save_hot_state(root, state);
}

common::result<beacon_state_t> state_gen::state_by_root(const hash32_t& root) {
  auto lock = std::shared_lock{migration_mutex_};
  if (cache_.has(root) || index_.has_summary(root)) {
    return hot_.load_hot_state_by_root(root);
  }
  auto cold = cold_.has_cold_summary(root);
  if (!cold) {
    return cold.error();
  }
  if (cold.value()) {
    return cold_.load_cold_state_by_root(root);
  }
  return make_state_error(state_error_code::unknown_root, 0, root,
                          "root is neither hot nor cold");
}

common::result<beacon_state_t> state_gen::state_by_slot(const slot_t slot) {
  auto lock = std::shared_lock{migration_mutex_};
  if (slot < split_.get().slot) {
    return cold_.load_cold_state_by_slot(slot);
  }
  auto loaded = hot_.load_hot_state_by_slot(slot);
  if (!loaded &&
      loaded.error().code == state_error_code::no_valid_ancestor) {
    auto error = loaded.error();
    error.code = state_error_code::unknown_slot;
    return error;
  }
  return loaded;
}

common::result<void> state_gen::migrate_to_cold(const slot_t slot,
                                                const hash32_t& root) {
  auto lock = std::unique_lock{migration_mutex_};
  spdlog::info("Finalized slot={} root={}, migrating to cold storage", slot,
               short_hex(root));
  return cold_.migrate(split_info_t{.slot = slot, .root = root});
}

split_info_t state_gen::split() const {
  return split_.get();
}

common::result<bool> state_gen::has_state(const hash32_t& root) const {
  auto lock = std::shared_lock{migration_mutex_};
  if (cache_.has(root) || index_.has_summary(root)) {
    return true;
  }
  return cold_.has_cold_summary(root);
}

}  // namespace stategen::state
