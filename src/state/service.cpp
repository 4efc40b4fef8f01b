#include <spdlog/spdlog.h>
#include <stategen/common/critical.hpp>
#include <stategen/state/service.hpp>
#include <string>
#include <utility>

namespace stategen::state {

namespace {

const options& checked(const options& opts) {
  auto error = std::string{};
  if (!validate(opts, error)) {
    stategen::common::critical(error);
  }
  return opts;
}

}  // namespace

service::service(const options& opts,
                 const std::string_view& db_path,
                 transition_function_t transition)
    : config{checked(opts)},
      encoder{},
      storage{stategen::storage::make_storage<
          stategen::storage::rocksdb_storage_tag>(db_path)},
      index{encoder, storage},
      cache{config.hot_state_cache_size},
      split{encoder, storage},
      blocks{encoder, storage},
      replay{std::move(transition)},
      hot{config, index, cache, blocks, replay},
      cold{config, encoder, storage, index, cache, blocks, replay, split},
      gen{hot, cold, split, index, cache} {
  spdlog::info(
      "State generation ready at '{}' slots_per_epoch={} "
      "slots_per_archived_point={} cache={}",
      db_path, config.slots_per_epoch, config.slots_per_archived_point,
      config.hot_state_cache_size);
}

}  // namespace stategen::state
