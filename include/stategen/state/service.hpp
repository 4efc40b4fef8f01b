#pragma once

#include <stategen/state/backend.hpp>
#include <stategen/state/block_store.hpp>
#include <stategen/state/checkpoint_index.hpp>
#include <stategen/state/cold_state_manager.hpp>
#include <stategen/state/hot_state_cache.hpp>
#include <stategen/state/hot_state_manager.hpp>
#include <stategen/state/options.hpp>
#include <stategen/state/replay.hpp>
#include <stategen/state/split_tracker.hpp>
#include <stategen/state/state_gen.hpp>
#include <stategen/state/transition.hpp>
#include <string_view>

namespace stategen::state {

/// Owns one RocksDB database and every component of state generation wired
/// on top of it. Members are declared in construction order.
struct service final {
  service(const options& opts,
          const std::string_view& db_path,
          transition_function_t transition = apply_block);

  service(const service&) = delete;
  service& operator=(const service&) = delete;

  options config;
  encoder_t encoder;
  storage_t storage;
  checkpoint_index index;
  hot_state_cache cache;
  split_tracker split;
  block_store blocks;
  replay_engine replay;
  hot_state_manager hot;
  cold_state_manager cold;
  state_gen gen;
};

}  // namespace stategen::state
