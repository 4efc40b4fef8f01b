#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <stategen/schema/primitives.hpp>
#include <stategen/state/options.hpp>
#include <stategen/state/service.hpp>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <optional>
#include <string>

namespace {

void print_state(const stategen::state::options& opts,
                 const stategen::schema::beacon_state_t& state) {
  auto total = std::accumulate(std::begin(state.balances),
                               std::end(state.balances), uint64_t{0});
  std::cout << fmt::format(
                   "slot={} epoch={} latest_block_slot={} latest_block_root={} "
                   "blocks={} accumulator={} validators={} total_balance={}",
                   state.slot, stategen::state::epoch_of(opts, state.slot),
                   state.latest_block_slot,
                   stategen::schema::to_hex(state.latest_block_root),
                   state.block_count,
                   stategen::schema::to_hex(state.accumulator),
                   state.balances.size(), total)
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto opts = stategen::state::options{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"stategen"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "stategen.db"),
      "RocksDB directory")(
      "slots-per-epoch",
      boost::program_options::value<uint64_t>(&opts.slots_per_epoch)
          ->default_value(32),
      "Slots between full hot states")(
      "slots-per-archived-point",
      boost::program_options::value<uint64_t>(&opts.slots_per_archived_point)
          ->default_value(2048),
      "Slots between archived cold states")(
      "hot-state-cache-size",
      boost::program_options::value<std::size_t>(&opts.hot_state_cache_size)
          ->default_value(16),
      "Number of states kept in memory")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "stategen.log"),
      "Log file path")("state-by-slot",
                       boost::program_options::value<uint64_t>(),
                       "Print the canonical state at a slot")(
      "state-by-root", boost::program_options::value<std::string>(),
      "Print the state of a block root (hex)")("verbose,v",
                                               "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto config_error = std::string{};
  if (!stategen::state::validate(opts, config_error)) {
    std::cerr << config_error << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "stategen", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto exit_code = 0;
  {
    auto node = stategen::state::service{opts, db_path};
    auto split = node.gen.split();
    spdlog::info("Split at slot={} root={}", split.slot,
                 stategen::schema::to_hex(split.root));

    if (vm.contains("state-by-slot")) {
      auto slot = vm["state-by-slot"].as<uint64_t>();
      auto state = node.gen.state_by_slot(slot);
      if (state) {
        print_state(opts, state.value());
      } else {
        spdlog::error("State at slot {} unavailable: {}", slot,
                      stategen::schema::describe(state.error()));
        exit_code = 2;
      }
    }

    if (vm.contains("state-by-root")) {
      auto hex = vm["state-by-root"].as<std::string>();
      auto root = stategen::schema::try_make_hash32(hex);
      if (!root) {
        spdlog::error("'{}' is not a 32 byte hex root", hex);
        exit_code = 1;
      } else {
        auto state = node.gen.state_by_root(*root);
        if (state) {
          print_state(opts, state.value());
        } else {
          spdlog::error("State for root {} unavailable: {}", hex,
                        stategen::schema::describe(state.error()));
          exit_code = 2;
        }
      }
    }
  }

  spdlog::shutdown();
  return exit_code;
}
