#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <stategen/schema/primitives.hpp>
#include <stategen/state/options.hpp>
#include <stategen/state/service.hpp>
#include <stategen/state/transition.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <string>

namespace {

namespace po = boost::program_options;

stategen::schema::bytes_t make_body(const uint64_t slot) {
  return stategen::schema::make_bytes("seed-block-" + std::to_string(slot));
}

}  // namespace

int main(int argc, const char** argv) {
  auto db_path = std::string{};
  auto opts = stategen::state::options{};
  auto slots = uint64_t{};
  auto validators = uint64_t{};
  auto balance = uint64_t{};
  auto skip_every = uint64_t{};

  auto options = po::options_description{"stategen-seed options"};
  options.add_options()("help,h", "show help")(
      "db-path", po::value<std::string>(&db_path)->default_value("stategen.db"),
      "RocksDB directory to seed")(
      "slots", po::value<uint64_t>(&slots)->default_value(256),
      "number of slots to build")(
      "validators", po::value<uint64_t>(&validators)->default_value(64),
      "validator count")(
      "initial-balance", po::value<uint64_t>(&balance)->default_value(32000),
      "genesis balance per validator")(
      "skip-every", po::value<uint64_t>(&skip_every)->default_value(0),
      "leave every n-th slot empty (0 disables)")(
      "finalize-slot", po::value<uint64_t>(),
      "migrate everything below this slot to cold storage")(
      "slots-per-epoch",
      po::value<uint64_t>(&opts.slots_per_epoch)->default_value(32),
      "slots between full hot states")(
      "slots-per-archived-point",
      po::value<uint64_t>(&opts.slots_per_archived_point)
          ->default_value(2048),
      "slots between archived cold states")(
      "verbose,v", "enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << options << std::endl;
    return 1;
  }
  if (vm.contains("help")) {
    std::cout << options << std::endl;
    return 0;
  }
  if (validators == 0) {
    std::cerr << "validators must be greater than zero" << std::endl;
    return 1;
  }
  auto config_error = std::string{};
  if (!stategen::state::validate(opts, config_error)) {
    std::cerr << config_error << std::endl;
    return 1;
  }

  spdlog::set_default_logger(spdlog::stdout_color_mt("seed"));
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto node = stategen::state::service{opts, db_path};
  auto genesis = stategen::state::make_genesis(validators, balance, 0);

  auto seeded = node.gen.has_state(genesis.root);
  if (!seeded) {
    spdlog::error("Failed to inspect database: {}",
                  stategen::schema::describe(seeded.error()));
    return 2;
  }
  if (seeded.value()) {
    spdlog::error("Database at '{}' already holds this genesis", db_path);
    return 1;
  }

  auto saved_genesis = node.blocks.save_block(genesis.block);
  if (!saved_genesis) {
    spdlog::error("Failed to save genesis block: {}",
                  stategen::schema::describe(saved_genesis.error()));
    return 2;
  }
  auto stored = node.gen.save_state(genesis.root, genesis.state);
  if (!stored) {
    spdlog::error("Failed to save genesis state: {}",
                  stategen::schema::describe(stored.error()));
    return 2;
  }

  // Canonical head by slot, used to pick the finalized root.
  auto heads = std::map<uint64_t, stategen::schema::hash32_t>{};
  heads.emplace(0, genesis.root);

  auto state = genesis.state;
  auto parent = genesis.root;
  for (auto slot = uint64_t{1}; slot <= slots; ++slot) {
    if (skip_every != 0 && slot % skip_every == 0) {
      continue;
    }
    auto block = stategen::schema::beacon_block_t{};
    block.slot = slot;
    block.proposer_index = slot % validators;
    block.parent_root = parent;
    block.body = make_body(slot);

    auto advanced = stategen::state::process_slots(std::move(state), slot);
    if (!advanced) {
      spdlog::error("Slot processing failed: {}",
                    stategen::schema::describe(advanced.error()));
      return 2;
    }
    auto applied = stategen::state::apply_block(std::move(advanced.value()),
                                                block);
    if (!applied) {
      spdlog::error("Block at slot {} rejected: {}", slot,
                    stategen::schema::describe(applied.error()));
      return 2;
    }
    state = std::move(applied.value());

    auto root = node.blocks.save_block(block);
    if (!root) {
      spdlog::error("Failed to save block at slot {}: {}", slot,
                    stategen::schema::describe(root.error()));
      return 2;
    }
    auto saved = node.gen.save_state(root.value(), state);
    if (!saved) {
      spdlog::error("Failed to save state at slot {}: {}", slot,
                    stategen::schema::describe(saved.error()));
      return 2;
    }
    parent = root.value();
    heads.emplace(slot, parent);
  }
  spdlog::info("Seeded {} block(s), head slot={} root={}", heads.size(),
               state.slot, stategen::schema::to_hex(parent));

  if (vm.contains("finalize-slot")) {
    auto finalized = vm["finalize-slot"].as<uint64_t>();
    auto head = heads.upper_bound(finalized);
    --head;
    auto migrated = node.gen.migrate_to_cold(finalized, head->second);
    if (!migrated) {
      spdlog::error("Migration to slot {} failed: {}", finalized,
                    stategen::schema::describe(migrated.error()));
      return 2;
    }
  }

  std::cout << stategen::schema::to_hex(parent) << std::endl;
  return 0;
}
