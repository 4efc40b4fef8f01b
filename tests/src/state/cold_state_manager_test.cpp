#include <gtest/gtest.h>
#include <stategen/state/cold_state_manager.hpp>
#include <stategen/state/transition.hpp>
#include <stategen/testing/chain_fixture.hpp>

#include <vector>

using stategen::testing::chain_fixture;
using stategen::testing::chain_link;

namespace {

// links[i] is the block at slot i + 1.
std::vector<chain_link> build_to(chain_fixture& fixture,
                                 const chain_link& genesis,
                                 const uint64_t last) {
  return fixture.extend_to(genesis, last);
}

}  // namespace

TEST(cold_state_manager, migration_moves_history_below_split) {
  auto fixture = chain_fixture{"stategen_cold_migrate"};
  auto genesis = fixture.genesis();
  auto links = build_to(fixture, genesis, 40);
  auto& r32 = links[31];

  ASSERT_TRUE(fixture.gen().migrate_to_cold(32, r32.root).has_value());
  EXPECT_EQ(fixture.gen().split().slot, 32u);
  EXPECT_EQ(fixture.gen().split().root, r32.root);

  for (auto i = std::size_t{0}; i < 31; ++i) {
    EXPECT_FALSE(fixture.node().index.has_summary(links[i].root));
    EXPECT_TRUE(fixture.node().cold.has_cold_summary(links[i].root).value());
  }
  EXPECT_TRUE(fixture.node().cold.has_cold_summary(genesis.root).value());
  EXPECT_TRUE(fixture.node().index.has_summary(r32.root));

  EXPECT_FALSE(fixture.node().index.has_boundary_state(genesis.root).value());
  EXPECT_FALSE(fixture.node().index.has_boundary_state(links[7].root).value());
  EXPECT_FALSE(fixture.node().index.has_boundary_state(links[23].root).value());
  EXPECT_TRUE(fixture.node().index.has_boundary_state(r32.root).value());
  EXPECT_TRUE(fixture.node().index.has_boundary_state(links[39].root).value());
}

TEST(cold_state_manager, migrated_states_still_load_by_root_and_slot) {
  auto fixture = chain_fixture{"stategen_cold_reload"};
  auto genesis = fixture.genesis();
  auto links = build_to(fixture, genesis, 40);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(32, links[31].root).has_value());

  for (const auto index : {0u, 6u, 19u, 30u, 33u, 39u}) {
    const auto& link = links[index];
    auto by_root = fixture.gen().state_by_root(link.root);
    ASSERT_TRUE(by_root.has_value()) << link.state.slot;
    EXPECT_EQ(by_root.value(), link.state) << link.state.slot;

    auto by_slot = fixture.gen().state_by_slot(link.state.slot);
    ASSERT_TRUE(by_slot.has_value()) << link.state.slot;
    EXPECT_EQ(by_slot.value(), link.state) << link.state.slot;
  }
  auto genesis_state = fixture.gen().state_by_root(genesis.root);
  ASSERT_TRUE(genesis_state.has_value());
  EXPECT_EQ(genesis_state.value(), genesis.state);
}

TEST(cold_state_manager, archived_points_written_for_each_interval) {
  auto fixture = chain_fixture{"stategen_cold_archives"};
  auto genesis = fixture.genesis();
  auto links = build_to(fixture, genesis, 72);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(32, links[31].root).has_value());
  ASSERT_TRUE(fixture.gen().migrate_to_cold(64, links[63].root).has_value());

  // Archived points at 0 and 32 serve every slot below the split.
  for (const auto slot : {1u, 31u, 32u, 47u, 63u}) {
    auto loaded = fixture.node().cold.load_cold_state_by_slot(slot);
    ASSERT_TRUE(loaded.has_value()) << slot;
    EXPECT_EQ(loaded.value(), links[slot - 1].state) << slot;
  }
  EXPECT_FALSE(fixture.node().index.has_boundary_state(links[31].root).value());
  EXPECT_TRUE(fixture.node().index.has_boundary_state(links[63].root).value());
}

TEST(cold_state_manager, split_root_off_epoch_gets_an_anchor) {
  auto fixture = chain_fixture{"stategen_cold_anchor"};
  auto genesis = fixture.genesis();
  auto links = build_to(fixture, genesis, 40);
  auto& r36 = links[35];
  ASSERT_FALSE(fixture.node().index.has_boundary_state(r36.root).value());

  ASSERT_TRUE(fixture.gen().migrate_to_cold(36, r36.root).has_value());
  EXPECT_TRUE(fixture.node().index.has_boundary_state(r36.root).value());
  EXPECT_FALSE(
      fixture.node().index.has_boundary_state(links[31].root).value());

  fixture.node().cache.clear({links[36].root, links[37].root});
  auto child = fixture.gen().state_by_root(links[37].root);
  ASSERT_TRUE(child.has_value());
  EXPECT_EQ(child.value(), links[37].state);

  auto by_slot = fixture.gen().state_by_slot(38);
  ASSERT_TRUE(by_slot.has_value());
  EXPECT_EQ(by_slot.value(), links[37].state);
}

TEST(cold_state_manager, split_root_before_skipped_slots) {
  auto fixture = chain_fixture{"stategen_cold_skipped"};
  auto genesis = fixture.genesis();
  auto early = fixture.extend_to(genesis, 30);
  auto late = fixture.extend_through(early.back(), {33, 34});
  auto& r30 = early.back();

  ASSERT_TRUE(fixture.gen().migrate_to_cold(32, r30.root).has_value());

  auto at_split = fixture.gen().state_by_slot(32);
  ASSERT_TRUE(at_split.has_value());
  EXPECT_EQ(at_split.value().slot, 32u);
  EXPECT_EQ(at_split.value().latest_block_root, r30.root);

  auto below_split = fixture.gen().state_by_slot(31);
  ASSERT_TRUE(below_split.has_value());
  EXPECT_EQ(below_split.value().slot, 31u);
  EXPECT_EQ(below_split.value().latest_block_root, r30.root);

  fixture.node().cache.clear({late[0].root, late[1].root});
  auto after = fixture.gen().state_by_root(late[1].root);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after.value(), late[1].state);
}

TEST(cold_state_manager, forks_below_split_are_pruned) {
  auto fixture = chain_fixture{"stategen_cold_prune"};
  auto genesis = fixture.genesis();
  auto trunk = fixture.extend_to(genesis, 10);
  auto fork = fixture.extend_through(trunk.back(), {11, 12}, 1);
  auto rest = fixture.extend_through(trunk.back(), {11, 13, 16, 17});

  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, rest[2].root).has_value());

  for (const auto& link : fork) {
    EXPECT_FALSE(fixture.node().index.has_summary(link.root));
    EXPECT_FALSE(fixture.node().cold.has_cold_summary(link.root).value());
    auto loaded = fixture.gen().state_by_root(link.root);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code,
              stategen::schema::state_error_code::unknown_root);
  }
  EXPECT_TRUE(fixture.node().cold.has_cold_summary(rest[1].root).value());

  auto canonical = fixture.gen().state_by_slot(12);
  ASSERT_TRUE(canonical.has_value());
  EXPECT_EQ(canonical.value().latest_block_root, rest[0].root);
}

TEST(cold_state_manager, migration_purges_cache_below_split) {
  auto fixture = chain_fixture{"stategen_cold_cache"};
  auto genesis = fixture.genesis();
  auto links = build_to(fixture, genesis, 20);
  ASSERT_TRUE(fixture.gen().state_by_root(links[4].root).has_value());
  ASSERT_TRUE(fixture.node().cache.has(links[4].root));

  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, links[15].root).has_value());
  EXPECT_FALSE(fixture.node().cache.has(links[4].root));
  EXPECT_TRUE(fixture.node().cache.has(links[19].root));
}

TEST(cold_state_manager, migration_not_past_split_is_ignored) {
  auto fixture = chain_fixture{"stategen_cold_ignored"};
  auto genesis = fixture.genesis();
  auto links = build_to(fixture, genesis, 20);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, links[15].root).has_value());

  ASSERT_TRUE(fixture.gen().migrate_to_cold(8, links[7].root).has_value());
  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, links[15].root).has_value());
  EXPECT_EQ(fixture.gen().split().slot, 16u);
  EXPECT_EQ(fixture.gen().split().root, links[15].root);
}

TEST(cold_state_manager, failed_migration_changes_nothing) {
  auto fixture = chain_fixture{"stategen_cold_atomic"};
  auto genesis = fixture.genesis();
  auto trunk = fixture.extend_to(genesis, 20);
  auto fork = fixture.extend_through(trunk[9], {18, 20}, 1);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, trunk[15].root).has_value());

  auto unknown = fixture.gen().migrate_to_cold(
      24, stategen::testing::make_hash(0x66));
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code,
            stategen::schema::state_error_code::unknown_root);

  auto off_chain = fixture.gen().migrate_to_cold(24, fork.back().root);
  ASSERT_FALSE(off_chain.has_value());
  EXPECT_EQ(off_chain.error().code,
            stategen::schema::state_error_code::discontinuous_chain);

  EXPECT_EQ(fixture.gen().split().slot, 16u);
  EXPECT_TRUE(fixture.node().index.has_summary(trunk[17].root));
  EXPECT_TRUE(fixture.node().index.has_summary(fork.front().root));
  EXPECT_FALSE(fixture.node().cold.has_cold_summary(trunk[17].root).value());

  fixture.reopen();
  EXPECT_EQ(fixture.gen().split().slot, 16u);
  EXPECT_TRUE(fixture.node().index.has_summary(trunk[17].root));
}

TEST(cold_state_manager, save_cold_state_backfills_history) {
  auto fixture = chain_fixture{"stategen_cold_save"};
  auto made = stategen::state::make_genesis(8, 1000, 0);
  auto genesis = chain_link{
      .root = made.root, .block = made.block, .state = made.state};
  ASSERT_TRUE(fixture.node().blocks.save_block(genesis.block).has_value());

  // Blocks arrive first, as after a checkpoint sync to slot 8.
  auto links = std::vector<chain_link>{};
  auto head = genesis;
  for (const auto slot : {1u, 2u, 4u, 5u, 8u}) {
    head = chain_fixture::make_child(head, slot);
    ASSERT_TRUE(fixture.node().blocks.save_block(head.block).has_value());
    links.push_back(head);
  }
  ASSERT_TRUE(fixture.node().split.advance({.slot = 8, .root = links[4].root}));

  ASSERT_TRUE(fixture.node()
                  .cold.save_cold_state(genesis.root, genesis.state)
                  .has_value());
  for (auto i = 0u; i < 4u; ++i) {
    ASSERT_TRUE(fixture.node()
                    .cold.save_cold_state(links[i].root, links[i].state)
                    .has_value());
  }

  EXPECT_TRUE(fixture.node().cold.has_cold_summary(links[2].root).value());
  EXPECT_FALSE(fixture.node().index.has_summary(links[2].root));

  auto by_root = fixture.node().cold.load_cold_state_by_root(links[2].root);
  ASSERT_TRUE(by_root.has_value());
  EXPECT_EQ(by_root.value(), links[2].state);

  auto by_slot = fixture.node().cold.load_cold_state_by_slot(7);
  ASSERT_TRUE(by_slot.has_value());
  EXPECT_EQ(by_slot.value().slot, 7u);
  EXPECT_EQ(by_slot.value().latest_block_root, links[3].root);
}

TEST(cold_state_manager, cold_save_without_split_keeps_summary_only) {
  auto fixture = chain_fixture{"stategen_cold_save_unverified"};
  auto made = stategen::state::make_genesis(8, 1000, 0);
  ASSERT_TRUE(fixture.node().blocks.save_block(made.block).has_value());
  ASSERT_TRUE(
      fixture.node().cold.save_cold_state(made.root, made.state).has_value());

  EXPECT_TRUE(fixture.node().cold.has_cold_summary(made.root).value());
  auto by_slot = fixture.node().cold.load_cold_state_by_slot(0);
  ASSERT_FALSE(by_slot.has_value());
  EXPECT_EQ(by_slot.error().code,
            stategen::schema::state_error_code::unknown_slot);
}

TEST(cold_state_manager, fork_saved_below_split_leaves_canonical_history) {
  auto fixture = chain_fixture{"stategen_cold_fork_archive",
                               stategen::testing::make_options(8, 8, 4)};
  auto genesis = fixture.genesis();
  auto links = build_to(fixture, genesis, 20);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, links[15].root).has_value());

  // Sibling of the canonical block at slot 8, itself an archived point slot.
  auto fork = chain_fixture::make_child(links[5], 8, 9);
  ASSERT_TRUE(fixture.node().blocks.save_block(fork.block).has_value());
  ASSERT_TRUE(fixture.gen().save_state(fork.root, fork.state).has_value());
  EXPECT_TRUE(fixture.node().cold.has_cold_summary(fork.root).value());

  auto by_slot = fixture.gen().state_by_slot(8);
  ASSERT_TRUE(by_slot.has_value());
  EXPECT_EQ(by_slot.value(), links[7].state);

  auto later = fixture.gen().state_by_slot(12);
  ASSERT_TRUE(later.has_value());
  EXPECT_EQ(later.value(), links[11].state);

  auto fork_state = fixture.gen().state_by_root(fork.root);
  ASSERT_TRUE(fork_state.has_value());
  EXPECT_EQ(fork_state.value(), fork.state);

  auto canonical = fixture.gen().state_by_root(links[7].root);
  ASSERT_TRUE(canonical.has_value());
  EXPECT_EQ(canonical.value(), links[7].state);
}

TEST(cold_state_manager, cold_lookups_fail_without_history) {
  auto fixture = chain_fixture{"stategen_cold_empty"};
  auto by_slot = fixture.node().cold.load_cold_state_by_slot(5);
  ASSERT_FALSE(by_slot.has_value());
  EXPECT_EQ(by_slot.error().code,
            stategen::schema::state_error_code::unknown_slot);

  auto by_root =
      fixture.node().cold.load_cold_state_by_root(stategen::testing::make_hash(1));
  ASSERT_FALSE(by_root.has_value());
  EXPECT_EQ(by_root.error().code,
            stategen::schema::state_error_code::unknown_checkpoint);
}
