#include <gtest/gtest.h>
#include <stategen/state/state_gen.hpp>
#include <stategen/testing/chain_fixture.hpp>

#include <atomic>
#include <thread>
#include <vector>

using stategen::testing::chain_fixture;
using stategen::testing::chain_link;

TEST(state_gen, fresh_store_has_zero_split) {
  auto fixture = chain_fixture{"stategen_gen_fresh"};
  EXPECT_EQ(fixture.gen().split().slot, 0u);
  EXPECT_EQ(fixture.gen().split().root, stategen::schema::make_zero_hash());
}

TEST(state_gen, unknown_root_and_slot_are_reported) {
  auto fixture = chain_fixture{"stategen_gen_unknown"};
  auto by_root = fixture.gen().state_by_root(stategen::testing::make_hash(3));
  ASSERT_FALSE(by_root.has_value());
  EXPECT_EQ(by_root.error().code,
            stategen::schema::state_error_code::unknown_root);
  EXPECT_EQ(by_root.error().root, stategen::testing::make_hash(3));

  auto by_slot = fixture.gen().state_by_slot(12);
  ASSERT_FALSE(by_slot.has_value());
  EXPECT_EQ(by_slot.error().code,
            stategen::schema::state_error_code::unknown_slot);
}

TEST(state_gen, save_routes_on_split) {
  auto fixture = chain_fixture{"stategen_gen_routing"};
  auto genesis = fixture.genesis();
  auto links = fixture.extend_to(genesis, 20);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, links[15].root).has_value());

  auto below = chain_fixture::make_child(links[12], 15, 4);
  ASSERT_TRUE(fixture.node().blocks.save_block(below.block).has_value());
  ASSERT_TRUE(fixture.gen().save_state(below.root, below.state).has_value());
  EXPECT_TRUE(fixture.node().cold.has_cold_summary(below.root).value());
  EXPECT_FALSE(fixture.node().index.has_summary(below.root));

  auto fork = fixture.gen().state_by_root(below.root);
  ASSERT_TRUE(fork.has_value());
  EXPECT_EQ(fork.value(), below.state);
  auto canonical = fixture.gen().state_by_root(links[14].root);
  ASSERT_TRUE(canonical.has_value());
  EXPECT_EQ(canonical.value(), links[14].state);
  auto by_slot = fixture.gen().state_by_slot(15);
  ASSERT_TRUE(by_slot.has_value());
  EXPECT_EQ(by_slot.value(), links[14].state);

  auto above = chain_fixture::make_child(links[19], 21);
  ASSERT_TRUE(fixture.node().blocks.save_block(above.block).has_value());
  ASSERT_TRUE(fixture.gen().save_state(above.root, above.state).has_value());
  EXPECT_TRUE(fixture.node().index.has_summary(above.root));
  EXPECT_FALSE(fixture.node().cold.has_cold_summary(above.root).value());
}

TEST(state_gen, has_state_covers_cache_hot_and_cold) {
  auto fixture = chain_fixture{"stategen_gen_has_state"};
  auto genesis = fixture.genesis();
  auto links = fixture.extend_to(genesis, 20);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, links[15].root).has_value());

  EXPECT_TRUE(fixture.gen().has_state(links[2].root).value());
  EXPECT_TRUE(fixture.gen().has_state(links[18].root).value());
  EXPECT_FALSE(fixture.gen().has_state(stategen::testing::make_hash(1)).value());
}

TEST(state_gen, round_trip_through_the_facade) {
  auto fixture = chain_fixture{"stategen_gen_round_trip"};
  auto genesis = fixture.genesis();
  auto links = fixture.extend_through(genesis, {1, 4, 8, 9, 15, 17, 23});

  fixture.node().cache.clear({links[1].root, links[4].root, links[6].root});
  for (const auto& link : links) {
    auto loaded = fixture.gen().state_by_root(link.root);
    ASSERT_TRUE(loaded.has_value()) << link.state.slot;
    EXPECT_EQ(loaded.value(), link.state) << link.state.slot;
  }
}

TEST(state_gen, resume_reloads_split_and_summaries) {
  auto fixture = chain_fixture{"stategen_gen_resume"};
  auto genesis = fixture.genesis();
  auto links = fixture.extend_to(genesis, 26);
  ASSERT_TRUE(fixture.gen().migrate_to_cold(16, links[15].root).has_value());

  fixture.reopen();
  EXPECT_EQ(fixture.gen().split().slot, 16u);
  EXPECT_EQ(fixture.gen().split().root, links[15].root);
  EXPECT_EQ(fixture.node().cache.size(), 0u);

  auto hot = fixture.gen().state_by_root(links[25].root);
  ASSERT_TRUE(hot.has_value());
  EXPECT_EQ(hot.value(), links[25].state);

  auto cold = fixture.gen().state_by_root(links[3].root);
  ASSERT_TRUE(cold.has_value());
  EXPECT_EQ(cold.value(), links[3].state);

  auto by_slot = fixture.gen().state_by_slot(10);
  ASSERT_TRUE(by_slot.has_value());
  EXPECT_EQ(by_slot.value(), links[9].state);
}

TEST(state_gen, concurrent_loads_agree_with_sequential_results) {
  auto fixture = chain_fixture{"stategen_gen_concurrent"};
  auto genesis = fixture.genesis();
  auto links = fixture.extend_to(genesis, 30);
  fixture.node().cache.clear({links[10].root, links[21].root});

  auto mismatches = std::atomic<int>{};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (const auto index : {10u, 21u, 29u}) {
        auto loaded = fixture.gen().state_by_root(links[index].root);
        if (!loaded || loaded.value() != links[index].state) {
          ++mismatches;
        }
        auto by_slot = fixture.gen().state_by_slot(links[index].state.slot);
        if (!by_slot || by_slot.value() != links[index].state) {
          ++mismatches;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}

TEST(state_gen, migration_waits_for_concurrent_readers) {
  auto fixture = chain_fixture{"stategen_gen_migrate_concurrent"};
  auto genesis = fixture.genesis();
  auto links = fixture.extend_to(genesis, 40);

  auto failures = std::atomic<int>{};
  auto reader = std::thread{[&] {
    for (auto round = 0; round < 20; ++round) {
      for (const auto index : {5u, 20u, 35u}) {
        auto loaded = fixture.gen().state_by_root(links[index].root);
        if (!loaded || loaded.value() != links[index].state) {
          ++failures;
        }
      }
    }
  }};
  auto first = fixture.gen().migrate_to_cold(24, links[23].root);
  auto second = fixture.gen().migrate_to_cold(32, links[31].root);
  reader.join();
  EXPECT_TRUE(first.has_value());
  EXPECT_TRUE(second.has_value());
  EXPECT_EQ(failures.load(), 0);
}

TEST(state_gen, rejected_transition_leaves_cache_and_index_untouched) {
  auto transition = [](stategen::schema::beacon_state_t state,
                       const stategen::schema::beacon_block_t& block)
      -> stategen::common::result<stategen::schema::beacon_state_t> {
    if (block.slot == 5) {
      return stategen::schema::make_state_error(
          stategen::schema::state_error_code::invalid_transition, block.slot,
          block.parent_root, "block rejected");
    }
    return stategen::state::apply_block(std::move(state), block);
  };
  auto fixture = chain_fixture{"stategen_gen_rejected_transition",
                               stategen::testing::make_options(8, 32, 4),
                               transition};
  auto genesis = fixture.genesis();
  auto links = fixture.extend_to(genesis, 7);
  auto& target = links.back();
  auto summaries_before = fixture.node().index.summaries_below(100).size();

  fixture.node().cache.clear({links[4].root, links[5].root, target.root});
  auto loaded = fixture.gen().state_by_root(target.root);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().code,
            stategen::schema::state_error_code::invalid_transition);
  EXPECT_FALSE(fixture.node().cache.has(target.root));
  EXPECT_TRUE(fixture.node().index.has_summary(target.root));
  EXPECT_EQ(fixture.node().index.summaries_below(100).size(),
            summaries_before);
}
