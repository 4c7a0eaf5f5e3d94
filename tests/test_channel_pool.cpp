/**
 * @file test_channel_pool.cpp
 * @brief Tests for LocalChannelPool selection, growth and binding table.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "sticky/pool/local_channel_pool.hpp"
#include "test_support.hpp"

using sticky::pool::LocalChannelPool;
using sticky::pool::PoolConfig;
using sticky::pool::PoolError;
using sticky::testing::fake_factory;
using sticky::testing::make_pool;

// --------------------------- Creation --------------------------------------

/**
 * @test Create_Opens_First_Channel
 * @brief A new pool holds exactly one channel pointing at the target.
 */
TEST(LocalChannelPool, Create_Opens_First_Channel) {
  auto pool = make_pool(nullptr);
  ASSERT_TRUE(pool);
  ASSERT_EQ(pool->size(), 1u);
  auto ch = pool->channels().front();
  EXPECT_EQ(ch->id(), 0u);
  EXPECT_EQ(ch->channel()->target(), "sessions.test:443");
  EXPECT_EQ(ch->active_streams(), 0u);
}

/**
 * @test Create_Rejects_Bad_Setup
 * @brief Setup errors are reported through expected, not exceptions.
 */
TEST(LocalChannelPool, Create_Rejects_Bad_Setup) {
  PoolConfig zero;
  zero.max_size = 0;
  auto a = LocalChannelPool::create(zero, fake_factory(), nullptr);
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error(), PoolError::ZeroMaxSize);

  auto b = LocalChannelPool::create(PoolConfig{}, nullptr, nullptr);
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error(), PoolError::NoTransportFactory);

  auto c = LocalChannelPool::create(PoolConfig{}, [](const std::string&, std::size_t) {
    return sticky::pool::TransportChannelPtr{};
  }, nullptr);
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error(), PoolError::TransportUnavailable);
}

// --------------------------- Selection -------------------------------------

/**
 * @test Select_Reuses_Below_Watermark
 * @brief While the least-loaded channel is under the watermark it is reused.
 */
TEST(LocalChannelPool, Select_Reuses_Below_Watermark) {
  auto pool = make_pool(nullptr, /*max_size=*/4, /*low_watermark=*/3);
  for (int i = 0; i < 3; ++i) {
    auto ch = pool->get_channel(std::nullopt);
    EXPECT_EQ(ch->id(), 0u);
    pool->increment_active(ch);
  }
  EXPECT_EQ(pool->size(), 1u);
}

/**
 * @test Select_Grows_Then_Falls_Back_To_Least_Loaded
 * @brief Busy channels trigger growth up to max_size, then least-loaded reuse.
 */
TEST(LocalChannelPool, Select_Grows_Then_Falls_Back_To_Least_Loaded) {
  auto pool = make_pool(nullptr, /*max_size=*/2, /*low_watermark=*/1);

  auto c0 = pool->get_channel(std::nullopt);
  pool->increment_active(c0);
  auto c1 = pool->get_channel(std::nullopt);    // c0 busy: grow
  EXPECT_EQ(c1->id(), 1u);
  pool->increment_active(c1);
  EXPECT_EQ(pool->size(), 2u);

  pool->increment_active(c1);                   // c1 now busier than c0
  auto c2 = pool->get_channel(std::nullopt);    // at max_size: least loaded
  EXPECT_EQ(c2, c0);
  EXPECT_EQ(pool->size(), 2u);
}

/**
 * @test Select_Bound_Key_Wins
 * @brief A bound key routes to its channel regardless of load.
 */
TEST(LocalChannelPool, Select_Bound_Key_Wins) {
  auto pool = make_pool(nullptr, 4, 1);
  auto c0 = pool->get_channel(std::nullopt);
  pool->increment_active(c0);
  auto c1 = pool->get_channel(std::nullopt);
  ASSERT_NE(c0, c1);

  pool->bind(c0, "sessions/a");
  for (int i = 0; i < 5; ++i) pool->increment_active(c0);

  EXPECT_EQ(pool->get_channel(std::string_view{"sessions/a"}), c0);
  // Unknown key: normal selection.
  EXPECT_NE(pool->get_channel(std::string_view{"sessions/zz"}), c0);
}

// --------------------------- Counters --------------------------------------

/**
 * @test Active_Streams_Saturate_At_Zero
 * @brief Releasing more than reserved never wraps the counter.
 */
TEST(LocalChannelPool, Active_Streams_Saturate_At_Zero) {
  auto pool = make_pool(nullptr);
  auto ch = pool->get_channel(std::nullopt);
  pool->increment_active(ch);
  pool->decrement_active(ch);
  pool->decrement_active(ch);
  EXPECT_EQ(ch->active_streams(), 0u);
  EXPECT_FALSE(ch->active_streams_decr());
}

/**
 * @test Active_Streams_Concurrent_Balance
 * @brief Concurrent reserve/release pairs return every counter to zero.
 */
TEST(LocalChannelPool, Active_Streams_Concurrent_Balance) {
  auto pool = make_pool(nullptr, 4, 2);
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 2000; ++i) {
        auto ch = pool->get_channel(std::nullopt);
        pool->increment_active(ch);
        pool->decrement_active(ch);
      }
    });
  }
  for (auto& w : workers) w.join();
  EXPECT_EQ(sticky::testing::total_active(*pool), 0u);
  EXPECT_LE(pool->size(), 4u);
}

// --------------------------- Binding table ---------------------------------

/**
 * @test Bind_Last_Writer_Wins
 * @brief Rebinding a key moves it and keeps affinity counts consistent.
 */
TEST(LocalChannelPool, Bind_Last_Writer_Wins) {
  auto pool = make_pool(nullptr, 4, 1);
  auto c0 = pool->get_channel(std::nullopt);
  pool->increment_active(c0);
  auto c1 = pool->get_channel(std::nullopt);

  pool->bind(c0, "k");
  EXPECT_EQ(c0->affinity_count(), 1u);
  pool->bind(c0, "k");                      // same channel: no double count
  EXPECT_EQ(c0->affinity_count(), 1u);

  pool->bind(c1, "k");
  EXPECT_EQ(pool->bound_channel("k"), c1);
  EXPECT_EQ(c0->affinity_count(), 0u);
  EXPECT_EQ(c1->affinity_count(), 1u);
  EXPECT_EQ(pool->binding_count(), 1u);
}

/**
 * @test Bind_Ignores_Empty_Key
 * @brief Empty keys and null channels never enter the table.
 */
TEST(LocalChannelPool, Bind_Ignores_Empty_Key) {
  auto pool = make_pool(nullptr);
  auto ch = pool->get_channel(std::nullopt);
  pool->bind(ch, "");
  pool->bind(nullptr, "k");
  EXPECT_EQ(pool->binding_count(), 0u);
  EXPECT_EQ(ch->affinity_count(), 0u);
}

/**
 * @test Unbind_Removes_And_Reports
 * @brief unbind() erases the key once and reports whether it existed.
 */
TEST(LocalChannelPool, Unbind_Removes_And_Reports) {
  auto pool = make_pool(nullptr);
  auto ch = pool->get_channel(std::nullopt);
  pool->bind(ch, "k");

  EXPECT_TRUE(pool->unbind("k"));
  EXPECT_FALSE(pool->unbind("k"));
  EXPECT_EQ(pool->bound_channel("k"), nullptr);
  EXPECT_EQ(ch->affinity_count(), 0u);
}

/**
 * @test Policy_Lookup_Through_Registry
 * @brief affinity_policy() reflects the shared registry; no registry means no policy.
 */
TEST(LocalChannelPool, Policy_Lookup_Through_Registry) {
  auto reg = sticky::testing::session_policies();
  auto pool = make_pool(reg);
  auto p = pool->affinity_policy(sticky::testing::kCreate);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->command, sticky::policy::AffinityCommand::Bind);
  EXPECT_FALSE(pool->affinity_policy("/other.Svc/M").has_value());

  // Registry edits are visible without rebuilding the pool.
  ASSERT_TRUE(reg->removePolicy(sticky::testing::kCreate));
  EXPECT_FALSE(pool->affinity_policy(sticky::testing::kCreate).has_value());

  auto bare = make_pool(nullptr);
  EXPECT_FALSE(bare->affinity_policy(sticky::testing::kCreate).has_value());
}
