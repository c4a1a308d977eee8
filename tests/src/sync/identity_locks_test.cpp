#include <warden/sync/identity_locks.hpp>
#include <warden/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

TEST(identity_locks, serializes_one_identity) {
  auto locks = warden::sync::identity_locks{};
  auto inside = std::atomic<int>{0};
  auto overlap = std::atomic<bool>{false};

  auto workers = std::vector<std::thread>{};
  for (auto i = 0; i < 4; ++i) {
    workers.emplace_back([&] {
      for (auto round = 0; round < 50; ++round) {
        auto held = locks.lock(warden::testing::user_ref("1"));
        if (inside.fetch_add(1) != 0) {
          overlap = true;
        }
        std::this_thread::yield();
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  EXPECT_FALSE(overlap.load());
  EXPECT_EQ(locks.size(), 0u);
}

TEST(identity_locks, different_identities_do_not_block) {
  auto locks = warden::sync::identity_locks{};
  auto held = locks.lock(warden::testing::user_ref("1"));
  EXPECT_EQ(locks.size(), 1u);

  auto done = std::atomic<bool>{false};
  auto worker = std::thread{[&] {
    auto other = locks.lock(warden::testing::user_ref("2"));
    done = true;
  }};
  worker.join();
  EXPECT_TRUE(done.load());
  EXPECT_EQ(locks.size(), 1u);
}

TEST(identity_locks, user_and_group_with_same_id_are_distinct) {
  auto locks = warden::sync::identity_locks{};
  auto user = locks.lock(warden::testing::user_ref("7"));
  auto group = locks.lock(warden::testing::group_ref("7"));
  EXPECT_EQ(locks.size(), 2u);
}
