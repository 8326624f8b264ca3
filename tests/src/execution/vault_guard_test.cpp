#include <prizepool/execution/vault_guard.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

TEST(vault_guard, same_thread_reentry_is_refused) {
  auto table = prizepool::execution::vault_guard_table{};
  auto outer = table.acquire(1);
  ASSERT_TRUE(outer.has_value());
  EXPECT_TRUE(table.held(1));
  EXPECT_FALSE(table.acquire(1).has_value());

  auto other_vault = table.acquire(2);
  EXPECT_TRUE(other_vault.has_value());
}

TEST(vault_guard, release_on_scope_exit) {
  auto table = prizepool::execution::vault_guard_table{};
  {
    auto guard = table.acquire(3);
    ASSERT_TRUE(guard.has_value());
  }
  EXPECT_FALSE(table.held(3));
  EXPECT_TRUE(table.acquire(3).has_value());
}

TEST(vault_guard, moved_guard_releases_once) {
  auto table = prizepool::execution::vault_guard_table{};
  auto guard = table.acquire(4);
  ASSERT_TRUE(guard.has_value());
  {
    auto moved = std::move(*guard);
    EXPECT_EQ(moved.vault_id(), 4u);
  }
  EXPECT_FALSE(table.held(4));
  guard.reset();
  EXPECT_FALSE(table.held(4));
}

TEST(vault_guard, other_threads_wait_for_release) {
  auto table = prizepool::execution::vault_guard_table{};
  auto entered = std::atomic<bool>{false};
  auto guard = table.acquire(5);
  ASSERT_TRUE(guard.has_value());

  auto waiter = std::thread{[&]() {
    auto inner = table.acquire(5);
    EXPECT_TRUE(inner.has_value());
    entered = true;
  }};
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(entered.load());

  guard.reset();
  waiter.join();
  EXPECT_TRUE(entered.load());
}
