#include "PermitPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using ingest::PermitPool;

TEST(PermitPoolTest, NeverExceedsCapacityUnderLoad) {
  PermitPool pool(3);
  std::atomic<int> active{0};
  std::atomic<int> observedMax{0};

  std::vector<std::thread> workers;
  for (int i = 0; i < 10; ++i) {
    workers.emplace_back([&] {
      auto permit = pool.acquire();
      int now = ++active;
      int prev = observedMax.load();
      while (now > prev && !observedMax.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(20ms);
      --active;
    });
  }
  for (auto &t : workers)
    t.join();

  EXPECT_LE(observedMax.load(), 3);
  EXPECT_LE(pool.peakInUse(), 3u);
  EXPECT_GE(pool.peakInUse(), 1u);
  EXPECT_EQ(pool.inUse(), 0u);
}

TEST(PermitPoolTest, PermitReleasesOnScopeExit) {
  PermitPool pool(2);
  {
    auto a = pool.acquire();
    auto b = pool.acquire();
    EXPECT_EQ(pool.inUse(), 2u);
  }
  EXPECT_EQ(pool.inUse(), 0u);
}

TEST(PermitPoolTest, MovedPermitKeepsSingleSlot) {
  PermitPool pool(1);
  auto first = pool.acquire();
  PermitPool::Permit second = std::move(first);

  EXPECT_FALSE(first.held());
  EXPECT_TRUE(second.held());
  EXPECT_EQ(pool.inUse(), 1u);

  second.release();
  second.release();
  EXPECT_EQ(pool.inUse(), 0u);
}

TEST(PermitPoolTest, AcquireBlocksWhileFull) {
  PermitPool pool(1);
  auto held = pool.acquire();

  std::atomic<bool> acquired{false};
  std::thread waiter([&] {
    auto permit = pool.acquire();
    acquired = true;
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(acquired.load());
  held.release();
  waiter.join();
  EXPECT_TRUE(acquired.load());
}

TEST(PermitPoolTest, ZeroCapacityIsRaisedToOne) {
  PermitPool pool(0);
  EXPECT_EQ(pool.capacity(), 1u);
}
