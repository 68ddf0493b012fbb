/**
 * @file test_atomic.cpp
 * @brief Tests for ordered store/load and the publication Flag.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <thread>
#include <vector>

#include "kprim/atomic/atomic.hpp"

using kprim::atomic::Flag;
using kprim::atomic::LoadOrdering;
using kprim::atomic::StoreOrdering;

TEST(AtomicStore, BothOrderingsStoreTheValue) {
  std::uint64_t x = 0;
  kprim::atomic::store(x, std::uint64_t{42}, StoreOrdering::Relaxed);
  EXPECT_EQ(x, 42u);
  kprim::atomic::store(x, std::uint64_t{7}, StoreOrdering::Releasing);
  EXPECT_EQ(x, 7u);

  int y = -1;
  kprim::atomic::store(y, 123, StoreOrdering::Releasing);
  EXPECT_EQ(kprim::atomic::load(y, LoadOrdering::Acquiring), 123);
  EXPECT_EQ(kprim::atomic::load(y, LoadOrdering::Relaxed), 123);
}

TEST(AtomicStore, MemoryOrderMapping) {
  EXPECT_EQ(kprim::atomic::to_memory_order(StoreOrdering::Relaxed), std::memory_order_relaxed);
  EXPECT_EQ(kprim::atomic::to_memory_order(StoreOrdering::Releasing), std::memory_order_release);
  EXPECT_EQ(kprim::atomic::to_memory_order(LoadOrdering::Acquiring), std::memory_order_acquire);
}

TEST(AtomicStore, ConcurrentRelaxedStoresNeverTear) {
  // Every observed value must be one of the two written patterns.
  alignas(8) std::uint64_t word = 0;
  constexpr std::uint64_t A = 0x0000000000000000ull;
  constexpr std::uint64_t B = 0xFFFFFFFFFFFFFFFFull;
  constexpr int N = 200000;

  std::thread writer([&] {
    for (int i = 0; i < N; ++i) {
      kprim::atomic::store(word, (i & 1) ? B : A, StoreOrdering::Relaxed);
    }
  });
  bool torn = false;
  for (int i = 0; i < N; ++i) {
    const auto v = kprim::atomic::load(word, LoadOrdering::Relaxed);
    if (v != A && v != B) torn = true;
  }
  writer.join();
  EXPECT_FALSE(torn);
}

TEST(AtomicFlag, PublishesPriorWrites) {
  std::vector<int> payload(1024, 0);
  Flag ready;
  EXPECT_FALSE(ready.is_set());

  std::thread producer([&] {
    for (std::size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<int>(i);
    ready.set();
  });

  while (!ready.is_set()) std::this_thread::yield();
  for (std::size_t i = 0; i < payload.size(); ++i) ASSERT_EQ(payload[i], static_cast<int>(i));
  producer.join();
}

TEST(AtomicFlag, InitialState) {
  Flag f(true);
  EXPECT_TRUE(f.is_set());
}
