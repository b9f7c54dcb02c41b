/***
 * Name: test_reclamation_queue
 * Purpose: Queue hands every pushed handle to exactly one drain.
 */
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "FakeCallTable.h"
#include "pyhost/refs/ReclamationQueue.h"

using pyhost::ffi::Handle;
using pyhost::refs::ReclamationQueue;
using testutil::fakeHandle;

TEST(ReclamationQueue, DrainReturnsEverythingPushed) {
  ReclamationQueue q;
  q.push(fakeHandle(1));
  q.push(fakeHandle(2));
  q.push(fakeHandle(1));
  EXPECT_EQ(q.size(), 3u);
  std::vector<Handle> seen;
  EXPECT_EQ(q.drain([&](Handle h) { seen.push_back(h); }), 3u);
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0], fakeHandle(1));
  EXPECT_EQ(seen[2], fakeHandle(1));
  EXPECT_EQ(q.size(), 0u);
  EXPECT_EQ(q.drain([&](Handle) { FAIL() << "queue should be empty"; }), 0u);
}

TEST(ReclamationQueue, PushDuringDrainWaitsForNextDrain) {
  ReclamationQueue q;
  q.push(fakeHandle(1));
  std::size_t calls = 0;
  const auto drained = q.drain([&](Handle) {
    ++calls;
    q.push(fakeHandle(2));
  });
  EXPECT_EQ(drained, 1u);
  EXPECT_EQ(calls, 1u);
  EXPECT_EQ(q.size(), 1u);
  EXPECT_EQ(q.drain([](Handle) {}), 1u);
}

TEST(ReclamationQueue, PeakTracksDeepestBacklog) {
  ReclamationQueue q;
  for (std::uintptr_t i = 1; i <= 5; ++i) { q.push(fakeHandle(i)); }
  q.drain([](Handle) {});
  q.push(fakeHandle(9));
  EXPECT_EQ(q.peak(), 5u);
}

TEST(ReclamationQueue, ConcurrentProducersLoseNothing) {
  ReclamationQueue q;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 5000;
  std::vector<std::thread> producers;
  for (int t = 0; t < kThreads; ++t) {
    producers.emplace_back([&q, t]() {
      for (int i = 0; i < kPerThread; ++i) { q.push(fakeHandle(static_cast<std::uintptr_t>(t * kPerThread + i + 1))); }
    });
  }
  std::size_t drained = 0;
  while (drained < static_cast<std::size_t>(kThreads * kPerThread) / 2) { drained += q.drain([](Handle) {}); }
  for (auto& p : producers) { p.join(); }
  drained += q.drain([](Handle) {});
  EXPECT_EQ(drained, static_cast<std::size_t>(kThreads * kPerThread));
}
