#include "stagehand/core/lockfree_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace stagehand;

TEST(LockfreeQueueTest, BasicPushPop) {
  BoundedMPSCQueue<int> queue(64);

  EXPECT_TRUE(queue.push(42));
  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
  EXPECT_TRUE(queue.empty());
}

TEST(LockfreeQueueTest, CapacityRoundsUpToPowerOfTwo) {
  EXPECT_EQ(BoundedMPSCQueue<int>(100).capacity(), 128u);
  EXPECT_EQ(BoundedMPSCQueue<int>(1).capacity(), 2u);
}

TEST(LockfreeQueueTest, FullQueueRejectsPush) {
  BoundedMPSCQueue<int> queue(4);

  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.push(99));
  EXPECT_EQ(queue.size(), 4u);

  EXPECT_EQ(queue.try_pop(), 0);
  EXPECT_TRUE(queue.push(4));
}

TEST(LockfreeQueueTest, MoveOnlyElements) {
  BoundedMPSCQueue<std::unique_ptr<std::string>> queue(8);

  EXPECT_TRUE(queue.push(std::make_unique<std::string>("event")));
  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(**value, "event");
}

TEST(LockfreeQueueTest, MultipleProducersSingleConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 10000;
  BoundedMPSCQueue<int> queue(1024);
  std::atomic<int> done{0};

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        while (!queue.push(p * kPerProducer + i)) {
          std::this_thread::yield();
        }
      }
      done.fetch_add(1);
    });
  }

  std::vector<int> last(kProducers, -1);
  long long received = 0;
  while (received < kProducers * kPerProducer) {
    if (auto v = queue.try_pop()) {
      int producer = *v / kPerProducer;
      EXPECT_GT(*v, last[producer]);
      last[producer] = *v;
      ++received;
    } else {
      std::this_thread::yield();
    }
  }

  for (auto& t : producers) {
    t.join();
  }
  EXPECT_EQ(done.load(), kProducers);
  EXPECT_TRUE(queue.empty());
}
