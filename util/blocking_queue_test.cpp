#include "util/blocking_queue.hpp"
#include <string>
#include <thread>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;

// NOLINTNEXTLINE
TEST(BlockingQueue, Fifo) {
  util::BlockingQueue<std::string> queue;
  queue.Enqueue("a");
  queue.Enqueue("b");
  EXPECT_EQ(queue.Size(), 2);
  std::string out;
  ASSERT_TRUE(queue.Dequeue(&out));
  EXPECT_EQ(out, "a");
  ASSERT_TRUE(queue.Dequeue(&out));
  EXPECT_EQ(out, "b");
}

// NOLINTNEXTLINE
TEST(BlockingQueue, StopDrainsThenFails) {
  util::BlockingQueue<int> queue;
  queue.Enqueue(1);
  queue.Stop();
  int out = 0;
  EXPECT_TRUE(queue.Dequeue(&out));
  EXPECT_EQ(out, 1);
  EXPECT_FALSE(queue.Dequeue(&out));
}

// NOLINTNEXTLINE
TEST(BlockingQueue, WakesConsumer) {
  util::BlockingQueue<int> queue;
  std::vector<int> seen;
  std::thread consumer([&queue, &seen]() {
    int value = 0;
    while (queue.Dequeue(&value)) seen.push_back(value);
  });
  for (int i = 0; i < 3; i++) queue.Enqueue(std::move(i));
  queue.Stop();
  consumer.join();
  EXPECT_THAT(seen, ElementsAre(0, 1, 2));
}

}  // namespace
