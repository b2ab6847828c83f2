#include <gtest/gtest.h>
#include "RequestSerializer.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(RequestSerializerTest, RunsInSubmissionOrder) {
  SCOPED_TRACE("Tasks run one after another in the order they were queued.");
  RecordProperty("description",
                 "Twenty tasks append their index; the record is 0..19.");

  std::mutex m;
  std::vector<int> order;
  std::vector<std::future<void>> done;
  {
    RequestSerializer serializer;
    for (int i = 0; i < 20; ++i) {
      done.push_back(serializer.Run([&, i] {
        std::lock_guard<std::mutex> lk(m);
        order.push_back(i);
      }));
    }
    for (auto& f : done)
      f.get();
  }

  ASSERT_EQ(order.size(), 20u);
  for (int i = 0; i < 20; ++i)
    EXPECT_EQ(order[i], i);
}

TEST(RequestSerializerTest, NeverRunsTwoTasksAtOnce) {
  SCOPED_TRACE("Submissions from many threads still run one at a time.");
  RecordProperty("description",
                 "Four threads submit sleeping tasks; the observed maximum "
                 "concurrency is one.");

  RequestSerializer serializer;
  std::atomic<int> active{0};
  std::atomic<int> peak{0};

  auto task = [&] {
    const int now = ++active;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(2ms);
    --active;
    return now;
  };

  std::mutex m;
  std::vector<std::future<int>> results;
  std::vector<std::thread> submitters;
  for (int t = 0; t < 4; ++t) {
    submitters.emplace_back([&] {
      for (int i = 0; i < 5; ++i) {
        auto f = serializer.Run(task);
        std::lock_guard<std::mutex> lk(m);
        results.push_back(std::move(f));
      }
    });
  }
  for (auto& th : submitters)
    th.join();

  for (auto& f : results)
    EXPECT_EQ(f.get(), 1);
  EXPECT_EQ(peak.load(), 1);
}

TEST(RequestSerializerTest, FailureIsIsolated) {
  SCOPED_TRACE("A throwing task fails only its own future.");
  RecordProperty("description",
                 "The exception reaches the first caller; the task queued "
                 "behind it still returns its value.");

  RequestSerializer serializer;
  auto bad = serializer.Run([]() -> int {
    throw std::runtime_error("boom");
  });
  auto good = serializer.Run([] { return 42; });

  EXPECT_THROW(bad.get(), std::runtime_error);
  EXPECT_EQ(good.get(), 42);
}

TEST(RequestSerializerTest, KnowsItsWorker) {
  SCOPED_TRACE("OnWorker() is true only inside a task.");
  RecordProperty("description",
                 "Compares OnWorker() from the test thread and from inside a "
                 "queued task.");

  RequestSerializer serializer;
  EXPECT_FALSE(serializer.OnWorker());
  EXPECT_TRUE(serializer.Run([&] { return serializer.OnWorker(); }).get());
}

TEST(RequestSerializerTest, DrainsQueueOnDestruction) {
  SCOPED_TRACE("Queued work is finished before the serializer goes away.");
  RecordProperty("description",
                 "Tasks still waiting when the serializer is destroyed run "
                 "and fulfil their futures.");

  std::atomic<int> ran{0};
  std::vector<std::future<void>> done;
  {
    RequestSerializer serializer;
    for (int i = 0; i < 5; ++i) {
      done.push_back(serializer.Run([&] {
        std::this_thread::sleep_for(1ms);
        ++ran;
      }));
    }
  }
  EXPECT_EQ(ran.load(), 5);
  for (auto& f : done)
    EXPECT_NO_THROW(f.get());
}
