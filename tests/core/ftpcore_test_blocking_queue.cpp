// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for BlockingQueue, including cancellable dequeue

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <ftpcore/core/blocking_queue.hpp>
#include <ftpcore/core/cancellation.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace ftpcore::core;

// ══════════════════════════════════════════════════════════════════════════
// Test: Basic Queue/Dequeue Operations
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue preserves FIFO order", "[blocking_queue][basic]")
{
  BlockingQueue<int> queue(10);

  REQUIRE(queue.empty());
  REQUIRE(queue.capacity() == 10);

  for (int i = 1; i <= 5; ++i)
  {
    REQUIRE(queue.queue(i));
  }
  REQUIRE(queue.size() == 5);

  int value = 0;
  for (int i = 1; i <= 5; ++i)
  {
    REQUIRE(queue.dequeue(value));
    REQUIRE(value == i);
  }
  REQUIRE(queue.empty());
}

TEST_CASE("BlockingQueue rejects zero capacity", "[blocking_queue][basic]")
{
  REQUIRE_THROWS_AS(BlockingQueue<int>(0), std::invalid_argument);
}

TEST_CASE("BlockingQueue holds move-only items", "[blocking_queue][move]")
{
  BlockingQueue<std::unique_ptr<int>> queue(4);
  REQUIRE(queue.queue(std::make_unique<int>(7)));

  std::unique_ptr<int> out;
  REQUIRE(queue.tryDequeue(out));
  REQUIRE(out);
  REQUIRE(*out == 7);
}

TEST_CASE("BlockingQueue tryQueue fails when full", "[blocking_queue][tryqueue][full]")
{
  BlockingQueue<int> queue(2);

  REQUIRE(queue.tryQueue(1));
  REQUIRE(queue.tryQueue(2));
  REQUIRE_FALSE(queue.tryQueue(3));
  REQUIRE(queue.size() == 2);
}

TEST_CASE("BlockingQueue queue blocks when full", "[blocking_queue][blocking][full]")
{
  BlockingQueue<int> queue(1);
  REQUIRE(queue.queue(1));

  std::atomic<bool> queued{false};
  std::thread producer(
    [&]()
    {
      queue.queue(2);
      queued = true;
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE_FALSE(queued.load());

  int value = 0;
  REQUIRE(queue.dequeue(value));
  producer.join();
  REQUIRE(queued.load());
  REQUIRE(queue.size() == 1);
}

// ══════════════════════════════════════════════════════════════════════════
// Test: Dequeue Timeout
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue dequeue with timeout", "[blocking_queue][dequeue][timeout]")
{
  BlockingQueue<int> queue(10);

  int value;
  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(queue.dequeue(value, std::chrono::milliseconds(100)));
  REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(100));
}

// ══════════════════════════════════════════════════════════════════════════
// Test: Close Operations
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue close wakes blocked dequeue", "[blocking_queue][close]")
{
  BlockingQueue<int> queue(10);

  std::atomic<bool> result{true};
  std::thread consumer(
    [&]()
    {
      int value;
      result = queue.dequeue(value);
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  queue.close();
  consumer.join();
  REQUIRE_FALSE(result.load());
}

TEST_CASE("BlockingQueue drains existing items after close", "[blocking_queue][close]")
{
  BlockingQueue<int> queue(10);
  queue.queue(1);
  queue.queue(2);
  queue.close();
  queue.close();

  REQUIRE(queue.isClosed());
  REQUIRE_FALSE(queue.queue(3));

  int value = 0;
  REQUIRE(queue.dequeue(value));
  REQUIRE(value == 1);
  REQUIRE(queue.dequeue(value));
  REQUIRE(value == 2);
  REQUIRE_FALSE(queue.dequeue(value));
}

// ══════════════════════════════════════════════════════════════════════════
// Test: Cancellable Dequeue
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue cancellable dequeue returns queued item", "[blocking_queue][cancel]")
{
  BlockingQueue<int> queue(10);
  CancellationSource source;
  queue.queue(5);

  int value = 0;
  REQUIRE(queue.dequeue(value, source.token()));
  REQUIRE(value == 5);
}

TEST_CASE("BlockingQueue cancellation wakes blocked dequeue", "[blocking_queue][cancel]")
{
  BlockingQueue<int> queue(10);
  CancellationSource source;

  std::atomic<bool> cancelled{false};
  std::thread consumer(
    [&]()
    {
      int value;
      try
      {
        queue.dequeue(value, source.token());
      }
      catch (const OperationCancelled &)
      {
        cancelled = true;
      }
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  source.cancel();
  consumer.join();
  REQUIRE(cancelled.load());
}

TEST_CASE("BlockingQueue pre-cancelled token wins over queued items", "[blocking_queue][cancel]")
{
  BlockingQueue<int> queue(10);
  queue.queue(1);
  CancellationSource source;
  source.cancel();

  int value = 0;
  REQUIRE_THROWS_AS(queue.dequeue(value, source.token()), OperationCancelled);
  REQUIRE(queue.size() == 1);
}

// ══════════════════════════════════════════════════════════════════════════
// Test: Multi-threaded Concurrency
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue multiple producers and one consumer", "[blocking_queue][concurrent]")
{
  BlockingQueue<int> queue(16);
  const int perProducer = 200;
  const int producers = 4;

  std::vector<std::thread> threads;
  for (int p = 0; p < producers; ++p)
  {
    threads.emplace_back(
      [&queue, p]()
      {
        for (int i = 0; i < perProducer; ++i)
        {
          queue.queue(p * perProducer + i);
        }
      });
  }

  std::vector<int> lastPerProducer(producers, -1);
  bool ordered = true;
  for (int n = 0; n < perProducer * producers; ++n)
  {
    int value = 0;
    REQUIRE(queue.dequeue(value));
    int p = value / perProducer;
    ordered = ordered && value > lastPerProducer[p];
    lastPerProducer[p] = value;
  }
  for (auto &t : threads)
  {
    t.join();
  }
  REQUIRE(ordered);
  REQUIRE(queue.empty());
}
