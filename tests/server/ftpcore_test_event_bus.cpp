// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for per-connection event publication

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace ftpcore::server;

namespace
{
std::string describe(const ConnectionEvent &event)
{
  std::string name = eventName(event);
  if (auto *received = std::get_if<CommandReceivedEvent>(&event))
  {
    name += ":" + received->command.name;
  }
  else if (auto *started = std::get_if<DataTransferStartedEvent>(&event))
  {
    name += ":" + started->transferId;
  }
  else if (auto *stopped = std::get_if<DataTransferStoppedEvent>(&event))
  {
    name += ":" + stopped->transferId;
  }
  return name;
}
} // namespace

TEST_CASE("Observers see events in publish order", "[event_bus]")
{
  ConnectionEventBus bus("conn-1");
  std::vector<std::string> first;
  std::vector<std::string> second;
  auto subA = bus.subscribe([&](const ConnectionEvent &e) { first.push_back(describe(e)); });
  auto subB = bus.subscribe([&](const ConnectionEvent &e) { second.push_back(describe(e)); });
  REQUIRE(bus.observerCount() == 2);

  bus.publish(CommandReceivedEvent{FtpCommand::parse("RETR a")});
  bus.publish(DataTransferStartedEvent{"t1", FtpCommand::parse("RETR a")});
  bus.publish(DataTransferStoppedEvent{"t1"});
  bus.publish(ConnectionClosedEvent{});

  std::vector<std::string> expected{"CommandReceived:RETR", "DataTransferStarted:t1",
                                    "DataTransferStopped:t1", "ConnectionClosed"};
  REQUIRE(first == expected);
  REQUIRE(second == expected);
}

TEST_CASE("Subscriptions end delivery", "[event_bus][subscription]")
{
  ConnectionEventBus bus;
  int count = 0;

  SECTION("explicit unsubscribe")
  {
    auto sub = bus.subscribe([&](const ConnectionEvent &) { ++count; });
    REQUIRE(sub.active());
    bus.publish(ConnectionClosedEvent{});
    sub.unsubscribe();
    sub.unsubscribe();
    REQUIRE_FALSE(sub.active());
    bus.publish(ConnectionClosedEvent{});
    REQUIRE(count == 1);
    REQUIRE(bus.observerCount() == 0);
  }

  SECTION("destruction")
  {
    {
      auto sub = bus.subscribe([&](const ConnectionEvent &) { ++count; });
      bus.publish(ConnectionClosedEvent{});
    }
    bus.publish(ConnectionClosedEvent{});
    REQUIRE(count == 1);
  }

  SECTION("moved subscription stays active")
  {
    ConnectionEventBus::Subscription kept;
    {
      auto sub = bus.subscribe([&](const ConnectionEvent &) { ++count; });
      kept = std::move(sub);
    }
    REQUIRE(kept.active());
    bus.publish(ConnectionClosedEvent{});
    REQUIRE(count == 1);
  }

  SECTION("subscription outliving the bus")
  {
    ConnectionEventBus::Subscription sub;
    {
      ConnectionEventBus temporary;
      sub = temporary.subscribe([&](const ConnectionEvent &) { ++count; });
    }
    REQUIRE_FALSE(sub.active());
    REQUIRE_NOTHROW(sub.unsubscribe());
  }
}

TEST_CASE("A failing observer does not affect the others", "[event_bus][error]")
{
  ConnectionEventBus bus("conn-2");
  int delivered = 0;
  auto bad = bus.subscribe([](const ConnectionEvent &) { throw std::runtime_error("observer"); });
  auto good = bus.subscribe([&](const ConnectionEvent &) { ++delivered; });

  REQUIRE_NOTHROW(bus.publish(ConnectionClosedEvent{}));
  REQUIRE(delivered == 1);
}

TEST_CASE("Non-standard observer exceptions are contained", "[event_bus][error]")
{
  ConnectionEventBus bus("conn-3");
  int delivered = 0;
  auto bad = bus.subscribe([](const ConnectionEvent &) { throw 42; });
  auto good = bus.subscribe([&](const ConnectionEvent &) { ++delivered; });

  REQUIRE_NOTHROW(bus.publish(DataTransferStoppedEvent{"t1"}));
  REQUIRE_NOTHROW(bus.publish(ConnectionClosedEvent{}));
  REQUIRE(delivered == 2);
}

TEST_CASE("An observer may unsubscribe another during delivery", "[event_bus][subscription]")
{
  ConnectionEventBus bus;
  int secondCalls = 0;
  ConnectionEventBus::Subscription second;
  auto first = bus.subscribe([&](const ConnectionEvent &) { second.unsubscribe(); });
  second = bus.subscribe([&](const ConnectionEvent &) { ++secondCalls; });

  bus.publish(ConnectionClosedEvent{});
  REQUIRE(secondCalls == 0);
}

TEST_CASE("Concurrent publishers are serialized", "[event_bus][threaded]")
{
  ConnectionEventBus bus;
  std::atomic<int> inside{0};
  std::atomic<bool> overlapped{false};
  std::atomic<int> total{0};
  auto sub = bus.subscribe(
    [&](const ConnectionEvent &)
    {
      if (inside.fetch_add(1) != 0)
      {
        overlapped = true;
      }
      std::this_thread::sleep_for(std::chrono::microseconds(100));
      inside.fetch_sub(1);
      total.fetch_add(1);
    });

  std::vector<std::thread> publishers;
  for (int i = 0; i < 4; ++i)
  {
    publishers.emplace_back(
      [&bus]()
      {
        for (int j = 0; j < 25; ++j)
        {
          bus.publish(DataTransferStoppedEvent{"t"});
        }
      });
  }
  for (auto &t : publishers)
  {
    t.join();
  }
  REQUIRE(total.load() == 100);
  REQUIRE_FALSE(overlapped.load());
}
