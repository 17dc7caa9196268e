// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for passive and active data connection openers

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include "ftpcore_test_net_utils.hpp"

#include <thread>

using namespace ftpcore::server;
using ftpcore::core::CancellationSource;
using ftpcore::core::OperationCancelled;
using testnet::LoopbackClient;

TEST_CASE("Passive opener announces its port", "[data_connection][passive]")
{
  PassiveDataConnectionOpener opener("127.0.0.1", "10.1.2.3", std::nullopt,
                                     std::chrono::milliseconds(500));
  REQUIRE(opener.port() != 0);
  auto tuple = opener.hostPortTuple();
  REQUIRE(tuple.rfind("10,1,2,3,", 0) == 0);
  REQUIRE(testnet::passivePort("227 Entering Passive Mode (" + tuple + ").") == opener.port());
}

TEST_CASE("Passive opener accepts one peer", "[data_connection][passive]")
{
  PassiveDataConnectionOpener opener("127.0.0.1", "", std::nullopt, std::chrono::seconds(2),
                                     "127.0.0.1");
  LoopbackClient client(opener.port());
  REQUIRE(client.connected());

  CancellationSource source;
  auto data = opener.open(source.token());
  REQUIRE(data);
  REQUIRE(data->peerAddress().rfind("127.0.0.1:", 0) == 0);
  REQUIRE_THROWS_AS(opener.open(source.token()), DataConnectionError);
}

TEST_CASE("Passive opener ignores hosts other than the control peer",
          "[data_connection][passive][security]")
{
  PassiveDataConnectionOpener opener("127.0.0.1", "", std::nullopt, std::chrono::seconds(2),
                                     "127.0.0.1");

  // another loopback address stands in for a foreign host
  LoopbackClient intruder(opener.port(), "127.0.0.1", "127.0.0.2");
  REQUIRE(intruder.connected());

  CancellationSource source;
  std::shared_ptr<DataConnection> data;
  std::exception_ptr failure;
  std::thread opening(
    [&]()
    {
      try
      {
        data = opener.open(source.token());
      }
      catch (const std::exception &)
      {
        failure = std::current_exception();
      }
    });

  CHECK(intruder.waitClosed());
  LoopbackClient client(opener.port());
  opening.join();

  REQUIRE(client.connected());
  REQUIRE_FALSE(failure);
  REQUIRE(data);
  REQUIRE(data->peerAddress().rfind("127.0.0.1:", 0) == 0);
}

TEST_CASE("Passive opener times out when only a foreign host connects",
          "[data_connection][passive][security]")
{
  PassiveDataConnectionOpener opener("127.0.0.1", "", std::nullopt,
                                     std::chrono::milliseconds(300), "127.0.0.1");
  LoopbackClient intruder(opener.port(), "127.0.0.1", "127.0.0.2");
  REQUIRE(intruder.connected());

  CancellationSource source;
  auto started = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(opener.open(source.token()), DataConnectionError);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
}

TEST_CASE("Passive opener stops on cancellation", "[data_connection][passive][cancel]")
{
  PassiveDataConnectionOpener opener("127.0.0.1", "", std::nullopt, std::chrono::seconds(5));
  CancellationSource source;
  std::thread canceller(
    [&]()
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      source.cancel();
    });
  REQUIRE_THROWS_AS(opener.open(source.token()), OperationCancelled);
  canceller.join();
}

TEST_CASE("Passive opener requires IPv4 addresses", "[data_connection][passive][error]")
{
  REQUIRE_THROWS_AS(PassiveDataConnectionOpener("::1", "", std::nullopt,
                                                std::chrono::milliseconds(100)),
                    DataConnectionError);
  REQUIRE_THROWS_AS(PassiveDataConnectionOpener("127.0.0.1", "not-an-ip", std::nullopt,
                                                std::chrono::milliseconds(100)),
                    DataConnectionError);
}

TEST_CASE("Active opener reports refused connections", "[data_connection][active][error]")
{
  auto port = testnet::getFreePortTCP();
  ActiveDataConnectionOpener opener("127.0.0.1", port, std::chrono::milliseconds(500));
  CancellationSource source;
  REQUIRE_THROWS_AS(opener.open(source.token()), DataConnectionError);
}
