// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for server options and their TOML configuration

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using ftpcore::core::ConfigLoader;
using ftpcore::core::Logger;
using namespace ftpcore::server;

TEST_CASE("Server option defaults", "[server_options]")
{
  FtpServerOptions opts;
  REQUIRE(opts.address.empty());
  REQUIRE(opts.port == 21);
  REQUIRE(opts.maxConnections == 0);
  REQUIRE(opts.idleCheckInterval == std::chrono::milliseconds(1000));
  REQUIRE(opts.connection.inactivityTimeout == std::chrono::milliseconds(std::chrono::minutes(5)));
  REQUIRE(opts.connection.serverCommandQueueSize == 1024);
  REQUIRE(opts.connection.banner == "FTP Server Ready");
  REQUIRE_FALSE(opts.connection.passivePortRange.has_value());
}

TEST_CASE("Server options from a TOML file", "[server_options][config]")
{
  auto config = ConfigLoader::fromString("[ftpcore.server]\n"
                                         "address = \"127.0.0.1\"\n"
                                         "port = 2121\n"
                                         "banner = \"Welcome\"\n"
                                         "pasv.address = \"10.0.0.5\"\n"
                                         "pasv.range = \"50000:50010\"\n"
                                         "\n"
                                         "[ftpcore.connection]\n"
                                         "inactivityTimeoutSeconds = 30\n"
                                         "idleCheckIntervalMs = 250\n"
                                         "dataConnectionTimeoutSeconds = 10\n"
                                         "serverCommandQueueSize = 64\n"
                                         "maxConnections = 8\n"
                                         "\n"
                                         "[ftpcore.fileSystem]\n"
                                         "root = \"/srv/ftp\"\n"
                                         "flushAfterWrite = true\n"
                                         "allowNonEmptyDirectoryDelete = true\n"
                                         "\n"
                                         "[ftpcore.log]\n"
                                         "level = \"debug\"\n"
                                         "file = \"/var/log/ftpcore\"\n"
                                         "async = true\n"
                                         "retentionDays = 3\n"
                                         "\n"
                                         "[ftpcore.threadPool]\n"
                                         "threads = 4\n"
                                         "queueSize = 128\n");
  auto opts = FtpServerOptions::fromConfig(config);

  REQUIRE(opts.address == "127.0.0.1");
  REQUIRE(opts.port == 2121);
  REQUIRE(opts.connection.banner == "Welcome");
  REQUIRE(opts.connection.passiveAddress == "10.0.0.5");
  REQUIRE(opts.connection.passivePortRange->first == 50000);
  REQUIRE(opts.connection.passivePortRange->second == 50010);
  REQUIRE(opts.connection.inactivityTimeout == std::chrono::milliseconds(30000));
  REQUIRE(opts.idleCheckInterval == std::chrono::milliseconds(250));
  REQUIRE(opts.connection.dataConnectionTimeout == std::chrono::milliseconds(10000));
  REQUIRE(opts.connection.serverCommandQueueSize == 64);
  REQUIRE(opts.maxConnections == 8);
  REQUIRE(opts.fileSystemRoot == "/srv/ftp");
  REQUIRE(opts.flushAfterWrite);
  REQUIRE(opts.allowNonEmptyDirectoryDelete);
  REQUIRE(opts.log.level == Logger::Level::Debug);
  REQUIRE(opts.log.file == "/var/log/ftpcore");
  REQUIRE(opts.log.async);
  REQUIRE(opts.log.retentionDays == 3);
  REQUIRE(opts.threadPoolSize == 4);
  REQUIRE(opts.threadPoolQueueSize == 128);
}

TEST_CASE("Missing keys keep defaults", "[server_options][config]")
{
  auto opts = FtpServerOptions::fromConfig(ConfigLoader::fromString("[other]\nkey = 1\n"));
  REQUIRE(opts.port == 21);
  REQUIRE(opts.connection.inactivityTimeout.has_value());
}

TEST_CASE("Inactivity timeout of zero is unbounded", "[server_options][config]")
{
  auto opts = FtpServerOptions::fromConfig(
    ConfigLoader::fromString("[ftpcore.connection]\ninactivityTimeoutSeconds = 0\n"));
  REQUIRE_FALSE(opts.connection.inactivityTimeout.has_value());

  opts.setInactivityTimeoutSeconds(-5);
  REQUIRE_FALSE(opts.connection.inactivityTimeout.has_value());
  opts.setInactivityTimeoutSeconds(2);
  REQUIRE(opts.connection.inactivityTimeout == std::chrono::milliseconds(2000));
}

TEST_CASE("Invalid configuration values are rejected", "[server_options][config][error]")
{
  REQUIRE_THROWS_AS(
    FtpServerOptions::fromConfig(ConfigLoader::fromString("[ftpcore.server]\nport = 70000\n")),
    std::runtime_error);
  REQUIRE_THROWS_AS(FtpServerOptions::fromConfig(
                      ConfigLoader::fromString("[ftpcore.connection]\nidleCheckIntervalMs = 0\n")),
                    std::runtime_error);
  REQUIRE_THROWS_AS(FtpServerOptions::fromConfig(
                      ConfigLoader::fromString("[ftpcore.server]\npasv.range = \"9:1\"\n")),
                    std::runtime_error);
}

TEST_CASE("parsePortRange", "[server_options][pasv]")
{
  auto range = parsePortRange("1024:2048");
  REQUIRE(range.first == 1024);
  REQUIRE(range.second == 2048);
  REQUIRE(parsePortRange("21:21").first == 21);

  REQUIRE_THROWS_AS(parsePortRange("1024"), std::runtime_error);
  REQUIRE_THROWS_AS(parsePortRange("a:b"), std::runtime_error);
  REQUIRE_THROWS_AS(parsePortRange("0:10"), std::runtime_error);
  REQUIRE_THROWS_AS(parsePortRange("1:70000"), std::runtime_error);
  REQUIRE_THROWS_AS(parsePortRange("10:5"), std::runtime_error);
  REQUIRE_THROWS_AS(parsePortRange("10:20x"), std::runtime_error);
}
