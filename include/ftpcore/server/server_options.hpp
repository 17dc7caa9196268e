// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "ftpcore/core/config_loader.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/server/ftp_connection.hpp"

namespace ftpcore
{
namespace server
{

/// \brief Parse a passive port range written as "min:max".
/// \throws std::runtime_error on malformed input
inline std::pair<std::uint16_t, std::uint16_t> parsePortRange(const std::string &text)
{
  auto colon = text.find(':');
  if (colon == std::string::npos)
  {
    throw std::runtime_error("Invalid port range '" + text + "', expected min:max");
  }
  auto toPort = [&text](const std::string &part) -> std::uint16_t
  {
    std::size_t used = 0;
    long value = -1;
    try
    {
      value = std::stol(part, &used);
    }
    catch (const std::logic_error &)
    {
      used = 0;
    }
    if (used != part.size() || value <= 0 || value > 65535)
    {
      throw std::runtime_error("Invalid port range '" + text + "'");
    }
    return static_cast<std::uint16_t>(value);
  };
  auto low = toPort(text.substr(0, colon));
  auto high = toPort(text.substr(colon + 1));
  if (low > high)
  {
    throw std::runtime_error("Invalid port range '" + text + "', min exceeds max");
  }
  return {low, high};
}

struct LogOptions
{
  core::Logger::Level level{core::Logger::Level::Info};
  std::string file;
  bool async{false};
  int retentionDays{7};
  std::string timeFormat{"%Y-%m-%d %H:%M:%S"};
};

/// \brief Everything needed to run an FtpServer.
struct FtpServerOptions
{
  /// Bind target: empty (IPv4 any), "*", "::", an address or a host name.
  std::string address;
  int port{21};
  FtpConnectionOptions connection;
  std::chrono::milliseconds idleCheckInterval{1000};
  /// 0 means unlimited.
  std::size_t maxConnections{0};

  std::string fileSystemRoot{
    (std::filesystem::temp_directory_path() / "ftpcore").string()};
  bool flushAfterWrite{false};
  bool allowNonEmptyDirectoryDelete{false};

  std::size_t threadPoolSize{std::thread::hardware_concurrency()};
  std::size_t threadPoolQueueSize{1024};

  LogOptions log;

  /// \brief Read the "ftpcore.*" keys; missing keys keep their defaults.
  /// \throws std::runtime_error on out-of-range values or a malformed pasv.range
  static FtpServerOptions fromConfig(const core::ConfigLoader &config)
  {
    FtpServerOptions opts;
    if (auto v = config.getString("ftpcore.server.address"))
    {
      opts.address = *v;
    }
    if (auto v = config.getInt("ftpcore.server.port"))
    {
      if (*v < 0 || *v > 65535)
      {
        throw std::runtime_error("ftpcore.server.port out of range: " + std::to_string(*v));
      }
      opts.port = static_cast<int>(*v);
    }
    if (auto v = config.getString("ftpcore.server.banner"))
    {
      opts.connection.banner = *v;
    }
    if (auto v = config.getString("ftpcore.server.pasv.address"))
    {
      opts.connection.passiveAddress = *v;
    }
    if (auto v = config.getString("ftpcore.server.pasv.range"))
    {
      opts.connection.passivePortRange = parsePortRange(*v);
    }

    if (auto v = config.getInt("ftpcore.connection.inactivityTimeoutSeconds"))
    {
      opts.setInactivityTimeoutSeconds(*v);
    }
    if (auto v = config.getInt("ftpcore.connection.idleCheckIntervalMs"))
    {
      opts.idleCheckInterval = std::chrono::milliseconds(positive(*v, "idleCheckIntervalMs"));
    }
    if (auto v = config.getInt("ftpcore.connection.dataConnectionTimeoutSeconds"))
    {
      opts.connection.dataConnectionTimeout =
        std::chrono::seconds(positive(*v, "dataConnectionTimeoutSeconds"));
    }
    if (auto v = config.getInt("ftpcore.connection.serverCommandQueueSize"))
    {
      opts.connection.serverCommandQueueSize =
        static_cast<std::size_t>(positive(*v, "serverCommandQueueSize"));
    }
    if (auto v = config.getInt("ftpcore.connection.maxConnections"))
    {
      opts.maxConnections = *v > 0 ? static_cast<std::size_t>(*v) : 0;
    }

    if (auto v = config.getString("ftpcore.fileSystem.root"))
    {
      opts.fileSystemRoot = *v;
    }
    if (auto v = config.getBool("ftpcore.fileSystem.flushAfterWrite"))
    {
      opts.flushAfterWrite = *v;
    }
    if (auto v = config.getBool("ftpcore.fileSystem.allowNonEmptyDirectoryDelete"))
    {
      opts.allowNonEmptyDirectoryDelete = *v;
    }

    if (auto v = config.getString("ftpcore.log.level"))
    {
      opts.log.level = core::Logger::levelFromString(*v);
    }
    if (auto v = config.getString("ftpcore.log.file"))
    {
      opts.log.file = *v;
    }
    if (auto v = config.getBool("ftpcore.log.async"))
    {
      opts.log.async = *v;
    }
    if (auto v = config.getInt("ftpcore.log.retentionDays"))
    {
      opts.log.retentionDays = static_cast<int>(*v);
    }
    if (auto v = config.getString("ftpcore.log.timeFormat"))
    {
      opts.log.timeFormat = *v;
    }

    if (auto v = config.getInt("ftpcore.threadPool.threads"))
    {
      opts.threadPoolSize = static_cast<std::size_t>(positive(*v, "threads"));
    }
    if (auto v = config.getInt("ftpcore.threadPool.queueSize"))
    {
      opts.threadPoolQueueSize = static_cast<std::size_t>(positive(*v, "queueSize"));
    }
    return opts;
  }

  /// \brief 0 or negative disables the inactivity timeout.
  void setInactivityTimeoutSeconds(std::int64_t seconds)
  {
    if (seconds <= 0)
    {
      connection.inactivityTimeout.reset();
    }
    else
    {
      connection.inactivityTimeout = std::chrono::seconds(seconds);
    }
  }

private:
  static std::int64_t positive(std::int64_t value, const char *key)
  {
    if (value <= 0)
    {
      throw std::runtime_error(std::string("Configuration value ") + key +
                               " must be positive, got " + std::to_string(value));
    }
    return value;
  }
};

} // namespace server
} // namespace ftpcore
