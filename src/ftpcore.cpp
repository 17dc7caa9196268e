// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <ftpcore/ftpcore.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <thread>

namespace
{
std::atomic<bool> g_terminate{false};

/// Command-line values; they win over the configuration file.
struct CliOverrides
{
  std::optional<std::string> configFile;
  std::optional<std::string> address;
  std::optional<int> port;
  std::optional<std::string> root;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  std::optional<bool> logAsync;
  std::optional<std::int64_t> inactivityTimeoutSeconds;
};

/// \brief Print help message
void printHelp()
{
  std::cout << "Ftpcore Server Options:\n"
            << "  -h, --help                       Show this help message\n"
            << "  -c, --config <file>              Configuration file path\n"
            << "  -a, --address <addr>             Bind address (*, ::, host; default: "
               "IPv4 any)\n"
            << "  -p, --port <port>                Control port (default: 21)\n"
            << "  -r, --root <dir>                 File system root directory\n"
            << "  -l, --log-level <level>          Log level (trace, debug, info, "
               "warning, error, fatal)\n"
            << "  -f, --log-file <file>            Log file path\n"
            << "      --log-async                  Enable async logging\n"
            << "      --inactivity-timeout <sec>   Idle timeout in seconds, 0 disables "
               "(default: 300)\n";
}

int parseInt(const std::string &value, const std::string &what)
{
  try
  {
    std::size_t used = 0;
    int result = std::stoi(value, &used);
    if (used != value.size())
    {
      throw std::invalid_argument(value);
    }
    return result;
  }
  catch (const std::logic_error &)
  {
    throw std::runtime_error("Invalid " + what + ": " + value);
  }
}

/// \brief Parse command-line arguments
CliOverrides parseCliArgs(int argc, char **argv)
{
  CliOverrides cli;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      cli.configFile = argv[++i];
    }
    else if ((arg == "-a" || arg == "--address") && i + 1 < argc)
    {
      cli.address = argv[++i];
    }
    else if ((arg == "-p" || arg == "--port") && i + 1 < argc)
    {
      cli.port = parseInt(argv[++i], "port number");
    }
    else if ((arg == "-r" || arg == "--root") && i + 1 < argc)
    {
      cli.root = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      cli.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      cli.logFile = argv[++i];
    }
    else if (arg == "--log-async")
    {
      cli.logAsync = true;
    }
    else if (arg == "--inactivity-timeout" && i + 1 < argc)
    {
      cli.inactivityTimeoutSeconds = parseInt(argv[++i], "inactivity timeout");
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
  return cli;
}

ftpcore::server::FtpServerOptions buildOptions(const CliOverrides &cli)
{
  ftpcore::server::FtpServerOptions options;
  if (cli.configFile)
  {
    options = ftpcore::server::FtpServerOptions::fromConfig(
      ftpcore::core::ConfigLoader(*cli.configFile));
  }
  if (cli.address)
  {
    options.address = *cli.address;
  }
  if (cli.port)
  {
    options.port = *cli.port;
  }
  if (cli.root)
  {
    options.fileSystemRoot = *cli.root;
  }
  if (cli.logLevel)
  {
    options.log.level = ftpcore::core::Logger::levelFromString(*cli.logLevel);
  }
  if (cli.logFile)
  {
    options.log.file = *cli.logFile;
  }
  if (cli.logAsync)
  {
    options.log.async = *cli.logAsync;
  }
  if (cli.inactivityTimeoutSeconds)
  {
    options.setInactivityTimeoutSeconds(*cli.inactivityTimeoutSeconds);
  }
  return options;
}
} // namespace

int main(int argc, char **argv)
{
  using ftpcore::core::Logger;
  try
  {
    auto options = buildOptions(parseCliArgs(argc, argv));
    Logger::init(options.log.level, options.log.file, options.log.async,
                 options.log.retentionDays, options.log.timeFormat);

    auto registry = std::make_shared<ftpcore::server::CommandRegistry>();
    ftpcore::commands::registerBasicCommands(*registry);

    ftpcore::server::FtpServer server(options, registry);
    auto port = server.start();
    FTPCORE_LOG_INFO("Serving " << options.fileSystemRoot << " on port " << port);

    std::signal(SIGINT, [](int) { g_terminate = true; });
    std::signal(SIGTERM, [](int) { g_terminate = true; });
    while (!g_terminate)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    FTPCORE_LOG_INFO("Termination requested");
    server.stop();
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error running ftpcore: " << ex.what() << std::endl;
    Logger::shutdown();
    return EXIT_FAILURE;
  }

  Logger::shutdown();
  return 0;
}
