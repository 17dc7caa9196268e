// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ftpcore/commands/listing.hpp"
#include "ftpcore/commands/transfer.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/fs/file_system.hpp"
#include "ftpcore/server/command_handler.hpp"
#include "ftpcore/server/data_connection.hpp"
#include "ftpcore/server/ftp_connection.hpp"

namespace ftpcore
{
namespace commands
{

using server::FtpCommand;
using server::FtpConnection;
using server::FtpResponse;

namespace detail
{
  inline FtpResponse syntaxError()
  {
    return {501, "Syntax error in parameters or arguments."};
  }

  /// Drop leading "-x" style options some clients pass to LIST and NLST.
  inline std::string stripListOptions(const std::string &argument)
  {
    std::istringstream in(argument);
    std::string word;
    std::string rest;
    while (in >> word)
    {
      if (word.size() > 1 && word.front() == '-' && rest.empty())
      {
        continue;
      }
      rest += rest.empty() ? word : " " + word;
    }
    return rest;
  }

  /// \return "h1.h2.h3.h4" and the port of a PORT argument
  inline std::optional<std::pair<std::string, std::uint16_t>>
  parseHostPort(const std::string &argument)
  {
    std::vector<int> values;
    std::string part;
    for (std::size_t i = 0; i <= argument.size(); ++i)
    {
      if (i == argument.size() || argument[i] == ',')
      {
        if (part.empty() || part.size() > 3)
        {
          return std::nullopt;
        }
        int value = std::stoi(part);
        if (value > 255)
        {
          return std::nullopt;
        }
        values.push_back(value);
        part.clear();
      }
      else if (std::isdigit(static_cast<unsigned char>(argument[i])))
      {
        part += argument[i];
      }
      else if (argument[i] != ' ')
      {
        return std::nullopt;
      }
    }
    if (values.size() != 6)
    {
      return std::nullopt;
    }
    std::string host = std::to_string(values[0]) + "." + std::to_string(values[1]) + "." +
                       std::to_string(values[2]) + "." + std::to_string(values[3]);
    return std::make_pair(host, static_cast<std::uint16_t>(values[4] * 256 + values[5]));
  }

  /// \return the dotted IPv4 local address of the control connection
  inline std::optional<std::string> localIPv4(const FtpConnection &connection)
  {
    sockaddr_storage ss{};
    if (!connection.localAddress(ss) || ss.ss_family != AF_INET)
    {
      return std::nullopt;
    }
    char buf[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in &>(ss).sin_addr, buf, sizeof(buf));
    return std::string(buf);
  }

  inline std::string quotePath(const std::string &path)
  {
    std::string out;
    for (char c : path)
    {
      out += c;
      if (c == '"')
      {
        out += '"';
      }
    }
    return "\"" + out + "\"";
  }

  inline std::optional<FtpResponse> list(FtpConnection &connection, const FtpCommand &command,
                                         const core::CancellationToken &token, bool namesOnly)
  {
    auto &fileSystem = connection.fileSystem();
    auto path =
      fs::resolveVirtualPath(connection.currentPath(), stripListOptions(command.argument));
    auto entry = fileSystem.getEntry(path, token);
    if (!entry)
    {
      return FtpResponse(550, "Directory not found.");
    }
    auto entries = entry->isDirectory() ? fileSystem.getEntries(path, token)
                                        : std::vector<fs::FileSystemEntry>{*entry};
    return runTransfer(
      connection, command, token,
      [entries = std::move(entries), namesOnly](server::DataConnection &data,
                                                const core::CancellationToken &ct)
        -> std::optional<FtpResponse>
      {
        auto now = std::chrono::system_clock::now();
        for (const auto &e : entries)
        {
          ct.throwIfCancellationRequested();
          data.write((namesOnly ? e.name : formatListLine(e, now)) + "\r\n", ct);
        }
        return std::nullopt;
      });
  }

  inline std::optional<FtpResponse> retrieve(FtpConnection &connection, const FtpCommand &command,
                                             const core::CancellationToken &token)
  {
    if (command.argument.empty())
    {
      return syntaxError();
    }
    auto &fileSystem = connection.fileSystem();
    auto path = fs::resolveVirtualPath(connection.currentPath(), command.argument);
    auto entry = fileSystem.getEntry(path, token);
    if (!entry || entry->isDirectory())
    {
      return FtpResponse(550, "File not found.");
    }
    return runTransfer(connection, command, token,
                       [&fileSystem, path](server::DataConnection &data,
                                           const core::CancellationToken &ct)
                         -> std::optional<FtpResponse>
                       {
                         auto input = fileSystem.openRead(path, 0, ct);
                         std::vector<char> buffer(64 * 1024);
                         while (*input)
                         {
                           ct.throwIfCancellationRequested();
                           input->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                           auto n = input->gcount();
                           if (n > 0)
                           {
                             data.write(buffer.data(), static_cast<std::size_t>(n), ct);
                           }
                         }
                         if (input->bad())
                         {
                           throw fs::FileSystemError(fs::FileSystemError::Kind::Io,
                                                     "Read failed for " + path);
                         }
                         FTPCORE_LOG_DEBUG("Sent " << data.bytesSent() << " bytes of " << path);
                         return std::nullopt;
                       });
  }

  inline std::optional<FtpResponse> store(FtpConnection &connection, const FtpCommand &command,
                                          const core::CancellationToken &token)
  {
    if (command.argument.empty())
    {
      return syntaxError();
    }
    auto &fileSystem = connection.fileSystem();
    auto path = fs::resolveVirtualPath(connection.currentPath(), command.argument);
    auto [directory, name] = fs::splitVirtualPath(path);
    auto parent = fileSystem.getEntry(directory, token);
    if (!parent || !parent->isDirectory() || name.empty())
    {
      return FtpResponse(553, "Requested action not taken. File name not allowed.");
    }
    return runTransfer(connection, command, token,
                       [&fileSystem, directory = directory, name = name](
                         server::DataConnection &data,
                         const core::CancellationToken &ct) -> std::optional<FtpResponse>
                       {
                         auto entry = fileSystem.create(
                           directory, name,
                           [&data, &ct](char *buffer, std::size_t capacity)
                           { return data.read(buffer, capacity, ct); },
                           ct);
                         FTPCORE_LOG_DEBUG("Stored " << entry.size << " bytes to " << entry.path);
                         return std::nullopt;
                       });
  }
} // namespace detail

/// \brief Register the minimal command set used to drive the core: session
/// commands answered inline, and the abortable transfer commands NLST, LIST,
/// RETR and STOR.
inline void registerBasicCommands(server::CommandRegistry &registry)
{
  registry.add("USER", false,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 if (command.argument.empty())
                 {
                   return detail::syntaxError();
                 }
                 connection.setUserName(command.argument);
                 return FtpResponse(331, "User name okay, need password.");
               });

  registry.add("PASS", false,
               [](FtpConnection &connection, const FtpCommand &,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 if (connection.userName().empty())
                 {
                   return FtpResponse(503, "Login with USER first.");
                 }
                 FTPCORE_LOG_INFO("Connection " << connection.connectionId() << ": user "
                                                << connection.userName() << " logged in");
                 return FtpResponse(230, "User logged in, proceed.");
               });

  registry.add("SYST", false,
               [](FtpConnection &, const FtpCommand &,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               { return FtpResponse(215, "UNIX Type: L8"); });

  registry.add("NOOP", false,
               [](FtpConnection &, const FtpCommand &,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               { return FtpResponse(200, "NOOP command successful."); });

  registry.add("TYPE", false,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 if (command.argument.empty())
                 {
                   return detail::syntaxError();
                 }
                 char type =
                   static_cast<char>(std::toupper(static_cast<unsigned char>(command.argument[0])));
                 if (type != 'A' && type != 'I')
                 {
                   return FtpResponse(504, "Command not implemented for that parameter.");
                 }
                 connection.setTransferType(type);
                 return FtpResponse(200, std::string("Type set to ") + type + ".");
               });

  registry.add("PWD", false,
               [](FtpConnection &connection, const FtpCommand &,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 return FtpResponse(257, detail::quotePath(connection.currentPath()) +
                                           " is current directory.");
               });

  registry.add("CWD", false,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &token) -> std::optional<FtpResponse>
               {
                 auto path = fs::resolveVirtualPath(connection.currentPath(), command.argument);
                 auto entry = connection.fileSystem().getEntry(path, token);
                 if (!entry || !entry->isDirectory())
                 {
                   return FtpResponse(550, "Directory not found.");
                 }
                 connection.setCurrentPath(path);
                 return FtpResponse(250, "Directory changed to " + path + ".");
               });

  registry.add("QUIT", false,
               [](FtpConnection &connection, const FtpCommand &,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 connection.enqueueServerCommand(
                   server::SendResponse{FtpResponse(221, "Service closing control connection.")});
                 connection.enqueueServerCommand(server::CloseConnection{});
                 return std::nullopt;
               });

  registry.add("ABOR", false,
               [](FtpConnection &connection, const FtpCommand &,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 auto task = connection.abortBackgroundTask();
                 if (!task)
                 {
                   return FtpResponse(225, "No transfer to abort.");
                 }
                 // the transfer queues its 426 before the task completes
                 task->task().wait();
                 return FtpResponse(226, "Abort command successful.");
               });

  registry.add("PORT", false,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 auto target = detail::parseHostPort(command.argument);
                 if (!target)
                 {
                   return detail::syntaxError();
                 }
                 connection.setDataConnectionOpener(
                   std::make_unique<server::ActiveDataConnectionOpener>(
                     target->first, target->second, connection.options().dataConnectionTimeout));
                 return FtpResponse(200, "PORT command successful.");
               });

  registry.add("PASV", false,
               [](FtpConnection &connection, const FtpCommand &,
                  const core::CancellationToken &) -> std::optional<FtpResponse>
               {
                 const auto &options = connection.options();
                 auto local = detail::localIPv4(connection);
                 if (!local && options.passiveAddress.empty())
                 {
                   return FtpResponse(425, "Passive mode needs an IPv4 address, use PORT.");
                 }
                 try
                 {
                   auto opener = std::make_unique<server::PassiveDataConnectionOpener>(
                     local ? *local : std::string("0.0.0.0"),
                     options.passiveAddress.empty() ? *local : options.passiveAddress,
                     options.passivePortRange, options.dataConnectionTimeout,
                     local ? connection.remoteHost() : std::string());
                   auto tuple = opener->hostPortTuple();
                   connection.setDataConnectionOpener(std::move(opener));
                   return FtpResponse(227, "Entering Passive Mode (" + tuple + ").");
                 }
                 catch (const server::DataConnectionError &ex)
                 {
                   FTPCORE_LOG_WARN("Connection " << connection.connectionId()
                                                  << ": PASV failed: " << ex.what());
                   return server::responses::cannotOpenDataConnection();
                 }
               });

  registry.add("NLST", true,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &token)
               { return detail::list(connection, command, token, true); });

  registry.add("LIST", true,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &token)
               { return detail::list(connection, command, token, false); });

  registry.add("RETR", true,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &token)
               { return detail::retrieve(connection, command, token); });

  registry.add("STOR", true,
               [](FtpConnection &connection, const FtpCommand &command,
                  const core::CancellationToken &token)
               { return detail::store(connection, command, token); });
}

} // namespace commands
} // namespace ftpcore
