// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/ids/uuid.hpp"
#include "ftpcore/server/server_commands.hpp"

namespace ftpcore
{
namespace server
{

namespace responses
{
  inline FtpResponse closingDataConnection() { return {226, "Closing data connection."}; }
  inline FtpResponse cannotOpenDataConnection() { return {425, "Could not open data connection"}; }
  inline FtpResponse transferAborted() { return {426, "Connection closed; transfer aborted."}; }
  inline FtpResponse localError()
  {
    return {451, "Requested action aborted. Local error in processing."};
  }
} // namespace responses

/// \brief Run \p operation, turning any failure other than cancellation into
/// a 451 response.
/// \throws core::OperationCancelled
inline std::optional<FtpResponse> runCommandOperation(const std::string &connectionId,
                                                      const FtpCommand &command,
                                                      const CommandOperation &operation,
                                                      const core::CancellationToken &token)
{
  try
  {
    return operation(token);
  }
  catch (const core::OperationCancelled &)
  {
    throw;
  }
  catch (const std::exception &ex)
  {
    FTPCORE_LOG_ERROR("Connection " << connectionId << ": failed to execute " << command.toString()
                                    << ": " << ex.what());
    return responses::localError();
  }
}

/// \brief Executes one server command against a connection.
class ServerCommandExecutor
{
public:
  explicit ServerCommandExecutor(ServerCommandContext &context) : _context(context) {}

  /// \brief \p token is the connection's cancellation token.
  /// \throws ResponseTransmissionError
  /// \throws core::OperationCancelled
  void execute(ServerCommand &command, const core::CancellationToken &token)
  {
    FTPCORE_LOG_TRACE("Connection " << _context.connectionId() << ": executing "
                                    << serverCommandName(command));
    std::visit(
      [this, &token](auto &cmd)
      {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, OpenDataConnectionAndRun>)
        {
          openAndRun(cmd, token);
        }
        else if constexpr (std::is_same_v<T, CloseDataConnection>)
        {
          closeDataConnection(cmd);
        }
        else if constexpr (std::is_same_v<T, SendResponse>)
        {
          _context.writeResponse(cmd.response, token);
        }
        else
        {
          FTPCORE_LOG_DEBUG("Connection " << _context.connectionId() << ": close requested");
          _context.abort();
        }
      },
      command);
  }

private:
  ServerCommandContext &_context;

  /// Publishes DataTransferStarted on construction and the matching
  /// DataTransferStopped on every exit path.
  class KeepAliveBracket
  {
  public:
    KeepAliveBracket(ServerCommandContext &context, const FtpCommand &command)
        : _context(context), _transferId(ids::Uuid::v4Compact())
    {
      _context.publishEvent(DataTransferStartedEvent{_transferId, command});
    }

    ~KeepAliveBracket() { _context.publishEvent(DataTransferStoppedEvent{_transferId}); }

    KeepAliveBracket(const KeepAliveBracket &) = delete;
    KeepAliveBracket &operator=(const KeepAliveBracket &) = delete;

    const std::string &transferId() const { return _transferId; }

  private:
    ServerCommandContext &_context;
    std::string _transferId;
  };

  void openAndRun(OpenDataConnectionAndRun &cmd, const core::CancellationToken &token)
  {
    KeepAliveBracket bracket(_context, cmd.command);

    // Opening and the delegate stop on connection cancellation or on the
    // command's own abort token.
    auto runSource = core::CancellationSource::createLinked(token);
    core::CancellationRegistration abortRegistration;
    if (cmd.abortToken)
    {
      abortRegistration = cmd.abortToken->registerCallback([&runSource]() { runSource.cancel(); });
    }

    std::shared_ptr<DataConnection> dataConnection;
    try
    {
      dataConnection = _context.openDataConnection(runSource.token());
    }
    catch (const core::OperationCancelled &)
    {
      if (token.isCancellationRequested())
      {
        throw;
      }
      FTPCORE_LOG_INFO("Connection " << _context.connectionId() << ": transfer "
                                     << bracket.transferId() << " aborted before it started");
      queueFollowUp(SendResponse{responses::transferAborted()});
      return;
    }
    catch (const std::exception &ex)
    {
      FTPCORE_LOG_WARN("Connection " << _context.connectionId()
                                     << ": could not open data connection: " << ex.what());
      queueFollowUp(SendResponse{responses::cannotOpenDataConnection()});
      return;
    }

    std::optional<FtpResponse> outcome;
    try
    {
      outcome = _context.executeCommand(
        cmd.command,
        [&cmd, &dataConnection](const core::CancellationToken &ct)
        { return cmd.delegate(*dataConnection, ct); },
        runSource.token());
    }
    catch (const core::OperationCancelled &)
    {
      if (token.isCancellationRequested())
      {
        throw;
      }
      FTPCORE_LOG_INFO("Connection " << _context.connectionId() << ": transfer "
                                     << bracket.transferId() << " (" << cmd.command.name
                                     << ") aborted");
      queueFollowUp(CloseDataConnection{dataConnection});
      queueFollowUp(SendResponse{responses::transferAborted()});
      return;
    }

    FtpResponse response = outcome ? *outcome : responses::closingDataConnection();
    if (response.code == 250)
    {
      _context.keepDataConnectionOpen(dataConnection);
    }
    else
    {
      queueFollowUp(CloseDataConnection{dataConnection});
    }
    queueFollowUp(SendResponse{std::move(response)});
  }

  /// A reply owed to the client that cannot be queued ends the connection.
  void queueFollowUp(ServerCommand command)
  {
    auto *close = std::get_if<CloseDataConnection>(&command);
    std::shared_ptr<DataConnection> dataConnection = close ? close->connection : nullptr;
    if (_context.enqueueServerCommand(std::move(command)))
    {
      return;
    }
    FTPCORE_LOG_ERROR("Connection " << _context.connectionId()
                                    << ": cannot queue transfer reply, aborting connection");
    if (dataConnection)
    {
      _context.closeDataConnection(dataConnection);
    }
    _context.abort();
  }

  void closeDataConnection(CloseDataConnection &cmd)
  {
    if (!cmd.connection)
    {
      return;
    }
    if (cmd.connection->isClosed())
    {
      FTPCORE_LOG_DEBUG("Connection " << _context.connectionId()
                                      << ": data connection already closed");
    }
    _context.closeDataConnection(cmd.connection);
  }
};

} // namespace server
} // namespace ftpcore
