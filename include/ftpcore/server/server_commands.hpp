// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/server/connection_events.hpp"
#include "ftpcore/server/data_connection.hpp"
#include "ftpcore/server/ftp_types.hpp"

namespace ftpcore
{
namespace server
{

/// \brief Work performed on an open data connection. Returning nullopt
/// means "226 Closing data connection.".
using DataConnectionDelegate =
  std::function<std::optional<FtpResponse>(DataConnection &, const core::CancellationToken &)>;

/// \brief Open (or reuse) the data connection and run \p delegate on it.
/// When \p abortToken fires the transfer is answered with 426.
struct OpenDataConnectionAndRun
{
  FtpCommand command;
  DataConnectionDelegate delegate;
  std::optional<core::CancellationToken> abortToken;
};

struct CloseDataConnection
{
  std::shared_ptr<DataConnection> connection;
};

struct SendResponse
{
  FtpResponse response;
};

struct CloseConnection
{
};

/// \brief Protocol side effect queued by command handlers and executed in
/// order by the connection's ServerCommandPipeline.
using ServerCommand =
  std::variant<OpenDataConnectionAndRun, CloseDataConnection, SendResponse, CloseConnection>;

inline const char *serverCommandName(const ServerCommand &command)
{
  switch (command.index())
  {
  case 0:
    return "OpenDataConnectionAndRun";
  case 1:
    return "CloseDataConnection";
  case 2:
    return "SendResponse";
  default:
    return "CloseConnection";
  }
}

/// \brief Writing a response to the control channel failed. Fatal for the
/// connection.
class ResponseTransmissionError : public std::runtime_error
{
public:
  explicit ResponseTransmissionError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Operation run by FtpConnection-style command execution.
using CommandOperation =
  std::function<std::optional<FtpResponse>(const core::CancellationToken &)>;

/// \brief What the server command executor needs from a connection.
class ServerCommandContext
{
public:
  virtual ~ServerCommandContext() = default;

  virtual const std::string &connectionId() const = 0;

  /// \brief Cancelled when the connection is aborted or evicted.
  virtual core::CancellationToken connectionToken() const = 0;

  virtual void publishEvent(const ConnectionEvent &event) = 0;

  /// \brief Return the data connection left open by a previous transfer or
  /// open a new one through the negotiated opener.
  /// \throws DataConnectionError if none can be opened
  virtual std::shared_ptr<DataConnection> openDataConnection(const core::CancellationToken &token) = 0;

  /// \brief Remember \p connection for reuse by the next transfer.
  virtual void keepDataConnectionOpen(std::shared_ptr<DataConnection> connection) = 0;

  /// \brief Close \p connection and forget it if it was kept open.
  virtual void closeDataConnection(const std::shared_ptr<DataConnection> &connection) = 0;

  /// \brief Run \p operation on behalf of \p command. Failures other than
  /// cancellation become a 451 response.
  /// \throws core::OperationCancelled
  virtual std::optional<FtpResponse> executeCommand(const FtpCommand &command,
                                                    const CommandOperation &operation,
                                                    const core::CancellationToken &token) = 0;

  /// \return false if the queue is closed
  virtual bool enqueueServerCommand(ServerCommand command) = 0;

  /// \throws ResponseTransmissionError
  virtual void writeResponse(const FtpResponse &response, const core::CancellationToken &token) = 0;

  /// \brief Mark the connection aborted. Does not wait for teardown.
  virtual void abort() = 0;
};

} // namespace server
} // namespace ftpcore
