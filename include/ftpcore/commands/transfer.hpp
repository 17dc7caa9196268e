// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/server/ftp_connection.hpp"
#include "ftpcore/server/server_commands.hpp"

namespace ftpcore
{
namespace commands
{

namespace detail
{
  struct TransferState
  {
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
  };

  /// Marks the transfer done when the pipeline releases the delegate that
  /// owns it.
  class TransferNotifier
  {
  public:
    explicit TransferNotifier(std::shared_ptr<TransferState> state) : _state(std::move(state)) {}

    ~TransferNotifier()
    {
      {
        std::lock_guard<std::mutex> lock(_state->mutex);
        _state->done = true;
      }
      _state->cv.notify_all();
    }

    TransferNotifier(const TransferNotifier &) = delete;
    TransferNotifier &operator=(const TransferNotifier &) = delete;

  private:
    std::shared_ptr<TransferState> _state;
  };
} // namespace detail

/// \brief Queue \p delegate on the connection's data channel and block until
/// the pipeline has executed it, or until the connection is closed.
///
/// Called from an abortable handler; \p abortToken is the handler's token.
/// A 150 reply precedes the delegate. The final reply (226, 250, 426, 451
/// or 425) is queued by the server command executor, so this returns
/// nullopt. Because the handler only returns after the executor has queued
/// that reply, a 226 for ABOR always follows the transfer's 426.
inline std::optional<server::FtpResponse> runTransfer(server::FtpConnection &connection,
                                                      const server::FtpCommand &command,
                                                      const core::CancellationToken &abortToken,
                                                      server::DataConnectionDelegate delegate)
{
  abortToken.throwIfCancellationRequested();
  auto state = std::make_shared<detail::TransferState>();
  auto notifier = std::make_shared<detail::TransferNotifier>(state);

  bool queued = connection.enqueueServerCommand(server::OpenDataConnectionAndRun{
    command,
    [notifier, &connection, delegate = std::move(delegate)](
      server::DataConnection &data,
      const core::CancellationToken &token) -> std::optional<server::FtpResponse>
    {
      token.throwIfCancellationRequested();
      // the control channel only follows the connection, never the abort
      connection.writeResponse(server::FtpResponse(150, "Opening data connection."),
                               connection.connectionToken());
      return delegate(data, token);
    },
    abortToken});
  notifier.reset();
  if (!queued)
  {
    return std::nullopt;
  }

  auto connectionToken = connection.connectionToken();
  auto wake = connectionToken.registerCallback(
    [state]()
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->cv.notify_all();
    });
  std::unique_lock<std::mutex> lock(state->mutex);
  state->cv.wait(lock, [&]() { return state->done || connectionToken.isCancellationRequested(); });
  return std::nullopt;
}

} // namespace commands
} // namespace ftpcore
