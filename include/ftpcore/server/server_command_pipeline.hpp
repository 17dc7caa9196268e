// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <thread>

#include "ftpcore/core/blocking_queue.hpp"
#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/server/server_command_executor.hpp"
#include "ftpcore/server/server_commands.hpp"

namespace ftpcore
{
namespace server
{

/// \brief Ordered server command queue of one connection.
///
/// run() executes one command at a time in enqueue order; a command,
/// including the responses it writes, completes before the next one
/// starts. Commands enqueued while a command runs (for example the
/// CloseDataConnection and SendResponse queued by a transfer) are executed
/// after it.
class ServerCommandPipeline
{
public:
  ServerCommandPipeline(ServerCommandContext &context, std::size_t capacity = 1024)
      : _queue(capacity), _executor(context), _connectionId(context.connectionId())
  {
  }

  ServerCommandPipeline(const ServerCommandPipeline &) = delete;
  ServerCommandPipeline &operator=(const ServerCommandPipeline &) = delete;

  /// \brief Queue \p command. Called from the pipeline thread itself the
  /// call never blocks and fails when the queue is full.
  /// \return false if the queue is closed (or full, see above)
  bool enqueue(ServerCommand command)
  {
    if (std::this_thread::get_id() == _runner.load())
    {
      if (!_queue.tryQueue(std::move(command)))
      {
        FTPCORE_LOG_ERROR("Connection " << _connectionId << ": server command queue full");
        return false;
      }
      return true;
    }
    return _queue.queue(std::move(command));
  }

  /// \brief Drain the queue until it is closed.
  /// \throws core::OperationCancelled when \p token fires
  /// \throws ResponseTransmissionError when a response cannot be written
  void run(const core::CancellationToken &token)
  {
    _runner.store(std::this_thread::get_id());
    struct RunnerReset
    {
      std::atomic<std::thread::id> &runner;
      ~RunnerReset() { runner.store(std::thread::id()); }
    } reset{_runner};

    ServerCommand command;
    while (_queue.dequeue(command, token))
    {
      _executor.execute(command, token);
      // release what the executed command captured
      command = CloseConnection{};
    }
    FTPCORE_LOG_DEBUG("Connection " << _connectionId << ": server command queue closed");
  }

  /// \brief Stop accepting commands. run() returns once queued commands are
  /// drained.
  void close() { _queue.close(); }

  std::size_t pending() const { return _queue.size(); }

private:
  core::BlockingQueue<ServerCommand> _queue;
  ServerCommandExecutor _executor;
  std::string _connectionId;
  std::atomic<std::thread::id> _runner{};
};

} // namespace server
} // namespace ftpcore
